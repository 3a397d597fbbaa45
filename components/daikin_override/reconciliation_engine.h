#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "override_classifier.h"
#include "reconcile_config.h"
#include "snapshot.h"

namespace esphome
{
    namespace daikin_override
    {
        enum class ReconcileResultType : uint8_t
        {
            Processed = 0,
            // Out-of-order or wrong-origin snapshot, nothing changed
            Discarded = 1,
            // Caller misuse: the device id was never registered
            UnknownDevice = 2
        };

        const char *result_type_to_string(ReconcileResultType type);

        struct ReconcileResult
        {
            ReconcileResultType type = ReconcileResultType::Processed;
            std::vector<OverrideEvent> events;
        };

        enum class FieldPhase : uint8_t
        {
            Idle = 0,
            CommandPending = 1
        };

        struct DeviceRecord;

        // Owns the per-device reconciliation state and is the only entry point for pollers and command
        // issuers. Calls for one device are serialized on that device's mutex; devices run independently.
        // Time always comes from the caller, the engine never reads a clock.
        class ReconciliationEngine
        {
        public:
            ReconciliationEngine();
            ~ReconciliationEngine();

            ReconciliationEngine(const ReconciliationEngine &) = delete;
            ReconciliationEngine &operator=(const ReconciliationEngine &) = delete;

            // False if the id is already registered
            bool register_device(const std::string &device_id, const ReconcileConfig &config = ReconcileConfig());
            bool unregister_device(const std::string &device_id);
            bool has_device(const std::string &device_id) const;
            std::vector<std::string> device_ids() const;

            ReconcileResult on_command_issued(const std::string &device_id, const FieldValues &fields, uint32_t now);

            // The device accepted a different value than requested (setpoint clipped to a supported one)
            ReconcileResult on_command_adjusted(const std::string &device_id, Field field, const std::string &accepted_value,
                                                uint32_t now);

            // Early detection from a command response; never advances the confirmed state
            ReconcileResult on_command_result(const std::string &device_id, const Snapshot &snapshot, uint32_t now);

            ReconcileResult on_poll(const std::string &device_id, const Snapshot &snapshot, uint32_t now);

            std::optional<Snapshot> current_confirmed_state(const std::string &device_id) const;

            std::optional<FieldPhase> field_phase(const std::string &device_id, Field field, uint32_t now) const;

        private:
            std::shared_ptr<DeviceRecord> find_device_(const std::string &device_id) const;

            mutable std::mutex registry_mutex_;
            std::map<std::string, std::shared_ptr<DeviceRecord>> devices_;
        };
    } // namespace daikin_override
} // namespace esphome
