#include "command_ledger.h"
#include "confirmed_state_store.h"
#include "debouncer.h"
#include "log.h"
#include "mismatch_detector.h"
#include "protection_policy.h"
#include "reconciliation_engine.h"
#include "util.h"

namespace esphome
{
    namespace daikin_override
    {
        // Everything the engine knows about one device. Guarded by `mutex`.
        struct DeviceRecord
        {
            DeviceRecord(const std::string &id, const ReconcileConfig &cfg)
                : device_id(id),
                  temperature_tolerance(cfg.temperature_tolerance),
                  ledger(cfg.default_protection_window_ms),
                  detector(cfg.temperature_tolerance),
                  policy(cfg.temperature_tolerance),
                  debouncer(cfg.debounce_cooldown_ms)
            {
                for (const auto &entry : cfg.field_protection_window_ms)
                    ledger.set_protection_window(entry.first, entry.second);
            }

            const std::string device_id;
            const float temperature_tolerance;
            std::mutex mutex;

            ConfirmedStateStore confirmed;
            CommandLedger ledger;
            MismatchDetector detector;
            ProtectionPolicy policy;
            OverrideClassifier classifier;
            Debouncer debouncer;

            // Actual values already reported from a command response; a poll settles (and clears) them
            FieldValues command_time_reported;
            // Setpoint requested while the unit is off. The device only takes it once it is running.
            std::optional<std::string> deferred_temperature;

            bool has_snapshot = false;
            uint32_t last_snapshot_ms = 0;
        };

        const char *result_type_to_string(ReconcileResultType type)
        {
            switch (type)
            {
            case ReconcileResultType::Processed:
                return "processed";
            case ReconcileResultType::Discarded:
                return "discarded";
            case ReconcileResultType::UnknownDevice:
                return "unknown device";
            default:
                return "unknown";
            }
        }

        static ReconcileResult make_result(ReconcileResultType type)
        {
            ReconcileResult result;
            result.type = type;
            return result;
        }

        static bool turns_unit_on(const FieldValues &fields)
        {
            auto power = fields.find(Field::Power);
            if (power != fields.end())
                return power->second == "1";

            auto mode = fields.find(Field::Mode);
            return mode != fields.end() && mode->second != "off";
        }

        static bool turns_unit_off(const FieldValues &fields)
        {
            auto power = fields.find(Field::Power);
            if (power != fields.end())
                return power->second == "0";

            auto mode = fields.find(Field::Mode);
            return mode != fields.end() && mode->second == "off";
        }

        // Rejects snapshots of the wrong origin and snapshots older than the last one processed, so the
        // confirmed state never moves backward in time
        static bool accept_snapshot(DeviceRecord &device, const Snapshot &snapshot, SnapshotOrigin expected)
        {
            if (snapshot.origin() != expected)
            {
                LOGW("%s: expected a %s snapshot, got %s - ignoring", device.device_id.c_str(),
                     origin_to_string(expected), origin_to_string(snapshot.origin()));
                return false;
            }

            if (device.has_snapshot && is_before(snapshot.timestamp(), device.last_snapshot_ms))
            {
                LOGW("%s: discarding out-of-order %s snapshot (t=%u, last processed t=%u)", device.device_id.c_str(),
                     origin_to_string(snapshot.origin()), snapshot.timestamp(), device.last_snapshot_ms);
                return false;
            }

            device.has_snapshot = true;
            device.last_snapshot_ms = snapshot.timestamp();
            return true;
        }

        static void expire_intents(DeviceRecord &device, uint32_t now)
        {
            for (const auto &intent : device.ledger.expire(now))
            {
                // The command never showed up in a poll; whatever the device reports from now on is the truth
                LOGW("%s: %s command to '%s' not confirmed within %u ms", device.device_id.c_str(),
                     field_to_string(intent.field), intent.target.c_str(), device.ledger.protection_window(intent.field));
            }
        }

        // Drops divergences a command response already reported with the same actual value
        static std::vector<Divergence> drop_reported(DeviceRecord &device, const std::vector<Divergence> &divergences)
        {
            std::vector<Divergence> remaining;
            for (const auto &divergence : divergences)
            {
                auto it = device.command_time_reported.find(divergence.field);
                if (it != device.command_time_reported.end() &&
                    values_equal(divergence.field, it->second, divergence.actual, device.temperature_tolerance))
                {
                    if (debug_log_messages)
                        LOGD("%s: %s already reported from command response", device.device_id.c_str(),
                             divergence.to_string().c_str());
                    continue;
                }
                remaining.push_back(divergence);
            }
            return remaining;
        }

        static std::vector<OverrideEvent> emit_events(DeviceRecord &device, const std::vector<Divergence> &divergences, uint32_t now)
        {
            std::vector<OverrideEvent> events;

            auto event = device.classifier.build_event(device.device_id, divergences, now);
            if (!event.has_value())
                return events;

            if (!device.debouncer.admit(event.value(), now))
            {
                if (debug_log_messages)
                    LOGD("%s: debounced %s override", device.device_id.c_str(), category_to_string(event->category));
                return events;
            }

            LOGI("Override detected: %s", event->to_string().c_str());
            events.push_back(std::move(event.value()));
            return events;
        }

        ReconciliationEngine::ReconciliationEngine() = default;

        ReconciliationEngine::~ReconciliationEngine() = default;

        bool ReconciliationEngine::register_device(const std::string &device_id, const ReconcileConfig &config)
        {
            std::lock_guard<std::mutex> lock(registry_mutex_);
            if (devices_.find(device_id) != devices_.end())
            {
                LOGW("Device %s is already registered", device_id.c_str());
                return false;
            }

            devices_[device_id] = std::make_shared<DeviceRecord>(device_id, config);
            LOGD("Registered device %s (protection window %u ms, debounce %u ms, tolerance %.2f)", device_id.c_str(),
                 config.default_protection_window_ms, config.debounce_cooldown_ms, config.temperature_tolerance);
            return true;
        }

        bool ReconciliationEngine::unregister_device(const std::string &device_id)
        {
            std::lock_guard<std::mutex> lock(registry_mutex_);
            return devices_.erase(device_id) > 0;
        }

        bool ReconciliationEngine::has_device(const std::string &device_id) const
        {
            std::lock_guard<std::mutex> lock(registry_mutex_);
            return devices_.find(device_id) != devices_.end();
        }

        std::vector<std::string> ReconciliationEngine::device_ids() const
        {
            std::lock_guard<std::mutex> lock(registry_mutex_);
            std::vector<std::string> ids;
            for (const auto &entry : devices_)
                ids.push_back(entry.first);
            return ids;
        }

        std::shared_ptr<DeviceRecord> ReconciliationEngine::find_device_(const std::string &device_id) const
        {
            std::lock_guard<std::mutex> lock(registry_mutex_);
            auto it = devices_.find(device_id);
            if (it == devices_.end())
                return nullptr;
            return it->second;
        }

        ReconcileResult ReconciliationEngine::on_command_issued(const std::string &device_id, const FieldValues &fields, uint32_t now)
        {
            auto device = find_device_(device_id);
            if (device == nullptr)
            {
                LOGW("on_command_issued: device %s is not registered", device_id.c_str());
                return make_result(ReconcileResultType::UnknownDevice);
            }

            std::lock_guard<std::mutex> lock(device->mutex);

            const bool turning_on = turns_unit_on(fields);
            auto confirmed_power = device->confirmed.read(Field::Power);
            const bool off_now = confirmed_power.has_value() && confirmed_power.value() == "0";
            const bool off_after = turns_unit_off(fields) || (off_now && !turning_on);

            for (const auto &entry : fields)
            {
                if (entry.first == Field::TargetTemperature && off_after)
                {
                    device->deferred_temperature = entry.second;
                    LOGI("%s: holding target temperature %s until the unit turns on", device_id.c_str(), entry.second.c_str());
                    continue;
                }

                const CommandIntent &intent = device->ledger.record_intent(entry.first, entry.second, now);
                if (debug_log_messages)
                    LOGD("%s: intent recorded {%s}", device_id.c_str(), intent.to_string().c_str());
            }

            auto power = fields.find(Field::Power);
            if (power != fields.end() && power->second == "1" && fields.find(Field::Mode) == fields.end())
            {
                // The unit resumes its last mode, which an "off" reading no longer tells us
                auto confirmed_mode = device->confirmed.read(Field::Mode);
                if (!confirmed_mode.has_value() || confirmed_mode.value() == "off")
                {
                    const CommandIntent &intent = device->ledger.record_intent(Field::Mode, "off", now, IntentMatch::AnyOther);
                    if (debug_log_messages)
                        LOGD("%s: intent recorded {%s}", device_id.c_str(), intent.to_string().c_str());
                }
            }

            if (fields.find(Field::TargetTemperature) != fields.end())
            {
                if (!off_after)
                    device->deferred_temperature.reset();
            }
            else if (turning_on && device->deferred_temperature.has_value())
            {
                // The device client sends the held setpoint along with the power-on command
                const CommandIntent &intent = device->ledger.record_intent(Field::TargetTemperature, device->deferred_temperature.value(), now);
                LOGI("%s: applying held target temperature %s on power on", device_id.c_str(), intent.target.c_str());
                device->deferred_temperature.reset();
            }

            return make_result(ReconcileResultType::Processed);
        }

        ReconcileResult ReconciliationEngine::on_command_adjusted(const std::string &device_id, Field field,
                                                                  const std::string &accepted_value, uint32_t now)
        {
            auto device = find_device_(device_id);
            if (device == nullptr)
            {
                LOGW("on_command_adjusted: device %s is not registered", device_id.c_str());
                return make_result(ReconcileResultType::UnknownDevice);
            }

            std::lock_guard<std::mutex> lock(device->mutex);

            if (field == Field::TargetTemperature && device->deferred_temperature.has_value() && !device->ledger.has_intent(field))
            {
                device->deferred_temperature = accepted_value;
                return make_result(ReconcileResultType::Processed);
            }

            auto intent = device->ledger.active_intent(field, now);
            if (!intent.has_value())
            {
                if (debug_log_messages)
                    LOGD("%s: no active %s intent to adjust", device_id.c_str(), field_to_string(field));
                return make_result(ReconcileResultType::Discarded);
            }

            device->ledger.retarget(field, accepted_value);
            LOGI("%s: %s adjusted from %s to %s (nearest available)", device_id.c_str(), field_to_string(field),
                 intent->target.c_str(), accepted_value.c_str());
            return make_result(ReconcileResultType::Processed);
        }

        ReconcileResult ReconciliationEngine::on_command_result(const std::string &device_id, const Snapshot &snapshot, uint32_t now)
        {
            auto device = find_device_(device_id);
            if (device == nullptr)
            {
                LOGW("on_command_result: device %s is not registered", device_id.c_str());
                return make_result(ReconcileResultType::UnknownDevice);
            }

            std::lock_guard<std::mutex> lock(device->mutex);

            if (!accept_snapshot(*device, snapshot, SnapshotOrigin::CommandResponse))
                return make_result(ReconcileResultType::Discarded);

            expire_intents(*device, now);

            auto divergences = device->detector.detect(snapshot, device->confirmed);
            auto real = drop_reported(*device, device->policy.filter(divergences, device->ledger, device->confirmed, now));

            for (const auto &divergence : real)
                device->command_time_reported[divergence.field] = divergence.actual;

            ReconcileResult result = make_result(ReconcileResultType::Processed);
            result.events = emit_events(*device, real, now);
            return result;
        }

        ReconcileResult ReconciliationEngine::on_poll(const std::string &device_id, const Snapshot &snapshot, uint32_t now)
        {
            auto device = find_device_(device_id);
            if (device == nullptr)
            {
                LOGW("on_poll: device %s is not registered", device_id.c_str());
                return make_result(ReconcileResultType::UnknownDevice);
            }

            std::lock_guard<std::mutex> lock(device->mutex);

            if (!accept_snapshot(*device, snapshot, SnapshotOrigin::Poll))
                return make_result(ReconcileResultType::Discarded);

            expire_intents(*device, now);

            auto divergences = device->detector.detect(snapshot, device->confirmed);
            auto real = drop_reported(*device, device->policy.filter(divergences, device->ledger, device->confirmed, now));

            ReconcileResult result = make_result(ReconcileResultType::Processed);
            result.events = emit_events(*device, real, now);

            device->confirmed.update(snapshot);

            for (const auto &entry : snapshot.values())
            {
                device->command_time_reported.erase(entry.first);

                auto intent = device->ledger.active_intent(entry.first, now);
                if (intent.has_value() && intent->satisfied_by(entry.second, device->temperature_tolerance))
                {
                    device->ledger.clear(entry.first);
                    if (debug_log_messages)
                        LOGD("%s: %s command to '%s' confirmed (seq %u)", device_id.c_str(), field_to_string(entry.first),
                             intent->target.c_str(), intent->sequence);
                }
            }

            return result;
        }

        std::optional<Snapshot> ReconciliationEngine::current_confirmed_state(const std::string &device_id) const
        {
            auto device = find_device_(device_id);
            if (device == nullptr)
            {
                LOGW("current_confirmed_state: device %s is not registered", device_id.c_str());
                return std::nullopt;
            }

            std::lock_guard<std::mutex> lock(device->mutex);
            return device->confirmed.snapshot();
        }

        std::optional<FieldPhase> ReconciliationEngine::field_phase(const std::string &device_id, Field field, uint32_t now) const
        {
            auto device = find_device_(device_id);
            if (device == nullptr)
                return std::nullopt;

            std::lock_guard<std::mutex> lock(device->mutex);
            return device->ledger.active_intent(field, now).has_value() ? FieldPhase::CommandPending : FieldPhase::Idle;
        }
    } // namespace daikin_override
} // namespace esphome
