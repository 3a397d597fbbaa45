#pragma once

#include <functional>
#include <string>
#include <vector>
#include "esphome/core/automation.h"
#include "esphome/core/component.h"
#include "esphome/core/helpers.h"
#include "log.h"
#include "reconciliation_engine.h"
#include "settings_normalizer.h"

namespace esphome
{
    namespace daikin_override
    {
        // Hosts the reconciliation engine in firmware. Device clients (lambdas or other components) report
        // commands and poll results here; detected overrides fire the on_override automation.
        class DaikinOverrideComponent : public Component
        {
        public:
            void setup() override;
            void dump_config() override;
            float get_setup_priority() const override { return setup_priority::DATA; }

            void add_device(const std::string &device_id) { device_ids_.push_back(device_id); }
            void set_protection_window(uint32_t window_ms) { config_.default_protection_window_ms = window_ms; }
            void set_field_protection_window(Field field, uint32_t window_ms) { config_.set_protection_window(field, window_ms); }
            void set_debounce_cooldown(uint32_t cooldown_ms) { config_.debounce_cooldown_ms = cooldown_ms; }
            void set_temperature_tolerance(float tolerance) { config_.temperature_tolerance = tolerance; }
            void set_temperature_step(float step) { normalizer_ = SettingsNormalizer(step); }
            void set_debug_log_messages(bool value) { debug_log_messages = value; }

            void command_issued(const std::string &device_id, const RawSettings &settings);
            void command_adjusted(const std::string &device_id, const std::string &key, const std::string &accepted_value);
            void command_result(const std::string &device_id, const RawSettings &settings);
            void poll_result(const std::string &device_id, const RawSettings &settings);

            void add_on_override_callback(std::function<void(const OverrideEvent &)> &&callback)
            {
                this->override_callback_.add(std::move(callback));
            }

            ReconciliationEngine &engine() { return engine_; }

        protected:
            NormalizeResult normalize_(const std::string &device_id, const RawSettings &settings, SnapshotOrigin origin, uint32_t now);
            void publish_(const std::string &device_id, const ReconcileResult &result);

            ReconciliationEngine engine_;
            ReconcileConfig config_;
            SettingsNormalizer normalizer_;
            std::vector<std::string> device_ids_;
            CallbackManager<void(const OverrideEvent &)> override_callback_;
        };

        class OverrideTrigger : public Trigger<std::string, std::string, std::string>
        {
        public:
            explicit OverrideTrigger(DaikinOverrideComponent *parent)
            {
                parent->add_on_override_callback([this](const OverrideEvent &event)
                                                 { this->trigger(event.device_id, category_to_string(event.category), event.to_string()); });
            }
        };
    } // namespace daikin_override
} // namespace esphome
