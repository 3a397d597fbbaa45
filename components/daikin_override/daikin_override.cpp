#include "daikin_override.h"
#include "esphome/core/hal.h"
#include "esphome/core/log.h"

namespace esphome
{
    namespace daikin_override
    {
        static const char *const TAG = "daikin_override";

        static void forward_to_esphome_logger(LogLevel level, const std::string &message)
        {
            switch (level)
            {
            case LogLevel::Error:
                ESP_LOGE(TAG, "%s", message.c_str());
                break;
            case LogLevel::Warn:
                ESP_LOGW(TAG, "%s", message.c_str());
                break;
            case LogLevel::Info:
                ESP_LOGI(TAG, "%s", message.c_str());
                break;
            case LogLevel::Debug:
                ESP_LOGD(TAG, "%s", message.c_str());
                break;
            case LogLevel::Verbose:
            default:
                ESP_LOGV(TAG, "%s", message.c_str());
                break;
            }
        }

        void DaikinOverrideComponent::setup()
        {
            set_log_handler(forward_to_esphome_logger);

            for (const auto &device_id : device_ids_)
                engine_.register_device(device_id, config_);
        }

        void DaikinOverrideComponent::dump_config()
        {
            ESP_LOGCONFIG(TAG, "Daikin override detection:");
            ESP_LOGCONFIG(TAG, "  Protection window: %u ms", config_.default_protection_window_ms);
            for (const auto &entry : config_.field_protection_window_ms)
                ESP_LOGCONFIG(TAG, "    %s: %u ms", field_to_string(entry.first), entry.second);
            ESP_LOGCONFIG(TAG, "  Debounce cooldown: %u ms", config_.debounce_cooldown_ms);
            ESP_LOGCONFIG(TAG, "  Temperature tolerance: %.2f", config_.temperature_tolerance);
            ESP_LOGCONFIG(TAG, "  Temperature step: %.2f", normalizer_.temperature_step());
            for (const auto &device_id : device_ids_)
                ESP_LOGCONFIG(TAG, "  Device: %s", device_id.c_str());
        }

        NormalizeResult DaikinOverrideComponent::normalize_(const std::string &device_id, const RawSettings &settings,
                                                            SnapshotOrigin origin, uint32_t now)
        {
            NormalizeResult normalized = normalizer_.normalize(settings, origin, now);
            for (const auto &key : normalized.unknown_keys)
                ESP_LOGV(TAG, "%s: ignoring unknown setting '%s'", device_id.c_str(), key.c_str());
            for (const auto &key : normalized.invalid_keys)
                ESP_LOGW(TAG, "%s: ignoring unparseable value for '%s'", device_id.c_str(), key.c_str());
            return normalized;
        }

        void DaikinOverrideComponent::command_issued(const std::string &device_id, const RawSettings &settings)
        {
            const uint32_t now = millis();
            auto normalized = normalize_(device_id, settings, SnapshotOrigin::CommandResponse, now);
            publish_(device_id, engine_.on_command_issued(device_id, normalized.snapshot.values(), now));
        }

        void DaikinOverrideComponent::command_adjusted(const std::string &device_id, const std::string &key,
                                                       const std::string &accepted_value)
        {
            const uint32_t now = millis();
            auto normalized = normalize_(device_id, {{key, accepted_value}}, SnapshotOrigin::CommandResponse, now);
            auto field = field_from_key(key);
            if (!field.has_value())
                return;

            auto value = normalized.snapshot.get(field.value());
            if (!value.has_value())
                return;

            publish_(device_id, engine_.on_command_adjusted(device_id, field.value(), value.value(), now));
        }

        void DaikinOverrideComponent::command_result(const std::string &device_id, const RawSettings &settings)
        {
            const uint32_t now = millis();
            auto normalized = normalize_(device_id, settings, SnapshotOrigin::CommandResponse, now);
            publish_(device_id, engine_.on_command_result(device_id, normalized.snapshot, now));
        }

        void DaikinOverrideComponent::poll_result(const std::string &device_id, const RawSettings &settings)
        {
            const uint32_t now = millis();
            auto normalized = normalize_(device_id, settings, SnapshotOrigin::Poll, now);
            publish_(device_id, engine_.on_poll(device_id, normalized.snapshot, now));
        }

        void DaikinOverrideComponent::publish_(const std::string &device_id, const ReconcileResult &result)
        {
            if (result.type == ReconcileResultType::UnknownDevice)
            {
                ESP_LOGE(TAG, "Device %s is not configured under daikin_override devices", device_id.c_str());
                return;
            }
            if (result.type != ReconcileResultType::Processed)
                ESP_LOGV(TAG, "%s: update %s", device_id.c_str(), result_type_to_string(result.type));

            for (const auto &event : result.events)
                this->override_callback_.call(event);
        }
    } // namespace daikin_override
} // namespace esphome
