#include <cmath>
#include "log.h"
#include "settings_normalizer.h"
#include "util.h"

namespace esphome
{
    namespace daikin_override
    {
        static const std::vector<std::string> MODES{"auto", "cool", "heat", "fan", "dry", "off"};
        static const std::vector<std::string> FAN_RATES{"auto", "quiet", "1", "2", "3", "4", "5"};
        static const std::vector<std::string> FAN_DIRECTIONS{"off", "vertical", "horizontal", "both"};

        static bool is_one_of(const std::string &value, const std::vector<std::string> &allowed)
        {
            for (const auto &item : allowed)
            {
                if (item == value)
                    return true;
            }
            return false;
        }

        SettingsNormalizer::SettingsNormalizer(float temperature_step)
            : temperature_step_(temperature_step > 0.0f ? temperature_step : DEFAULT_TEMPERATURE_STEP)
        {
        }

        std::string SettingsNormalizer::normalize_temperature(const std::string &value) const
        {
            float temp = 0.0f;
            if (!parse_float(value, temp))
                return "";

            float rounded = std::floor(temp / temperature_step_ + 0.5f) * temperature_step_;
            return format_float(rounded);
        }

        NormalizeResult SettingsNormalizer::normalize(const RawSettings &raw, SnapshotOrigin origin, uint32_t timestamp) const
        {
            NormalizeResult result;
            FieldValues values;

            for (const auto &entry : raw)
            {
                auto field = field_from_key(entry.first);
                if (!field.has_value())
                {
                    result.unknown_keys.push_back(entry.first);
                    continue;
                }

                std::string value = to_lower(entry.second);
                switch (field.value())
                {
                case Field::Power:
                    if (value != "0" && value != "1")
                        value.clear();
                    break;

                case Field::TargetTemperature:
                    // Units report "--" while off or in modes without a setpoint
                    if (value == "--" || value.empty())
                        continue;
                    value = normalize_temperature(value);
                    break;

                case Field::FanRate:
                    if (!is_one_of(value, FAN_RATES))
                        value.clear();
                    break;

                case Field::FanDirection:
                    if (value == "3d")
                        value = "both";
                    if (!is_one_of(value, FAN_DIRECTIONS))
                        value.clear();
                    break;

                case Field::Mode:
                    if (!is_one_of(value, MODES))
                        value.clear();
                    break;

                default:
                    value.clear();
                    break;
                }

                if (value.empty())
                {
                    result.invalid_keys.push_back(entry.first);
                    continue;
                }
                values[field.value()] = value;
            }

            // Power and mode describe the same switch: "off" is a mode on the device side
            auto power = values.find(Field::Power);
            auto mode = values.find(Field::Mode);
            if (mode != values.end() && mode->second == "off")
            {
                values[Field::Power] = "0";
            }
            else if (power != values.end() && power->second == "0")
            {
                values[Field::Mode] = "off";
            }
            else if (power == values.end() && mode != values.end())
            {
                values[Field::Power] = "1";
            }

            if (debug_log_messages && (!result.unknown_keys.empty() || !result.invalid_keys.empty()))
                LOGD("Normalized %zu settings: %zu unknown, %zu invalid", raw.size(), result.unknown_keys.size(),
                     result.invalid_keys.size());

            result.snapshot = Snapshot(std::move(values), timestamp, origin);
            return result;
        }
    } // namespace daikin_override
} // namespace esphome
