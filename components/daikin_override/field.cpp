#include <algorithm>
#include <cmath>
#include "field.h"
#include "util.h"

namespace esphome
{
    namespace daikin_override
    {
        // Parsing noise, used when the configured tolerance is zero
        static constexpr float MIN_TEMPERATURE_DIFFERENCE = 0.01f;

        const std::vector<FieldInfo> &field_table()
        {
            static const std::vector<FieldInfo> table{
                {Field::Power, "power", "pow", CompareRule::Exact},
                {Field::TargetTemperature, "target_temperature", "stemp", CompareRule::Temperature},
                {Field::FanRate, "fan_rate", "f_rate", CompareRule::Exact},
                {Field::FanDirection, "fan_direction", "f_dir", CompareRule::Exact},
                {Field::Mode, "mode", "mode", CompareRule::Exact},
            };
            return table;
        }

        const FieldInfo *find_field_info(Field field)
        {
            for (const auto &info : field_table())
            {
                if (info.field == field)
                    return &info;
            }
            return nullptr;
        }

        std::optional<Field> field_from_key(const std::string &key)
        {
            for (const auto &info : field_table())
            {
                if (key == info.key)
                    return info.field;
            }
            return std::nullopt;
        }

        const char *field_to_string(Field field)
        {
            const FieldInfo *info = find_field_info(field);
            return info != nullptr ? info->name : "unknown";
        }

        CompareResult compare_values(Field field, const std::string &a, const std::string &b, float temperature_tolerance)
        {
            const FieldInfo *info = find_field_info(field);
            if (info == nullptr)
                return CompareResult::Incomparable;

            switch (info->rule)
            {
            case CompareRule::Exact:
                return a == b ? CompareResult::Equal : CompareResult::Different;

            case CompareRule::Temperature:
            {
                if (a == b)
                    return CompareResult::Equal;

                float fa = 0.0f;
                float fb = 0.0f;
                if (!parse_float(a, fa) || !parse_float(b, fb))
                    return CompareResult::Incomparable;

                // Strictly below the tolerance, so a half-degree step on a 0.5 unit is a change
                const float limit = std::max(temperature_tolerance, MIN_TEMPERATURE_DIFFERENCE);
                return std::fabs(fa - fb) < limit ? CompareResult::Equal : CompareResult::Different;
            }

            default:
                return CompareResult::Incomparable;
            }
        }
    } // namespace daikin_override
} // namespace esphome
