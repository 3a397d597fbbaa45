#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace esphome
{
    namespace daikin_override
    {
        // Controllable settings tracked by the reconciliation engine.
        // New fields need an enumerator here and a row in the field table (field.cpp).
        enum class Field : uint8_t
        {
            Power = 0,
            TargetTemperature = 1,
            FanRate = 2,
            FanDirection = 3,
            Mode = 4
        };

        enum class CompareRule : uint8_t
        {
            // Normalized discrete codes ("0"/"1", "cool", "auto", ...)
            Exact = 0,
            // Decimal setpoints, equal within the configured tolerance
            Temperature = 1
        };

        enum class CompareResult : uint8_t
        {
            Equal = 0,
            Different = 1,
            // At least one side can't be interpreted under the field's rule (e.g. stemp "--")
            Incomparable = 2
        };

        struct FieldInfo
        {
            Field field;
            const char *name;
            // Key of the field in the raw settings map reported by the device client
            const char *key;
            CompareRule rule;
        };

        const std::vector<FieldInfo> &field_table();

        const FieldInfo *find_field_info(Field field);

        std::optional<Field> field_from_key(const std::string &key);

        const char *field_to_string(Field field);

        CompareResult compare_values(Field field, const std::string &a, const std::string &b, float temperature_tolerance);

        inline bool values_equal(Field field, const std::string &a, const std::string &b, float temperature_tolerance)
        {
            return compare_values(field, a, b, temperature_tolerance) == CompareResult::Equal;
        }
    } // namespace daikin_override
} // namespace esphome
