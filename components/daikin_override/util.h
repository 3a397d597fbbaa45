#pragma once

#include <cstdint>
#include <string>

namespace esphome
{
    namespace daikin_override
    {
        // Milliseconds from `since` to `now`, correct across the 32-bit millis() wraparound (~49.7 days)
        uint32_t elapsed_ms(uint32_t now, uint32_t since);

        // True when `a` lies before `b` on the wrapping millisecond clock
        bool is_before(uint32_t a, uint32_t b);

        // Parses the whole string as a float; false on empty input or trailing garbage
        bool parse_float(const std::string &value, float &out);

        // Shortest decimal form with at most one fractional digit: 24.0 -> "24", 23.5 -> "23.5"
        std::string format_float(float value);

        std::string to_lower(const std::string &value);
    } // namespace daikin_override
} // namespace esphome
