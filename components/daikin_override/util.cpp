#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cmath>
#include "util.h"

namespace esphome
{
    namespace daikin_override
    {
        uint32_t elapsed_ms(uint32_t now, uint32_t since)
        {
            // Unsigned subtraction is modulo 2^32, so a wrapped `now` still yields the real distance
            return now - since;
        }

        bool is_before(uint32_t a, uint32_t b)
        {
            return static_cast<int32_t>(b - a) > 0;
        }

        bool parse_float(const std::string &value, float &out)
        {
            if (value.empty())
                return false;

            const char *begin = value.c_str();
            char *end = nullptr;
            float parsed = std::strtof(begin, &end);
            if (end == begin)
                return false;

            while (*end != '\0' && std::isspace(static_cast<unsigned char>(*end)))
                end++;
            if (*end != '\0')
                return false;

            if (std::isnan(parsed) || std::isinf(parsed))
                return false;

            out = parsed;
            return true;
        }

        std::string format_float(float value)
        {
            char buffer[32];
            snprintf(buffer, sizeof(buffer), "%.1f", value);
            std::string str(buffer);
            if (str.size() > 2 && str.compare(str.size() - 2, 2, ".0") == 0)
                str.resize(str.size() - 2);
            if (str == "-0")
                str = "0";
            return str;
        }

        std::string to_lower(const std::string &value)
        {
            std::string str = value;
            for (auto &c : str)
                c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            return str;
        }
    } // namespace daikin_override
} // namespace esphome
