#pragma once

#include <cstdint>
#include <map>
#include "field.h"

namespace esphome
{
    namespace daikin_override
    {
        // Roughly 2-3x the polling interval of the integration (10-15s)
        constexpr uint32_t DEFAULT_PROTECTION_WINDOW_MS = 30000;
        // Absorbs the poll and command-time paths reporting the same physical action
        constexpr uint32_t DEFAULT_DEBOUNCE_COOLDOWN_MS = 5000;
        // Setpoint differences below this are rounding noise; half of the coarsest device step
        constexpr float DEFAULT_TEMPERATURE_TOLERANCE = 0.5f;

        struct ReconcileConfig
        {
            uint32_t default_protection_window_ms = DEFAULT_PROTECTION_WINDOW_MS;
            // Per-field overrides; device generations confirm some settings slower than others
            std::map<Field, uint32_t> field_protection_window_ms;
            uint32_t debounce_cooldown_ms = DEFAULT_DEBOUNCE_COOLDOWN_MS;
            float temperature_tolerance = DEFAULT_TEMPERATURE_TOLERANCE;

            void set_protection_window(Field field, uint32_t window_ms)
            {
                field_protection_window_ms[field] = window_ms;
            }
        };
    } // namespace daikin_override
} // namespace esphome
