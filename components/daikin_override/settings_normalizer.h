#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "snapshot.h"

namespace esphome
{
    namespace daikin_override
    {
        using RawSettings = std::map<std::string, std::string>;

        constexpr float DEFAULT_TEMPERATURE_STEP = 1.0f;

        struct NormalizeResult
        {
            Snapshot snapshot;
            // Keys outside the field table; for the caller to log, never an error
            std::vector<std::string> unknown_keys;
            // Known keys whose value couldn't be normalized; the field is left out of the snapshot
            std::vector<std::string> invalid_keys;
        };

        // Converts the settings map a device client reports (pow, mode, stemp, f_rate, f_dir) into the
        // normalized snapshot the engine consumes
        class SettingsNormalizer
        {
        public:
            explicit SettingsNormalizer(float temperature_step = DEFAULT_TEMPERATURE_STEP);

            NormalizeResult normalize(const RawSettings &raw, SnapshotOrigin origin, uint32_t timestamp) const;

            // Rounds half-up to the step and formats ("23.5" -> "24" with step 1.0). Empty on placeholders like "--".
            std::string normalize_temperature(const std::string &value) const;

            float temperature_step() const { return temperature_step_; }

        private:
            float temperature_step_;
        };
    } // namespace daikin_override
} // namespace esphome
