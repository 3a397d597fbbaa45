#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "mismatch_detector.h"

namespace esphome
{
    namespace daikin_override
    {
        enum class OverrideCategory : uint8_t
        {
            Power = 0,
            Temperature = 1,
            FanRate = 2,
            FanDirection = 3,
            Mode = 4,
            // More than one non-power field changed at once
            Combined = 5
        };

        const char *category_to_string(OverrideCategory category);

        struct OverrideEvent
        {
            std::string device_id;
            OverrideCategory category = OverrideCategory::Combined;
            // Every real divergence of the pass, highest priority field first
            std::vector<Divergence> divergences;
            uint32_t timestamp = 0;

            std::string to_string() const;
        };

        struct CategoryRule
        {
            Field field;
            OverrideCategory category;
            // A dominant field decides the category on its own, whatever else changed with it
            bool dominant;
        };

        class OverrideClassifier
        {
        public:
            // Ordered from highest to lowest priority
            static const std::vector<CategoryRule> &priority_table();

            // nullopt for an empty set
            std::optional<OverrideCategory> classify(const std::vector<Divergence> &divergences) const;

            std::optional<OverrideEvent> build_event(const std::string &device_id, const std::vector<Divergence> &divergences,
                                                     uint32_t now) const;
        };
    } // namespace daikin_override
} // namespace esphome
