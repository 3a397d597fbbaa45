#include <algorithm>
#include "override_classifier.h"

namespace esphome
{
    namespace daikin_override
    {
        const char *category_to_string(OverrideCategory category)
        {
            switch (category)
            {
            case OverrideCategory::Power:
                return "power";
            case OverrideCategory::Temperature:
                return "temperature";
            case OverrideCategory::FanRate:
                return "fan";
            case OverrideCategory::FanDirection:
                return "swing";
            case OverrideCategory::Mode:
                return "mode";
            case OverrideCategory::Combined:
                return "combined";
            default:
                return "unknown";
            }
        }

        std::string OverrideEvent::to_string() const
        {
            std::string str;
            str += "device:" + device_id + "; ";
            str += "category:" + std::string(category_to_string(category)) + "; ";
            str += "t:" + std::to_string(timestamp) + "; ";
            str += "changes:[";
            for (size_t i = 0; i < divergences.size(); i++)
            {
                if (i > 0)
                    str += ", ";
                str += divergences[i].to_string();
            }
            str += "]";
            return str;
        }

        const std::vector<CategoryRule> &OverrideClassifier::priority_table()
        {
            // Power flips mean somebody switched the unit on/off; nothing may mask that
            static const std::vector<CategoryRule> table{
                {Field::Power, OverrideCategory::Power, true},
                {Field::TargetTemperature, OverrideCategory::Temperature, false},
                {Field::FanRate, OverrideCategory::FanRate, false},
                {Field::FanDirection, OverrideCategory::FanDirection, false},
                {Field::Mode, OverrideCategory::Mode, false},
            };
            return table;
        }

        static size_t priority_of(Field field)
        {
            const auto &table = OverrideClassifier::priority_table();
            for (size_t i = 0; i < table.size(); i++)
            {
                if (table[i].field == field)
                    return i;
            }
            return table.size();
        }

        static bool contains_field(const std::vector<Divergence> &divergences, Field field)
        {
            return std::any_of(divergences.begin(), divergences.end(),
                               [field](const Divergence &divergence)
                               { return divergence.field == field; });
        }

        std::optional<OverrideCategory> OverrideClassifier::classify(const std::vector<Divergence> &divergences) const
        {
            if (divergences.empty())
                return std::nullopt;

            std::optional<OverrideCategory> first;
            size_t matched = 0;
            for (const auto &rule : priority_table())
            {
                if (!contains_field(divergences, rule.field))
                    continue;

                if (rule.dominant)
                    return rule.category;

                if (!first.has_value())
                    first = rule.category;
                matched++;
            }

            if (matched > 1)
                return OverrideCategory::Combined;
            if (first.has_value())
                return first;

            // Only fields without a table row diverged
            return OverrideCategory::Combined;
        }

        std::optional<OverrideEvent> OverrideClassifier::build_event(const std::string &device_id,
                                                                     const std::vector<Divergence> &divergences,
                                                                     uint32_t now) const
        {
            auto category = classify(divergences);
            if (!category.has_value())
                return std::nullopt;

            OverrideEvent event;
            event.device_id = device_id;
            event.category = category.value();
            event.timestamp = now;
            event.divergences = divergences;
            std::stable_sort(event.divergences.begin(), event.divergences.end(),
                             [](const Divergence &a, const Divergence &b)
                             { return priority_of(a.field) < priority_of(b.field); });
            return event;
        }
    } // namespace daikin_override
} // namespace esphome
