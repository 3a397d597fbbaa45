#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "field.h"
#include "reconcile_config.h"

namespace esphome
{
    namespace daikin_override
    {
        enum class IntentMatch : uint8_t
        {
            // Satisfied by the target value
            Exact = 0,
            // Satisfied by any value except the target (power on without a mode leaves the mode to the unit)
            AnyOther = 1
        };

        struct CommandIntent
        {
            Field field = Field::Power;
            std::string target;
            IntentMatch match = IntentMatch::Exact;
            uint32_t issued_at = 0;
            // Increases with every recorded intent of the ledger, so a superseding command is distinguishable
            // from the one it replaced even when both carry the same target
            uint32_t sequence = 0;

            bool satisfied_by(const std::string &value, float temperature_tolerance) const;
            std::string to_string() const;
        };

        // Most recent command per field. At most one intent per field; a newer command replaces it.
        class CommandLedger
        {
        public:
            explicit CommandLedger(uint32_t default_window_ms = DEFAULT_PROTECTION_WINDOW_MS);

            void set_protection_window(Field field, uint32_t window_ms) { field_window_ms_[field] = window_ms; }
            uint32_t protection_window(Field field) const;

            // Creates or replaces the intent for `field`, restarting its protection window at `now`
            const CommandIntent &record_intent(Field field, const std::string &target, uint32_t now,
                                               IntentMatch match = IntentMatch::Exact);

            // The intent for `field` while `now - issued_at` is within the field's protection window
            std::optional<CommandIntent> active_intent(Field field, uint32_t now) const;

            // Replaces the target of the stored intent with an exact one, keeping its issue time. False when no
            // intent is stored.
            bool retarget(Field field, const std::string &target);

            bool clear(Field field);

            // Drops every intent whose window has elapsed and returns them
            std::vector<CommandIntent> expire(uint32_t now);

            bool has_intent(Field field) const { return intents_.find(field) != intents_.end(); }
            size_t size() const { return intents_.size(); }

        private:
            bool is_active_(const CommandIntent &intent, uint32_t now) const;

            std::map<Field, CommandIntent> intents_;
            std::map<Field, uint32_t> field_window_ms_;
            uint32_t default_window_ms_;
            uint32_t next_sequence_ = 0;
        };
    } // namespace daikin_override
} // namespace esphome
