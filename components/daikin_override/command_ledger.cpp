#include "command_ledger.h"
#include "util.h"

namespace esphome
{
    namespace daikin_override
    {
        bool CommandIntent::satisfied_by(const std::string &value, float temperature_tolerance) const
        {
            const bool equal = values_equal(field, target, value, temperature_tolerance);
            return match == IntentMatch::AnyOther ? !equal : equal;
        }

        std::string CommandIntent::to_string() const
        {
            std::string str;
            str += "field:" + std::string(field_to_string(field)) + "; ";
            str += "target:" + std::string(match == IntentMatch::AnyOther ? "!" : "") + target + "; ";
            str += "issued_at:" + std::to_string(issued_at) + "; ";
            str += "seq:" + std::to_string(sequence);
            return str;
        }

        CommandLedger::CommandLedger(uint32_t default_window_ms)
            : default_window_ms_(default_window_ms)
        {
        }

        uint32_t CommandLedger::protection_window(Field field) const
        {
            auto it = field_window_ms_.find(field);
            return it != field_window_ms_.end() ? it->second : default_window_ms_;
        }

        const CommandIntent &CommandLedger::record_intent(Field field, const std::string &target, uint32_t now,
                                                          IntentMatch match)
        {
            CommandIntent &intent = intents_[field];
            intent.field = field;
            intent.target = target;
            intent.match = match;
            intent.issued_at = now;
            intent.sequence = ++next_sequence_;
            return intent;
        }

        bool CommandLedger::is_active_(const CommandIntent &intent, uint32_t now) const
        {
            return elapsed_ms(now, intent.issued_at) <= protection_window(intent.field);
        }

        std::optional<CommandIntent> CommandLedger::active_intent(Field field, uint32_t now) const
        {
            auto it = intents_.find(field);
            if (it == intents_.end() || !is_active_(it->second, now))
                return std::nullopt;
            return it->second;
        }

        bool CommandLedger::retarget(Field field, const std::string &target)
        {
            auto it = intents_.find(field);
            if (it == intents_.end())
                return false;
            it->second.target = target;
            it->second.match = IntentMatch::Exact;
            return true;
        }

        bool CommandLedger::clear(Field field)
        {
            return intents_.erase(field) > 0;
        }

        std::vector<CommandIntent> CommandLedger::expire(uint32_t now)
        {
            std::vector<CommandIntent> expired;
            for (auto it = intents_.begin(); it != intents_.end();)
            {
                if (!is_active_(it->second, now))
                {
                    expired.push_back(it->second);
                    it = intents_.erase(it);
                }
                else
                {
                    ++it;
                }
            }
            return expired;
        }
    } // namespace daikin_override
} // namespace esphome
