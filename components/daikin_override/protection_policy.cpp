#include "log.h"
#include "protection_policy.h"

namespace esphome
{
    namespace daikin_override
    {
        const char *verdict_to_string(ProtectionVerdict verdict)
        {
            switch (verdict)
            {
            case ProtectionVerdict::Real:
                return "real";
            case ProtectionVerdict::CommandInFlight:
                return "command in flight";
            case ProtectionVerdict::AwaitingConfirmation:
                return "awaiting confirmation";
            case ProtectionVerdict::ChangedAfterConfirmation:
                return "changed after confirmation";
            default:
                return "unknown";
            }
        }

        ProtectionPolicy::ProtectionPolicy(float temperature_tolerance)
            : temperature_tolerance_(temperature_tolerance)
        {
        }

        ProtectionVerdict ProtectionPolicy::evaluate(const Divergence &divergence, const CommandLedger &ledger,
                                                     const ConfirmedStateStore &confirmed, uint32_t now) const
        {
            auto intent = ledger.active_intent(divergence.field, now);
            if (!intent.has_value())
                return ProtectionVerdict::Real;

            // The device moved to the value we asked for; a later poll will confirm it
            if (intent->satisfied_by(divergence.actual, temperature_tolerance_))
                return ProtectionVerdict::CommandInFlight;

            auto confirmed_value = confirmed.read(divergence.field);
            if (confirmed_value.has_value() && intent->satisfied_by(confirmed_value.value(), temperature_tolerance_))
                return ProtectionVerdict::ChangedAfterConfirmation;

            // Only skip detection while the device hasn't confirmed our command yet
            return ProtectionVerdict::AwaitingConfirmation;
        }

        std::vector<Divergence> ProtectionPolicy::filter(const std::vector<Divergence> &divergences, const CommandLedger &ledger,
                                                         const ConfirmedStateStore &confirmed, uint32_t now) const
        {
            std::vector<Divergence> real;
            for (const auto &divergence : divergences)
            {
                ProtectionVerdict verdict = evaluate(divergence, ledger, confirmed, now);
                if (is_suppressed(verdict))
                {
                    if (debug_log_messages)
                        LOGD("Suppressed %s: %s", divergence.to_string().c_str(), verdict_to_string(verdict));
                    continue;
                }

                if (debug_log_messages && verdict == ProtectionVerdict::ChangedAfterConfirmation)
                    LOGD("Divergence %s despite pending command: %s", divergence.to_string().c_str(), verdict_to_string(verdict));

                real.push_back(divergence);
            }
            return real;
        }
    } // namespace daikin_override
} // namespace esphome
