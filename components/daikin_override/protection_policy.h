#pragma once

#include <cstdint>
#include <vector>
#include "command_ledger.h"
#include "confirmed_state_store.h"
#include "mismatch_detector.h"

namespace esphome
{
    namespace daikin_override
    {
        enum class ProtectionVerdict : uint8_t
        {
            // No command explains the divergence
            Real = 0,
            // The device reports the value we asked for before a poll confirmed it
            CommandInFlight = 1,
            // A command is pending and the device hasn't confirmed it yet; intermediate values are latency
            AwaitingConfirmation = 2,
            // The command had been confirmed already, so a later different value came from someone else
            ChangedAfterConfirmation = 3
        };

        const char *verdict_to_string(ProtectionVerdict verdict);

        inline bool is_suppressed(ProtectionVerdict verdict)
        {
            return verdict == ProtectionVerdict::CommandInFlight || verdict == ProtectionVerdict::AwaitingConfirmation;
        }

        // Decides which divergences are real external changes and which are our own commands still
        // settling on the device. Stateless: everything it needs comes in through the arguments.
        class ProtectionPolicy
        {
        public:
            explicit ProtectionPolicy(float temperature_tolerance = DEFAULT_TEMPERATURE_TOLERANCE);

            ProtectionVerdict evaluate(const Divergence &divergence, const CommandLedger &ledger,
                                       const ConfirmedStateStore &confirmed, uint32_t now) const;

            // Subset of `divergences` to be treated as real, in input order
            std::vector<Divergence> filter(const std::vector<Divergence> &divergences, const CommandLedger &ledger,
                                           const ConfirmedStateStore &confirmed, uint32_t now) const;

        private:
            float temperature_tolerance_;
        };
    } // namespace daikin_override
} // namespace esphome
