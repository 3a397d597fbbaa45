#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "confirmed_state_store.h"
#include "reconcile_config.h"
#include "snapshot.h"

namespace esphome
{
    namespace daikin_override
    {
        enum class DivergenceSource : uint8_t
        {
            Poll = 0,
            CommandTime = 1
        };

        struct Divergence
        {
            Field field = Field::Power;
            // Confirmed value
            std::string expected;
            // Value in the incoming snapshot
            std::string actual;
            DivergenceSource source = DivergenceSource::Poll;

            std::string to_string() const;
        };

        const char *source_to_string(DivergenceSource source);

        DivergenceSource source_for_origin(SnapshotOrigin origin);

        class MismatchDetector
        {
        public:
            explicit MismatchDetector(float temperature_tolerance = DEFAULT_TEMPERATURE_TOLERANCE);

            // One divergence per field present in both the snapshot and the confirmed state whose values
            // differ under the field's comparison rule. Fields never polled can't diverge.
            std::vector<Divergence> detect(const Snapshot &snapshot, const ConfirmedStateStore &confirmed) const;

        private:
            float temperature_tolerance_;
        };
    } // namespace daikin_override
} // namespace esphome
