#pragma once

#include <cstdint>
#include <map>
#include "override_classifier.h"
#include "reconcile_config.h"

namespace esphome
{
    namespace daikin_override
    {
        // Drops repeats of a category inside the cooldown that follows its last emitted event.
        // Categories never suppress each other.
        class Debouncer
        {
        public:
            explicit Debouncer(uint32_t cooldown_ms = DEFAULT_DEBOUNCE_COOLDOWN_MS);

            bool admit(const OverrideEvent &event, uint32_t now);

            void reset() { last_emitted_.clear(); }
            uint32_t cooldown() const { return cooldown_ms_; }

        private:
            uint32_t cooldown_ms_;
            std::map<OverrideCategory, uint32_t> last_emitted_;
        };
    } // namespace daikin_override
} // namespace esphome
