#include "debouncer.h"
#include "util.h"

namespace esphome
{
    namespace daikin_override
    {
        Debouncer::Debouncer(uint32_t cooldown_ms)
            : cooldown_ms_(cooldown_ms)
        {
        }

        bool Debouncer::admit(const OverrideEvent &event, uint32_t now)
        {
            auto it = last_emitted_.find(event.category);
            if (it != last_emitted_.end() && elapsed_ms(now, it->second) < cooldown_ms_)
                return false;

            // Cooldown runs from the last emitted event, suppressed repeats don't extend it
            last_emitted_[event.category] = now;
            return true;
        }
    } // namespace daikin_override
} // namespace esphome
