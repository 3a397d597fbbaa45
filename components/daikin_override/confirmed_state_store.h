#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "snapshot.h"

namespace esphome
{
    namespace daikin_override
    {
        // Last poll-confirmed value per field. Command responses never reach this store.
        class ConfirmedStateStore
        {
        public:
            // Merges a poll snapshot: fields it carries replace the stored values, missing fields keep
            // theirs. Returns false (and changes nothing) for any other origin.
            bool update(const Snapshot &snapshot);

            std::optional<std::string> read(Field field) const;

            bool empty() const { return values_.empty(); }
            bool has_update() const { return has_update_; }
            uint32_t last_update() const { return last_update_ms_; }

            // Stored values as a poll-origin snapshot stamped with the last confirming poll
            Snapshot snapshot() const;

        private:
            FieldValues values_;
            uint32_t last_update_ms_ = 0;
            bool has_update_ = false;
        };
    } // namespace daikin_override
} // namespace esphome
