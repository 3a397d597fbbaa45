#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include "field.h"

namespace esphome
{
    namespace daikin_override
    {
        enum class SnapshotOrigin : uint8_t
        {
            Poll = 0,
            CommandResponse = 1
        };

        using FieldValues = std::map<Field, std::string>;

        // Normalized field values observed at one instant. Never modified after construction.
        class Snapshot
        {
        public:
            Snapshot() = default;
            Snapshot(FieldValues values, uint32_t timestamp, SnapshotOrigin origin);

            std::optional<std::string> get(Field field) const;
            bool has(Field field) const { return values_.find(field) != values_.end(); }
            bool empty() const { return values_.empty(); }

            const FieldValues &values() const { return values_; }
            uint32_t timestamp() const { return timestamp_; }
            SnapshotOrigin origin() const { return origin_; }

            std::string to_string() const;

        private:
            FieldValues values_;
            uint32_t timestamp_ = 0;
            SnapshotOrigin origin_ = SnapshotOrigin::Poll;
        };

        const char *origin_to_string(SnapshotOrigin origin);
    } // namespace daikin_override
} // namespace esphome
