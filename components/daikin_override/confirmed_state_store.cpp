#include "confirmed_state_store.h"

namespace esphome
{
    namespace daikin_override
    {
        bool ConfirmedStateStore::update(const Snapshot &snapshot)
        {
            if (snapshot.origin() != SnapshotOrigin::Poll)
                return false;

            for (const auto &entry : snapshot.values())
            {
                values_[entry.first] = entry.second;
            }
            last_update_ms_ = snapshot.timestamp();
            has_update_ = true;
            return true;
        }

        std::optional<std::string> ConfirmedStateStore::read(Field field) const
        {
            auto it = values_.find(field);
            if (it == values_.end())
                return std::nullopt;
            return it->second;
        }

        Snapshot ConfirmedStateStore::snapshot() const
        {
            return Snapshot(values_, last_update_ms_, SnapshotOrigin::Poll);
        }
    } // namespace daikin_override
} // namespace esphome
