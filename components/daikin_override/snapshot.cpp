#include "snapshot.h"

namespace esphome
{
    namespace daikin_override
    {
        Snapshot::Snapshot(FieldValues values, uint32_t timestamp, SnapshotOrigin origin)
            : values_(std::move(values)), timestamp_(timestamp), origin_(origin)
        {
        }

        std::optional<std::string> Snapshot::get(Field field) const
        {
            auto it = values_.find(field);
            if (it == values_.end())
                return std::nullopt;
            return it->second;
        }

        std::string Snapshot::to_string() const
        {
            std::string str;
            str += "{";
            str += "origin:" + std::string(origin_to_string(origin_)) + ";";
            str += "t:" + std::to_string(timestamp_) + ";";
            for (const auto &entry : values_)
            {
                str += std::string(field_to_string(entry.first)) + ":" + entry.second + ";";
            }
            str += "}";
            return str;
        }

        const char *origin_to_string(SnapshotOrigin origin)
        {
            switch (origin)
            {
            case SnapshotOrigin::Poll:
                return "poll";
            case SnapshotOrigin::CommandResponse:
                return "command-response";
            default:
                return "unknown";
            }
        }
    } // namespace daikin_override
} // namespace esphome
