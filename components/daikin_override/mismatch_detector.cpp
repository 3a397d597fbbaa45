#include "log.h"
#include "mismatch_detector.h"

namespace esphome
{
    namespace daikin_override
    {
        std::string Divergence::to_string() const
        {
            std::string str;
            str += std::string(field_to_string(field)) + ":";
            str += expected + "->" + actual;
            str += " (" + std::string(source_to_string(source)) + ")";
            return str;
        }

        const char *source_to_string(DivergenceSource source)
        {
            switch (source)
            {
            case DivergenceSource::Poll:
                return "poll";
            case DivergenceSource::CommandTime:
                return "command-time";
            default:
                return "unknown";
            }
        }

        DivergenceSource source_for_origin(SnapshotOrigin origin)
        {
            return origin == SnapshotOrigin::CommandResponse ? DivergenceSource::CommandTime : DivergenceSource::Poll;
        }

        MismatchDetector::MismatchDetector(float temperature_tolerance)
            : temperature_tolerance_(temperature_tolerance)
        {
        }

        std::vector<Divergence> MismatchDetector::detect(const Snapshot &snapshot, const ConfirmedStateStore &confirmed) const
        {
            std::vector<Divergence> divergences;
            const DivergenceSource source = source_for_origin(snapshot.origin());

            for (const auto &entry : snapshot.values())
            {
                auto expected = confirmed.read(entry.first);
                if (!expected.has_value())
                    continue;

                switch (compare_values(entry.first, expected.value(), entry.second, temperature_tolerance_))
                {
                case CompareResult::Equal:
                    break;

                case CompareResult::Different:
                {
                    Divergence divergence;
                    divergence.field = entry.first;
                    divergence.expected = expected.value();
                    divergence.actual = entry.second;
                    divergence.source = source;
                    divergences.push_back(std::move(divergence));
                    break;
                }

                case CompareResult::Incomparable:
                default:
                    // Skipped for this pass only; the next poll gets another chance
                    LOGW("Can't compare %s: confirmed '%s' vs observed '%s', skipping field",
                         field_to_string(entry.first), expected.value().c_str(), entry.second.c_str());
                    break;
                }
            }

            return divergences;
        }
    } // namespace daikin_override
} // namespace esphome
