#pragma once

#include "types.hpp"

#include <filesystem>
#include <vector>

namespace codeact::rust {

/**
 * \brief One executed step: the submitted action and the scored observation.
 */
struct StepRecord {
    RustAction action;
    RustObservation observation;
};

/**
 * \brief Emits machine-readable and human-friendly reports for an episode.
 *
 * - write_summary(): JSON document with the final episode state, per-step
 *   observations and aggregate counts (true sums over the episode).
 * - write_detailed(): HTML report with a tabular view of the steps.
 */
class EpisodeReportWriter {
public:
    EpisodeReportWriter() = default;

    void write_summary(const std::filesystem::path& destination,
                       const EpisodeState& state,
                       const std::vector<StepRecord>& steps) const;

    void write_detailed(const std::filesystem::path& destination,
                        const EpisodeState& state,
                        const std::vector<StepRecord>& steps) const;
};

}  // namespace codeact::rust
