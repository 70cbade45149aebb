#pragma once

#include "compile_runner.hpp"
#include "config_loader.hpp"
#include "scoring_pipeline.hpp"
#include "types.hpp"

#include <memory>
#include <optional>
#include <string>

namespace codeact::rust {

/**
 * \brief Builds the standard scoring chain: safety penalty, then quality bonuses.
 */
[[nodiscard]] ScoringPipeline make_default_pipeline(const EnvironmentConfig& config);

/**
 * \brief Builds a rustc-backed toolchain from the configured compiler and edition.
 */
[[nodiscard]] std::shared_ptr<const Toolchain> make_rustc_toolchain(const EnvironmentConfig& config);

/**
 * \brief Per-episode driver: compiles and tests Rust actions and scores them.
 *
 * Lifecycle: a freshly constructed environment is uninitialised; reset()
 * makes it ready and every step() keeps it ready. There is no terminal state,
 * episode length is decided by the caller.
 *
 * step() runs synchronously: at most two compiler invocations and one binary
 * run per call, each under its own timeout. An instance is not safe for
 * concurrent use; callers must serialise steps per instance.
 */
class RustCodingEnv {
public:
    explicit RustCodingEnv(EnvironmentConfig config = {});
    RustCodingEnv(EnvironmentConfig config, std::shared_ptr<const Toolchain> toolchain);

    /**
     * \brief Starts a new episode.
     *
     * Recreates the compile runner and scoring pipeline, assigns a fresh
     * episode id and zeroes all counters. The returned neutral observation
     * (compiles, no tests, empty code metadata) has been through the pipeline.
     */
    RustObservation reset();

    /**
     * \brief Compiles, optionally tests, and scores one action.
     *
     * Throws std::invalid_argument when \a action is not a RustAction and
     * std::logic_error when called before reset(). Compile errors, crashes and
     * timeouts of the submitted code are reported in the observation.
     */
    RustObservation step(const Action& action);

    [[nodiscard]] const EpisodeState& state() const noexcept { return state_; }
    [[nodiscard]] bool ready() const noexcept { return runner_.has_value(); }
    [[nodiscard]] const EnvironmentConfig& config() const noexcept { return config_; }

    /// Problems met while persisting the latest step's artifacts (empty when none).
    [[nodiscard]] const std::string& diagnostics() const noexcept { return diag_; }

private:
    struct StepSources {
        std::string core_program;
        std::optional<std::string> test_program;
    };

    void persist_step(const StepSources& sources, const RustObservation& observation);

    EnvironmentConfig config_;
    std::shared_ptr<const Toolchain> toolchain_;
    std::optional<CompileRunner> runner_;
    ScoringPipeline pipeline_;
    EpisodeState state_;
    std::string diag_;
};

}  // namespace codeact::rust
