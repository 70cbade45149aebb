#pragma once

#include <map>
#include <string>
#include <utility>

namespace codeact::rust {

/**
 * \brief Captured outcome of one compiler invocation or one binary run.
 *
 * Timeouts and spawn failures are folded into this shape as well, so callers
 * never have to distinguish them from an ordinary non-zero exit.
 */
struct ExecutionResult {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code{0};
};

/**
 * \brief (passed, failed) counts extracted from a test run.
 */
struct TestSummary {
    int passed{0};
    int failed{0};

    friend bool operator==(const TestSummary&, const TestSummary&) = default;
};

using Metadata = std::map<std::string, std::string>;

// Metadata keys shared by the environment and the scoring transforms.
inline constexpr const char* kCoreCodeKey = "core_code";
inline constexpr const char* kTestCodeKey = "test_code";
inline constexpr const char* kLastCodeKey = "last_code";
inline constexpr const char* kSafetyViolationKey = "safety_violation";

/**
 * \brief Generic environment action. Concrete environments derive from it.
 */
struct Action {
    virtual ~Action() = default;

    Metadata metadata;
};

/**
 * \brief Rust code to compile, optionally with test statements.
 */
struct RustAction : Action {
    RustAction() = default;
    explicit RustAction(std::string core, std::string tests = {})
        : core_code{std::move(core)}, test_code{std::move(tests)} {}

    std::string core_code;
    std::string test_code;
};

/**
 * \brief Generic environment observation carrying reward and metadata.
 */
struct Observation {
    virtual ~Observation() = default;

    bool done{false};
    double reward{0.0};
    Metadata metadata;
};

/**
 * \brief Result of compiling and executing one RustAction.
 */
struct RustObservation : Observation {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code{0};
    int tests_passed{0};
    int tests_failed{0};
    bool code_compiles{false};
};

/**
 * \brief Per-episode bookkeeping owned by the environment.
 *
 * NOTE: total_tests_passed / total_tests_failed carry the values of the most
 * recent step only. They are overwritten on every step, not summed over the
 * episode.
 */
struct EpisodeState {
    std::string episode_id;
    int step_count{0};
    int last_exit_code{0};
    bool last_code_compiles{false};
    int total_tests_passed{0};
    int total_tests_failed{0};
};

}  // namespace codeact::rust
