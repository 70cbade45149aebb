#pragma once

#include "types.hpp"

#include <limits>
#include <string_view>

namespace codeact::rust {

/**
 * \brief Extracts (passed, failed) counts from a test binary's output.
 *
 * stdout and stderr are joined with a newline and searched for, in order:
 *   1. the libtest report line `test result: <ok|FAILED>. N passed; M failed`
 *   2. the looser `N passed; M failed`
 * The stricter pattern wins whenever both would match. Text matching neither
 * yields (0, 0). Any change in the toolchain's report wording must be
 * reflected here.
 */
[[nodiscard]] TestSummary parse_test_summary(std::string_view stdout_text,
                                             std::string_view stderr_text);

/**
 * \brief Single-buffer overload of parse_test_summary().
 */
[[nodiscard]] TestSummary parse_test_summary(std::string_view combined_output);

/**
 * \brief Forces an unparsed abnormal exit to count as one failure.
 *
 * A non-zero \a exit_code with an empty (0, 0) summary becomes (0, 1); every
 * other input is returned unchanged.
 */
[[nodiscard]] TestSummary apply_exit_status(TestSummary summary, int exit_code) noexcept;

/// Reward assigned to code that does not compile.
inline constexpr int kCompileFailureReward = -3;

/**
 * \brief Base reward before the scoring pipeline runs.
 *
 * - not compiling: kCompileFailureReward
 * - otherwise: 1 + 3 * passed - failed, plus 2 when passed > 0 and failed == 0
 *
 * Counts come from untrusted output and may sit at INT_MAX; the sum is taken
 * in 64 bits and clamped to the int range.
 */
[[nodiscard]] constexpr int calculate_reward(bool compiles, int passed, int failed) noexcept {
    if (!compiles) {
        return kCompileFailureReward;
    }
    long long reward = 1 + 3LL * passed - static_cast<long long>(failed);
    if (passed > 0 && failed == 0) {
        reward += 2;
    }
    if (reward > std::numeric_limits<int>::max()) {
        return std::numeric_limits<int>::max();
    }
    if (reward < std::numeric_limits<int>::min()) {
        return std::numeric_limits<int>::min();
    }
    return static_cast<int>(reward);
}

}  // namespace codeact::rust
