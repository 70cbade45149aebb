#pragma once

#include "scoring_pipeline.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

namespace codeact::rust {

/**
 * \brief Construction-time knobs of the environment. Nothing here can be
 *        changed per step.
 */
struct EnvironmentConfig {
    // Toolchain
    std::string rustc{"rustc"};
    std::string edition{"2021"};
    std::chrono::seconds compile_timeout{10};
    std::chrono::seconds run_timeout{10};
    std::vector<std::string> test_args{"--nocapture"};

    // Filesystem. Empty scratch_root means the system temp directory; empty
    // artifact_root disables per-step artifacts.
    std::filesystem::path scratch_root{};
    std::filesystem::path artifact_root{};

    // Scoring
    double safety_penalty{3.0};
    std::vector<std::string> dangerous_patterns{SafetyTransform::default_patterns()};
    double concise_bonus{0.5};
    double test_bonus{1.0};
    std::size_t max_length{250};
};

/**
 * \brief Loads an EnvironmentConfig from a line-oriented `key=value` file.
 *
 * Lines starting with `#` and empty lines are ignored; keys and values are
 * trimmed. Unset keys keep their defaults.
 *
 * Recognised keys:
 *   - `rustc`, `edition`
 *   - `compile_timeout`, `run_timeout`: positive whole seconds
 *   - `test_args`: whitespace-separated arguments for the test binary
 *   - `scratch_root`, `artifact_root`: directories
 *   - `safety.penalty`: magnitude subtracted on a dangerous-pattern match
 *   - `safety.pattern`: regular expression; repeatable, kept in file order.
 *                       The first occurrence replaces the built-in list.
 *   - `quality.concise_bonus`, `quality.test_bonus`, `quality.max_length`
 *
 * Example:
 * \code{.txt}
 * edition=2021
 * compile_timeout=20
 * safety.penalty=5
 * safety.pattern=std::process::Command
 * safety.pattern=unsafe\s*\{
 * \endcode
 *
 * Unknown keys and malformed values throw std::runtime_error naming the
 * offending `file:line`.
 */
class ConfigLoader {
public:
    ConfigLoader() = default;

    [[nodiscard]] EnvironmentConfig load(const std::filesystem::path& file) const;

    [[nodiscard]] EnvironmentConfig parse(std::istream& input, const std::string& origin) const;
};

}  // namespace codeact::rust
