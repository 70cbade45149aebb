#pragma once

#include "types.hpp"

#include <filesystem>
#include <vector>

#include <nlohmann/json.hpp>

namespace codeact::rust {

/**
 * JSON wire shape shared with transport layers.
 *
 * action:      {"core_code": str, "test_code": str?}
 * observation: {"stdout", "stderr", "exit_code", "tests_passed", "tests_failed",
 *               "code_compiles", "reward", "done", "metadata": {str: str}}
 * state:       {"episode_id", "step_count", "last_exit_code", "last_code_compiles",
 *               "total_tests_passed", "total_tests_failed"}
 *
 * The functions below are found by nlohmann::json through ADL, so
 * `nlohmann::json j = observation;` and `j.get<RustAction>()` work directly.
 */
void to_json(nlohmann::json& j, const RustAction& action);
void to_json(nlohmann::json& j, const RustObservation& observation);
void to_json(nlohmann::json& j, const EpisodeState& state);

/// Throws std::invalid_argument unless \a j is an object with a string
/// `core_code` and, when present, a string `test_code`.
void from_json(const nlohmann::json& j, RustAction& action);

void from_json(const nlohmann::json& j, RustObservation& observation);
void from_json(const nlohmann::json& j, EpisodeState& state);

/**
 * \brief Loads a list of actions from a JSON file.
 *
 * The document is either an array of action objects or an object carrying
 * them under `"actions"`. I/O and JSON syntax errors throw std::runtime_error;
 * malformed actions throw std::invalid_argument naming their index.
 */
[[nodiscard]] std::vector<RustAction> load_actions(const std::filesystem::path& file);

}  // namespace codeact::rust
