#include "codeact_rust/serialization.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

using nlohmann::json;

namespace {

std::string require_string(const json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end()) {
        throw std::invalid_argument(std::string("Action is missing '") + key + "'");
    }
    if (!it->is_string()) {
        throw std::invalid_argument(std::string("Action field '") + key + "' must be a string");
    }
    return it->get<std::string>();
}

}  // namespace

namespace codeact::rust {

void to_json(json& j, const RustAction& action) {
    j = json{
        {"core_code", action.core_code},
        {"test_code", action.test_code},
    };
}

void to_json(json& j, const RustObservation& observation) {
    j = json{
        {"stdout", observation.stdout_text},
        {"stderr", observation.stderr_text},
        {"exit_code", observation.exit_code},
        {"tests_passed", observation.tests_passed},
        {"tests_failed", observation.tests_failed},
        {"code_compiles", observation.code_compiles},
        {"reward", observation.reward},
        {"done", observation.done},
        {"metadata", observation.metadata},
    };
}

void to_json(json& j, const EpisodeState& state) {
    j = json{
        {"episode_id", state.episode_id},
        {"step_count", state.step_count},
        {"last_exit_code", state.last_exit_code},
        {"last_code_compiles", state.last_code_compiles},
        {"total_tests_passed", state.total_tests_passed},
        {"total_tests_failed", state.total_tests_failed},
    };
}

void from_json(const json& j, RustAction& action) {
    if (!j.is_object()) {
        throw std::invalid_argument("Expected a JSON object for an action, got " +
                                    std::string(j.type_name()));
    }
    action.core_code = require_string(j, "core_code");
    action.test_code.clear();
    if (const auto it = j.find("test_code"); it != j.end() && !it->is_null()) {
        if (!it->is_string()) {
            throw std::invalid_argument("Action field 'test_code' must be a string");
        }
        action.test_code = it->get<std::string>();
    }
}

void from_json(const json& j, RustObservation& observation) {
    observation.stdout_text = j.value("stdout", "");
    observation.stderr_text = j.value("stderr", "");
    observation.exit_code = j.value("exit_code", 0);
    observation.tests_passed = j.value("tests_passed", 0);
    observation.tests_failed = j.value("tests_failed", 0);
    observation.code_compiles = j.value("code_compiles", false);
    observation.reward = j.value("reward", 0.0);
    observation.done = j.value("done", false);
    observation.metadata = j.value("metadata", Metadata{});
}

void from_json(const json& j, EpisodeState& state) {
    state.episode_id = j.value("episode_id", "");
    state.step_count = j.value("step_count", 0);
    state.last_exit_code = j.value("last_exit_code", 0);
    state.last_code_compiles = j.value("last_code_compiles", false);
    state.total_tests_passed = j.value("total_tests_passed", 0);
    state.total_tests_failed = j.value("total_tests_failed", 0);
}

std::vector<RustAction> load_actions(const std::filesystem::path& file) {
    std::ifstream input(file);
    if (!input.is_open()) {
        throw std::runtime_error("Unable to open action file: " + file.string());
    }

    json document;
    try {
        input >> document;
    } catch (const json::parse_error& ex) {
        throw std::runtime_error("Invalid JSON in " + file.string() + ": " + ex.what());
    }

    const json* list = &document;
    if (document.is_object()) {
        const auto it = document.find("actions");
        if (it == document.end()) {
            throw std::runtime_error("Action file " + file.string() + " has no 'actions' array");
        }
        list = &*it;
    }
    if (!list->is_array()) {
        throw std::runtime_error("Action file " + file.string() + " must contain an array of actions");
    }

    std::vector<RustAction> actions;
    actions.reserve(list->size());
    for (std::size_t index = 0; index < list->size(); ++index) {
        try {
            actions.push_back((*list)[index].get<RustAction>());
        } catch (const std::invalid_argument& ex) {
            throw std::invalid_argument(file.string() + ": action #" + std::to_string(index + 1) + ": " +
                                        ex.what());
        }
    }
    return actions;
}

}  // namespace codeact::rust
