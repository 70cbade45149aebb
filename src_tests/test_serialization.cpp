/**
 * @file test_serialization.cpp
 * @brief JSON wire shape of actions, observations and state
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "codeact_rust/process.hpp"
#include "codeact_rust/serialization.hpp"

#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

using namespace codeact::rust;
using nlohmann::json;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("Observation serialises with the documented keys", "[json]") {
    RustObservation obs;
    obs.stdout_text = "hi\n";
    obs.stderr_text = "warning";
    obs.exit_code = 0;
    obs.tests_passed = 2;
    obs.tests_failed = 1;
    obs.code_compiles = true;
    obs.reward = 7.5;
    obs.metadata[kLastCodeKey] = "fn f() {}";

    const json j = obs;

    REQUIRE(j.at("stdout") == "hi\n");
    REQUIRE(j.at("stderr") == "warning");
    REQUIRE(j.at("exit_code") == 0);
    REQUIRE(j.at("tests_passed") == 2);
    REQUIRE(j.at("tests_failed") == 1);
    REQUIRE(j.at("code_compiles") == true);
    REQUIRE(j.at("reward") == 7.5);
    REQUIRE(j.at("done") == false);
    REQUIRE(j.at("metadata").at("last_code") == "fn f() {}");

    const auto back = j.get<RustObservation>();
    REQUIRE(back.tests_passed == 2);
    REQUIRE(back.metadata == obs.metadata);
}

TEST_CASE("State serialises every counter", "[json]") {
    EpisodeState state;
    state.episode_id = "abc";
    state.step_count = 4;
    state.last_exit_code = 101;
    state.last_code_compiles = true;
    state.total_tests_passed = 3;
    state.total_tests_failed = 1;

    const json j = state;
    REQUIRE(j.at("episode_id") == "abc");
    REQUIRE(j.at("step_count") == 4);
    REQUIRE(j.at("last_exit_code") == 101);
    REQUIRE(j.at("last_code_compiles") == true);
    REQUIRE(j.at("total_tests_passed") == 3);
    REQUIRE(j.at("total_tests_failed") == 1);

    const auto partial = json{{"episode_id", "xyz"}}.get<EpisodeState>();
    REQUIRE(partial.episode_id == "xyz");
    REQUIRE(partial.step_count == 0);
}

TEST_CASE("Actions are validated on decode", "[json]") {
    SECTION("test code is optional") {
        const auto action = json{{"core_code", "let x = 1;"}}.get<RustAction>();
        REQUIRE(action.core_code == "let x = 1;");
        REQUIRE(action.test_code.empty());

        const auto with_null = json{{"core_code", "a"}, {"test_code", nullptr}}.get<RustAction>();
        REQUIRE(with_null.test_code.empty());
    }

    SECTION("both fields") {
        const auto action = json::parse(R"({"core_code": "fn f() {}", "test_code": "#[test] fn t() {}"})")
                                .get<RustAction>();
        REQUIRE(action.test_code == "#[test] fn t() {}");
    }

    SECTION("malformed actions") {
        REQUIRE_THROWS_AS(json::array().get<RustAction>(), std::invalid_argument);
        REQUIRE_THROWS_WITH(json::object().get<RustAction>(), ContainsSubstring("core_code"));
        REQUIRE_THROWS_AS((json{{"core_code", 3}}.get<RustAction>()), std::invalid_argument);
        REQUIRE_THROWS_AS((json{{"core_code", "a"}, {"test_code", false}}.get<RustAction>()),
                          std::invalid_argument);
    }
}

TEST_CASE("Action files are loaded in order", "[json][actions]") {
    const ScratchDirectory scratch;

    SECTION("bare array") {
        const auto file = scratch.path() / "actions.json";
        std::ofstream(file) << R"([{"core_code": "println!(\"a\");"}, {"core_code": "fn f() {}", "test_code": "#[test] fn t() {}"}])";

        const auto actions = load_actions(file);
        REQUIRE(actions.size() == 2);
        REQUIRE(actions[0].core_code == "println!(\"a\");");
        REQUIRE(actions[1].test_code == "#[test] fn t() {}");
    }

    SECTION("wrapped in an object") {
        const auto file = scratch.path() / "episode.json";
        std::ofstream(file) << R"({"actions": [{"core_code": "let x = 1;"}]})";
        REQUIRE(load_actions(file).size() == 1);
    }

    SECTION("errors") {
        REQUIRE_THROWS_AS(load_actions(scratch.path() / "missing.json"), std::runtime_error);

        const auto broken = scratch.path() / "broken.json";
        std::ofstream(broken) << "[{";
        REQUIRE_THROWS_WITH(load_actions(broken), ContainsSubstring("Invalid JSON"));

        const auto no_list = scratch.path() / "no_list.json";
        std::ofstream(no_list) << R"({"steps": []})";
        REQUIRE_THROWS_AS(load_actions(no_list), std::runtime_error);

        const auto bad_action = scratch.path() / "bad_action.json";
        std::ofstream(bad_action) << R"([{"core_code": "ok"}, {"test_code": "x"}])";
        REQUIRE_THROWS_WITH(load_actions(bad_action), ContainsSubstring("action #2"));
    }
}
