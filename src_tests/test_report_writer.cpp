/**
 * @file test_report_writer.cpp
 * @brief JSON summary and HTML report output
 */

#include <catch2/catch_test_macros.hpp>

#include "codeact_rust/process.hpp"
#include "codeact_rust/report_writer.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

using namespace codeact::rust;
namespace fs = std::filesystem;

namespace {

std::string slurp(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

StepRecord make_step(const std::string& core, bool compiles, int passed, int failed, double reward) {
    StepRecord step;
    step.action = RustAction{core};
    step.observation.code_compiles = compiles;
    step.observation.exit_code = compiles ? 0 : 1;
    step.observation.tests_passed = passed;
    step.observation.tests_failed = failed;
    step.observation.reward = reward;
    step.observation.metadata[kLastCodeKey] = core;
    return step;
}

}  // namespace

TEST_CASE("Summary carries state, true totals and every step", "[report]") {
    const ScratchDirectory scratch;

    EpisodeState state;
    state.episode_id = "episode-1";
    state.step_count = 3;
    state.total_tests_passed = 1;
    state.total_tests_failed = 1;

    std::vector<StepRecord> steps{
        make_step("fn a() {}", true, 2, 0, 10.5),
        make_step("let x = ;", false, 0, 0, -2.5),
        make_step("fn b() {}", true, 1, 1, 3.0),
    };
    steps[1].observation.metadata[kSafetyViolationKey] = "unsafe\\s*\\{";

    const auto destination = scratch.path() / "nested" / "summary.json";
    EpisodeReportWriter{}.write_summary(destination, state, steps);

    const auto summary = nlohmann::json::parse(slurp(destination));
    REQUIRE(summary["state"]["episode_id"] == "episode-1");
    REQUIRE(summary["state"]["total_tests_passed"] == 1);

    const auto& totals = summary["totals"];
    REQUIRE(totals["steps"] == 3);
    REQUIRE(totals["compiled"] == 2);
    REQUIRE(totals["tests_passed"] == 3);
    REQUIRE(totals["tests_failed"] == 1);
    REQUIRE(totals["safety_violations"] == 1);
    REQUIRE(totals["reward"]["sum"] == 11.0);
    REQUIRE(totals["reward"]["min"] == -2.5);
    REQUIRE(totals["reward"]["max"] == 10.5);

    REQUIRE(summary["steps"].size() == 3);
    REQUIRE(summary["steps"][0]["index"] == 1);
    REQUIRE(summary["steps"][1]["action"]["core_code"] == "let x = ;");
    REQUIRE(summary["steps"][2]["observation"]["tests_failed"] == 1);
}

TEST_CASE("Empty episode produces zeroed totals", "[report]") {
    const ScratchDirectory scratch;
    const auto destination = scratch.path() / "summary.json";

    EpisodeReportWriter{}.write_summary(destination, EpisodeState{}, {});

    const auto summary = nlohmann::json::parse(slurp(destination));
    REQUIRE(summary["steps"].empty());
    REQUIRE(summary["totals"]["steps"] == 0);
    REQUIRE(summary["totals"]["reward"]["mean"] == 0.0);
}

TEST_CASE("HTML report shows statuses and escapes code", "[report]") {
    const ScratchDirectory scratch;
    const auto destination = scratch.path() / "report.html";

    std::vector<StepRecord> steps{
        make_step("fn lt(a: i32) -> bool { a < 3 && true }", true, 1, 0, 6.5),
        make_step("let x = ;", false, 0, 0, -3.0),
        make_step("fn f() {}", true, 0, 2, -1.0),
    };
    EpisodeReportWriter{}.write_detailed(destination, EpisodeState{}, steps);

    const auto html = slurp(destination);
    REQUIRE(html.rfind("<!DOCTYPE html>", 0) == 0);
    REQUIRE(html.find("status-PASS") != std::string::npos);
    REQUIRE(html.find("status-COMPILE_ERROR") != std::string::npos);
    REQUIRE(html.find("status-FAIL") != std::string::npos);
    REQUIRE(html.find("a &lt; 3 &amp;&amp; true") != std::string::npos);
    REQUIRE(html.find("a < 3") == std::string::npos);
}

TEST_CASE("Unwritable destination throws", "[report]") {
    const ScratchDirectory scratch;
    const auto blocker = scratch.path() / "file";
    std::ofstream(blocker) << "x";

    REQUIRE_THROWS(EpisodeReportWriter{}.write_summary(blocker / "summary.json", EpisodeState{}, {}));
}
