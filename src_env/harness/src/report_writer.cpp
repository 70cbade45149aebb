#include "codeact_rust/report_writer.hpp"
#include "codeact_rust/serialization.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace {

using nlohmann::json;
using codeact::rust::EpisodeState;
using codeact::rust::StepRecord;

json build_totals(const std::vector<StepRecord>& steps) {
    std::size_t compiled = 0;
    std::size_t violations = 0;
    long long passed = 0;
    long long failed = 0;
    double reward_sum = 0.0;
    double reward_min = 0.0;
    double reward_max = 0.0;

    for (std::size_t i = 0; i < steps.size(); ++i) {
        const auto& obs = steps[i].observation;
        if (obs.code_compiles) ++compiled;
        if (obs.metadata.count(codeact::rust::kSafetyViolationKey) != 0) ++violations;
        passed += obs.tests_passed;
        failed += obs.tests_failed;
        reward_sum += obs.reward;
        reward_min = (i == 0) ? obs.reward : std::min(reward_min, obs.reward);
        reward_max = (i == 0) ? obs.reward : std::max(reward_max, obs.reward);
    }

    return json{
        {"steps", steps.size()},
        {"compiled", compiled},
        {"tests_passed", passed},
        {"tests_failed", failed},
        {"safety_violations", violations},
        {"reward", {
            {"sum", reward_sum},
            {"mean", steps.empty() ? 0.0 : reward_sum / static_cast<double>(steps.size())},
            {"min", reward_min},
            {"max", reward_max},
        }},
    };
}

json build_summary(const EpisodeState& state, const std::vector<StepRecord>& steps) {
    json summary = {
        {"state", state},
        {"totals", build_totals(steps)},
        {"steps", json::array()},
    };

    for (std::size_t index = 0; index < steps.size(); ++index) {
        summary["steps"].push_back(json{
            {"index", index + 1},
            {"action", steps[index].action},
            {"observation", steps[index].observation},
        });
    }
    return summary;
}

std::string escape_html(const std::string& input) {
    std::ostringstream oss;
    for (char ch : input) {
        switch (ch) {
            case '&':
                oss << "&amp;";
                break;
            case '<':
                oss << "&lt;";
                break;
            case '>':
                oss << "&gt;";
                break;
            case '"':
                oss << "&quot;";
                break;
            case '\'':
                oss << "&#39;";
                break;
            default:
                oss << ch;
        }
    }
    return oss.str();
}

std::string status_of(const codeact::rust::RustObservation& obs) {
    if (!obs.code_compiles) return "COMPILE_ERROR";
    if (obs.tests_failed > 0) return "FAIL";
    if (obs.tests_passed > 0) return "PASS";
    return obs.exit_code == 0 ? "OK" : "ERROR";
}

std::string render_html(const EpisodeState& state, const std::vector<StepRecord>& steps) {
    std::ostringstream oss;
    oss << "<!DOCTYPE html><html><head><meta charset=\"utf-8\"/>"
        << "<title>Rust CodeAct Episode Report</title>"
        << "<style>"
        << "body{font-family:system-ui, sans-serif;margin:2rem;}"
        << "table{border-collapse:collapse;width:100%;}"
        << "th,td{border:1px solid #ccc;padding:0.5rem;vertical-align:top;}"
        << "th{background:#f5f5f5;text-align:left;}"
        << "pre{margin:0;white-space:pre-wrap;}"
        << ".status-PASS,.status-OK{color:#0a7c2f;font-weight:bold;}"
        << ".status-FAIL{color:#c1121f;font-weight:bold;}"
        << ".status-COMPILE_ERROR{color:#b000b5;font-weight:bold;}"
        << ".status-ERROR{color:#ff8800;font-weight:bold;}"
        << "</style></head><body>";

    oss << "<h1>Rust CodeAct Episode Report</h1>";

    const auto totals = build_totals(steps);
    oss << "<section><h2>Summary</h2><ul>";
    oss << "<li>Episode: " << escape_html(state.episode_id) << "</li>";
    oss << "<li>Steps: " << steps.size() << "</li>";
    oss << "<li>Compiled: " << totals["compiled"].get<std::size_t>() << "</li>";
    oss << "<li>Tests passed: " << totals["tests_passed"].get<long long>()
        << ", failed: " << totals["tests_failed"].get<long long>() << "</li>";
    oss << "<li>Safety violations: " << totals["safety_violations"].get<std::size_t>() << "</li>";
    oss << "<li>Total reward: " << totals["reward"]["sum"].get<double>() << "</li>";
    oss << "</ul></section>";

    oss << "<section><h2>Steps</h2><table>";
    oss << "<thead><tr>"
        << "<th>#</th>"
        << "<th>Status</th>"
        << "<th>Reward</th>"
        << "<th>Tests</th>"
        << "<th>Exit</th>"
        << "<th>Code</th>"
        << "<th>Stderr</th>"
        << "<th>Safety</th>"
        << "</tr></thead><tbody>";

    for (std::size_t index = 0; index < steps.size(); ++index) {
        const auto& obs = steps[index].observation;
        const auto status = status_of(obs);
        const auto code_it = obs.metadata.find(codeact::rust::kLastCodeKey);
        const auto safety_it = obs.metadata.find(codeact::rust::kSafetyViolationKey);

        oss << "<tr>";
        oss << "<td>" << (index + 1) << "</td>";
        oss << "<td class=\"status-" << status << "\">" << status << "</td>";
        oss << "<td>" << obs.reward << "</td>";
        oss << "<td>" << obs.tests_passed << " passed / " << obs.tests_failed << " failed</td>";
        oss << "<td>" << obs.exit_code << "</td>";
        oss << "<td><pre>"
            << escape_html(code_it == obs.metadata.end() ? std::string{} : code_it->second)
            << "</pre></td>";
        oss << "<td><pre>" << escape_html(obs.stderr_text) << "</pre></td>";
        oss << "<td>"
            << escape_html(safety_it == obs.metadata.end() ? std::string{} : safety_it->second)
            << "</td>";
        oss << "</tr>";
    }

    oss << "</tbody></table></section>";
    oss << "</body></html>";
    return oss.str();
}

void ensure_parent(const std::filesystem::path& destination) {
    const auto parent = destination.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        std::filesystem::create_directories(parent);
    }
}

void write_file(const std::filesystem::path& destination, const std::string& content) {
    ensure_parent(destination);
    std::ofstream output(destination, std::ios::binary);
    if (!output.is_open()) {
        throw std::runtime_error("Unable to open output file: " + destination.string());
    }
    output << content;
}

}  // namespace

namespace codeact::rust {

void EpisodeReportWriter::write_summary(const std::filesystem::path& destination,
                                        const EpisodeState& state,
                                        const std::vector<StepRecord>& steps) const {
    const json summary = build_summary(state, steps);
    write_file(destination, summary.dump(2));
}

void EpisodeReportWriter::write_detailed(const std::filesystem::path& destination,
                                         const EpisodeState& state,
                                         const std::vector<StepRecord>& steps) const {
    write_file(destination, render_html(state, steps));
}

}  // namespace codeact::rust
