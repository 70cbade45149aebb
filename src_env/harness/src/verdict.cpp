#include "codeact_rust/verdict.hpp"

#include <limits>
#include <regex>
#include <stdexcept>
#include <string>
#include <string_view>

namespace {

const std::regex& report_line_pattern() {
    static const std::regex pattern{
        R"(test result:\s*(ok|FAILED)\.\s*(\d+)\s+passed;\s*(\d+)\s+failed)"};
    return pattern;
}

const std::regex& loose_count_pattern() {
    static const std::regex pattern{R"((\d+)\s+passed;\s*(\d+)\s+failed)"};
    return pattern;
}

// Counts beyond int range saturate instead of throwing.
int to_count(const std::ssub_match& group) {
    const auto digits = group.str();
    try {
        const auto value = std::stoll(digits);
        if (value > std::numeric_limits<int>::max()) {
            return std::numeric_limits<int>::max();
        }
        return static_cast<int>(value);
    } catch (const std::out_of_range&) {
        return std::numeric_limits<int>::max();
    }
}

}  // namespace

namespace codeact::rust {

TestSummary parse_test_summary(std::string_view combined_output) {
    const std::string haystack{combined_output};
    std::smatch match;

    if (std::regex_search(haystack, match, report_line_pattern())) {
        return TestSummary{to_count(match[2]), to_count(match[3])};
    }
    if (std::regex_search(haystack, match, loose_count_pattern())) {
        return TestSummary{to_count(match[1]), to_count(match[2])};
    }
    return TestSummary{};
}

TestSummary parse_test_summary(std::string_view stdout_text, std::string_view stderr_text) {
    std::string combined;
    combined.reserve(stdout_text.size() + stderr_text.size() + 1);
    combined.append(stdout_text);
    combined.push_back('\n');
    combined.append(stderr_text);
    return parse_test_summary(combined);
}

TestSummary apply_exit_status(TestSummary summary, int exit_code) noexcept {
    if (exit_code != 0 && summary.passed == 0 && summary.failed == 0) {
        summary.failed = 1;
    }
    return summary;
}

}  // namespace codeact::rust
