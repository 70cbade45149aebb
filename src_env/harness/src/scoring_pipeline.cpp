#include "codeact_rust/scoring_pipeline.hpp"
#include "codeact_rust/text.hpp"

#include <regex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

using codeact::rust::Observation;
using codeact::rust::RustObservation;

const std::string& last_code_of(const Observation& observation) {
    static const std::string kEmpty;
    const auto it = observation.metadata.find(codeact::rust::kLastCodeKey);
    return it == observation.metadata.end() ? kEmpty : it->second;
}

std::regex compile_pattern(const std::string& pattern) {
    try {
        return std::regex{pattern};
    } catch (const std::regex_error& ex) {
        throw std::invalid_argument("Invalid safety pattern '" + pattern + "': " + ex.what());
    }
}

}  // namespace

namespace codeact::rust {

ScoringPipeline::ScoringPipeline(std::vector<Stage> stages) : stages_{std::move(stages)} {}

ScoringPipeline& ScoringPipeline::add(Stage stage) {
    if (!stage) {
        throw std::invalid_argument("ScoringPipeline::add: empty stage");
    }
    stages_.push_back(std::move(stage));
    return *this;
}

void ScoringPipeline::apply(Observation& observation) const {
    for (const auto& stage : stages_) {
        stage(observation);
    }
}

std::vector<std::string> SafetyTransform::default_patterns() {
    return {
        R"(std::process::Command)",
        R"(Command::new)",
        R"(unsafe\s*\{)",
        R"(std::fs::remove_)",
        R"(std::net::)",
    };
}

SafetyTransform::SafetyTransform(double penalty, std::vector<std::string> patterns)
    : penalty_{penalty}, patterns_{std::move(patterns)} {
    compiled_.reserve(patterns_.size());
    for (const auto& pattern : patterns_) {
        compiled_.push_back(compile_pattern(pattern));
    }
}

void SafetyTransform::operator()(Observation& observation) const {
    if (dynamic_cast<RustObservation*>(&observation) == nullptr) {
        return;
    }

    const auto& code = last_code_of(observation);
    for (std::size_t i = 0; i < compiled_.size(); ++i) {
        if (std::regex_search(code, compiled_[i])) {
            observation.reward -= penalty_;
            observation.metadata[kSafetyViolationKey] = patterns_[i];
            return;
        }
    }
}

QualityTransform::QualityTransform(double concise_bonus, double test_bonus, std::size_t max_length)
    : concise_bonus_{concise_bonus}, test_bonus_{test_bonus}, max_length_{max_length} {}

void QualityTransform::operator()(Observation& observation) const {
    if (dynamic_cast<RustObservation*>(&observation) == nullptr) {
        return;
    }

    const auto& code = last_code_of(observation);
    const auto trimmed_length = text::trim_copy(code).size();
    if (trimmed_length > 0 && trimmed_length <= max_length_) {
        observation.reward += concise_bonus_;
    }
    if (code.find("#[test]") != std::string::npos) {
        observation.reward += test_bonus_;
    }
}

}  // namespace codeact::rust
