#pragma once

#include "types.hpp"

#include <cstddef>
#include <functional>
#include <regex>
#include <string>
#include <vector>

namespace codeact::rust {

/**
 * \brief Ordered chain of observation transforms applied after the base reward.
 *
 * Each stage receives the observation produced by the previous one and may
 * adjust its reward or add metadata keys in place. Stages are independent of
 * each other; adding or removing one never requires touching another.
 */
class ScoringPipeline {
public:
    using Stage = std::function<void(Observation&)>;

    ScoringPipeline() = default;
    explicit ScoringPipeline(std::vector<Stage> stages);

    ScoringPipeline& add(Stage stage);

    void apply(Observation& observation) const;

    [[nodiscard]] std::size_t size() const noexcept { return stages_.size(); }
    [[nodiscard]] bool empty() const noexcept { return stages_.empty(); }

private:
    std::vector<Stage> stages_;
};

/**
 * \brief Penalises code that reaches for dangerous APIs.
 *
 * Patterns are regular expressions searched in `metadata["last_code"]` in
 * their configured order. The first match subtracts \a penalty once and is
 * recorded under `metadata["safety_violation"]`; later patterns are not
 * consulted.
 */
class SafetyTransform {
public:
    static std::vector<std::string> default_patterns();

    explicit SafetyTransform(double penalty = 3.0,
                             std::vector<std::string> patterns = default_patterns());

    void operator()(Observation& observation) const;

    [[nodiscard]] double penalty() const noexcept { return penalty_; }
    [[nodiscard]] const std::vector<std::string>& patterns() const noexcept { return patterns_; }

private:
    double penalty_;
    std::vector<std::string> patterns_;
    std::vector<std::regex> compiled_;
};

/**
 * \brief Rewards concise code and the presence of tests.
 *
 * - trimmed `last_code` non-empty and at most \a max_length characters:
 *   + \a concise_bonus
 * - `last_code` contains `#[test]`: + \a test_bonus
 *
 * The bonuses are independent of each other and of correctness.
 */
class QualityTransform {
public:
    explicit QualityTransform(double concise_bonus = 0.5,
                              double test_bonus = 1.0,
                              std::size_t max_length = 250);

    void operator()(Observation& observation) const;

private:
    double concise_bonus_;
    double test_bonus_;
    std::size_t max_length_;
};

}  // namespace codeact::rust
