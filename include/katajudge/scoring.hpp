#ifndef SCORING_HPP
#define SCORING_HPP

#include <span>   // std::span
#include <vector> // std::vector

#include <nlohmann/json.hpp> // nlohmann::json

#include <katajudge/types.hpp> // KataJudge::CombinedExecutionResult, KataJudge::ExecutionResult, KataJudge::ScoringConfig, KataJudge::TestResult

/**
 * @file
 * @brief Turning test results into scores and a verdict.
 */
namespace KataJudge
{

/** Percentage of passed tests. Zero when there are no results. */
[[nodiscard]] double calculate_score(std::span<const TestResult> results) noexcept;

/**
 * Merges a public and a hidden run.
 *
 * Test names get a `[Public] ` or `[Hidden] ` prefix. Failing hidden tests
 * only keep their name: the message becomes `Hidden test failed` and the
 * expected value, the actual value and the input are dropped.
 */
[[nodiscard]] CombinedExecutionResult combine_results(const ExecutionResult& public_result, const ExecutionResult& hidden_result, const ScoringConfig& config = {});

/** Returns a copy of @p result whose score is always set. */
[[nodiscard]] ExecutionResult process_result(const ExecutionResult& result);

[[nodiscard]] bool determine_pass_status(const ExecutionResult& result, double threshold = ScoringConfig {}.passing_threshold) noexcept;

/** Fills in missing names (`Test N`) and messages. */
[[nodiscard]] std::vector<TestResult> format_test_results(std::span<const TestResult> results);

struct ScoringSummary
{
    double public_score {};
    double hidden_score {};
    double final_score {};
    double public_weight {};
    double hidden_weight {};
    bool passed {};
};

[[nodiscard]] ScoringSummary get_scoring_summary(const CombinedExecutionResult& result, const ScoringConfig& config = {}) noexcept;

void to_json(nlohmann::json& json, const ScoringSummary& summary);

} // namespace KataJudge

#endif
