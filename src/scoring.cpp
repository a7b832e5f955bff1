#include <katajudge/scoring.hpp>

#include <algorithm>   // std::ranges::count_if, std::ranges::for_each
#include <cstddef>     // std::size_t
#include <format>      // std::format
#include <span>        // std::span
#include <string>      // std::string
#include <string_view> // std::string_view
#include <utility>     // std::move
#include <vector>      // std::vector

#include <katajudge/parser.hpp> // KataJudge::trim

namespace
{

using KataJudge::ExecutionResult;
using KataJudge::TestResult;

double score_of(const ExecutionResult& result) noexcept
{
    return result.score.value_or(KataJudge::calculate_score(result.test_results));
}

/** A failed hidden test keeps only its name and a generic message. */
void redact(TestResult& test)
{
    if (test.passed)
        return;

    test.message = "Hidden test failed";
    test.expected.reset();
    test.actual.reset();
    test.input.reset();
}

/** Joins the non-empty texts under their headings, separated by blank lines. */
std::string join_sections(std::string_view public_heading, std::string_view public_text, std::string_view hidden_heading, std::string_view hidden_text)
{
    std::string joined;

    const auto append = [&joined](std::string_view heading, std::string_view text)
    {
        const auto trimmed = KataJudge::trim(text);

        if (trimmed.empty())
            return;

        if (!joined.empty())
            joined += "\n\n";

        joined += std::format("{:s}\n\n{:s}", heading, trimmed);
    };

    append(public_heading, public_text);
    append(hidden_heading, hidden_text);

    return joined;
}

}

namespace KataJudge
{

double calculate_score(std::span<const TestResult> results) noexcept
{
    if (results.empty())
        return 0.0;

    const auto passed = std::ranges::count_if(results, [](const TestResult& result)
        { return result.passed; });

    return static_cast<double>(passed) / static_cast<double>(results.size()) * 100.0;
}

CombinedExecutionResult combine_results(const ExecutionResult& public_result, const ExecutionResult& hidden_result, const ScoringConfig& config)
{
    const auto public_score = score_of(public_result);
    const auto hidden_score = score_of(hidden_result);

    const auto final_score = public_score * config.public_weight + hidden_score * config.hidden_weight;
    const auto passed = final_score >= config.passing_threshold && public_result.success && hidden_result.success;

    CombinedExecutionResult combined;

    combined.test_results.reserve(public_result.test_results.size() + hidden_result.test_results.size());

    for (auto test : public_result.test_results)
    {
        test.name = std::format("[Public] {:s}", test.name);
        combined.test_results.push_back(std::move(test));
    }

    for (auto test : hidden_result.test_results)
    {
        test.name = std::format("[Hidden] {:s}", test.name);
        redact(test);
        combined.test_results.push_back(std::move(test));
    }

    combined.success = passed;
    combined.output = join_sections("=== Public Tests ===", public_result.output, "=== Hidden Tests ===", hidden_result.output);
    combined.errors = join_sections("=== Public Test Errors ===", public_result.errors, "=== Hidden Test Errors ===", hidden_result.errors);
    combined.score = final_score;
    combined.duration = public_result.duration + hidden_result.duration;
    combined.public_results = public_result;
    combined.hidden_results = hidden_result;
    std::ranges::for_each(combined.hidden_results.test_results, redact);
    combined.final_score = final_score;
    combined.passed = passed;

    return combined;
}

ExecutionResult process_result(const ExecutionResult& result)
{
    auto processed = result;
    processed.score = score_of(result);

    return processed;
}

bool determine_pass_status(const ExecutionResult& result, double threshold) noexcept
{
    return result.success && score_of(result) >= threshold;
}

std::vector<TestResult> format_test_results(std::span<const TestResult> results)
{
    std::vector<TestResult> formatted { results.begin(), results.end() };

    for (std::size_t i {}; i < formatted.size(); ++i)
    {
        auto& test = formatted[i];

        if (test.name.empty())
            test.name = std::format("Test {:d}", i + 1);

        if (!test.message.has_value() || test.message->empty())
            test.message = test.passed ? "Test passed" : "Test failed";
    }

    return formatted;
}

ScoringSummary get_scoring_summary(const CombinedExecutionResult& result, const ScoringConfig& config) noexcept
{
    return ScoringSummary {
        .public_score = score_of(result.public_results),
        .hidden_score = score_of(result.hidden_results),
        .final_score = result.final_score,
        .public_weight = config.public_weight,
        .hidden_weight = config.hidden_weight,
        .passed = result.passed
    };
}

void to_json(nlohmann::json& json, const ScoringSummary& summary)
{
    json = nlohmann::json {
        { "publicScore", summary.public_score },
        { "hiddenScore", summary.hidden_score },
        { "finalScore", summary.final_score },
        { "publicWeight", summary.public_weight },
        { "hiddenWeight", summary.hidden_weight },
        { "passed", summary.passed }
    };
}

} // namespace KataJudge
