#include <katajudge/types.hpp>

#include <nlohmann/json.hpp> // nlohmann::json

namespace KataJudge
{

void to_json(nlohmann::json& json, const TestResult& result)
{
    json = nlohmann::json {
        { "name", result.name },
        { "passed", result.passed }
    };

    if (result.message.has_value())
        json["message"] = *result.message;

    if (result.expected.has_value())
        json["expected"] = *result.expected;

    if (result.actual.has_value())
        json["actual"] = *result.actual;

    if (result.input.has_value())
        json["input"] = *result.input;
}

void to_json(nlohmann::json& json, const ExecutionResult& result)
{
    json = nlohmann::json {
        { "success", result.success },
        { "output", result.output },
        { "errors", result.errors },
        { "testResults", result.test_results },
        { "duration", result.duration.count() }
    };

    if (result.score.has_value())
        json["score"] = *result.score;
}

void to_json(nlohmann::json& json, const CombinedExecutionResult& result)
{
    to_json(json, static_cast<const ExecutionResult&>(result));

    json["publicResults"] = result.public_results;
    json["hiddenResults"] = result.hidden_results;
    json["finalScore"] = result.final_score;
    json["passed"] = result.passed;
}

void to_json(nlohmann::json& json, const ScoringConfig& config)
{
    json = nlohmann::json {
        { "publicWeight", config.public_weight },
        { "hiddenWeight", config.hidden_weight },
        { "passingThreshold", config.passing_threshold }
    };
}

} // namespace KataJudge
