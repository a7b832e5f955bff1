#ifndef TYPES_HPP
#define TYPES_HPP

#include <array>       // std::array
#include <chrono>      // std::chrono::milliseconds
#include <cstddef>     // std::size_t
#include <cstdint>     // std::uint8_t
#include <optional>    // std::optional
#include <string>      // std::string
#include <string_view> // std::string_view
#include <utility>     // std::to_underlying
#include <vector>      // std::vector

#include <nlohmann/json.hpp> // nlohmann::json

/**
 * @file
 * @brief The values exchanged by the execution engine and the scorer.
 */
namespace KataJudge
{

using namespace std::string_view_literals;

/** The languages a kata can be written in. */
enum class Language : std::uint8_t
{
    Python,
    JavaScript,
    TypeScript,
    Cpp
};

/** Static properties of a language. */
struct LanguageInfo
{
    /** The tag used by kata metadata, such as `py`. */
    std::string_view tag;

    /** The human-readable name. */
    std::string_view name;

    /** Extension of the entry file, `entry.<ext>`. */
    std::string_view source_extension;

    /** Extension of the test files, `tests.<ext>` and `hidden_tests.<ext>`. */
    std::string_view test_extension;
};

/** Indexed by the underlying value of Language. */
inline constexpr std::array available_languages {
    LanguageInfo { "py"sv, "Python"sv, "py"sv, "py"sv },
    LanguageInfo { "js"sv, "JavaScript"sv, "js"sv, "js"sv },
    LanguageInfo { "ts"sv, "TypeScript"sv, "ts"sv, "ts"sv },
    LanguageInfo { "cpp"sv, "C++"sv, "cpp"sv, "txt"sv },
};

[[nodiscard]] constexpr const LanguageInfo& language_info(Language language) noexcept
{
    return available_languages[std::to_underlying(language)];
}

/** Returns the language with the given tag, or nothing if the tag is unknown. */
[[nodiscard]] constexpr std::optional<Language> parse_language(std::string_view tag) noexcept
{
    for (std::size_t i {}; i < available_languages.size(); ++i)
    {
        if (available_languages[i].tag == tag)
            return static_cast<Language>(i);
    }

    return std::nullopt;
}

/** The outcome of a single test. */
struct TestResult
{
    std::string name;

    bool passed {};

    std::optional<std::string> message;

    /** The expected value, if the test harness reported one. */
    std::optional<nlohmann::json> expected;

    /** The value the submission produced. */
    std::optional<nlohmann::json> actual;

    /** The input fed to the submission, for stdin based tests. */
    std::optional<std::string> input;
};

/** The outcome of running one test suite against one submission. */
struct ExecutionResult
{
    /** Zero exit status and no infrastructure failure. */
    bool success {};

    std::string output;

    /** Human-readable cause when something went wrong, plus the captured standard error. */
    std::string errors;

    std::vector<TestResult> test_results;

    /**
     * Percentage of passed tests, between 0 and 100. When missing, it can be
     * derived from test_results.
     */
    std::optional<double> score;

    std::chrono::milliseconds duration {};
};

/** Weights used when combining the public and the hidden suites. */
struct ScoringConfig
{
    double public_weight { 0.3 };
    double hidden_weight { 0.7 };
    double passing_threshold { 70.0 };
};

/** The public and hidden runs merged into one verdict. */
struct CombinedExecutionResult : ExecutionResult
{
    ExecutionResult public_results;
    ExecutionResult hidden_results;

    double final_score {};

    /** Always false when either of the runs was not successful. */
    bool passed {};
};

void to_json(nlohmann::json& json, const TestResult& result);
void to_json(nlohmann::json& json, const ExecutionResult& result);
void to_json(nlohmann::json& json, const CombinedExecutionResult& result);
void to_json(nlohmann::json& json, const ScoringConfig& config);

} // namespace KataJudge

#endif
