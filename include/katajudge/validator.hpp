#ifndef VALIDATOR_HPP
#define VALIDATOR_HPP

#include <cstddef>     // std::size_t
#include <cstdint>     // std::uint8_t
#include <optional>    // std::optional
#include <string>      // std::string
#include <string_view> // std::string_view
#include <vector>      // std::vector

#include <nlohmann/json.hpp> // nlohmann::json

#include <katajudge/executor.hpp>  // KataJudge::Executor
#include <katajudge/runner.hpp>    // KataJudge::Runner
#include <katajudge/toolchain.hpp> // KataJudge::ToolchainConfig
#include <katajudge/types.hpp>     // KataJudge::Language

/**
 * @file
 * @brief Checking kata content without running it, and checking that a test
 * suite accepts its reference solution.
 */
namespace KataJudge
{

enum class ValidationErrorType : std::uint8_t
{
    Syntax,
    Logic,
    Structure,
    Metadata
};

enum class ValidationWarningType : std::uint8_t
{
    Style,
    Performance,
    Clarity
};

[[nodiscard]] std::string_view to_string(ValidationErrorType type) noexcept;
[[nodiscard]] std::string_view to_string(ValidationWarningType type) noexcept;

struct ValidationError
{
    ValidationErrorType type {};
    std::string message;
    std::optional<std::string> file;

    /** 1-based. */
    std::optional<std::size_t> line;
};

struct ValidationWarning
{
    ValidationWarningType type {};
    std::string message;
    std::optional<std::string> file;
    std::optional<std::string> suggestion;
};

struct ContentValidationResult
{
    /** Equivalent to `errors.empty()`. */
    bool is_valid {};

    std::vector<ValidationError> errors;
    std::vector<ValidationWarning> warnings;
    std::vector<std::string> suggestions;
};

/**
 * Extracts the errors reported by a syntax checker.
 *
 * @param output The standard output and the standard error of the checker.
 */
[[nodiscard]] std::vector<ValidationError> parse_diagnostics(Language language, std::string_view output);

/** Textual style heuristics. They never produce errors. */
[[nodiscard]] std::vector<ValidationWarning> check_style(Language language, std::string_view code);

/** Runs the syntax checker of each language on code it is given. Never executes the code. */
class SyntaxValidator
{
public:
    explicit SyntaxValidator(Runner& runner, ToolchainConfig toolchain = {});

    /**
     * @param language A language tag. `none` is always valid, unknown tags
     * give a single syntax error.
     */
    [[nodiscard]] ContentValidationResult check_syntax(std::string_view code, std::string_view language) const;

    [[nodiscard]] ContentValidationResult check_syntax(std::string_view code, Language language) const;

private:
    Runner& m_runner;
    ToolchainConfig m_toolchain;
};

/**
 * Runs @p tests against @p solution in a scratch kata and reports whether the
 * suite accepts it. Also warns about small suites and generic test names.
 */
[[nodiscard]] ContentValidationResult validate_test_cases(std::string_view tests, std::string_view solution, std::string_view language, const Executor& executor);

void to_json(nlohmann::json& json, const ValidationError& error);
void to_json(nlohmann::json& json, const ValidationWarning& warning);
void to_json(nlohmann::json& json, const ContentValidationResult& result);

} // namespace KataJudge

#endif
