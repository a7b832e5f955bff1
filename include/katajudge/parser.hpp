#ifndef PARSER_HPP
#define PARSER_HPP

#include <cstddef>     // std::size_t
#include <cstdint>     // std::uint8_t
#include <optional>    // std::optional
#include <span>        // std::span
#include <string>      // std::string
#include <string_view> // std::string_view
#include <vector>      // std::vector

#include <katajudge/types.hpp> // KataJudge::TestResult

/**
 * @file
 * @brief Heuristics that turn the output of a test script into test results.
 *
 * Test scripts do not report their results in a structured way. They print
 * `All public tests passed!` (or `hidden`) when everything passed, and crash
 * with a traceback or an error message on the first failing assertion.
 */
namespace KataJudge
{

/** The conventions of the test script. TypeScript tests follow JavaScript. */
enum class TestDialect : std::uint8_t
{
    Python,
    JavaScript
};

/** Used when the number of tests cannot be inferred. */
inline constexpr std::size_t default_test_count { 3 };

/** Removes leading and trailing whitespace. */
[[nodiscard]] std::string_view trim(std::string_view text) noexcept;

/** True if @p out contains both `All` and `tests passed!`. */
[[nodiscard]] bool has_success_marker(std::string_view out) noexcept;

/**
 * Guesses how many tests a script contains. Test function definitions in
 * @p test_source are counted first, then definitions in @p output, then
 * calls like `test_name()` in @p output. Falls back to default_test_count.
 */
[[nodiscard]] std::size_t estimate_test_count(TestDialect dialect, std::string_view output, std::string_view test_source);

/**
 * Builds the test results of one run.
 *
 * On success (@p success and the success marker) every estimated test passed.
 * Otherwise a single failing result is reported, named after the last test
 * call found in the output and carrying the last recognised error message,
 * followed by the remaining estimated tests marked as not executed.
 */
[[nodiscard]] std::vector<TestResult> parse_test_output(TestDialect dialect, std::string_view out, std::string_view err, bool success, std::string_view test_source);

/** `100 * passed / total`, or nothing if @p results is empty. */
[[nodiscard]] std::optional<double> score_from(std::span<const TestResult> results) noexcept;

/** One stdin/stdout case of a compiled kata. */
struct IoCase
{
    std::string input;
    std::string expected_output;
};

/**
 * Parses a case file. Cases are separated by `===`, and each case is made of
 * an input and an expected output separated by `---`. Both parts are trimmed.
 * Cases that do not have exactly two parts are ignored.
 */
[[nodiscard]] std::vector<IoCase> parse_io_cases(std::string_view content);

} // namespace KataJudge

#endif
