#include <katajudge/parser.hpp>

#include <algorithm>   // std::ranges::count_if
#include <array>       // std::array
#include <cstddef>     // std::size_t
#include <format>      // std::format
#include <optional>    // std::optional
#include <ranges>      // std::views::split
#include <span>        // std::span
#include <string>      // std::string
#include <string_view> // std::string_view
#include <utility>     // std::move
#include <vector>      // std::vector

namespace
{

using namespace std::string_view_literals;

using KataJudge::TestDialect;

constexpr std::string_view whitespace { " \t\n\r\f\v" };

constexpr std::string_view success_prefix { "All" };
constexpr std::string_view success_suffix { "tests passed!" };

constexpr std::string_view unknown_test { "unknown_test" };
constexpr std::string_view generic_failure { "Test failed" };
constexpr std::string_view not_executed { "Test not executed due to earlier failure" };
constexpr std::string_view passed_message { "Test passed" };

constexpr std::string_view assertion_marker { "AssertionError:" };

constexpr std::array python_error_markers {
    "TypeError:"sv,
    "ValueError:"sv,
    "AttributeError:"sv,
    "NameError:"sv,
    "IndexError:"sv,
    "KeyError:"sv,
    "ZeroDivisionError:"sv,
    "SyntaxError:"sv,
    "IndentationError:"sv,
};

constexpr std::string_view javascript_error_marker { "Error:" };

constexpr std::string_view case_separator { "===" };
constexpr std::string_view part_separator { "---" };

constexpr std::string_view test_prefix { "test_" };
constexpr std::string_view call_suffix { "()" };

constexpr bool is_word(char c) noexcept
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

std::size_t word_end(std::string_view text, std::size_t position) noexcept
{
    while (position < text.size() && is_word(text[position]))
        ++position;

    return position;
}

std::string_view definition_keyword(TestDialect dialect) noexcept
{
    return dialect == TestDialect::Python ? "def test_"sv : "function test_"sv;
}

/** Counts `<keyword><word>` occurrences, such as `def test_add`. */
std::size_t count_definitions(std::string_view text, std::string_view keyword) noexcept
{
    std::size_t count {};

    for (auto position = text.find(keyword); position != std::string_view::npos; position = text.find(keyword, position))
    {
        const auto name = position + keyword.size();
        const auto end = word_end(text, name);

        if (end != name)
            ++count;

        position = end;
    }

    return count;
}

/**
 * Finds the first call of a test function, a word containing `test_` with at
 * least one word character after it, directly followed by `()`.
 */
std::optional<std::string_view> find_test_call(std::string_view text) noexcept
{
    for (auto position = text.find(test_prefix); position != std::string_view::npos; position = text.find(test_prefix, position))
    {
        auto begin = position;

        while (begin > 0 && is_word(text[begin - 1]))
            --begin;

        const auto end = word_end(text, position + test_prefix.size());

        if (end > position + test_prefix.size() && text.substr(end).starts_with(call_suffix))
            return text.substr(begin, end - begin);

        // Every later `test_` of this word ends at the same place.
        position = end;
    }

    return std::nullopt;
}

/** Counts calls such as `test_add()`, names starting at any `test_` of a word. */
std::size_t count_test_calls(std::string_view text) noexcept
{
    std::size_t count {};

    for (auto position = text.find(test_prefix); position != std::string_view::npos; position = text.find(test_prefix, position))
    {
        const auto end = word_end(text, position + test_prefix.size());

        if (end > position + test_prefix.size() && text.substr(end).starts_with(call_suffix))
        {
            ++count;
            position = end + call_suffix.size();
        }
        else
            position = end;
    }

    return count;
}

/** The message a line carries, if it is a recognised error line. */
std::optional<std::string> error_message(TestDialect dialect, std::string_view line)
{
    if (dialect == TestDialect::JavaScript)
    {
        if (line.contains(javascript_error_marker))
            return std::string { line };

        return std::nullopt;
    }

    if (const auto position = line.find(assertion_marker); position != std::string_view::npos)
    {
        const auto message = std::format("{:s}{:s}", line.substr(0, position), line.substr(position + assertion_marker.size()));

        // A bare `AssertionError:` line has no message of its own.
        if (KataJudge::trim(message).empty())
            return std::nullopt;

        return std::string { KataJudge::trim(message) };
    }

    for (const auto marker : python_error_markers)
    {
        if (line.contains(marker))
            return std::string { line };
    }

    return std::nullopt;
}

std::vector<std::string_view> split(std::string_view text, std::string_view separator)
{
    std::vector<std::string_view> parts;

    for (const auto part : std::views::split(text, separator))
        parts.emplace_back(part.begin(), part.end());

    return parts;
}

}

namespace KataJudge
{

std::string_view trim(std::string_view text) noexcept
{
    const auto first = text.find_first_not_of(whitespace);

    if (first == std::string_view::npos)
        return {};

    const auto last = text.find_last_not_of(whitespace);

    return text.substr(first, last - first + 1);
}

bool has_success_marker(std::string_view out) noexcept
{
    return out.contains(success_prefix) && out.contains(success_suffix);
}

std::size_t estimate_test_count(TestDialect dialect, std::string_view output, std::string_view test_source)
{
    const auto keyword = definition_keyword(dialect);

    if (const auto count = count_definitions(test_source, keyword); count != 0)
        return count;

    if (const auto count = count_definitions(output, keyword); count != 0)
        return count;

    if (const auto count = count_test_calls(output); count != 0)
        return count;

    return default_test_count;
}

std::vector<TestResult> parse_test_output(TestDialect dialect, std::string_view out, std::string_view err, bool success, std::string_view test_source)
{
    std::vector<TestResult> results;

    if (success && has_success_marker(out))
    {
        const auto count = estimate_test_count(dialect, std::format("{:s}{:s}", out, err), test_source);

        results.reserve(count);

        for (std::size_t i { 1 }; i <= count; ++i)
            results.push_back({ .name = std::format("test_{:d}", i), .passed = true, .message = std::string { passed_message } });

        return results;
    }

    const auto output = std::format("{:s}\n{:s}", out, err);

    std::string failed_test { unknown_test };
    std::string message { generic_failure };

    for (const auto part : std::views::split(std::string_view { output }, '\n'))
    {
        const auto line = trim(std::string_view { part.begin(), part.end() });

        if (const auto call = find_test_call(line); call.has_value())
            failed_test = std::string { *call };

        if (auto found = error_message(dialect, line); found.has_value())
            message = std::move(*found);
    }

    results.push_back({ .name = std::move(failed_test), .passed = false, .message = std::move(message) });

    const auto total = estimate_test_count(dialect, output, test_source);

    for (std::size_t i { 2 }; i <= total; ++i)
        results.push_back({ .name = std::format("test_{:d}", i), .passed = false, .message = std::string { not_executed } });

    return results;
}

std::optional<double> score_from(std::span<const TestResult> results) noexcept
{
    if (results.empty())
        return std::nullopt;

    const auto passed = std::ranges::count_if(results, [](const TestResult& result)
        { return result.passed; });

    return 100.0 * static_cast<double>(passed) / static_cast<double>(results.size());
}

std::vector<IoCase> parse_io_cases(std::string_view content)
{
    std::vector<IoCase> cases;

    for (const auto raw : split(content, case_separator))
    {
        const auto test_case = trim(raw);

        if (test_case.empty())
            continue;

        const auto parts = split(test_case, part_separator);

        if (parts.size() != 2)
            continue;

        cases.push_back({ .input = std::string { trim(parts[0]) }, .expected_output = std::string { trim(parts[1]) } });
    }

    return cases;
}

} // namespace KataJudge
