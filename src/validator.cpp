#include <katajudge/validator.hpp>

#include <algorithm>    // std::ranges::any_of, std::ranges::count_if
#include <array>        // std::array
#include <charconv>     // std::from_chars
#include <chrono>       // std::chrono::milliseconds
#include <cstddef>      // std::size_t
#include <filesystem>   // std::filesystem::path
#include <format>       // std::format
#include <optional>     // std::optional
#include <ranges>       // std::views::split
#include <regex>        // std::cmatch, std::regex, std::regex_match, std::regex_search
#include <span>         // std::span
#include <string>       // std::string
#include <string_view>  // std::string_view
#include <system_error> // std::errc
#include <utility>      // std::move, std::unreachable
#include <vector>       // std::vector

#include <katajudge/logging.hpp>   // logd, logging::path_to_utf8
#include <katajudge/parser.hpp>    // KataJudge::trim
#include <katajudge/pipeline.hpp>  // KataJudge::entry_file_name, KataJudge::test_file_name
#include <katajudge/workspace.hpp> // KataJudge::Workspace, KataJudge::WorkspaceError

namespace
{

using namespace std::string_view_literals;

using KataJudge::Language;
using KataJudge::ValidationError;
using KataJudge::ValidationErrorType;
using KataJudge::ValidationWarning;
using KataJudge::ValidationWarningType;

constexpr std::string_view no_language { "none" };

constexpr std::chrono::milliseconds interpreter_check_timeout { 5000 };
constexpr std::chrono::milliseconds compiler_check_timeout { 10000 };
constexpr std::chrono::milliseconds test_validation_timeout { 10000 };

constexpr std::size_t max_python_line_length { 79 };
constexpr std::size_t min_test_count { 3 };

constexpr std::array python_markers { "SyntaxError:"sv, "IndentationError:"sv, "TabError:"sv };
constexpr std::array javascript_markers { "SyntaxError:"sv, "ReferenceError:"sv, "TypeError:"sv };
constexpr std::array typescript_markers { "error TS"sv };
constexpr std::array cpp_markers { "error:"sv };

std::string_view missing_toolchain_message(Language language) noexcept
{
    switch (language)
    {
    case Language::Python:
        return "Python interpreter not available. Please install Python 3.8 or newer";
    case Language::JavaScript:
        return "Node.js not available. Please install Node.js 18 or newer";
    case Language::TypeScript:
        return "TypeScript compiler not available. Please install TypeScript globally: npm install -g typescript";
    case Language::Cpp:
        return "C++ compiler not available. Please install g++ or clang++";
    }

    std::unreachable();
}

KataJudge::ProcessRequest checker_request(Language language, const KataJudge::ToolchainConfig& toolchain, const std::filesystem::path& file)
{
    const auto path = logging::path_to_utf8(file);

    KataJudge::ProcessRequest request {
        .working_directory = file.parent_path(),
        .timeout = interpreter_check_timeout,
        .timeout_message = "Process timed out",
    };

    switch (language)
    {
    case Language::Python:
        request.command = toolchain.python;
        request.arguments = { "-m", "py_compile", path };
        break;
    case Language::JavaScript:
        request.command = toolchain.node;
        request.arguments = { "--check", path };
        break;
    case Language::TypeScript:
        request.command = toolchain.tsc;
        request.arguments = { "--noEmit", "--skipLibCheck", path };
        request.timeout = compiler_check_timeout;
        break;
    case Language::Cpp:
        request.command = toolchain.cxx;
        request.arguments = { "-fsyntax-only", "-std=c++17", path };
        request.timeout = compiler_check_timeout;
        break;
    }

    return request;
}

std::optional<std::size_t> find_line_number(std::string_view line, const std::regex& pattern)
{
    std::cmatch match;

    if (!std::regex_search(line.data(), line.data() + line.size(), match, pattern))
        return std::nullopt;

    std::size_t value {};
    const auto [ptr, ec] = std::from_chars(match[1].first, match[1].second, value);

    if (ec != std::errc {})
        return std::nullopt;

    return value;
}

bool contains_any(std::string_view line, std::span<const std::string_view> markers) noexcept
{
    return std::ranges::any_of(markers, [line](std::string_view marker)
        { return line.contains(marker); });
}

std::span<const std::string_view> markers_of(Language language) noexcept
{
    switch (language)
    {
    case Language::Python:
        return python_markers;
    case Language::JavaScript:
        return javascript_markers;
    case Language::TypeScript:
        return typescript_markers;
    case Language::Cpp:
        return cpp_markers;
    }

    std::unreachable();
}

ValidationWarning style(std::string message, std::string_view suggestion)
{
    return ValidationWarning { .type = ValidationWarningType::Style, .message = std::move(message), .file = std::nullopt, .suggestion = std::string { suggestion } };
}

KataJudge::ContentValidationResult single_error(ValidationErrorType type, std::string message)
{
    return KataJudge::ContentValidationResult {
        .is_valid = false,
        .errors = { ValidationError { .type = type, .message = std::move(message) } }
    };
}

}

namespace KataJudge
{

std::string_view to_string(ValidationErrorType type) noexcept
{
    switch (type)
    {
    case ValidationErrorType::Syntax:
        return "syntax";
    case ValidationErrorType::Logic:
        return "logic";
    case ValidationErrorType::Structure:
        return "structure";
    case ValidationErrorType::Metadata:
        return "metadata";
    }

    std::unreachable();
}

std::string_view to_string(ValidationWarningType type) noexcept
{
    switch (type)
    {
    case ValidationWarningType::Style:
        return "style";
    case ValidationWarningType::Performance:
        return "performance";
    case ValidationWarningType::Clarity:
        return "clarity";
    }

    std::unreachable();
}

std::vector<ValidationError> parse_diagnostics(Language language, std::string_view output)
{
    // Python prints the location on a `File "...", line N` line above the
    // message; Node.js prints `path:N` above it.
    static const std::regex python_line { R"(line (\d+))" };
    static const std::regex javascript_location { R"(:(\d+)$)" };
    static const std::regex colon_line { R"(:(\d+):)" };
    static const std::regex typescript_line { R"(\((\d+),\d+\):)" };

    const auto markers = markers_of(language);
    const auto file = entry_file_name(language);

    std::vector<ValidationError> errors;
    std::optional<std::size_t> remembered_line;

    for (const auto part : std::views::split(output, '\n'))
    {
        const auto line = trim(std::string_view { part.begin(), part.end() });

        if (!contains_any(line, markers))
        {
            if (language == Language::Python)
            {
                if (const auto number = find_line_number(line, python_line); number.has_value())
                    remembered_line = number;
            }
            else if (language == Language::JavaScript)
            {
                if (const auto number = find_line_number(line, javascript_location); number.has_value())
                    remembered_line = number;
            }

            continue;
        }

        std::optional<std::size_t> number;

        switch (language)
        {
        case Language::Python:
            number = find_line_number(line, python_line);
            break;
        case Language::JavaScript:
        case Language::Cpp:
            number = find_line_number(line, colon_line);
            break;
        case Language::TypeScript:
            number = find_line_number(line, typescript_line);
            break;
        }

        if (!number.has_value())
            number = remembered_line;

        errors.push_back({ .type = ValidationErrorType::Syntax, .message = std::string { line }, .file = file, .line = number });
    }

    return errors;
}

std::vector<ValidationWarning> check_style(Language language, std::string_view code)
{
    std::vector<ValidationWarning> warnings;

    switch (language)
    {
    case Language::Python:
    {
        if (!code.contains("def "))
            warnings.push_back(style("No function definitions found", "Consider defining functions for better code organization"));

        if (code.contains('\t'))
            warnings.push_back(style("Tabs found in code", "Use spaces instead of tabs for indentation (PEP 8)"));

        const auto long_lines = std::ranges::count_if(std::views::split(code, '\n'), [](const auto& line)
            { return static_cast<std::size_t>(std::ranges::distance(line)) > max_python_line_length; });

        if (long_lines > 0)
            warnings.push_back(style(std::format("{:d} line(s) exceed {:d} characters", long_lines, max_python_line_length), "Consider breaking long lines (PEP 8 recommendation)"));

        break;
    }
    case Language::JavaScript:
        if (!code.contains("function") && !code.contains("=>"))
            warnings.push_back(style("No function definitions found", "Consider defining functions for better code organization"));

        if (code.contains("var "))
            warnings.push_back(style("var declarations found", "Consider using let or const instead of var"));

        if (!code.contains("module.exports") && !code.contains("export"))
            warnings.push_back(style("No exports found", "Consider exporting functions for testing"));

        break;
    case Language::TypeScript:
        if (!code.contains(": ") && !code.contains("interface") && !code.contains("type "))
            warnings.push_back(style("No type annotations found", "Consider adding type annotations for better type safety"));

        if (code.contains("any"))
            warnings.push_back(style("any type found", "Consider using more specific types instead of any"));

        if (!code.contains("export"))
            warnings.push_back(style("No exports found", "Consider exporting functions for testing"));

        break;
    case Language::Cpp:
        if (!code.contains("#include"))
            warnings.push_back(style("No include statements found", "Consider including necessary headers"));

        if (!code.contains("std::") && code.contains("using namespace std"))
            warnings.push_back(style("using namespace std found", "Consider using std:: prefix instead of using namespace std"));

        if (code.contains("malloc") || code.contains("free"))
            warnings.push_back(style("C-style memory management found", "Consider using new/delete or smart pointers in C++"));

        break;
    }

    return warnings;
}

SyntaxValidator::SyntaxValidator(Runner& runner, ToolchainConfig toolchain) :
    m_runner { runner }, m_toolchain { std::move(toolchain) } { }

ContentValidationResult SyntaxValidator::check_syntax(std::string_view code, std::string_view language) const
{
    if (language == no_language)
        return ContentValidationResult { .is_valid = true };

    const auto parsed = parse_language(language);

    if (!parsed.has_value())
        return single_error(ValidationErrorType::Syntax, std::format("Unsupported language: {:s}", language));

    return check_syntax(code, *parsed);
}

ContentValidationResult SyntaxValidator::check_syntax(std::string_view code, Language language) const
{
    ContentValidationResult result;

    try
    {
        const Workspace scratch { "katajudge-check" };

        const auto file = scratch.write_file(entry_file_name(language), code);

        const auto process = m_runner.run(checker_request(language, m_toolchain, file));

        if (process.status == ProcessResult::Status::SpawnFailed)
        {
            logd("No syntax checker for {:s}: {:s}", language_info(language).name, trim(process.err));

            result.errors.push_back({ .type = ValidationErrorType::Syntax, .message = std::string { missing_toolchain_message(language) } });
        }
        else if (!process.success)
        {
            result.errors = parse_diagnostics(language, std::format("{:s}\n{:s}", process.out, process.err));

            if (result.errors.empty())
            {
                const auto details = trim(process.err.empty() ? process.out : process.err);

                result.errors.push_back({
                    .type = ValidationErrorType::Syntax,
                    .message = details.empty() ? std::format("{:s} syntax check failed", language_info(language).name) : std::string { details },
                    .file = entry_file_name(language),
                });
            }
        }
    }
    catch (const WorkspaceError& error)
    {
        result.errors.push_back({ .type = ValidationErrorType::Syntax, .message = std::format("{:s} validation failed: {:s}", language_info(language).name, error.what()) });
    }

    result.warnings = check_style(language, code);
    result.is_valid = result.errors.empty();

    return result;
}

ContentValidationResult validate_test_cases(std::string_view tests, std::string_view solution, std::string_view language, const Executor& executor)
{
    if (language == no_language)
        return ContentValidationResult { .is_valid = true };

    const auto parsed = parse_language(language);

    if (!parsed.has_value())
        return single_error(ValidationErrorType::Logic, std::format("Unsupported language: {:s}", language));

    ContentValidationResult validation;

    try
    {
        const Workspace scratch { "katajudge-validation" };

        const auto tests_name = test_file_name(*parsed, false);

        scratch.write_file(entry_file_name(*parsed), solution);
        scratch.write_file(tests_name, tests);

        const auto result = executor.execute_code(language, solution, tests_name, scratch.path(), false, test_validation_timeout);

        if (!result.success)
        {
            validation.errors.push_back({ .type = ValidationErrorType::Logic, .message = "Test execution failed", .file = "tests" });

            if (!result.errors.empty())
                validation.errors.push_back({ .type = ValidationErrorType::Logic, .message = std::format("Test errors: {:s}", result.errors), .file = "tests" });
        }
        else
        {
            const auto failed = std::ranges::count_if(result.test_results, [](const TestResult& test)
                { return !test.passed; });

            if (failed > 0)
            {
                validation.errors.push_back({ .type = ValidationErrorType::Logic, .message = std::format("{:d} test(s) failed", failed), .file = "tests" });

                for (const auto& test : result.test_results)
                {
                    if (!test.passed)
                        validation.errors.push_back({ .type = ValidationErrorType::Logic, .message = std::format(R"(Test "{:s}" failed: {:s})", test.name, test.message.value_or("No message")), .file = "tests" });
                }
            }

            if (result.test_results.size() < min_test_count)
                validation.warnings.push_back({ .type = ValidationWarningType::Clarity, .message = "Consider adding more test cases for better coverage", .file = "tests", .suggestion = "Add edge cases and boundary conditions" });

            static const std::regex generic_name { R"(test_?\d+)" };

            const auto has_generic_name = std::ranges::any_of(result.test_results, [](const TestResult& test)
                { return std::regex_match(test.name, generic_name) || test.name == "test" || test.name == "unknown_test"; });

            if (has_generic_name)
                validation.warnings.push_back({ .type = ValidationWarningType::Clarity, .message = "Test names could be more descriptive", .file = "tests", .suggestion = "Use descriptive test names that explain what is being tested" });
        }
    }
    catch (const WorkspaceError& error)
    {
        validation.errors.push_back({ .type = ValidationErrorType::Logic, .message = std::format("Test validation failed: {:s}", error.what()) });
    }

    validation.is_valid = validation.errors.empty();

    return validation;
}

void to_json(nlohmann::json& json, const ValidationError& error)
{
    json = nlohmann::json {
        { "type", to_string(error.type) },
        { "message", error.message }
    };

    if (error.file.has_value())
        json["file"] = *error.file;

    if (error.line.has_value())
        json["line"] = *error.line;
}

void to_json(nlohmann::json& json, const ValidationWarning& warning)
{
    json = nlohmann::json {
        { "type", to_string(warning.type) },
        { "message", warning.message }
    };

    if (warning.file.has_value())
        json["file"] = *warning.file;

    if (warning.suggestion.has_value())
        json["suggestion"] = *warning.suggestion;
}

void to_json(nlohmann::json& json, const ContentValidationResult& result)
{
    json = nlohmann::json {
        { "isValid", result.is_valid },
        { "errors", result.errors },
        { "warnings", result.warnings },
        { "suggestions", result.suggestions }
    };
}

} // namespace KataJudge
