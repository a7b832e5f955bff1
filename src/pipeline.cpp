#include <katajudge/pipeline.hpp>

#include <chrono>       // std::chrono::duration_cast, std::chrono::milliseconds, std::chrono::steady_clock
#include <cstdlib>      // std::getenv
#include <exception>    // std::exception
#include <filesystem>   // std::filesystem::is_regular_file, std::filesystem::path
#include <format>       // std::format
#include <memory>       // std::make_unique, std::unique_ptr
#include <string>       // std::string
#include <string_view>  // std::string_view
#include <system_error> // std::error_code
#include <utility>      // std::move, std::unreachable

#include <katajudge/logging.hpp> // logd, logging::path_to_utf8

namespace
{

constexpr std::string_view workspace_prefix { "katajudge" };

/** `:` on POSIX systems, `;` on Windows. */
constexpr char path_separator {
#ifdef _WIN32
    ';'
#else
    ':'
#endif
};

}

namespace KataJudge
{

std::string test_file_name(Language language, bool hidden)
{
    return std::format("{:s}.{:s}", hidden ? "hidden_tests" : "tests", language_info(language).test_extension);
}

std::string entry_file_name(Language language)
{
    return std::format("entry.{:s}", language_info(language).source_extension);
}

Pipeline::Pipeline(Runner& runner, ToolchainConfig toolchain) :
    m_runner { runner }, m_toolchain { std::move(toolchain) } { }

ExecutionResult Pipeline::execute(const execution_args& args) const
{
    const auto start = std::chrono::steady_clock::now();

    const auto test_file = test_file_name(language(), args.hidden);

    ExecutionResult result;

    try
    {
        std::error_code error_code;

        if (!std::filesystem::is_regular_file(args.kata_dir / test_file, error_code))
        {
            logd("`{:s}` has no `{:s}`.", logging::path_to_utf8(args.kata_dir), test_file);

            result.errors = std::format("Test file not found: {:s}", test_file);
        }
        else
        {
            const Workspace workspace { workspace_prefix, args.kata_dir };

            workspace.write_file(entry_file_name(language()), args.user_code);

            result = run_tests(workspace, test_file, args.timeout);
        }
    }
    catch (const std::exception& error)
    {
        logd("Execution of a {:s} submission failed: {:s}", language_info(language()).name, error.what());

        result = ExecutionResult { .errors = std::format("Execution error: {:s}", error.what()) };
    }

    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    return result;
}

ExecutionResult Pipeline::interpreted_result(TestDialect dialect, const ProcessResult& process, std::string_view test_source)
{
    ExecutionResult result {
        .success = process.success,
        .output = process.out,
        .errors = process.err,
        .test_results = parse_test_output(dialect, process.out, process.err, process.success, test_source)
    };

    result.score = score_from(result.test_results);

    return result;
}

std::string Pipeline::search_path(const std::filesystem::path& directory, const char* variable)
{
    const auto* current = std::getenv(variable);

    if (current == nullptr || *current == '\0')
        return logging::path_to_utf8(directory);

    return std::format("{:s}{:c}{:s}", logging::path_to_utf8(directory), path_separator, current);
}

std::unique_ptr<Pipeline> make_pipeline(Language language, Runner& runner, const ToolchainConfig& toolchain)
{
    switch (language)
    {
    case Language::Python:
        return std::make_unique<PythonPipeline>(runner, toolchain);
    case Language::JavaScript:
        return std::make_unique<JavaScriptPipeline>(runner, toolchain);
    case Language::TypeScript:
        return std::make_unique<TypeScriptPipeline>(runner, toolchain);
    case Language::Cpp:
        return std::make_unique<CppPipeline>(runner, toolchain);
    }

    std::unreachable();
}

} // namespace KataJudge
