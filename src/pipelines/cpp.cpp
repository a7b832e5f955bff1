#include <katajudge/pipeline.hpp>

#include <algorithm>   // std::ranges::all_of
#include <chrono>      // std::chrono::milliseconds
#include <cstddef>     // std::size_t
#include <format>      // std::format
#include <ranges>      // std::views::enumerate
#include <string>      // std::string
#include <string_view> // std::string_view

#include <katajudge/logging.hpp> // logd
#include <katajudge/parser.hpp>  // KataJudge::parse_io_cases, KataJudge::score_from, KataJudge::trim

namespace
{

constexpr std::string_view solution_name { "solution" };

/** Why a case that did not exit successfully failed. */
std::string failure_reason(const KataJudge::ProcessResult& process, const std::string& timeout_message)
{
    switch (process.status)
    {
    case KataJudge::ProcessResult::Status::TimedOut:
        return timeout_message;
    case KataJudge::ProcessResult::Status::SpawnFailed:
        return std::string { KataJudge::trim(process.err) };
    case KataJudge::ProcessResult::Status::Exited:
        break;
    }

    return std::format("Process exited with code {:d}. stderr: {:s}", process.exit_code.value_or(-1), process.err);
}

}

namespace KataJudge
{

ExecutionResult CppPipeline::run_tests(const Workspace& workspace, const std::string& test_file, std::chrono::milliseconds timeout) const
{
    const auto& directory = workspace.path();

    const auto compilation = runner().run({
        .command = toolchain().cxx,
        .arguments = { "-std=c++20", "-O2", "-Wall", "-Wextra", "-o", std::string { solution_name }, entry_file_name(Language::Cpp) },
        .working_directory = directory,
        .timeout = timeout,
        .timeout_message = "C++ compilation timed out",
    });

    if (compilation.status == ProcessResult::Status::SpawnFailed)
    {
        logd("The C++ compiler `{:s}` is not available.", toolchain().cxx);

        return ExecutionResult {
            .errors = "C++ compiler not available. Please install g++ or clang++",
            .test_results = { { .name = "compilation", .passed = false, .message = "C++ compiler not found" } }
        };
    }

    if (!compilation.success)
    {
        return ExecutionResult {
            .output = compilation.out,
            .errors = compilation.err,
            .test_results = { { .name = "compilation", .passed = false, .message = "C++ compilation failed" } }
        };
    }

    const auto cases = parse_io_cases(read_file(directory / test_file));

    if (cases.empty())
        return ExecutionResult { .errors = "No test cases found in test file" };

    ExecutionResult result;
    result.test_results.reserve(cases.size());

    const ProcessRequest base_request {
        .command = std::format("./{:s}", solution_name),
        .working_directory = directory,
        .timeout = timeout,
    };

    for (const auto [index, test_case] : std::views::enumerate(cases))
    {
        const auto number = static_cast<std::size_t>(index) + 1;

        auto request = base_request;
        request.input = std::format("{:s}\n", test_case.input);

        const auto process = runner().run(request);

        if (!process.success)
        {
            const auto reason = failure_reason(process, request.timeout_message);

            logd("Case {:d} failed to run: {:s}", number, reason);

            result.test_results.push_back({
                .name = std::format("test_{:d}", number),
                .passed = false,
                .message = std::format("Test execution failed: {:s}", reason),
                .expected = test_case.expected_output,
                .actual = std::string {},
                .input = test_case.input,
            });

            result.errors += std::format("Test {:d} error: {:s}\n", number, reason);

            continue;
        }

        const auto actual = trim(process.out);
        const auto passed = actual == test_case.expected_output;

        result.test_results.push_back({
            .name = std::format("test_{:d}", number),
            .passed = passed,
            .message = passed ? std::string { "Test passed" } : std::format(R"(Expected: "{:s}", Got: "{:s}")", test_case.expected_output, actual),
            .expected = test_case.expected_output,
            .actual = std::string { actual },
            .input = test_case.input,
        });

        result.output += std::format("Test {:d}:\n{:s}\n", number, process.out);

        if (!process.err.empty())
            result.errors += std::format("Test {:d} stderr:\n{:s}\n", number, process.err);
    }

    result.success = std::ranges::all_of(result.test_results, [](const TestResult& test)
        { return test.passed; });
    result.score = score_from(result.test_results);

    return result;
}

} // namespace KataJudge
