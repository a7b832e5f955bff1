#define BOOST_TEST_MODULE test_pipelines
#include <boost/test/unit_test.hpp>

#include <array>       // std::array
#include <chrono>      // std::chrono::milliseconds
#include <filesystem>  // std::filesystem::exists, std::filesystem::path
#include <stdexcept>   // std::runtime_error
#include <string>      // std::string
#include <string_view> // std::string_view
#include <thread>      // std::this_thread::sleep_for

#include <nlohmann/json.hpp> // nlohmann::json

#include <katajudge/executor.hpp>  // KataJudge::Executor
#include <katajudge/pipeline.hpp>  // KataJudge::execution_args, KataJudge::entry_file_name, KataJudge::test_file_name
#include <katajudge/runner.hpp>    // KataJudge::ProcessRequest, KataJudge::ProcessResult
#include <katajudge/toolchain.hpp> // KataJudge::ToolchainConfig
#include <katajudge/types.hpp>     // KataJudge::Language
#include <katajudge/workspace.hpp> // KataJudge::read_file, KataJudge::Workspace

#include <test_utils.hpp> // exited, FakeRunner, spawn_failed, staged_file, timed_out

using KataJudge::Language;
using KataJudge::ProcessRequest;
using KataJudge::ProcessResult;

namespace
{

constexpr std::string_view python_tests {
    "from entry import add\n"
    "\n"
    "def test_small():\n"
    "    assert add(1, 2) == 3\n"
    "\n"
    "def test_negative():\n"
    "    assert add(-1, -2) == -3, \"add(-1, -2) should be -3\"\n"
    "\n"
    "def test_zero():\n"
    "    assert add(0, 0) == 0\n"
};

constexpr std::string_view python_submission { "def add(a, b):\n    return a + b\n" };

constexpr std::string_view cpp_test_cases {
    "1 2\n"
    "---\n"
    "3\n"
    "===\n"
    "2 2\n"
    "---\n"
    "5\n"
};

KataJudge::ExecutionResult execute(const KataJudge::Executor& executor, Language language, std::string_view code, const std::filesystem::path& kata, bool hidden = false)
{
    return executor.execute_code(language, KataJudge::execution_args { .user_code = code, .test_file_name = {}, .kata_dir = kata, .hidden = hidden, .timeout = std::chrono::milliseconds { 1000 } });
}

}

BOOST_AUTO_TEST_CASE(file_names)
{
    BOOST_CHECK_EQUAL(KataJudge::test_file_name(Language::Python, false), "tests.py");
    BOOST_CHECK_EQUAL(KataJudge::test_file_name(Language::TypeScript, true), "hidden_tests.ts");
    BOOST_CHECK_EQUAL(KataJudge::test_file_name(Language::Cpp, false), "tests.txt");
    BOOST_CHECK_EQUAL(KataJudge::entry_file_name(Language::JavaScript), "entry.js");
    BOOST_CHECK_EQUAL(KataJudge::entry_file_name(Language::Cpp), "entry.cpp");
}

BOOST_AUTO_TEST_CASE(python_passing)
{
    const KataJudge::Workspace kata { "katajudge-kata-test" };
    kata.write_file("tests.py", python_tests);

    std::string staged_entry;

    FakeRunner runner { [&staged_entry](const ProcessRequest& request)
        {
            staged_entry = staged_file(request, "entry.py");
            return exited(0, "All public tests passed!\n");
        } };

    const KataJudge::Executor executor { runner };

    const auto result = execute(executor, Language::Python, python_submission, kata.path());

    BOOST_CHECK(result.success);
    BOOST_REQUIRE_EQUAL(result.test_results.size(), 3U);
    BOOST_CHECK(result.test_results[0].passed);
    BOOST_REQUIRE(result.score.has_value());
    BOOST_CHECK_CLOSE(*result.score, 100.0, 1e-9);
    BOOST_CHECK_EQUAL(staged_entry, python_submission);

    BOOST_REQUIRE_EQUAL(runner.requests.size(), 1U);

    const auto& request = runner.requests.front();

    BOOST_CHECK_EQUAL(request.command, "python3");
    BOOST_REQUIRE_EQUAL(request.arguments.size(), 1U);
    BOOST_CHECK_EQUAL(std::filesystem::path { request.arguments.front() }, request.working_directory / "tests.py");
    BOOST_CHECK_EQUAL(request.timeout.count(), 1000);
    BOOST_CHECK_NE(request.working_directory, kata.path());

    BOOST_REQUIRE_EQUAL(request.environment.size(), 1U);
    BOOST_CHECK_EQUAL(request.environment.front().first, "PYTHONPATH");
    BOOST_CHECK(request.environment.front().second.starts_with(request.working_directory.string()));

    // The workspace is gone and the kata was left untouched.
    BOOST_CHECK(!std::filesystem::exists(request.working_directory));
    BOOST_CHECK(!std::filesystem::exists(kata.path() / "entry.py"));
}

BOOST_AUTO_TEST_CASE(python_failing)
{
    const KataJudge::Workspace kata { "katajudge-kata-test" };
    kata.write_file("tests.py", python_tests);
    kata.write_file("entry.py", "# reference solution\n");

    FakeRunner runner { [](const ProcessRequest&)
        {
            return exited(1, "", "Traceback (most recent call last):\n    test_negative()\nAssertionError: add(-1, -2) should be -3\n");
        } };

    const KataJudge::Executor executor { runner };

    const auto result = execute(executor, Language::Python, "def add(a, b):\n    return abs(a) + abs(b)\n", kata.path());

    BOOST_CHECK(!result.success);
    BOOST_REQUIRE_EQUAL(result.test_results.size(), 3U);
    BOOST_CHECK_EQUAL(result.test_results[0].name, "test_negative");
    BOOST_CHECK_EQUAL(result.test_results[0].message.value_or(""), "add(-1, -2) should be -3");
    BOOST_CHECK_EQUAL(result.test_results[1].message.value_or(""), "Test not executed due to earlier failure");
    BOOST_CHECK(result.errors.contains("AssertionError"));
    BOOST_CHECK_CLOSE(result.score.value_or(-1.0), 0.0, 1e-9);

    BOOST_CHECK_EQUAL(KataJudge::read_file(kata.path() / "entry.py"), "# reference solution\n");
}

BOOST_AUTO_TEST_CASE(missing_test_file)
{
    const KataJudge::Workspace kata { "katajudge-kata-test" };
    kata.write_file("tests.py", python_tests);

    FakeRunner runner { [](const ProcessRequest&)
        { return exited(0); } };

    const KataJudge::Executor executor { runner };

    const auto result = execute(executor, Language::Python, python_submission, kata.path(), true);

    BOOST_CHECK(!result.success);
    BOOST_CHECK_EQUAL(result.errors, "Test file not found: hidden_tests.py");
    BOOST_CHECK(result.test_results.empty());
    BOOST_CHECK(runner.requests.empty());
}

BOOST_AUTO_TEST_CASE(missing_kata_directory)
{
    std::filesystem::path missing;

    {
        const KataJudge::Workspace scratch { "katajudge-kata-test" };
        missing = scratch.path();
    }

    FakeRunner runner { [](const ProcessRequest&)
        { return exited(0); } };

    const KataJudge::Executor executor { runner };

    const auto result = execute(executor, Language::JavaScript, "", missing);

    BOOST_CHECK(!result.success);
    BOOST_CHECK(result.errors.starts_with("Test file not found"));
}

BOOST_AUTO_TEST_CASE(runner_failure)
{
    const KataJudge::Workspace kata { "katajudge-kata-test" };
    kata.write_file("tests.py", python_tests);

    FakeRunner runner { [](const ProcessRequest&) -> ProcessResult
        {
            std::this_thread::sleep_for(std::chrono::milliseconds { 20 });
            throw std::runtime_error { "boom" };
        } };

    const KataJudge::Executor executor { runner };

    const auto result = execute(executor, Language::Python, python_submission, kata.path());

    BOOST_CHECK(!result.success);
    BOOST_CHECK_EQUAL(result.errors, "Execution error: boom");
    BOOST_CHECK(result.test_results.empty());
    BOOST_CHECK(!result.score.has_value());
    BOOST_CHECK(result.duration >= std::chrono::milliseconds { 20 });

    BOOST_REQUIRE_EQUAL(runner.requests.size(), 1U);
    BOOST_CHECK(!std::filesystem::exists(runner.requests.front().working_directory));
}

BOOST_AUTO_TEST_CASE(javascript_hidden_suite)
{
    const KataJudge::Workspace kata { "katajudge-kata-test" };
    kata.write_file("tests.js", "function test_public() {}\n");
    kata.write_file("hidden_tests.js", "function test_a() {}\nfunction test_b() {}\n");

    FakeRunner runner { [](const ProcessRequest&)
        { return exited(0, "All hidden tests passed!\n"); } };

    const KataJudge::ToolchainConfig toolchain { .node = "/opt/node/bin/node" };
    const KataJudge::Executor executor { runner, toolchain };

    const auto result = execute(executor, Language::JavaScript, "module.exports = {};\n", kata.path(), true);

    BOOST_CHECK(result.success);
    BOOST_CHECK_EQUAL(result.test_results.size(), 2U);

    BOOST_REQUIRE_EQUAL(runner.requests.size(), 1U);
    BOOST_CHECK_EQUAL(runner.requests.front().command, "/opt/node/bin/node");
    BOOST_CHECK(runner.requests.front().arguments.front().ends_with("hidden_tests.js"));
    BOOST_CHECK_EQUAL(runner.requests.front().environment.front().first, "NODE_PATH");
}

BOOST_AUTO_TEST_CASE(javascript_timeout)
{
    const KataJudge::Workspace kata { "katajudge-kata-test" };
    kata.write_file("tests.js", "function test_loop() {}\n");

    FakeRunner runner { [](const ProcessRequest& request)
        { return timed_out(request.timeout_message); } };

    const KataJudge::Executor executor { runner };

    const auto result = execute(executor, Language::JavaScript, "while (true) {}\n", kata.path());

    BOOST_CHECK(!result.success);
    BOOST_CHECK(result.errors.contains("Execution timed out"));
    BOOST_REQUIRE(!result.test_results.empty());
    BOOST_CHECK(!result.test_results.front().passed);
}

BOOST_AUTO_TEST_CASE(typescript_compiles_then_runs)
{
    const KataJudge::Workspace kata { "katajudge-kata-test" };
    kata.write_file("tests.ts", "import { greet } from './entry';\nfunction test_greet() {}\n");

    FakeRunner runner { [](const ProcessRequest& request)
        {
            if (request.command == "tsc")
                return exited(0);

            return exited(0, "All public tests passed!\n");
        } };

    const KataJudge::Executor executor { runner };

    const auto result = execute(executor, Language::TypeScript, "export function greet(): string { return 'hi'; }\n", kata.path());

    BOOST_CHECK(result.success);
    BOOST_CHECK_EQUAL(result.test_results.size(), 1U);

    BOOST_REQUIRE_EQUAL(runner.requests.size(), 2U);

    const auto& compilation = runner.requests[0];
    BOOST_CHECK_EQUAL(compilation.command, "tsc");

    constexpr std::array expected_arguments { "--target", "es2020", "--module", "commonjs", "--esModuleInterop", "--allowSyntheticDefaultImports", "--moduleResolution", "node", "--skipLibCheck", "entry.ts", "tests.ts" };
    BOOST_CHECK_EQUAL_COLLECTIONS(compilation.arguments.begin(), compilation.arguments.end(), expected_arguments.begin(), expected_arguments.end());
    BOOST_CHECK_EQUAL(compilation.timeout_message, "TypeScript compilation timed out");

    const auto& run = runner.requests[1];
    BOOST_CHECK_EQUAL(run.command, "node");
    BOOST_CHECK(run.arguments.front().ends_with("tests.js"));
}

BOOST_AUTO_TEST_CASE(typescript_compiler_missing)
{
    const KataJudge::Workspace kata { "katajudge-kata-test" };
    kata.write_file("tests.ts", "function test_greet() {}\n");

    FakeRunner runner { [](const ProcessRequest& request)
        { return spawn_failed(request.command); } };

    const KataJudge::Executor executor { runner };

    const auto result = execute(executor, Language::TypeScript, "", kata.path());

    BOOST_CHECK(!result.success);
    BOOST_CHECK_EQUAL(result.errors, "TypeScript compiler not available. Please install TypeScript globally: npm install -g typescript");
    BOOST_REQUIRE_EQUAL(result.test_results.size(), 1U);
    BOOST_CHECK_EQUAL(result.test_results.front().name, "compilation");
    BOOST_CHECK_EQUAL(result.test_results.front().message.value_or(""), "TypeScript compiler not found");
}

BOOST_AUTO_TEST_CASE(typescript_compilation_failure)
{
    const KataJudge::Workspace kata { "katajudge-kata-test" };
    kata.write_file("tests.ts", "function test_greet() {}\n");

    FakeRunner runner { [](const ProcessRequest&)
        { return exited(2, "entry.ts(1,17): error TS2322: Type 'number' is not assignable to type 'string'.\n"); } };

    const KataJudge::Executor executor { runner };

    const auto result = execute(executor, Language::TypeScript, "export const x: string = 1;\n", kata.path());

    BOOST_CHECK(!result.success);
    BOOST_CHECK(result.output.contains("error TS2322"));
    BOOST_REQUIRE_EQUAL(result.test_results.size(), 1U);
    BOOST_CHECK_EQUAL(result.test_results.front().message.value_or(""), "TypeScript compilation failed");
    BOOST_CHECK_EQUAL(runner.requests.size(), 1U);
}

BOOST_AUTO_TEST_CASE(cpp_cases)
{
    const KataJudge::Workspace kata { "katajudge-kata-test" };
    kata.write_file("tests.txt", cpp_test_cases);

    FakeRunner runner { [](const ProcessRequest& request)
        {
            if (request.command == "g++")
                return exited(0);

            // Right for the first case only.
            if (request.input == "1 2\n")
                return exited(0, "3\n");

            return exited(0, "4\n", "debug output");
        } };

    const KataJudge::Executor executor { runner };

    const auto result = execute(executor, Language::Cpp, "int main() {}\n", kata.path());

    BOOST_CHECK(!result.success);
    BOOST_REQUIRE_EQUAL(result.test_results.size(), 2U);

    const auto& first = result.test_results[0];
    BOOST_CHECK_EQUAL(first.name, "test_1");
    BOOST_CHECK(first.passed);
    BOOST_CHECK_EQUAL(first.message.value_or(""), "Test passed");
    BOOST_CHECK_EQUAL(first.input.value_or(""), "1 2");

    const auto& second = result.test_results[1];
    BOOST_CHECK_EQUAL(second.name, "test_2");
    BOOST_CHECK(!second.passed);
    BOOST_CHECK_EQUAL(second.message.value_or(""), R"(Expected: "5", Got: "4")");
    BOOST_REQUIRE(second.expected.has_value());
    BOOST_CHECK_EQUAL(second.expected->get<std::string>(), "5");
    BOOST_REQUIRE(second.actual.has_value());
    BOOST_CHECK_EQUAL(second.actual->get<std::string>(), "4");

    BOOST_CHECK_CLOSE(result.score.value_or(-1.0), 50.0, 1e-9);
    BOOST_CHECK(result.output.contains("Test 1:\n3\n"));
    BOOST_CHECK(result.errors.contains("Test 2 stderr:\ndebug output"));

    BOOST_REQUIRE_EQUAL(runner.requests.size(), 3U);

    const auto& compilation = runner.requests[0];
    constexpr std::array expected_arguments { "-std=c++20", "-O2", "-Wall", "-Wextra", "-o", "solution", "entry.cpp" };
    BOOST_CHECK_EQUAL_COLLECTIONS(compilation.arguments.begin(), compilation.arguments.end(), expected_arguments.begin(), expected_arguments.end());

    BOOST_CHECK_EQUAL(runner.requests[1].command, "./solution");
    BOOST_CHECK_EQUAL(runner.requests[2].input, "2 2\n");
}

BOOST_AUTO_TEST_CASE(cpp_runtime_failures)
{
    const KataJudge::Workspace kata { "katajudge-kata-test" };
    kata.write_file("tests.txt", cpp_test_cases);

    FakeRunner runner { [](const ProcessRequest& request)
        {
            if (request.command == "g++")
                return exited(0);

            if (request.input == "1 2\n")
                return exited(139, "", "Segmentation fault");

            return timed_out(request.timeout_message);
        } };

    const KataJudge::Executor executor { runner };

    const auto result = execute(executor, Language::Cpp, "int main() {}\n", kata.path());

    BOOST_CHECK(!result.success);
    BOOST_REQUIRE_EQUAL(result.test_results.size(), 2U);
    BOOST_CHECK_EQUAL(result.test_results[0].message.value_or(""), "Test execution failed: Process exited with code 139. stderr: Segmentation fault");
    BOOST_CHECK_EQUAL(result.test_results[0].actual.value_or(nlohmann::json {}).get<std::string>(), "");
    BOOST_CHECK_EQUAL(result.test_results[1].message.value_or(""), "Test execution failed: Execution timed out");
    BOOST_CHECK(result.errors.contains("Test 1 error: Process exited with code 139"));
    BOOST_CHECK(result.errors.contains("Test 2 error: Execution timed out"));
    BOOST_CHECK_CLOSE(result.score.value_or(-1.0), 0.0, 1e-9);
}

BOOST_AUTO_TEST_CASE(cpp_compiler_errors)
{
    const KataJudge::Workspace kata { "katajudge-kata-test" };
    kata.write_file("tests.txt", cpp_test_cases);

    FakeRunner missing_compiler { [](const ProcessRequest& request)
        { return spawn_failed(request.command); } };

    const auto missing = execute(KataJudge::Executor { missing_compiler }, Language::Cpp, "", kata.path());

    BOOST_CHECK_EQUAL(missing.errors, "C++ compiler not available. Please install g++ or clang++");
    BOOST_REQUIRE_EQUAL(missing.test_results.size(), 1U);
    BOOST_CHECK_EQUAL(missing.test_results.front().message.value_or(""), "C++ compiler not found");

    FakeRunner broken_code { [](const ProcessRequest&)
        { return exited(1, "", "entry.cpp:1:1: error: expected unqualified-id\n"); } };

    const auto failed = execute(KataJudge::Executor { broken_code }, Language::Cpp, "int main( {}\n", kata.path());

    BOOST_CHECK(!failed.success);
    BOOST_CHECK(failed.errors.contains("expected unqualified-id"));
    BOOST_REQUIRE_EQUAL(failed.test_results.size(), 1U);
    BOOST_CHECK_EQUAL(failed.test_results.front().name, "compilation");
    BOOST_CHECK_EQUAL(failed.test_results.front().message.value_or(""), "C++ compilation failed");
}

BOOST_AUTO_TEST_CASE(cpp_without_cases)
{
    const KataJudge::Workspace kata { "katajudge-kata-test" };
    kata.write_file("tests.txt", "this is not a case file\n");

    FakeRunner runner { [](const ProcessRequest&)
        { return exited(0); } };

    const auto result = execute(KataJudge::Executor { runner }, Language::Cpp, "int main() {}\n", kata.path());

    BOOST_CHECK(!result.success);
    BOOST_CHECK_EQUAL(result.errors, "No test cases found in test file");
    BOOST_CHECK(result.test_results.empty());
}

BOOST_AUTO_TEST_CASE(unsupported_languages)
{
    const KataJudge::Workspace kata { "katajudge-kata-test" };

    FakeRunner runner { [](const ProcessRequest&)
        { return exited(0); } };

    const KataJudge::Executor executor { runner };

    const auto unknown = executor.execute_code("ruby", "puts 1", "tests.rb", kata.path());

    BOOST_CHECK(!unknown.success);
    BOOST_CHECK_EQUAL(unknown.errors, "Unsupported language: ruby");

    constexpr std::array only_python { Language::Python };
    const KataJudge::Executor python_only { runner, {}, only_python };

    BOOST_CHECK(python_only.supports(Language::Python));
    BOOST_CHECK(!python_only.supports(Language::Cpp));

    const auto missing = python_only.execute_code("cpp", "int main() {}", "tests.txt", kata.path());

    BOOST_CHECK(!missing.success);
    BOOST_CHECK_EQUAL(missing.errors, "C++ execution not implemented yet");
    BOOST_CHECK(runner.requests.empty());
}
