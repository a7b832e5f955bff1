#define BOOST_TEST_MODULE test_execution
#include <boost/test/unit_test.hpp>

#include <algorithm>   // std::ranges::all_of
#include <chrono>      // std::chrono::milliseconds, std::chrono::seconds
#include <filesystem>  // std::filesystem::path
#include <string>      // std::string
#include <string_view> // std::string_view

#include <katajudge/executor.hpp>  // KataJudge::Executor
#include <katajudge/pipeline.hpp>  // KataJudge::execution_args
#include <katajudge/runner.hpp>    // KataJudge::find_executable, KataJudge::SubprocessRunner
#include <katajudge/scoring.hpp>   // KataJudge::combine_results
#include <katajudge/types.hpp>     // KataJudge::ExecutionResult, KataJudge::Language, KataJudge::TestResult
#include <katajudge/workspace.hpp> // KataJudge::read_file, KataJudge::Workspace

using KataJudge::Language;

namespace
{

constexpr std::string_view python_tests {
    "from entry import add\n"
    "\n"
    "def test_add():\n"
    "    assert add(1, 2) == 3, \"add(1, 2) should be 3\"\n"
    "\n"
    "def test_negative():\n"
    "    assert add(-2, -3) == -5, \"add(-2, -3) should be -5\"\n"
    "\n"
    "test_add()\n"
    "test_negative()\n"
    "print(\"All public tests passed!\")\n"
};

constexpr std::string_view python_hidden_tests {
    "from entry import add\n"
    "\n"
    "def test_large():\n"
    "    assert add(10**12, 1) == 10**12 + 1\n"
    "\n"
    "test_large()\n"
    "print(\"All hidden tests passed!\")\n"
};

constexpr std::string_view javascript_tests {
    "const { add } = require('./entry');\n"
    "\n"
    "function test_add() {\n"
    "    const result = add(1, 2);\n"
    "    if (result !== 3) throw new Error(`Expected 3, got ${result}`);\n"
    "}\n"
    "\n"
    "function test_zero() {\n"
    "    if (add(0, 0) !== 0) throw new Error('Expected 0');\n"
    "}\n"
    "\n"
    "test_add();\n"
    "test_zero();\n"
    "console.log('All public tests passed!');\n"
};

constexpr std::string_view cpp_cases {
    "1 2\n"
    "---\n"
    "3\n"
    "===\n"
    "10 20\n"
    "---\n"
    "30\n"
};

constexpr std::string_view cpp_solution {
    "#include <iostream>\n"
    "\n"
    "int main()\n"
    "{\n"
    "    long long a {}, b {};\n"
    "    std::cin >> a >> b;\n"
    "    std::cout << a + b << '\\n';\n"
    "}\n"
};

boost::test_tools::assertion_result python_available(boost::unit_test::test_unit_id /*unused*/)
{
    return !KataJudge::find_executable("python3").empty();
}

boost::test_tools::assertion_result node_available(boost::unit_test::test_unit_id /*unused*/)
{
    return !KataJudge::find_executable("node").empty();
}

boost::test_tools::assertion_result compiler_available(boost::unit_test::test_unit_id /*unused*/)
{
    return !KataJudge::find_executable("g++").empty();
}

KataJudge::ExecutionResult run(Language language, std::string_view code, const std::filesystem::path& kata, bool hidden = false, std::chrono::milliseconds timeout = std::chrono::seconds { 20 })
{
    KataJudge::SubprocessRunner runner;
    const KataJudge::Executor executor { runner };

    return executor.execute_code(language, { .user_code = code, .test_file_name = {}, .kata_dir = kata, .hidden = hidden, .timeout = timeout });
}

bool all_passed(const KataJudge::ExecutionResult& result)
{
    return !result.test_results.empty() && std::ranges::all_of(result.test_results, [](const KataJudge::TestResult& test)
        { return test.passed; });
}

}

BOOST_AUTO_TEST_CASE(python_correct_solution, *boost::unit_test::precondition(python_available))
{
    const KataJudge::Workspace kata { "katajudge-kata-test" };
    kata.write_file("tests.py", python_tests);
    kata.write_file("entry.py", "raise NotImplementedError\n");

    const auto result = run(Language::Python, "def add(a, b):\n    return a + b\n", kata.path());

    BOOST_CHECK_MESSAGE(result.success, result.errors);
    BOOST_CHECK_EQUAL(result.test_results.size(), 2U);
    BOOST_CHECK(all_passed(result));
    BOOST_CHECK_CLOSE(result.score.value_or(-1.0), 100.0, 1e-9);

    // The stub of the kata is never replaced by the submission.
    BOOST_CHECK_EQUAL(KataJudge::read_file(kata.path() / "entry.py"), "raise NotImplementedError\n");
}

BOOST_AUTO_TEST_CASE(python_wrong_solution, *boost::unit_test::precondition(python_available))
{
    const KataJudge::Workspace kata { "katajudge-kata-test" };
    kata.write_file("tests.py", python_tests);

    const auto result = run(Language::Python, "def add(a, b):\n    return a - b\n", kata.path());

    BOOST_CHECK(!result.success);
    BOOST_REQUIRE_EQUAL(result.test_results.size(), 2U);
    BOOST_CHECK_EQUAL(result.test_results[0].name, "test_add");
    BOOST_CHECK_EQUAL(result.test_results[0].message.value_or(""), "add(1, 2) should be 3");
    BOOST_CHECK(!result.test_results[1].passed);
    BOOST_CHECK(result.errors.contains("AssertionError"));
}

BOOST_AUTO_TEST_CASE(python_infinite_loop, *boost::unit_test::precondition(python_available))
{
    const KataJudge::Workspace kata { "katajudge-kata-test" };
    kata.write_file("tests.py", python_tests);

    const auto result = run(Language::Python, "while True:\n    pass\n", kata.path(), false, std::chrono::milliseconds { 1000 });

    BOOST_CHECK(!result.success);
    BOOST_CHECK(result.errors.contains("Execution timed out"));
    BOOST_CHECK(result.duration < std::chrono::seconds { 10 });
}

BOOST_AUTO_TEST_CASE(python_public_and_hidden, *boost::unit_test::precondition(python_available))
{
    const KataJudge::Workspace kata { "katajudge-kata-test" };
    kata.write_file("tests.py", python_tests);
    kata.write_file("hidden_tests.py", python_hidden_tests);

    constexpr std::string_view solution { "def add(a, b):\n    return a + b\n" };

    const auto public_result = run(Language::Python, solution, kata.path());
    const auto hidden_result = run(Language::Python, solution, kata.path(), true);

    BOOST_CHECK(hidden_result.success);
    BOOST_CHECK_EQUAL(hidden_result.test_results.size(), 1U);

    const auto combined = KataJudge::combine_results(public_result, hidden_result);

    BOOST_CHECK(combined.passed);
    BOOST_CHECK_CLOSE(combined.final_score, 100.0, 1e-9);
}

BOOST_AUTO_TEST_CASE(javascript_solutions, *boost::unit_test::precondition(node_available))
{
    const KataJudge::Workspace kata { "katajudge-kata-test" };
    kata.write_file("tests.js", javascript_tests);

    const auto correct = run(Language::JavaScript, "function add(a, b) { return a + b; }\nmodule.exports = { add };\n", kata.path());

    BOOST_CHECK_MESSAGE(correct.success, correct.errors);
    BOOST_CHECK_EQUAL(correct.test_results.size(), 2U);
    BOOST_CHECK(all_passed(correct));

    const auto wrong = run(Language::JavaScript, "function add(a, b) { return a - b; }\nmodule.exports = { add };\n", kata.path());

    BOOST_CHECK(!wrong.success);
    BOOST_REQUIRE(!wrong.test_results.empty());
    BOOST_CHECK(!wrong.test_results[0].passed);
    BOOST_CHECK_EQUAL(wrong.test_results[0].message.value_or(""), "Error: Expected 3, got -1");
}

BOOST_AUTO_TEST_CASE(cpp_solutions, *boost::unit_test::precondition(compiler_available))
{
    const KataJudge::Workspace kata { "katajudge-kata-test" };
    kata.write_file("tests.txt", cpp_cases);

    const auto correct = run(Language::Cpp, cpp_solution, kata.path());

    BOOST_CHECK_MESSAGE(correct.success, correct.errors);
    BOOST_CHECK_EQUAL(correct.test_results.size(), 2U);
    BOOST_CHECK(all_passed(correct));

    const auto wrong = run(Language::Cpp, "#include <iostream>\nint main() { std::cout << 3 << '\\n'; }\n", kata.path());

    BOOST_CHECK(!wrong.success);
    BOOST_REQUIRE_EQUAL(wrong.test_results.size(), 2U);
    BOOST_CHECK(wrong.test_results[0].passed);
    BOOST_CHECK_EQUAL(wrong.test_results[1].message.value_or(""), R"(Expected: "30", Got: "3")");
    BOOST_CHECK_CLOSE(wrong.score.value_or(-1.0), 50.0, 1e-9);

    const auto broken = run(Language::Cpp, "int main( {}\n", kata.path());

    BOOST_CHECK(!broken.success);
    BOOST_REQUIRE_EQUAL(broken.test_results.size(), 1U);
    BOOST_CHECK_EQUAL(broken.test_results.front().message.value_or(""), "C++ compilation failed");
}
