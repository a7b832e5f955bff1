#ifndef PIPELINE_HPP
#define PIPELINE_HPP

#include <chrono>      // std::chrono::milliseconds
#include <filesystem>  // std::filesystem::path
#include <memory>      // std::unique_ptr
#include <string>      // std::string
#include <string_view> // std::string_view

#include <katajudge/parser.hpp>    // KataJudge::TestDialect
#include <katajudge/runner.hpp>    // KataJudge::ProcessResult, KataJudge::Runner
#include <katajudge/toolchain.hpp> // KataJudge::ToolchainConfig
#include <katajudge/types.hpp>     // KataJudge::ExecutionResult, KataJudge::Language
#include <katajudge/workspace.hpp> // KataJudge::Workspace

namespace KataJudge
{

struct execution_args
{
    std::string_view user_code;

    /**
     * Accepted for compatibility with callers that pass a path. The suite is
     * always chosen by convention from `hidden`.
     */
    std::string_view test_file_name;

    /** Holds `tests.<ext>`, `hidden_tests.<ext>` and any helper files. Never written. */
    const std::filesystem::path& kata_dir;

    bool hidden {};

    /** Applies to every process started, compilers included. */
    std::chrono::milliseconds timeout { 5000 };
};

/** `tests.<ext>` or `hidden_tests.<ext>`. */
[[nodiscard]] std::string test_file_name(Language language, bool hidden);

/** `entry.<ext>`, the file the tests import. */
[[nodiscard]] std::string entry_file_name(Language language);

/**
 * Runs a submission against the test suite of a kata in one language.
 *
 * The kata directory is copied to a fresh Workspace, the submission is
 * written there as the entry file, and the language-specific steps run
 * inside it. Nothing escapes as an exception: every failure is reported in
 * the returned ExecutionResult.
 */
class Pipeline
{
public:
    Pipeline(Runner& runner, ToolchainConfig toolchain);

    virtual ~Pipeline() = default;

    [[nodiscard]] ExecutionResult execute(const execution_args& args) const;

    [[nodiscard]] virtual Language language() const noexcept = 0;

protected:
    /**
     * Compiles and runs the tests. The workspace already holds the kata files
     * and the entry file.
     */
    [[nodiscard]] virtual ExecutionResult run_tests(const Workspace& workspace, const std::string& test_file, std::chrono::milliseconds timeout) const = 0;

    [[nodiscard]] Runner& runner() const noexcept { return m_runner; }

    [[nodiscard]] const ToolchainConfig& toolchain() const noexcept { return m_toolchain; }

    /** Builds the result of an interpreted test script from its output. */
    [[nodiscard]] static ExecutionResult interpreted_result(TestDialect dialect, const ProcessResult& process, std::string_view test_source);

    /** @p directory followed by the current value of @p variable, if any. */
    [[nodiscard]] static std::string search_path(const std::filesystem::path& directory, const char* variable);

private:
    Runner& m_runner;
    ToolchainConfig m_toolchain;
};

class PythonPipeline final : public Pipeline
{
public:
    using Pipeline::Pipeline;

    [[nodiscard]] Language language() const noexcept override { return Language::Python; }

protected:
    [[nodiscard]] ExecutionResult run_tests(const Workspace& workspace, const std::string& test_file, std::chrono::milliseconds timeout) const override;
};

class JavaScriptPipeline : public Pipeline
{
public:
    using Pipeline::Pipeline;

    [[nodiscard]] Language language() const noexcept override { return Language::JavaScript; }

protected:
    [[nodiscard]] ExecutionResult run_tests(const Workspace& workspace, const std::string& test_file, std::chrono::milliseconds timeout) const override;

    /** Runs @p script with Node.js. Test counts are estimated from @p test_source. */
    [[nodiscard]] ExecutionResult run_script(const Workspace& workspace, const std::filesystem::path& script, std::string_view test_source, std::chrono::milliseconds timeout) const;
};

/** Compiles the entry and test files with `tsc`, then runs the emitted JavaScript. */
class TypeScriptPipeline final : public JavaScriptPipeline
{
public:
    using JavaScriptPipeline::JavaScriptPipeline;

    [[nodiscard]] Language language() const noexcept override { return Language::TypeScript; }

protected:
    [[nodiscard]] ExecutionResult run_tests(const Workspace& workspace, const std::string& test_file, std::chrono::milliseconds timeout) const override;
};

/**
 * Compiles the entry file into `solution`, then feeds the input of every case
 * of the case file to it and compares the trimmed standard output with the
 * expected output.
 */
class CppPipeline final : public Pipeline
{
public:
    using Pipeline::Pipeline;

    [[nodiscard]] Language language() const noexcept override { return Language::Cpp; }

protected:
    [[nodiscard]] ExecutionResult run_tests(const Workspace& workspace, const std::string& test_file, std::chrono::milliseconds timeout) const override;
};

[[nodiscard]] std::unique_ptr<Pipeline> make_pipeline(Language language, Runner& runner, const ToolchainConfig& toolchain);

} // namespace KataJudge

#endif
