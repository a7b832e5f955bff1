#ifndef EXECUTOR_HPP
#define EXECUTOR_HPP

#include <array>       // std::array
#include <chrono>      // std::chrono::milliseconds
#include <filesystem>  // std::filesystem::path
#include <memory>      // std::unique_ptr
#include <span>        // std::span
#include <string_view> // std::string_view

#include <katajudge/pipeline.hpp>  // KataJudge::Pipeline, KataJudge::execution_args
#include <katajudge/runner.hpp>    // KataJudge::Runner
#include <katajudge/toolchain.hpp> // KataJudge::ToolchainConfig
#include <katajudge/types.hpp>     // KataJudge::ExecutionResult, KataJudge::Language

namespace KataJudge
{

inline constexpr std::chrono::milliseconds default_timeout { 5000 };

/** Dispatches submissions to the pipeline of their language. */
class Executor
{
public:
    /** Registers a pipeline for every language. */
    explicit Executor(Runner& runner, ToolchainConfig toolchain = {});

    /** Registers pipelines for @p languages only. */
    Executor(Runner& runner, const ToolchainConfig& toolchain, std::span<const Language> languages);

    /**
     * Runs @p user_code against the public or hidden suite of @p kata_dir.
     *
     * @param language The tag of the language, such as `py`. Unknown tags
     * are reported in the result.
     */
    [[nodiscard]] ExecutionResult execute_code(std::string_view language, std::string_view user_code, std::string_view test_file_name, const std::filesystem::path& kata_dir, bool hidden = false, std::chrono::milliseconds timeout = default_timeout) const;

    [[nodiscard]] ExecutionResult execute_code(Language language, const execution_args& args) const;

    [[nodiscard]] bool supports(Language language) const noexcept;

private:
    std::array<std::unique_ptr<Pipeline>, available_languages.size()> m_pipelines;
};

} // namespace KataJudge

#endif
