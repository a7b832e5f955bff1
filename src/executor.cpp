#include <katajudge/executor.hpp>

#include <chrono>      // std::chrono::milliseconds
#include <cstddef>     // std::size_t
#include <filesystem>  // std::filesystem::path
#include <format>      // std::format
#include <span>        // std::span
#include <string_view> // std::string_view
#include <utility>     // std::to_underlying

#include <katajudge/logging.hpp> // logd

namespace KataJudge
{

Executor::Executor(Runner& runner, ToolchainConfig toolchain)
{
    for (std::size_t i {}; i < m_pipelines.size(); ++i)
        m_pipelines[i] = make_pipeline(static_cast<Language>(i), runner, toolchain);
}

Executor::Executor(Runner& runner, const ToolchainConfig& toolchain, std::span<const Language> languages)
{
    for (const auto language : languages)
        m_pipelines[std::to_underlying(language)] = make_pipeline(language, runner, toolchain);
}

ExecutionResult Executor::execute_code(std::string_view language, std::string_view user_code, std::string_view test_file_name, const std::filesystem::path& kata_dir, bool hidden, std::chrono::milliseconds timeout) const
{
    const auto parsed = parse_language(language);

    if (!parsed.has_value())
    {
        logd("Unsupported language `{:s}`.", language);

        return ExecutionResult { .errors = std::format("Unsupported language: {:s}", language) };
    }

    return execute_code(*parsed, {
        .user_code = user_code,
        .test_file_name = test_file_name,
        .kata_dir = kata_dir,
        .hidden = hidden,
        .timeout = timeout,
    });
}

ExecutionResult Executor::execute_code(Language language, const execution_args& args) const
{
    const auto& pipeline = m_pipelines[std::to_underlying(language)];

    if (pipeline == nullptr)
        return ExecutionResult { .errors = std::format("{:s} execution not implemented yet", language_info(language).name) };

    return pipeline->execute(args);
}

bool Executor::supports(Language language) const noexcept
{
    return m_pipelines[std::to_underlying(language)] != nullptr;
}

} // namespace KataJudge
