#include <katajudge/pipeline.hpp>

#include <chrono>      // std::chrono::milliseconds
#include <filesystem>  // std::filesystem::path
#include <string>      // std::string
#include <string_view> // std::string_view

#include <katajudge/logging.hpp> // logging::path_to_utf8

namespace KataJudge
{

ExecutionResult JavaScriptPipeline::run_tests(const Workspace& workspace, const std::string& test_file, std::chrono::milliseconds timeout) const
{
    const auto script = workspace.path() / test_file;

    return run_script(workspace, script, read_file(script), timeout);
}

ExecutionResult JavaScriptPipeline::run_script(const Workspace& workspace, const std::filesystem::path& script, std::string_view test_source, std::chrono::milliseconds timeout) const
{
    const auto& directory = workspace.path();

    const auto process = runner().run({
        .command = toolchain().node,
        .arguments = { logging::path_to_utf8(script) },
        .working_directory = directory,
        .environment = { { "NODE_PATH", search_path(directory, "NODE_PATH") } },
        .timeout = timeout,
    });

    return interpreted_result(TestDialect::JavaScript, process, test_source);
}

} // namespace KataJudge
