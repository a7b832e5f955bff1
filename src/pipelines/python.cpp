#include <katajudge/pipeline.hpp>

#include <chrono>     // std::chrono::milliseconds
#include <filesystem> // std::filesystem::path
#include <string>     // std::string

#include <katajudge/logging.hpp> // logging::path_to_utf8

namespace KataJudge
{

ExecutionResult PythonPipeline::run_tests(const Workspace& workspace, const std::string& test_file, std::chrono::milliseconds timeout) const
{
    const auto& directory = workspace.path();
    const auto script = directory / test_file;

    // The tests import the submission with `from entry import ...`.
    const auto process = runner().run({
        .command = toolchain().python,
        .arguments = { logging::path_to_utf8(script) },
        .working_directory = directory,
        .environment = { { "PYTHONPATH", search_path(directory, "PYTHONPATH") } },
        .timeout = timeout,
    });

    return interpreted_result(TestDialect::Python, process, read_file(script));
}

} // namespace KataJudge
