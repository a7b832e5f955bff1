#include <katajudge/pipeline.hpp>

#include <chrono>     // std::chrono::milliseconds
#include <filesystem> // std::filesystem::path
#include <string>     // std::string

#include <katajudge/logging.hpp> // logd

namespace KataJudge
{

ExecutionResult TypeScriptPipeline::run_tests(const Workspace& workspace, const std::string& test_file, std::chrono::milliseconds timeout) const
{
    const auto& directory = workspace.path();

    const auto compilation = runner().run({
        .command = toolchain().tsc,
        .arguments = {
            "--target", "es2020",
            "--module", "commonjs",
            "--esModuleInterop",
            "--allowSyntheticDefaultImports",
            "--moduleResolution", "node",
            "--skipLibCheck",
            entry_file_name(Language::TypeScript),
            test_file },
        .working_directory = directory,
        .timeout = timeout,
        .timeout_message = "TypeScript compilation timed out",
    });

    if (compilation.status == ProcessResult::Status::SpawnFailed)
    {
        logd("The TypeScript compiler `{:s}` is not available.", toolchain().tsc);

        return ExecutionResult {
            .errors = "TypeScript compiler not available. Please install TypeScript globally: npm install -g typescript",
            .test_results = { { .name = "compilation", .passed = false, .message = "TypeScript compiler not found" } }
        };
    }

    if (!compilation.success)
    {
        return ExecutionResult {
            .output = compilation.out,
            .errors = compilation.err,
            .test_results = { { .name = "compilation", .passed = false, .message = "TypeScript compilation failed" } }
        };
    }

    // `tsc` writes `tests.js` next to `tests.ts`.
    auto script = directory / test_file;
    script.replace_extension(".js");

    return run_script(workspace, script, read_file(directory / test_file), timeout);
}

} // namespace KataJudge
