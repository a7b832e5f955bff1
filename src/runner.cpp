#include <katajudge/runner.hpp>

#include <chrono>       // std::chrono::milliseconds
#include <csignal>      // std::signal, SIGPIPE, SIG_IGN
#include <cstddef>      // std::size_t
#include <cstdlib>      // EXIT_SUCCESS
#include <filesystem>   // std::filesystem::current_path, std::filesystem::exists, std::filesystem::path
#include <format>       // std::format
#include <map>          // std::map
#include <optional>     // std::optional
#include <string>       // std::string
#include <string_view>  // std::string_view
#include <system_error> // std::error_code
#include <utility>      // std::pair
#include <vector>       // std::vector

#include <unistd.h> // environ

#include <boost/asio/buffer.hpp>            // boost::asio::buffer, boost::asio::dynamic_buffer
#include <boost/asio/error.hpp>             // boost::asio::error::operation_aborted
#include <boost/asio/io_context.hpp>        // boost::asio::io_context
#include <boost/asio/read.hpp>              // boost::asio::async_read
#include <boost/asio/readable_pipe.hpp>     // boost::asio::readable_pipe
#include <boost/asio/steady_timer.hpp>      // boost::asio::steady_timer
#include <boost/asio/writable_pipe.hpp>     // boost::asio::writable_pipe
#include <boost/asio/write.hpp>             // boost::asio::async_write
#include <boost/process/v2/environment.hpp> // boost::process::v2::environment::find_executable
#include <boost/process/v2/process.hpp>     // boost::process::v2::process
#include <boost/process/v2/start_dir.hpp>   // boost::process::v2::process_start_dir
#include <boost/process/v2/stdio.hpp>       // boost::process::v2::process_stdio
#include <boost/system/error_code.hpp>      // boost::system::error_code
#include <boost/system/system_error.hpp>    // boost::system::system_error

#include <katajudge/logging.hpp> // logd

namespace
{

namespace asio = boost::asio;
namespace process = boost::process::v2;

using KataJudge::ProcessRequest;
using KataJudge::ProcessResult;

std::vector<std::string> build_environment(const std::vector<std::pair<std::string, std::string>>& overrides)
{
    std::map<std::string, std::string> variables;

    for (char** entry { environ }; *entry != nullptr; ++entry)
    {
        const std::string_view view { *entry };
        const auto separator = view.find('=');

        if (separator == std::string_view::npos)
            continue;

        variables.insert_or_assign(std::string { view.substr(0, separator) }, std::string { view.substr(separator + 1) });
    }

    for (const auto& [key, value] : overrides)
        variables.insert_or_assign(key, value);

    std::vector<std::string> environment;
    environment.reserve(variables.size());

    for (const auto& [key, value] : variables)
        environment.emplace_back(std::format("{:s}={:s}", key, value));

    return environment;
}

std::filesystem::path working_directory_of(const ProcessRequest& request)
{
    if (!request.working_directory.empty())
        return request.working_directory;

    std::error_code error_code;

    return std::filesystem::current_path(error_code);
}

std::filesystem::path resolve_command(const ProcessRequest& request)
{
    const std::filesystem::path command { request.command };

    if (!command.has_parent_path())
        return KataJudge::find_executable(request.command);

    const auto path = command.is_absolute() ? command : working_directory_of(request) / command;

    std::error_code error_code;

    return std::filesystem::exists(path, error_code) ? path : std::filesystem::path {};
}

ProcessResult spawn_failure(std::string message)
{
    ProcessResult result;
    result.status = ProcessResult::Status::SpawnFailed;
    result.err = std::move(message);

    return result;
}

}

namespace KataJudge
{

SubprocessRunner::SubprocessRunner()
{
    // Writing the input of a child that exited early must not kill this process.
    std::signal(SIGPIPE, SIG_IGN);
}

ProcessResult SubprocessRunner::run(const ProcessRequest& request)
{
    const auto executable = resolve_command(request);

    if (executable.empty())
    {
        logd("Could not find the executable `{:s}`.", request.command);

        return spawn_failure(std::format("Process error: could not find the executable `{:s}`.", request.command));
    }

    asio::io_context ctx;

    asio::readable_pipe out_pipe { ctx };
    asio::readable_pipe err_pipe { ctx };
    asio::writable_pipe in_pipe { ctx };

    const auto environment = build_environment(request.environment);

    std::optional<process::process> child;

    try
    {
        child.emplace(
            ctx,
            executable,
            request.arguments,
            process::process_stdio { .in = in_pipe, .out = out_pipe, .err = err_pipe },
            process::process_start_dir { working_directory_of(request) },
            process::process_environment(environment));
    }
    catch (const boost::system::system_error& error)
    {
        logd("Could not start `{:s}`: {:s}", logging::path_to_utf8(executable), error.what());

        return spawn_failure(std::format("Process error: {:s}", error.what()));
    }

    logd("Started `{:s}` (pid {:d}) in `{:s}`.", logging::path_to_utf8(executable), child->id(), logging::path_to_utf8(working_directory_of(request)));

    ProcessResult result;

    // The run ends either when both streams are closed and the process has
    // exited, or when the timer expires, whichever happens first.
    bool resolved { false };
    std::size_t pending { 3 };

    asio::steady_timer timer { ctx, request.timeout };

    const auto complete = [&]
    {
        if (--pending != 0 || resolved)
            return;

        resolved = true;
        timer.cancel();
    };

    const auto on_read = [&](const boost::system::error_code&, std::size_t)
    {
        complete();
    };

    asio::async_read(out_pipe, asio::dynamic_buffer(result.out), on_read);
    asio::async_read(err_pipe, asio::dynamic_buffer(result.err), on_read);

    child->async_wait([&](const boost::system::error_code& error_code, int exit_code)
        {
            if (!error_code)
                result.exit_code = exit_code;

            complete(); });

    timer.async_wait([&](const boost::system::error_code& error_code)
        {
            if (error_code == asio::error::operation_aborted || resolved)
                return;

            resolved = true;
            result.status = ProcessResult::Status::TimedOut;

            logd("`{:s}` exceeded {:d} ms, killing it.", request.command, request.timeout.count());

            boost::system::error_code ignored;
            child->terminate(ignored);
            out_pipe.cancel(ignored);
            err_pipe.cancel(ignored);
            in_pipe.close(ignored); });

    if (request.input.empty())
    {
        boost::system::error_code ignored;
        in_pipe.close(ignored);
    }
    else
    {
        asio::async_write(in_pipe, asio::buffer(request.input), [&](const boost::system::error_code& error_code, std::size_t)
            {
                if (error_code && error_code != asio::error::operation_aborted)
                    logd("Could not write the input of `{:s}`: {:s}", request.command, error_code.message());

                boost::system::error_code ignored;
                in_pipe.close(ignored); });
    }

    ctx.run();

    if (result.status == ProcessResult::Status::TimedOut)
    {
        result.success = false;
        result.exit_code.reset();
        result.err += '\n';
        result.err += request.timeout_message;

        return result;
    }

    result.success = result.exit_code == EXIT_SUCCESS;

    logd("`{:s}` exited with code {:d}.", request.command, result.exit_code.value_or(-1));

    return result;
}

std::filesystem::path find_executable(std::string_view name)
{
    return process::environment::find_executable(std::filesystem::path { name });
}

} // namespace KataJudge
