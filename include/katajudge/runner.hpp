#ifndef RUNNER_HPP
#define RUNNER_HPP

#include <chrono>      // std::chrono::milliseconds
#include <cstdint>     // std::uint8_t
#include <filesystem>  // std::filesystem::path
#include <optional>    // std::optional
#include <string>      // std::string
#include <string_view> // std::string_view
#include <utility>     // std::pair
#include <vector>      // std::vector

/**
 * @file
 * @brief Running external tools with a wall-clock limit.
 */
namespace KataJudge
{

/** Everything needed to start one process. */
struct ProcessRequest
{
    /**
     * The executable. A bare name is searched on `PATH`; a name with a
     * directory part is resolved against working_directory.
     */
    std::string command;

    std::vector<std::string> arguments;

    /** Defaults to the current directory when empty. */
    std::filesystem::path working_directory;

    /** Variables added to, or replacing those of, the inherited environment. */
    std::vector<std::pair<std::string, std::string>> environment;

    /** Written to the standard input, which is then closed. */
    std::string input;

    std::chrono::milliseconds timeout { 5000 };

    /** Appended to the standard error when the timeout expires. */
    std::string timeout_message { "Execution timed out" };
};

/** The outcome of a ProcessRequest. */
struct ProcessResult
{
    /** How the run ended. Exactly one of these applies to every run. */
    enum class Status : std::uint8_t
    {
        /** The process exited on its own. */
        Exited,
        /** The process was killed because the timeout expired. */
        TimedOut,
        /** The process could not be started. */
        SpawnFailed
    };

    /** True only if the process exited with status zero. */
    bool success {};

    std::string out;
    std::string err;

    Status status { Status::Exited };

    /** Only set when status is Status::Exited. */
    std::optional<int> exit_code;
};

/**
 * Starts processes. Components receive a reference to a Runner instead of
 * spawning processes themselves, so tests can substitute a fake.
 *
 * Implementations must not throw for failures of the started tool; those are
 * reported through ProcessResult.
 */
class Runner
{
public:
    virtual ~Runner() = default;

    [[nodiscard]] virtual ProcessResult run(const ProcessRequest& request) = 0;
};

/**
 * Runner backed by Boost.Process. Every call owns its own I/O context, so
 * one instance can be shared between threads.
 *
 * Constructing one sets `SIGPIPE` to `SIG_IGN` for the whole process, so
 * that feeding input to a child that already exited reports a write error
 * instead of killing the host. The disposition is not restored.
 */
class SubprocessRunner final : public Runner
{
public:
    SubprocessRunner();

    [[nodiscard]] ProcessResult run(const ProcessRequest& request) override;
};

/** Searches `PATH` for the executable. Returns an empty path if not found. */
[[nodiscard]] std::filesystem::path find_executable(std::string_view name);

} // namespace KataJudge

#endif
