#include <katajudge/toolchain.hpp>

#include <algorithm>    // std::find
#include <charconv>     // std::from_chars
#include <chrono>       // std::chrono::milliseconds
#include <format>       // std::format
#include <optional>     // std::optional
#include <regex>        // std::regex, std::regex_search, std::smatch
#include <string>       // std::string
#include <string_view>  // std::string_view
#include <system_error> // std::errc
#include <utility>      // std::move, std::pair
#include <vector>       // std::vector

#include <katajudge/logging.hpp> // logd
#include <katajudge/parser.hpp>  // KataJudge::trim

namespace
{

using KataJudge::DependencyStatus;
using KataJudge::Runner;

constexpr std::chrono::milliseconds version_timeout { 5000 };

constexpr int minimum_python_major { 3 };
constexpr int minimum_python_minor { 8 };
constexpr int minimum_node_major { 18 };

#if defined(__APPLE__)
constexpr std::string_view python_guide { R"(Install Python using Homebrew: "brew install python" or download from https://python.org/downloads/)" };
constexpr std::string_view node_guide { R"(Install Node.js using Homebrew: "brew install node" or download from https://nodejs.org/downloads/)" };
constexpr std::string_view cpp_guide { R"(Install Xcode Command Line Tools: "xcode-select --install" or install via Homebrew: "brew install gcc")" };
#elif defined(__linux__)
constexpr std::string_view python_guide { R"(Install Python using your package manager: "sudo apt install python3" (Ubuntu/Debian) or "sudo yum install python3" (RHEL/CentOS))" };
constexpr std::string_view node_guide { "Install Node.js using NodeSource repository or your package manager. See https://nodejs.org/en/download/package-manager/" };
constexpr std::string_view cpp_guide { R"(Install build-essential: "sudo apt install build-essential" (Ubuntu/Debian) or "sudo yum groupinstall 'Development Tools'" (RHEL/CentOS))" };
#else
constexpr std::string_view python_guide { "Install Python 3.8+ from https://python.org/downloads/ and ensure it's added to your PATH" };
constexpr std::string_view node_guide { "Install Node.js 18+ from https://nodejs.org/downloads/" };
constexpr std::string_view cpp_guide { "Install a C++ compiler (GCC or Clang) and ensure it's available in your PATH" };
#endif

constexpr std::string_view typescript_guide { "Install TypeScript globally: npm install -g typescript" };

/** First line of the version banner, or nothing if the tool could not be run. */
std::optional<std::string> query_version(Runner& runner, const std::string& command)
{
    const auto result = runner.run({ .command = command, .arguments = { "--version" }, .timeout = version_timeout });

    if (!result.success)
    {
        logd("`{:s} --version` failed: {:s}", command, KataJudge::trim(result.err));
        return std::nullopt;
    }

    // Python 2 prints its version on the standard error.
    const auto banner = KataJudge::trim(result.out.empty() ? result.err : result.out);
    const auto end_of_line = banner.find('\n');

    return std::string { KataJudge::trim(banner.substr(0, end_of_line)) };
}

/** Extracts the two numbers captured by @p pattern. */
std::optional<std::pair<int, int>> parse_version(const std::string& version, const std::regex& pattern)
{
    std::smatch match;

    if (!std::regex_search(version, match, pattern))
        return std::nullopt;

    const auto to_int = [](const std::ssub_match& sub) -> std::optional<int>
    {
        int value {};
        const auto [ptr, ec] = std::from_chars(&*sub.first, &*sub.first + sub.length(), value);

        if (ec != std::errc {})
            return std::nullopt;

        return value;
    };

    const auto major = to_int(match[1]);
    const auto minor = to_int(match[2]);

    if (!major.has_value() || !minor.has_value())
        return std::nullopt;

    return std::pair { *major, *minor };
}

DependencyStatus missing(std::string name, std::string error, std::string_view guide)
{
    return DependencyStatus {
        .name = std::move(name),
        .available = false,
        .version = std::nullopt,
        .error = std::move(error),
        .installation_guide = std::string { guide }
    };
}

DependencyStatus check_python(Runner& runner, const std::string& command)
{
    auto version = query_version(runner, command);

    if (!version.has_value())
        return missing("Python", "Python not found in PATH", python_guide);

    static const std::regex pattern { R"(Python (\d+)\.(\d+))" };

    if (const auto numbers = parse_version(*version, pattern); numbers.has_value())
    {
        const auto [major, minor] = *numbers;

        if (major < minimum_python_major || (major == minimum_python_major && minor < minimum_python_minor))
        {
            auto status = missing("Python", std::format("Python {:d}.{:d}+ is required", minimum_python_major, minimum_python_minor), python_guide);
            status.version = std::move(version);

            return status;
        }
    }

    return DependencyStatus { .name = "Python", .available = true, .version = std::move(version) };
}

DependencyStatus check_node(Runner& runner, const std::string& command)
{
    auto version = query_version(runner, command);

    if (!version.has_value())
        return missing("Node.js", "Node.js not found in PATH", node_guide);

    static const std::regex pattern { R"(v(\d+)\.(\d+))" };

    // A banner that cannot be parsed is accepted as long as the tool runs.
    if (const auto numbers = parse_version(*version, pattern); numbers.has_value() && numbers->first < minimum_node_major)
    {
        auto status = missing("Node.js", std::format("Node.js {:d}+ is required", minimum_node_major), node_guide);
        status.version = std::move(version);

        return status;
    }

    return DependencyStatus { .name = "Node.js", .available = true, .version = std::move(version) };
}

DependencyStatus check_typescript(Runner& runner, const std::string& command)
{
    auto version = query_version(runner, command);

    if (!version.has_value())
        return missing("TypeScript Compiler", "TypeScript compiler not found in PATH", typescript_guide);

    return DependencyStatus { .name = "TypeScript Compiler", .available = true, .version = std::move(version) };
}

std::string_view compiler_label(std::string_view command)
{
    if (command == "g++")
        return "GCC";

    if (command == "clang++")
        return "Clang";

    return command;
}

DependencyStatus check_cpp(Runner& runner, const std::string& command)
{
    std::vector<std::string> candidates { command };

    for (const auto* fallback : { "g++", "clang++" })
    {
        if (std::find(candidates.begin(), candidates.end(), fallback) == candidates.end())
            candidates.emplace_back(fallback);
    }

    for (const auto& candidate : candidates)
    {
        auto version = query_version(runner, candidate);

        if (version.has_value())
            return DependencyStatus { .name = std::format("C++ Compiler ({:s})", compiler_label(candidate)), .available = true, .version = std::move(version) };
    }

    std::string tried;

    for (const auto& candidate : candidates)
        tried += tried.empty() ? candidate : std::format(", {:s}", candidate);

    return missing("C++ Compiler", std::format("No C++ compiler found (tried {:s})", tried), cpp_guide);
}

}

namespace KataJudge
{

SystemDependencies check_dependencies(Runner& runner, const ToolchainConfig& config)
{
    SystemDependencies dependencies {
        .python = check_python(runner, config.python),
        .nodejs = check_node(runner, config.node),
        .typescript = check_typescript(runner, config.tsc),
        .cpp = check_cpp(runner, config.cxx)
    };

    dependencies.all_available = dependencies.python.available && dependencies.nodejs.available && dependencies.cpp.available;

    logd("Dependencies: python={}, node={}, tsc={}, c++={}.", dependencies.python.available, dependencies.nodejs.available, dependencies.typescript.available, dependencies.cpp.available);

    return dependencies;
}

void to_json(nlohmann::json& json, const DependencyStatus& status)
{
    json = nlohmann::json {
        { "name", status.name },
        { "available", status.available }
    };

    if (status.version.has_value())
        json["version"] = *status.version;

    if (status.error.has_value())
        json["error"] = *status.error;

    if (status.installation_guide.has_value())
        json["installationGuide"] = *status.installation_guide;
}

void to_json(nlohmann::json& json, const SystemDependencies& dependencies)
{
    json = nlohmann::json {
        { "python", dependencies.python },
        { "nodejs", dependencies.nodejs },
        { "typescript", dependencies.typescript },
        { "cpp", dependencies.cpp },
        { "allAvailable", dependencies.all_available }
    };
}

} // namespace KataJudge
