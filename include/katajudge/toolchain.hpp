#ifndef TOOLCHAIN_HPP
#define TOOLCHAIN_HPP

#include <optional> // std::optional
#include <string>   // std::string

#include <nlohmann/json.hpp> // nlohmann::json

#include <katajudge/runner.hpp> // KataJudge::Runner

namespace KataJudge
{

/** The executables used to check, compile and run submissions. */
struct ToolchainConfig
{
    std::string python { "python3" };
    std::string node { "node" };
    std::string tsc { "tsc" };
    std::string cxx { "g++" };
};

struct DependencyStatus
{
    std::string name;
    bool available {};
    std::optional<std::string> version;
    std::optional<std::string> error;
    std::optional<std::string> installation_guide;
};

struct SystemDependencies
{
    DependencyStatus python;
    DependencyStatus nodejs;
    DependencyStatus typescript;
    DependencyStatus cpp;

    /** Python, Node.js and a C++ compiler. The TypeScript compiler is optional. */
    bool all_available {};
};

/**
 * Runs every tool with `--version`. Python must be 3.8 or newer and Node.js
 * 18 or newer. For C++ the configured compiler is tried first, then `g++` and
 * `clang++`.
 */
[[nodiscard]] SystemDependencies check_dependencies(Runner& runner, const ToolchainConfig& config = {});

void to_json(nlohmann::json& json, const DependencyStatus& status);
void to_json(nlohmann::json& json, const SystemDependencies& dependencies);

} // namespace KataJudge

#endif
