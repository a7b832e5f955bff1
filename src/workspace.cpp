#include <katajudge/workspace.hpp>

#include <cstdint>      // std::uint64_t
#include <filesystem>   // std::filesystem::copy, std::filesystem::create_directory, std::filesystem::is_directory, std::filesystem::remove_all, std::filesystem::temp_directory_path
#include <format>       // std::format
#include <fstream>      // std::ifstream, std::ofstream
#include <ios>          // std::ios
#include <random>       // std::random_device, std::mt19937_64, std::uniform_int_distribution
#include <sstream>      // std::stringstream
#include <string>       // std::string
#include <string_view>  // std::string_view
#include <system_error> // std::error_code
#include <utility>      // std::move

#include <katajudge/logging.hpp> // logging::code, logging::Color, logging::Style, logging::path_to_utf8, logd

namespace
{

constexpr std::uint64_t max_attempts { 16 };

std::filesystem::path create_unique_directory(std::string_view prefix)
{
    std::error_code error_code;

    const auto base = std::filesystem::temp_directory_path(error_code);

    if (error_code)
        throw KataJudge::WorkspaceError { std::format("Could not find the temporary directory: {:s}", error_code.message()) };

    std::random_device device;
    std::mt19937_64 engine { device() };
    std::uniform_int_distribution<std::uint64_t> distribution;

    for (std::uint64_t attempt {}; attempt < max_attempts; ++attempt)
    {
        auto path = base / std::format("{:s}-{:016x}", prefix, distribution(engine));

        // `create_directory` returns false without an error when the path already exists.
        if (std::filesystem::create_directory(path, error_code))
            return path;

        if (error_code)
            break;
    }

    throw KataJudge::WorkspaceError { std::format("Could not create a directory named `{:s}{:s}-...{:s}` in `{:s}`.", logging::code(logging::Color::Blue), prefix, logging::code(logging::Style::Reset), logging::path_to_utf8(base)) };
}

}

namespace KataJudge
{

Workspace::Workspace(std::string_view prefix) :
    m_path { create_unique_directory(prefix) }
{
    logd("Created the workspace `{:s}`.", logging::path_to_utf8(m_path));
}

Workspace::Workspace(std::string_view prefix, const std::filesystem::path& source) :
    Workspace { prefix }
{
    // The delegated constructor has finished, so the destructor cleans up if the copy throws.
    std::error_code error_code;

    if (!std::filesystem::is_directory(source, error_code))
        throw WorkspaceError { std::format("The kata directory `{:s}{:s}{:s}` does not exist.", logging::code(logging::Color::Blue), logging::path_to_utf8(source), logging::code(logging::Style::Reset)) };

    std::filesystem::copy(source, m_path, std::filesystem::copy_options::recursive | std::filesystem::copy_options::overwrite_existing, error_code);

    if (error_code)
        throw WorkspaceError { std::format("Could not copy `{:s}{:s}{:s}`: {:s}", logging::code(logging::Color::Blue), logging::path_to_utf8(source), logging::code(logging::Style::Reset), error_code.message()) };
}

Workspace::~Workspace()
{
    std::error_code error_code;

    std::filesystem::remove_all(m_path, error_code);

    if (error_code)
        logd("Could not remove the workspace `{:s}`: {:s}", logging::path_to_utf8(m_path), error_code.message());
}

std::filesystem::path Workspace::write_file(std::string_view name, std::string_view contents) const
{
    auto path = m_path / name;

    std::ofstream file { path, std::ios::binary | std::ios::trunc };

    if (!file.is_open())
        throw WorkspaceError { std::format("Could not open the file `{:s}{:s}{:s}`.", logging::code(logging::Color::Blue), logging::path_to_utf8(path), logging::code(logging::Style::Reset)) };

    file << contents;

    if (file.bad())
        throw WorkspaceError { std::format("Could not write to the file `{:s}{:s}{:s}`.", logging::code(logging::Color::Blue), logging::path_to_utf8(path), logging::code(logging::Style::Reset)) };

    return path;
}

std::string read_file(const std::filesystem::path& path)
{
    std::error_code error_code;

    if (!std::filesystem::is_regular_file(path, error_code))
        throw WorkspaceError { std::format("The file `{:s}{:s}{:s}` does not exist.", logging::code(logging::Color::Blue), logging::path_to_utf8(path), logging::code(logging::Style::Reset)) };

    const std::ifstream ifstream { path, std::ios::binary };

    std::stringstream buffer;
    buffer << ifstream.rdbuf();

    if (ifstream.bad())
        throw WorkspaceError { std::format("Could not read the file `{:s}{:s}{:s}`.", logging::code(logging::Color::Blue), logging::path_to_utf8(path), logging::code(logging::Style::Reset)) };

    return std::move(buffer).str();
}

} // namespace KataJudge
