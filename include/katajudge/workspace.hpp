#ifndef WORKSPACE_HPP
#define WORKSPACE_HPP

#include <filesystem>  // std::filesystem::path
#include <stdexcept>   // std::runtime_error
#include <string>      // std::string
#include <string_view> // std::string_view

namespace KataJudge
{

class WorkspaceError : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/**
 * A uniquely named directory under the system temporary directory, removed
 * with everything inside it when the object is destroyed.
 */
class Workspace
{
public:
    /**
     * Creates an empty workspace named `<prefix>-<random suffix>`.
     *
     * @throws WorkspaceError if no directory could be created.
     */
    explicit Workspace(std::string_view prefix);

    /**
     * Creates a workspace holding a recursive copy of @p source. The source
     * directory is only read.
     *
     * @throws WorkspaceError if @p source is not a directory or the copy failed.
     */
    Workspace(std::string_view prefix, const std::filesystem::path& source);

    ~Workspace();

    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return m_path; }

    /**
     * Creates or replaces the file @p name inside the workspace.
     *
     * @returns The full path of the file.
     * @throws WorkspaceError if the file could not be written.
     */
    std::filesystem::path write_file(std::string_view name, std::string_view contents) const;

private:
    std::filesystem::path m_path;
};

/**
 * Reads a whole file.
 *
 * @throws WorkspaceError if the file does not exist or could not be read.
 */
[[nodiscard]] std::string read_file(const std::filesystem::path& path);

} // namespace KataJudge

#endif
