#pragma once

#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace execbox {

/**
 * @brief Confines sandboxed file access to the workspace root
 *
 * A path is allowed only if it resolves (symlinks followed, relative paths
 * taken from the workspace) to the workspace root or a descendant, and does
 * not sit under a restricted system directory. Write and delete additionally
 * require allow_writes. Resolution failure denies.
 *
 * Restricted directories are matched on the first path component. One that
 * is itself an ancestor of the workspace root does not deny paths inside the
 * workspace.
 *
 * Immutable after construction; safe to share across threads.
 */
class FileSystemPolicy {
public:
    /**
     * @brief Create the policy, creating the workspace directory if needed
     * @throws std::filesystem::filesystem_error if the workspace cannot be created
     */
    explicit FileSystemPolicy(const std::filesystem::path& workspace_root,
                              bool allow_writes = true);

    [[nodiscard]] bool is_allowed(std::string_view path, FsAction action) const;

    /**
     * @brief Check an access attempt
     * @return Denial message, or std::nullopt when allowed
     */
    [[nodiscard]] std::optional<std::string> validate_access(std::string_view path,
                                                             FsAction action) const;

    /// Shorthand for is_allowed(path, FsAction::READ)
    [[nodiscard]] bool is_path_safe(std::string_view path) const {
        return is_allowed(path, FsAction::READ);
    }

    [[nodiscard]] const std::filesystem::path& workspace_root() const { return workspace_root_; }
    [[nodiscard]] bool allow_writes() const { return allow_writes_; }

    [[nodiscard]] static const std::vector<std::string>& restricted_dirs();

    /// {"workspace_root", "allow_writes", "restricted_dirs", "exempt_dirs"}
    [[nodiscard]] nlohmann::json to_json() const;

private:
    [[nodiscard]] std::optional<std::filesystem::path> resolve(std::string_view path) const;
    [[nodiscard]] bool in_restricted_dir(const std::filesystem::path& resolved) const;
    [[nodiscard]] bool inside_workspace(const std::filesystem::path& resolved) const;

    std::filesystem::path workspace_root_;
    bool allow_writes_;
    std::vector<std::string> exempt_dirs_;  // restricted dirs that contain the workspace
};

} // namespace execbox
