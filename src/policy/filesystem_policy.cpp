#include "policy/filesystem_policy.hpp"

#include <algorithm>
#include <format>

namespace fs = std::filesystem;

namespace execbox {

const std::vector<std::string>& FileSystemPolicy::restricted_dirs() {
    static const std::vector<std::string> dirs = {
        "/etc", "/home", "/var", "/usr", "/bin", "/sbin",
        "/sys", "/proc", "/dev", "/root", "/boot", "/lib",
        "/lib64", "/opt", "/srv", "/tmp", "/run", "/mnt",
        "/media", "/lost+found",
    };
    return dirs;
}

namespace {

// "/" + first component of an absolute path ("/tmp/a/b" -> "/tmp")
std::string top_level_dir(const fs::path& absolute) {
    auto it = absolute.begin();
    if (it == absolute.end()) return {};
    ++it;  // skip root directory
    if (it == absolute.end()) return {};
    return "/" + it->string();
}

} // anonymous namespace

FileSystemPolicy::FileSystemPolicy(const fs::path& workspace_root, bool allow_writes)
    : allow_writes_(allow_writes) {
    fs::create_directories(workspace_root);
    workspace_root_ = fs::weakly_canonical(fs::absolute(workspace_root));

    const std::string top = top_level_dir(workspace_root_);
    const auto& dirs = restricted_dirs();
    if (std::find(dirs.begin(), dirs.end(), top) != dirs.end()) {
        exempt_dirs_.push_back(top);
    }
}

std::optional<fs::path> FileSystemPolicy::resolve(std::string_view path) const {
    if (path.empty()) return std::nullopt;

    fs::path p{std::string(path)};
    if (p.is_relative()) p = workspace_root_ / p;

    std::error_code ec;
    auto resolved = fs::weakly_canonical(p, ec);
    if (ec) return std::nullopt;
    return resolved;
}

bool FileSystemPolicy::in_restricted_dir(const fs::path& resolved) const {
    const std::string top = top_level_dir(resolved);
    if (top.empty()) return false;

    const auto& dirs = restricted_dirs();
    if (std::find(dirs.begin(), dirs.end(), top) == dirs.end()) return false;

    // The workspace carve-out: /tmp/ws/x is fine when the workspace is /tmp/ws
    if (std::find(exempt_dirs_.begin(), exempt_dirs_.end(), top) != exempt_dirs_.end()) {
        return !inside_workspace(resolved);
    }
    return true;
}

bool FileSystemPolicy::inside_workspace(const fs::path& resolved) const {
    auto ws = workspace_root_.begin();
    auto it = resolved.begin();
    for (; ws != workspace_root_.end(); ++ws, ++it) {
        if (ws->empty()) continue;  // trailing separator
        if (it == resolved.end() || *it != *ws) return false;
    }
    return true;
}

bool FileSystemPolicy::is_allowed(std::string_view path, FsAction action) const {
    return !validate_access(path, action).has_value();
}

std::optional<std::string> FileSystemPolicy::validate_access(std::string_view path,
                                                             FsAction action) const {
    const char* action_name = fs_action_to_string(action);

    const auto resolved = resolve(path);
    if (!resolved) {
        return std::format("File system {} access to '{}' is blocked: path could not be resolved",
                           action_name, path);
    }
    if (in_restricted_dir(*resolved)) {
        return std::format(
            "File system {} access to '{}' is blocked by security policy: restricted system directory",
            action_name, path);
    }
    if (!inside_workspace(*resolved)) {
        return std::format(
            "File system {} access to '{}' is blocked by security policy: outside workspace directory '{}'",
            action_name, path, workspace_root_.string());
    }
    if ((action == FsAction::WRITE || action == FsAction::DELETE) && !allow_writes_) {
        return std::string("Write access denied: writes are disabled");
    }
    return std::nullopt;
}

nlohmann::json FileSystemPolicy::to_json() const {
    return {
        {"workspace_root", workspace_root_.string()},
        {"allow_writes", allow_writes_},
        {"restricted_dirs", restricted_dirs()},
        {"exempt_dirs", exempt_dirs_},
    };
}

} // namespace execbox
