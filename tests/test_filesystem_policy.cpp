#include <catch2/catch_test_macros.hpp>
#include "policy/filesystem_policy.hpp"
#include "core/random.hpp"

#include <algorithm>
#include <filesystem>

using namespace execbox;

namespace {

// RAII workspace under the temp directory
struct TmpWorkspace {
    std::filesystem::path path;
    TmpWorkspace()
        : path(std::filesystem::temp_directory_path() / ("execbox_fs_" + random::hex(4))) {
        std::filesystem::create_directories(path);
    }
    ~TmpWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
};

} // namespace

TEST_CASE("FileSystemPolicy: workspace confinement", "[policy][filesystem]") {
    TmpWorkspace ws;
    const FileSystemPolicy policy(ws.path);

    SECTION("relative paths resolve inside the workspace") {
        REQUIRE(policy.is_allowed("data.csv", FsAction::READ));
        REQUIRE(policy.is_allowed("nested/out.json", FsAction::WRITE));
        REQUIRE(policy.is_path_safe("."));
    }

    SECTION("absolute path inside the workspace, even under a restricted top level dir") {
        REQUIRE(policy.is_allowed((ws.path / "file.txt").string(), FsAction::READ));
    }

    SECTION("restricted system directory") {
        const auto denied = policy.validate_access("/etc/passwd", FsAction::READ);
        REQUIRE(denied.has_value());
        REQUIRE(denied->ends_with("restricted system directory"));
    }

    SECTION("restricted directory outside the workspace carve-out") {
        const auto sibling = ws.path.parent_path() / "someone_else.txt";
        REQUIRE_FALSE(policy.is_allowed(sibling.string(), FsAction::READ));
    }

    SECTION("dot-dot escapes are resolved before checking") {
        REQUIRE_FALSE(policy.is_allowed("../../etc/shadow", FsAction::READ));
    }

    SECTION("symlink pointing out of the workspace") {
        std::error_code ec;
        std::filesystem::create_symlink("/etc", ws.path / "link", ec);
        if (!ec) {
            REQUIRE_FALSE(policy.is_allowed("link/hostname", FsAction::READ));
        }
    }

    SECTION("empty path cannot be resolved") {
        const auto denied = policy.validate_access("", FsAction::READ);
        REQUIRE(denied.has_value());
        REQUIRE(denied->find("could not be resolved") != std::string::npos);
    }
}

TEST_CASE("FileSystemPolicy: writes can be disabled", "[policy][filesystem]") {
    TmpWorkspace ws;
    const FileSystemPolicy policy(ws.path, false);

    REQUIRE(policy.is_allowed("report.txt", FsAction::READ));
    const auto denied = policy.validate_access("report.txt", FsAction::WRITE);
    REQUIRE(denied == "Write access denied: writes are disabled");
    REQUIRE_FALSE(policy.is_allowed("report.txt", FsAction::DELETE));
}

TEST_CASE("FileSystemPolicy: to_json and restricted list", "[policy][filesystem]") {
    TmpWorkspace ws;
    const FileSystemPolicy policy(ws.path);

    const auto& dirs = FileSystemPolicy::restricted_dirs();
    REQUIRE(std::find(dirs.begin(), dirs.end(), "/etc") != dirs.end());
    REQUIRE(std::find(dirs.begin(), dirs.end(), "/tmp") != dirs.end());

    auto j = policy.to_json();
    REQUIRE(j["allow_writes"] == true);
    REQUIRE(j["workspace_root"].get<std::string>() == policy.workspace_root().string());
    REQUIRE_FALSE(j["restricted_dirs"].empty());
}
