#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"
#include "core/random.hpp"
#include <filesystem>
#include <fstream>

using namespace execbox;

namespace {

// RAII temporary directory
struct TmpDir {
    std::filesystem::path path;
    TmpDir()
        : path(std::filesystem::temp_directory_path() / ("execbox_test_include_" + random::hex(4))) {
        std::filesystem::create_directories(path);
    }
    ~TmpDir() { std::filesystem::remove_all(path); }
    std::string file(const std::string& name, const std::string& content) {
        auto p = path / name;
        std::ofstream f(p);
        f << content;
        return p.string();
    }
};

} // namespace

TEST_CASE("ConfigInclude: single include file loads and merges", "[config][include]") {
    TmpDir tmp;

    tmp.file("provider.toml", R"(
[provider]
type = "mcp"
endpoint = "http://tools.internal:9000/mcp"
server_name = "internal_tools"
)");

    auto main_path = tmp.file("main.toml", R"(
include = "provider.toml"

[workspace]
root = "/srv/execbox/ws"
)");

    auto result = ConfigLoader::load_from_file(main_path);
    REQUIRE(result.success);
    CHECK(result.config.provider.endpoint == "http://tools.internal:9000/mcp");
    CHECK(result.config.provider.server_name == "internal_tools");
    CHECK(result.config.workspace.root == "/srv/execbox/ws");
}

TEST_CASE("ConfigInclude: array includes concatenate allowed endpoints", "[config][include]") {
    TmpDir tmp;

    tmp.file("endpoints_a.toml", R"(
[policy]
allowed_endpoints = ["api.a.example:443"]
)");

    tmp.file("endpoints_b.toml", R"(
[policy]
allowed_endpoints = ["api.b.example:443"]
)");

    auto main_path = tmp.file("main.toml", R"(
include = ["endpoints_a.toml", "endpoints_b.toml"]

[policy]
allowed_endpoints = ["localhost:8974"]
)");

    auto result = ConfigLoader::load_from_file(main_path);
    REQUIRE(result.success);
    // Main list plus both included lists
    CHECK(result.config.policy.allowed_endpoints.size() == 3);
}

TEST_CASE("ConfigInclude: main config scalars override included", "[config][include]") {
    TmpDir tmp;

    tmp.file("base.toml", R"(
[limits]
timeout_seconds = 5
max_memory_mb = 128
)");

    auto main_path = tmp.file("main.toml", R"(
include = "base.toml"

[limits]
timeout_seconds = 60
)");

    auto result = ConfigLoader::load_from_file(main_path);
    REQUIRE(result.success);
    // Main config wins, included values fill the gaps
    CHECK(result.config.limits.timeout_seconds == 60);
    CHECK(result.config.limits.max_memory_mb == 128);
}

TEST_CASE("ConfigInclude: nested includes resolve relative to each file", "[config][include]") {
    TmpDir tmp;
    std::filesystem::create_directories(tmp.path / "conf.d");

    tmp.file("conf.d/logging.toml", R"(
[logging]
level = "debug"
)");
    tmp.file("conf.d/base.toml", R"(
include = "logging.toml"
)");
    auto main_path = tmp.file("main.toml", R"(
include = "conf.d/base.toml"
)");

    auto result = ConfigLoader::load_from_file(main_path);
    REQUIRE(result.success);
    CHECK(result.config.logging.level == "debug");
}

TEST_CASE("ConfigInclude: circular include detection throws", "[config][include]") {
    TmpDir tmp;

    // a.toml includes b.toml, b.toml includes a.toml
    auto a_path = (tmp.path / "a.toml").string();
    auto b_path = (tmp.path / "b.toml").string();

    {
        std::ofstream f(a_path);
        f << "include = \"b.toml\"\n[workspace]\nroot = \"./ws\"\n";
    }
    {
        std::ofstream f(b_path);
        f << "include = \"a.toml\"\n";
    }

    auto result = ConfigLoader::load_from_file(a_path);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("ircular") != std::string::npos);
}

TEST_CASE("ConfigInclude: missing include file throws with path", "[config][include]") {
    TmpDir tmp;

    auto main_path = tmp.file("main.toml", R"(
include = "nonexistent.toml"

[workspace]
root = "./ws"
)");

    auto result = ConfigLoader::load_from_file(main_path);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("nonexistent.toml") != std::string::npos);
}
