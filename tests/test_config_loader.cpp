#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>

using namespace execbox;

namespace {

// Sets an environment variable for the lifetime of the guard
struct EnvGuard {
    std::string name;
    EnvGuard(std::string n, const std::string& value) : name(std::move(n)) {
        ::setenv(name.c_str(), value.c_str(), 1);
    }
    ~EnvGuard() { ::unsetenv(name.c_str()); }
};

bool has_error(const std::vector<std::string>& errors, const std::string& fragment) {
    for (const auto& e : errors) {
        if (e.find(fragment) != std::string::npos) return true;
    }
    return false;
}

} // namespace

TEST_CASE("ConfigLoader: defaults", "[config]") {
    auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);
    const auto& cfg = result.config;

    CHECK(cfg.workspace.root == "./workspace");
    CHECK(cfg.limits.timeout_seconds == 30);
    CHECK(cfg.limits.max_memory_mb == 512);
    CHECK(cfg.policy.enforce_network);
    CHECK(cfg.policy.enforce_filesystem);
    CHECK(cfg.policy.allowed_endpoints.empty());
    CHECK(cfg.provider.type == "mcp");
    CHECK(cfg.provider.endpoint == "http://127.0.0.1:8974/mcp");
    CHECK(cfg.privacy.tokenization);
    CHECK(cfg.executor.python == "python3");
    CHECK(cfg.logging.level == "info");
}

TEST_CASE("ConfigLoader: every section", "[config]") {
    const std::string toml = R"(
[workspace]
root = "/var/lib/execbox"

[limits]
timeout_seconds = 10
max_memory_mb = 256
max_cpu_seconds = 8
max_output_bytes = 65536

[policy]
enforce_network = false
allow_writes = false
allowed_endpoints = ["api.example.com:443", "*.internal:8080"]

[provider]
type = "mcp"
endpoint = "http://tools:9000/mcp"
server_name = "tools"
timeout_ms = 5000

[privacy]
tokenization = false

[executor]
python = "/usr/bin/python3.12"

[logging]
level = "debug"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    const auto& cfg = result.config;

    CHECK(cfg.workspace.root == "/var/lib/execbox");
    CHECK(cfg.limits.max_cpu_seconds == 8);
    CHECK(cfg.limits.max_output_bytes == 65536);
    CHECK_FALSE(cfg.policy.enforce_network);
    CHECK(cfg.policy.enforce_filesystem);
    CHECK_FALSE(cfg.policy.allow_writes);
    CHECK(cfg.policy.allowed_endpoints.size() == 2);
    CHECK(cfg.provider.server_name == "tools");
    CHECK(cfg.provider.timeout_ms == 5000);
    CHECK_FALSE(cfg.privacy.tokenization);
    CHECK(cfg.executor.python == "/usr/bin/python3.12");
    CHECK(cfg.logging.level == "debug");
}

TEST_CASE("ConfigLoader: validation", "[config]") {

    SECTION("out-of-range limits") {
        auto result = ConfigLoader::load_from_string(R"(
[limits]
timeout_seconds = 0
max_memory_mb = 4
)");
        REQUIRE_FALSE(result.success);
        CHECK(result.error_message.find("limits.timeout_seconds") != std::string::npos);
        CHECK(result.error_message.find("limits.max_memory_mb") != std::string::npos);
    }

    SECTION("unknown log level") {
        SandboxConfig cfg;
        cfg.logging.level = "verbose";
        CHECK(has_error(ConfigLoader::validate_config(cfg), "logging.level"));
    }

    SECTION("provider timeout out of range") {
        auto result = ConfigLoader::load_from_string("[provider]\ntimeout_ms = 0\n");
        REQUIRE_FALSE(result.success);
        CHECK(result.error_message.find("provider.timeout_ms") != std::string::npos);
    }

    SECTION("empty values") {
        SandboxConfig cfg;
        cfg.workspace.root = "  ";
        cfg.executor.python = "";
        cfg.policy.allowed_endpoints = {"ok:1", ""};
        const auto errors = ConfigLoader::validate_config(cfg);
        CHECK(has_error(errors, "workspace.root"));
        CHECK(has_error(errors, "executor.python"));
        CHECK(has_error(errors, "policy.allowed_endpoints[1]"));
    }

    SECTION("defaults are valid") {
        CHECK(ConfigLoader::validate_config(SandboxConfig{}).empty());
    }

    SECTION("malformed TOML") {
        auto result = ConfigLoader::load_from_string("[limits\ntimeout_seconds = 1");
        REQUIRE_FALSE(result.success);
        CHECK(result.error_message.find("Failed to parse config") != std::string::npos);
    }
}

TEST_CASE("ConfigLoader: ${VAR} expansion", "[config][env]") {

    SECTION("set variable") {
        EnvGuard guard("EXECBOX_TEST_TOOL_HOST", "tools.internal");
        auto result = ConfigLoader::load_from_string(R"(
[provider]
endpoint = "http://${EXECBOX_TEST_TOOL_HOST}:9000/mcp"
)");
        REQUIRE(result.success);
        CHECK(result.config.provider.endpoint == "http://tools.internal:9000/mcp");
    }

    SECTION("unset variable expands to empty") {
        ::unsetenv("EXECBOX_TEST_NOT_SET_12345");
        auto result = ConfigLoader::load_from_string(R"(
[workspace]
root = "/data/${EXECBOX_TEST_NOT_SET_12345}ws"
)");
        REQUIRE(result.success);
        CHECK(result.config.workspace.root == "/data/ws");
    }

    SECTION("unclosed ${ is a parse error") {
        auto result = ConfigLoader::load_from_string(R"(
[workspace]
root = "/data/${UNCLOSED"
)");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("Unclosed") != std::string::npos);
    }
}

TEST_CASE("ConfigLoader: environment overrides", "[config][env]") {
    SandboxConfig cfg;
    for (const char* name : {"EXECBOX_WORKSPACE", "EXECBOX_PROVIDER",
                             "EXECBOX_MCP_ENDPOINT", "EXECBOX_ENABLE_TOKENIZATION"}) {
        ::unsetenv(name);
    }

    SECTION("nothing set") {
        CHECK(ConfigLoader::apply_env_overrides(cfg).empty());
        CHECK(cfg.provider.type == "mcp");
    }

    SECTION("each variable is applied and reported") {
        EnvGuard ws("EXECBOX_WORKSPACE", "/tmp/override_ws");
        EnvGuard provider("EXECBOX_PROVIDER", "MCP");
        EnvGuard endpoint("EXECBOX_MCP_ENDPOINT", "http://other:1/mcp");
        EnvGuard tok("EXECBOX_ENABLE_TOKENIZATION", "off");

        const auto applied = ConfigLoader::apply_env_overrides(cfg);
        CHECK(applied.size() == 4);
        CHECK(cfg.workspace.root == "/tmp/override_ws");
        CHECK(cfg.provider.type == "mcp");
        CHECK(cfg.provider.endpoint == "http://other:1/mcp");
        CHECK_FALSE(cfg.privacy.tokenization);
    }

    SECTION("unrecognized boolean is ignored") {
        EnvGuard tok("EXECBOX_ENABLE_TOKENIZATION", "maybe");
        const auto applied = ConfigLoader::apply_env_overrides(cfg);
        CHECK(applied.empty());
        CHECK(cfg.privacy.tokenization);
    }
}

TEST_CASE("ConfigLoader: boolean parsing", "[config]") {
    CHECK(ConfigLoader::parse_bool("TRUE") == true);
    CHECK(ConfigLoader::parse_bool(" yes ") == true);
    CHECK(ConfigLoader::parse_bool("1") == true);
    CHECK(ConfigLoader::parse_bool("Off") == false);
    CHECK(ConfigLoader::parse_bool("0") == false);
    CHECK_FALSE(ConfigLoader::parse_bool("enabled").has_value());
    CHECK_FALSE(ConfigLoader::parse_bool("").has_value());
}
