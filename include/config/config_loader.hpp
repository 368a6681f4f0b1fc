#pragma once

#include "provider/tool_provider.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace execbox {

// ============================================================================
// Sandbox Config (mirrors TOML hierarchy)
// ============================================================================

struct WorkspaceConfig {
    std::string root = "./workspace";
};

struct LimitsConfig {
    int64_t timeout_seconds = 30;
    int64_t max_memory_mb = 512;
    int64_t max_cpu_seconds = 30;
    int64_t max_output_bytes = 10 * 1024 * 1024;
};

struct PolicyConfig {
    bool enforce_network = true;
    bool enforce_filesystem = true;
    bool allow_writes = true;
    std::vector<std::string> allowed_endpoints;
};

struct PrivacyConfig {
    bool tokenization = true;
};

struct ExecutorSection {
    std::string python = "python3";
};

struct LoggingConfig {
    std::string level = "info";
};

struct SandboxConfig {
    WorkspaceConfig workspace;
    LimitsConfig limits;
    PolicyConfig policy;
    ProviderSettings provider;
    PrivacyConfig privacy;
    ExecutorSection executor;
    LoggingConfig logging;
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML (toml++)
// ============================================================================

/**
 * @brief Loads sandbox.toml
 *
 * String values get ${VAR} environment expansion. A top-level
 * include = "file" or include = ["a", "b"] merges other files underneath
 * the including one (the including file wins), up to 10 levels deep.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        SandboxConfig config;

        static LoadResult ok(SandboxConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to sandbox.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// Every problem found, empty when the config is usable
    [[nodiscard]] static std::vector<std::string> validate_config(const SandboxConfig& config);

    /**
     * @brief Apply EXECBOX_WORKSPACE, EXECBOX_PROVIDER, EXECBOX_MCP_ENDPOINT and
     *        EXECBOX_ENABLE_TOKENIZATION when set
     * @return Names of the variables that were applied
     */
    static std::vector<std::string> apply_env_overrides(SandboxConfig& config);

    /// "1", "true", "yes", "on" (any case) -> true; "0", "false", "no", "off" -> false
    [[nodiscard]] static std::optional<bool> parse_bool(const std::string& value);
};

} // namespace execbox
