#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace execbox {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 * Unset variables expand to the empty string.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            if (const char* env_val = std::getenv(var_name.c_str())) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_node(toml::node& node);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) expand_node(val);
}

void expand_node(toml::node& node) {
    if (auto* s = node.as_string()) {
        *s = expand_env_vars(s->get());
    } else if (auto* tbl = node.as_table()) {
        expand_env_vars_recursive(*tbl);
    } else if (auto* arr = node.as_array()) {
        for (auto& elem : *arr) expand_node(elem);
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars; arrays concatenate.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else if (val.is_array() && base.contains(key) && base[key].is_array()) {
            auto& base_arr = *base[key].as_array();
            for (const auto& elem : *val.as_array()) {
                base_arr.push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > 10) {
        throw std::runtime_error("Config include depth exceeds 10 (circular include?)");
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (item.is_string()) {
                paths.emplace_back(item.as_string()->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Included file is the base, the including file overrides it
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir, visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

// ---- Section extraction ----------------------------------------------------

WorkspaceConfig extract_workspace(const toml::table& root) {
    WorkspaceConfig cfg;
    if (const auto* ws = root["workspace"].as_table()) {
        cfg.root = (*ws)["root"].value_or(cfg.root);
    }
    return cfg;
}

LimitsConfig extract_limits(const toml::table& root) {
    LimitsConfig cfg;
    const auto* limits = root["limits"].as_table();
    if (!limits) return cfg;
    const auto& l = *limits;

    cfg.timeout_seconds = l["timeout_seconds"].value_or(cfg.timeout_seconds);
    cfg.max_memory_mb = l["max_memory_mb"].value_or(cfg.max_memory_mb);
    cfg.max_cpu_seconds = l["max_cpu_seconds"].value_or(cfg.max_cpu_seconds);
    cfg.max_output_bytes = l["max_output_bytes"].value_or(cfg.max_output_bytes);
    return cfg;
}

PolicyConfig extract_policy(const toml::table& root) {
    PolicyConfig cfg;
    const auto* policy = root["policy"].as_table();
    if (!policy) return cfg;
    const auto& p = *policy;

    cfg.enforce_network = p["enforce_network"].value_or(cfg.enforce_network);
    cfg.enforce_filesystem = p["enforce_filesystem"].value_or(cfg.enforce_filesystem);
    cfg.allow_writes = p["allow_writes"].value_or(cfg.allow_writes);
    cfg.allowed_endpoints = toml_string_array(p, "allowed_endpoints");
    return cfg;
}

ProviderSettings extract_provider(const toml::table& root) {
    ProviderSettings cfg;
    const auto* provider = root["provider"].as_table();
    if (!provider) return cfg;
    const auto& p = *provider;

    cfg.type = p["type"].value_or(cfg.type);
    cfg.endpoint = p["endpoint"].value_or(cfg.endpoint);
    cfg.server_name = p["server_name"].value_or(cfg.server_name);
    const int64_t timeout = p["timeout_ms"].value_or(static_cast<int64_t>(cfg.timeout_ms));
    cfg.timeout_ms = utils::in_range<1, 3600000>(timeout) ? static_cast<uint32_t>(timeout) : 0;
    return cfg;
}

SandboxConfig extract_all_sections(const toml::table& root) {
    SandboxConfig config;
    config.workspace = extract_workspace(root);
    config.limits = extract_limits(root);
    config.policy = extract_policy(root);
    config.provider = extract_provider(root);
    if (const auto* privacy = root["privacy"].as_table()) {
        config.privacy.tokenization = (*privacy)["tokenization"].value_or(true);
    }
    if (const auto* executor = root["executor"].as_table()) {
        config.executor.python = (*executor)["python"].value_or("python3"s);
    }
    if (const auto* logging = root["logging"].as_table()) {
        config.logging.level = (*logging)["level"].value_or("info"s);
    }
    return config;
}

ConfigLoader::LoadResult validate_and_return(SandboxConfig config) {
    const auto errors = ConfigLoader::validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

} // anonymous namespace

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

std::optional<bool> ConfigLoader::parse_bool(const std::string& value) {
    const std::string lower = utils::to_lower(utils::trim(value));
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") return true;
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") return false;
    return std::nullopt;
}

std::vector<std::string> ConfigLoader::apply_env_overrides(SandboxConfig& config) {
    std::vector<std::string> applied;

    if (const char* ws = std::getenv("EXECBOX_WORKSPACE"); ws && *ws) {
        config.workspace.root = ws;
        applied.emplace_back("EXECBOX_WORKSPACE");
    }
    if (const char* provider = std::getenv("EXECBOX_PROVIDER"); provider && *provider) {
        config.provider.type = utils::to_lower(provider);
        applied.emplace_back("EXECBOX_PROVIDER");
    }
    if (const char* endpoint = std::getenv("EXECBOX_MCP_ENDPOINT"); endpoint && *endpoint) {
        config.provider.endpoint = endpoint;
        applied.emplace_back("EXECBOX_MCP_ENDPOINT");
    }
    if (const char* tok = std::getenv("EXECBOX_ENABLE_TOKENIZATION"); tok && *tok) {
        if (auto enabled = parse_bool(tok)) {
            config.privacy.tokenization = *enabled;
            applied.emplace_back("EXECBOX_ENABLE_TOKENIZATION");
        } else {
            utils::log::warn(std::format(
                "Ignoring EXECBOX_ENABLE_TOKENIZATION='{}': expected true or false", tok));
        }
    }
    return applied;
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const SandboxConfig& config) {
    std::vector<std::string> errors;

    if (utils::trim(config.workspace.root).empty()) {
        errors.emplace_back("workspace.root must not be empty");
    }

    if (!utils::in_range<1, 86400>(config.limits.timeout_seconds)) {
        errors.push_back(std::format("limits.timeout_seconds must be 1-86400, got {}",
                                     config.limits.timeout_seconds));
    }
    if (!utils::in_range<16, 1048576>(config.limits.max_memory_mb)) {
        errors.push_back(std::format("limits.max_memory_mb must be 16-1048576, got {}",
                                     config.limits.max_memory_mb));
    }
    if (!utils::in_range<1, 86400>(config.limits.max_cpu_seconds)) {
        errors.push_back(std::format("limits.max_cpu_seconds must be 1-86400, got {}",
                                     config.limits.max_cpu_seconds));
    }
    if (config.limits.max_output_bytes <= 0) {
        errors.push_back(std::format("limits.max_output_bytes must be > 0, got {}",
                                     config.limits.max_output_bytes));
    }

    if (utils::trim(config.executor.python).empty()) {
        errors.emplace_back("executor.python must not be empty");
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be one of debug, info, warn, error; got '{}'",
            config.logging.level));
    }

    if (utils::trim(config.provider.type).empty()) {
        errors.emplace_back("provider.type must not be empty");
    }
    if (config.provider.timeout_ms == 0) {
        errors.emplace_back("provider.timeout_ms must be 1-3600000");
    }

    for (size_t i = 0; i < config.policy.allowed_endpoints.size(); ++i) {
        if (utils::trim(config.policy.allowed_endpoints[i]).empty()) {
            errors.push_back(std::format("policy.allowed_endpoints[{}] must not be empty", i));
        }
    }

    return errors;
}

} // namespace execbox
