#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace execbox {

// ============================================================================
// Basic Enums
// ============================================================================

enum class ViolationLevel : uint8_t {
    BLOCK,
    WARN,
    INFO
};

[[nodiscard]] inline const char* violation_level_to_string(ViolationLevel level) {
    switch (level) {
        case ViolationLevel::BLOCK: return "block";
        case ViolationLevel::WARN:  return "warn";
        case ViolationLevel::INFO:  return "info";
        default:                    return "unknown";
    }
}

enum class FsAction : uint8_t {
    READ,
    WRITE,
    EXECUTE,
    DELETE
};

[[nodiscard]] inline const char* fs_action_to_string(FsAction action) {
    switch (action) {
        case FsAction::READ:    return "read";
        case FsAction::WRITE:   return "write";
        case FsAction::EXECUTE: return "execute";
        case FsAction::DELETE:  return "delete";
        default:                return "unknown";
    }
}

// ============================================================================
// Static Validation
// ============================================================================

struct SecurityViolation {
    std::string rule_name;
    ViolationLevel level = ViolationLevel::WARN;
    std::string message;
    uint32_t line = 0;
    std::optional<uint32_t> column;
    std::optional<std::string> snippet;

    [[nodiscard]] nlohmann::json to_json() const;
};

/**
 * @brief Outcome of one validation call.
 *
 * valid == blocking_violations.empty(). A syntax error sets blocked and
 * leaves every violation list empty.
 */
struct ValidationResult {
    bool valid = true;
    bool blocked = false;
    std::vector<SecurityViolation> violations;
    std::vector<SecurityViolation> blocking_violations;
    std::vector<SecurityViolation> warnings;
    std::vector<SecurityViolation> info;
    std::optional<std::string> syntax_error;

    [[nodiscard]] nlohmann::json to_json() const;

    // One line per violation: "[BLOCK] rule (line N): message"
    [[nodiscard]] std::string format_violations() const;
};

// ============================================================================
// Execution
// ============================================================================

struct ExecutionResult {
    bool success = false;
    nlohmann::json result;   // null when the program set no result slot
    std::optional<std::string> error;
    std::optional<std::string> error_type;
    std::optional<std::string> traceback;
    std::string stdout_text;
    std::string stderr_text;
    uint64_t duration_ms = 0;

    [[nodiscard]] nlohmann::json to_json() const;

    static ExecutionResult failure(std::string error, std::string error_type) {
        ExecutionResult r;
        r.success = false;
        r.error = std::move(error);
        r.error_type = std::move(error_type);
        return r;
    }
};

// ============================================================================
// Tools
// ============================================================================

struct Tool {
    std::string name;
    std::string description;
    nlohmann::json input_schema = nlohmann::json::object();
    std::optional<std::string> provider_name;

    [[nodiscard]] nlohmann::json to_json() const;
};

struct ToolResult {
    std::vector<nlohmann::json> content;
    bool is_error = false;
    std::optional<std::string> error_message;
    std::optional<nlohmann::json> metadata;

    [[nodiscard]] nlohmann::json to_json() const;
};

} // namespace execbox
