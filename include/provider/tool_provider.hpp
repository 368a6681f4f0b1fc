#pragma once

#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace execbox {

/**
 * @brief Connection settings handed to a provider factory
 */
struct ProviderSettings {
    std::string type = "mcp";
    std::string endpoint = "http://127.0.0.1:8974/mcp";
    std::string server_name = "demo_mcp";
    uint32_t timeout_ms = 30000;
};

// ============================================================================
// Provider errors
// ============================================================================

class ProviderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ToolDiscoveryError : public ProviderError {
public:
    using ProviderError::ProviderError;
};

class ToolCallError : public ProviderError {
public:
    using ProviderError::ProviderError;
};

class ProviderNotImplementedError : public ProviderError {
public:
    using ProviderError::ProviderError;
};

class UnknownProviderError : public ProviderError {
public:
    using ProviderError::ProviderError;
};

/**
 * @brief Interface for external tool sources
 *
 * Each implementation speaks one tool protocol. Implementations must be
 * safe to call from several threads at once: concurrent executions share
 * the provider through the tool client.
 */
class IToolProvider {
public:
    virtual ~IToolProvider() = default;

    /**
     * @brief List every tool the source offers
     * @throws ToolDiscoveryError on transport or protocol failure
     */
    [[nodiscard]] virtual std::vector<Tool> discover_tools() = 0;

    /**
     * @brief Invoke one tool
     * @param tool_name Wire name reported by discover_tools()
     * @param arguments JSON object of arguments
     * @throws ToolCallError on transport or protocol failure (tool-level errors
     *         come back as ToolResult::is_error instead)
     */
    [[nodiscard]] virtual ToolResult call_tool(const std::string& tool_name,
                                               const nlohmann::json& arguments) = 0;

    /// Directory name under servers/ for this provider's wrappers
    [[nodiscard]] virtual std::string provider_name() const = 0;

    /// {"type", "endpoint", "server_name"} for diagnostics
    [[nodiscard]] virtual nlohmann::json provider_config() const = 0;
};

} // namespace execbox
