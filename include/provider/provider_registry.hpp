#pragma once

#include "provider/tool_provider.hpp"

#include <functional>
#include <mutex>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace execbox {

/**
 * @brief Registry of tool provider factories keyed by kind ("mcp", ...)
 *
 * Built-in kinds are registered by register_builtin_providers(); tests and
 * embedders may add their own.
 *
 * Usage:
 *   ProviderRegistry::instance().register_provider("mcp",
 *       [](const ProviderSettings& s) { return std::make_unique<McpToolProvider>(s); });
 *
 *   auto provider = ProviderRegistry::instance().create(settings);
 */
class ProviderRegistry {
public:
    using Factory = std::function<std::unique_ptr<IToolProvider>(const ProviderSettings&)>;

    static ProviderRegistry& instance() {
        static ProviderRegistry registry;
        return registry;
    }

    void register_provider(const std::string& kind, Factory factory);

    /// Kind is known but has no implementation yet
    void register_unimplemented(const std::string& kind);

    /**
     * @brief Instantiate the provider named by settings.type (case-insensitive)
     * @throws UnknownProviderError for unregistered kinds
     * @throws ProviderNotImplementedError for kinds registered as unimplemented
     */
    [[nodiscard]] std::unique_ptr<IToolProvider> create(const ProviderSettings& settings) const;

    [[nodiscard]] bool has_provider(const std::string& kind) const;

    /// Kinds with a working implementation, sorted
    [[nodiscard]] std::vector<std::string> available_providers() const;

private:
    ProviderRegistry() = default;

    [[nodiscard]] std::vector<std::string> available_providers_locked() const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Factory> factories_;  // null factory = not implemented
};

/// Register mcp (implemented), openai_functions and rest_api (not implemented)
void register_builtin_providers();

} // namespace execbox
