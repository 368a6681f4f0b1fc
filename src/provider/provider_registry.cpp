#include "provider/provider_registry.hpp"
#include "provider/mcp_tool_provider.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace execbox {

void ProviderRegistry::register_provider(const std::string& kind, Factory factory) {
    std::lock_guard lock(mutex_);
    factories_[utils::to_lower(kind)] = std::move(factory);
}

void ProviderRegistry::register_unimplemented(const std::string& kind) {
    std::lock_guard lock(mutex_);
    factories_[utils::to_lower(kind)] = nullptr;
}

std::unique_ptr<IToolProvider> ProviderRegistry::create(const ProviderSettings& settings) const {
    const std::string kind = utils::to_lower(settings.type);

    Factory factory;
    {
        std::lock_guard lock(mutex_);
        const auto it = factories_.find(kind);
        if (it == factories_.end()) {
            throw UnknownProviderError(std::format(
                "Unknown tool provider: '{}'. Supported providers: {}",
                settings.type, utils::join(available_providers_locked(), ", ")));
        }
        if (!it->second) {
            throw ProviderNotImplementedError(std::format(
                "Provider '{}' not yet implemented. Currently supported: {}",
                settings.type, utils::join(available_providers_locked(), ", ")));
        }
        factory = it->second;
    }
    return factory(settings);
}

bool ProviderRegistry::has_provider(const std::string& kind) const {
    std::lock_guard lock(mutex_);
    const auto it = factories_.find(utils::to_lower(kind));
    return it != factories_.end() && it->second != nullptr;
}

std::vector<std::string> ProviderRegistry::available_providers() const {
    std::lock_guard lock(mutex_);
    return available_providers_locked();
}

std::vector<std::string> ProviderRegistry::available_providers_locked() const {
    std::vector<std::string> kinds;
    for (const auto& [kind, factory] : factories_) {
        if (factory) kinds.push_back(kind);
    }
    std::sort(kinds.begin(), kinds.end());
    return kinds;
}

void register_builtin_providers() {
    auto& registry = ProviderRegistry::instance();
    registry.register_provider("mcp", [](const ProviderSettings& settings) {
        return std::make_unique<McpToolProvider>(settings);
    });
    registry.register_unimplemented("openai_functions");
    registry.register_unimplemented("rest_api");
}

} // namespace execbox
