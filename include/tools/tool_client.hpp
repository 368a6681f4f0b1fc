#pragma once

#include "core/types.hpp"
#include "privacy/privacy_tokenizer.hpp"
#include "provider/tool_provider.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <memory>
#include <string>

namespace execbox {

/**
 * @brief Mediates every tool call made by a sandboxed program
 *
 * Arguments are tokenized before they are logged or passed on to the
 * provider; string items of the result content are untokenized before they
 * go back to the program. Tokenization can be switched off, in which case
 * arguments and results pass through untouched.
 *
 * One instance is shared by all executions; call_tool() is thread-safe as
 * long as the provider is.
 */
class ToolClient {
public:
    ToolClient(std::shared_ptr<IToolProvider> provider,
               std::shared_ptr<PrivacyTokenizer> tokenizer,
               bool tokenization_enabled = true);

    /**
     * @brief Call a tool through the provider
     * @throws ProviderError (or a subclass) when the provider fails
     */
    [[nodiscard]] ToolResult call_tool(const std::string& tool_name,
                                       const nlohmann::json& arguments);

    [[nodiscard]] std::string provider_name() const { return provider_->provider_name(); }
    [[nodiscard]] nlohmann::json provider_config() const { return provider_->provider_config(); }

    [[nodiscard]] bool tokenization_enabled() const {
        return tokenization_enabled_.load(std::memory_order_relaxed);
    }
    void set_tokenization_enabled(bool enabled) {
        tokenization_enabled_.store(enabled, std::memory_order_relaxed);
    }

    [[nodiscard]] const std::shared_ptr<PrivacyTokenizer>& tokenizer() const { return tokenizer_; }

    [[nodiscard]] uint64_t total_calls() const { return total_calls_.load(std::memory_order_relaxed); }
    [[nodiscard]] uint64_t failed_calls() const { return failed_calls_.load(std::memory_order_relaxed); }

private:
    std::shared_ptr<IToolProvider> provider_;
    std::shared_ptr<PrivacyTokenizer> tokenizer_;
    std::atomic<bool> tokenization_enabled_;

    std::atomic<uint64_t> total_calls_{0};
    std::atomic<uint64_t> failed_calls_{0};
};

} // namespace execbox
