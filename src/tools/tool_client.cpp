#include "tools/tool_client.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace execbox {

ToolClient::ToolClient(std::shared_ptr<IToolProvider> provider,
                       std::shared_ptr<PrivacyTokenizer> tokenizer,
                       bool tokenization_enabled)
    : provider_(std::move(provider)),
      tokenizer_(std::move(tokenizer)),
      tokenization_enabled_(tokenization_enabled) {
    if (!provider_) {
        throw std::invalid_argument("ToolClient requires a tool provider");
    }
    if (!tokenizer_) {
        tokenizer_ = std::make_shared<PrivacyTokenizer>();
    }
}

ToolResult ToolClient::call_tool(const std::string& tool_name, const nlohmann::json& arguments) {
    total_calls_.fetch_add(1, std::memory_order_relaxed);
    const bool tokenize = tokenization_enabled();

    const nlohmann::json args = tokenize ? tokenizer_->tokenize(arguments) : arguments;
    utils::log::info(std::format("Tool call: {} args={}", tool_name, args.dump()));

    const utils::Timer timer;
    ToolResult result;
    try {
        result = provider_->call_tool(tool_name, args);
    } catch (const ProviderError& e) {
        failed_calls_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Tool call {} failed: {}", tool_name, e.what()));
        throw;
    }

    if (tokenize) {
        for (auto& item : result.content) {
            if (item.is_string()) {
                item = tokenizer_->untokenize_text(item.get_ref<const std::string&>());
            }
        }
    }

    if (result.is_error) {
        failed_calls_.fetch_add(1, std::memory_order_relaxed);
    }
    utils::log::debug(std::format("Tool call {} finished in {}ms ({} content item(s){})",
        tool_name, timer.elapsed_ms().count(), result.content.size(),
        result.is_error ? ", error" : ""));
    return result;
}

} // namespace execbox
