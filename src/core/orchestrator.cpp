#include "core/orchestrator.hpp"
#include "core/utils.hpp"
#include "policy/network_policy.hpp"
#include "provider/provider_registry.hpp"
#include "tools/tool_generator.hpp"

#include <filesystem>
#include <format>
#include <stdexcept>

namespace execbox {

nlohmann::json RunOutcome::to_json() const {
    nlohmann::json j = {
        {"source", source},
        {"fixes_applied", fixes_applied},
        {"validation", validation.to_json()},
        {"executed", executed()},
        {"success", success()},
    };
    j["execution"] = execution ? execution->to_json() : nlohmann::json(nullptr);
    return j;
}

ExecutorConfig to_executor_config(const SandboxConfig& config) {
    ExecutorConfig exec;
    exec.workspace = config.workspace.root;
    exec.python = config.executor.python;
    exec.timeout_seconds = static_cast<uint32_t>(config.limits.timeout_seconds);
    exec.max_memory_mb = static_cast<uint32_t>(config.limits.max_memory_mb);
    exec.max_cpu_seconds = static_cast<uint32_t>(config.limits.max_cpu_seconds);
    exec.max_output_bytes = static_cast<size_t>(config.limits.max_output_bytes);
    exec.enforce_network = config.policy.enforce_network;
    exec.enforce_filesystem = config.policy.enforce_filesystem;
    exec.allow_writes = config.policy.allow_writes;
    return exec;
}

Orchestrator::Orchestrator(SandboxConfig config, std::shared_ptr<IToolProvider> provider)
    : config_(std::move(config)),
      tokenizer_(std::make_shared<PrivacyTokenizer>()),
      provider_(std::move(provider)),
      skills_(std::filesystem::path(config_.workspace.root) / "skills") {}

void Orchestrator::startup() {
    namespace fs = std::filesystem;

    const fs::path workspace = fs::absolute(config_.workspace.root);
    fs::create_directories(workspace);
    skills_.ensure_package();

    if (!provider_) {
        register_builtin_providers();
        // Bad provider type is a startup configuration error
        provider_ = ProviderRegistry::instance().create(config_.provider);
    }

    tool_client_ = std::make_shared<ToolClient>(provider_, tokenizer_,
                                                config_.privacy.tokenization);

    auto network = NetworkPolicy::from_provider_endpoint(config_.provider.endpoint,
                                                         config_.policy.allowed_endpoints);
    executor_ = std::make_unique<CodeExecutor>(to_executor_config(config_),
                                               std::move(network), tool_client_);

    utils::log::info(std::format(
        "Sandbox ready: workspace={} provider={} tokenization={} timeout={}s memory={}MB",
        executor_->workspace().string(), provider_->provider_name(),
        config_.privacy.tokenization ? "on" : "off",
        config_.limits.timeout_seconds, config_.limits.max_memory_mb));

    generation_report_ = regenerate_tools();
}

nlohmann::json Orchestrator::regenerate_tools() {
    require_started();
    try {
        const ToolGenerator generator(executor_->workspace());
        auto report = generator.generate(*provider_);
        utils::log::info(std::format("Generated {} tool wrapper(s) across {} server(s)",
                                     report.value("total_tools", 0),
                                     report.value("server_count", 0)));
        return report;
    } catch (const ProviderError& e) {
        utils::log::error(std::format(
            "Tool generation failed, continuing without tools: {}", e.what()));
        return nlohmann::json{
            {"servers", nlohmann::json::object()},
            {"total_tools", 0},
            {"server_count", 0},
            {"error", e.what()},
        };
    }
}

void Orchestrator::require_started() const {
    if (!executor_) {
        throw std::logic_error("Orchestrator used before startup()");
    }
}

const CodeExecutor& Orchestrator::executor() const {
    require_started();
    return *executor_;
}

void Orchestrator::begin_execution() const {
    std::lock_guard lock(token_mutex_);
    ++active_executions_;
}

void Orchestrator::end_execution(bool clear_tokens) const {
    std::lock_guard lock(token_mutex_);
    if (clear_tokens) clear_pending_ = true;
    if (--active_executions_ == 0 && clear_pending_) {
        const size_t dropped = tokenizer_->size();
        tokenizer_->clear();
        clear_pending_ = false;
        utils::log::debug(std::format("Cleared {} privacy token(s)", dropped));
    }
}

RunOutcome Orchestrator::validate_then_execute(const std::string& source) const {
    require_started();

    RunOutcome outcome;
    outcome.source = source;
    outcome.validation = rule_engine_.validate(source);

    if (outcome.validation.blocked) {
        utils::log::warn(std::format("Execution blocked by validation:\n{}",
                                     outcome.validation.format_violations()));
        return outcome;
    }
    if (!outcome.validation.warnings.empty()) {
        utils::log::info(std::format("Validation passed with {} warning(s)",
                                     outcome.validation.warnings.size()));
    }

    struct ExecutionScope {
        const Orchestrator& owner;
        ~ExecutionScope() { owner.end_execution(false); }
    };
    begin_execution();
    ExecutionScope scope{*this};

    outcome.execution = executor_->execute(source);
    return outcome;
}

std::future<RunOutcome> Orchestrator::validate_then_execute_async(std::string source) const {
    require_started();
    return std::async(std::launch::async, [this, src = std::move(source)] {
        return validate_then_execute(src);
    });
}

std::string Orchestrator::extract_code(std::string_view text) {
    std::string code = utils::trim(std::string(text));
    if (code.starts_with("```python")) {
        code.erase(0, 9);
    } else if (code.starts_with("```")) {
        code.erase(0, 3);
    }
    if (code.ends_with("```")) {
        code.erase(code.size() - 3);
    }
    return utils::trim(code);
}

RunOutcome Orchestrator::run_task(const std::string& prompt) {
    require_started();
    if (!generator_) {
        throw std::logic_error("run_task requires a code generator");
    }

    // Tokens are dropped once this task and every overlapping one are done
    struct TaskScope {
        const Orchestrator& owner;
        ~TaskScope() { owner.end_execution(true); }
    };
    begin_execution();
    TaskScope scope{*this};

    const std::string generated = generator_->generate(prompt);
    std::string source = extract_code(generated);

    std::vector<std::string> fixes;
    if (fixer_) {
        auto fixed = fixer_->fix(source);
        if (!fixed.fixes.empty()) {
            utils::log::info(std::format("{} applied {} fix(es)", fixer_->name(),
                                         fixed.fixes.size()));
            source = std::move(fixed.source);
            fixes = std::move(fixed.fixes);
        }
    }

    auto outcome = validate_then_execute(source);
    outcome.fixes_applied = std::move(fixes);
    return outcome;
}

} // namespace execbox
