#pragma once

#include "config/config_loader.hpp"
#include "core/icode_generator.hpp"
#include "core/types.hpp"
#include "executor/code_executor.hpp"
#include "privacy/privacy_tokenizer.hpp"
#include "provider/tool_provider.hpp"
#include "security/security_rule_engine.hpp"
#include "skills/skill_registry.hpp"
#include "tools/tool_client.hpp"

#include <nlohmann/json.hpp>

#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace execbox {

/**
 * @brief Outcome of one validate-then-execute pass
 *
 * execution is empty when validation blocked the source.
 */
struct RunOutcome {
    std::string source;
    std::vector<std::string> fixes_applied;
    ValidationResult validation;
    std::optional<ExecutionResult> execution;

    [[nodiscard]] bool executed() const { return execution.has_value(); }
    [[nodiscard]] bool success() const {
        return !validation.blocked && execution && execution->success;
    }
    [[nodiscard]] nlohmann::json to_json() const;
};

/// Map the [limits]/[policy]/[executor] sections onto an executor config
[[nodiscard]] ExecutorConfig to_executor_config(const SandboxConfig& config);

/**
 * @brief Wires the sandbox together and sequences a request
 *
 * source -> SecurityRuleEngine -> CodeExecutor -> RunOutcome. Owns the
 * process-wide tokenizer, provider, tool client and generated module tree.
 *
 * Lifecycle: construct, startup() once, then validate_then_execute() or
 * run_task() from any number of threads.
 *
 * The tokenizer is shared by every execution, so one value maps to one token
 * across overlapping tasks. A finished run_task() only clears it once no
 * other execution is still in flight.
 */
class Orchestrator {
public:
    /**
     * @param config    Loaded configuration
     * @param provider  Tool provider to use instead of the one [provider]
     *                  describes (null = create from config at startup)
     */
    explicit Orchestrator(SandboxConfig config,
                          std::shared_ptr<IToolProvider> provider = nullptr);

    /**
     * @brief Create the workspace, provider, tool client and executor, then
     *        generate tool wrappers
     *
     * Tool discovery failures are logged and leave the executor running
     * without tools.
     * @throws UnknownProviderError / ProviderNotImplementedError for a bad
     *         [provider] type
     * @throws std::filesystem::filesystem_error if the workspace is unusable
     */
    void startup();

    [[nodiscard]] bool started() const { return executor_ != nullptr; }

    /**
     * @brief Validate, and execute only when nothing blocks
     * @throws std::logic_error before startup()
     */
    [[nodiscard]] RunOutcome validate_then_execute(const std::string& source) const;

    [[nodiscard]] std::future<RunOutcome> validate_then_execute_async(std::string source) const;

    /**
     * @brief Prompt -> generated source -> fixes -> validate -> execute
     *
     * The tokenizer is cleared once the task and every execution that
     * overlapped it are done.
     * @throws std::logic_error without a code generator or before startup()
     */
    [[nodiscard]] RunOutcome run_task(const std::string& prompt);

    void set_code_generator(std::shared_ptr<ICodeGenerator> generator) {
        generator_ = std::move(generator);
    }
    void set_source_fixer(std::shared_ptr<ISourceFixer> fixer) { fixer_ = std::move(fixer); }

    /// Strip a surrounding ```python / ``` fence from model output
    [[nodiscard]] static std::string extract_code(std::string_view text);

    /// Rerun tool discovery and regenerate the wrappers
    [[nodiscard]] nlohmann::json regenerate_tools();

    [[nodiscard]] const SandboxConfig& config() const { return config_; }
    [[nodiscard]] const SecurityRuleEngine& rule_engine() const { return rule_engine_; }
    [[nodiscard]] const std::shared_ptr<PrivacyTokenizer>& tokenizer() const { return tokenizer_; }
    [[nodiscard]] const std::shared_ptr<ToolClient>& tool_client() const { return tool_client_; }
    [[nodiscard]] const CodeExecutor& executor() const;
    [[nodiscard]] const SkillRegistry& skills() const { return skills_; }
    [[nodiscard]] const nlohmann::json& generation_report() const { return generation_report_; }

private:
    void require_started() const;
    void begin_execution() const;
    void end_execution(bool clear_tokens) const;

    SandboxConfig config_;
    SecurityRuleEngine rule_engine_;
    std::shared_ptr<PrivacyTokenizer> tokenizer_;
    std::shared_ptr<IToolProvider> provider_;
    std::shared_ptr<ToolClient> tool_client_;
    std::unique_ptr<CodeExecutor> executor_;
    SkillRegistry skills_;
    nlohmann::json generation_report_ = nlohmann::json::object();

    std::shared_ptr<ICodeGenerator> generator_;
    std::shared_ptr<ISourceFixer> fixer_;

    mutable std::mutex token_mutex_;
    mutable size_t active_executions_ = 0;
    mutable bool clear_pending_ = false;
};

} // namespace execbox
