#pragma once

#include "core/types.hpp"
#include "policy/filesystem_policy.hpp"
#include "policy/network_policy.hpp"
#include "tools/tool_client.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <future>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace execbox {

struct ExecutorConfig {
    std::filesystem::path workspace = "workspace";
    std::string python = "python3";
    uint32_t timeout_seconds = 30;
    uint32_t max_memory_mb = 512;
    uint32_t max_cpu_seconds = 30;
    size_t max_output_bytes = 10 * 1024 * 1024;
    bool enforce_network = true;
    bool enforce_filesystem = true;
    bool allow_writes = true;
};

/// Per-call overrides of the configured limits
struct ExecutionLimits {
    uint32_t timeout_seconds = 30;
    uint32_t max_memory_mb = 512;
    uint32_t max_cpu_seconds = 30;
};

/**
 * @brief Runs untrusted Python source in an isolated child process
 *
 * Each execution writes a generated harness script into the workspace,
 * spawns a fresh interpreter in its own process group under resource limits
 * and waits for it under a hard wall-clock deadline. Tool calls made by the
 * program come back over a socketpair and are served by the ToolClient on a
 * worker thread, so a slow provider never delays the deadline kill.
 *
 * Every failure that originates in the child is returned as an
 * ExecutionResult; execute() does not throw for untrusted-code failures.
 *
 * Thread-safety: execute() may be called concurrently. Policies are fixed
 * after construction; the tool client may be swapped at any time.
 */
class CodeExecutor {
public:
    /**
     * @param config          Limits, interpreter and policy switches
     * @param network_policy  Allow-list baked into each harness when network
     *                        enforcement is on
     * @param tool_client     Serves in-sandbox tool calls (may be null)
     * @throws std::filesystem::filesystem_error if the workspace cannot be created
     */
    CodeExecutor(ExecutorConfig config,
                 NetworkPolicy network_policy,
                 std::shared_ptr<ToolClient> tool_client = nullptr);

    /// Execute with the configured limits
    [[nodiscard]] ExecutionResult execute(std::string_view source) const;

    /// Execute with explicit limits
    [[nodiscard]] ExecutionResult execute(std::string_view source,
                                          const ExecutionLimits& limits) const;

    /// Execute on a worker thread
    [[nodiscard]] std::future<ExecutionResult> execute_async(std::string source) const;

    /**
     * @brief Inventory of generated tool modules, read from disk only
     * @return {servers:{name:{tools, path, absolute_path, tool_count}}, errors,
     *          servers_dir, workspace_dir}
     */
    [[nodiscard]] nlohmann::json list_available_tools() const;

    /**
     * @brief Check that servers/<server>/<tool>.py exists
     * @return {exists, server_dir, tool_file, errors, suggestions}
     */
    [[nodiscard]] nlohmann::json verify_tool_exists(const std::string& server_name,
                                                    const std::string& tool_name) const;

    void set_tool_client(std::shared_ptr<ToolClient> client);
    [[nodiscard]] std::shared_ptr<ToolClient> tool_client() const;

    [[nodiscard]] const ExecutorConfig& config() const { return config_; }
    [[nodiscard]] ExecutionLimits default_limits() const;
    [[nodiscard]] const std::filesystem::path& workspace() const { return workspace_; }
    [[nodiscard]] const std::filesystem::path& servers_dir() const { return servers_dir_; }
    [[nodiscard]] const NetworkPolicy& network_policy() const { return network_policy_; }
    [[nodiscard]] const FileSystemPolicy& filesystem_policy() const { return filesystem_policy_; }

    [[nodiscard]] uint64_t total_executions() const {
        return total_executions_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] uint64_t timeouts() const { return timeouts_.load(std::memory_order_relaxed); }

    /**
     * @brief Turn the child's captured output into a result
     *
     * The last non-empty stdout line is the harness's serialized outcome. When
     * it is missing, a clean exit means success with a null result and any
     * other exit is a ProcessError.
     */
    [[nodiscard]] static ExecutionResult decode_output(std::string stdout_text,
                                                       std::string stderr_text,
                                                       int wait_status);

    /// Serve one tool bridge request line; returns the reply object
    [[nodiscard]] nlohmann::json handle_bridge_request(std::string_view line) const;

private:
    [[nodiscard]] std::vector<std::string> child_environment() const;

    ExecutorConfig config_;
    std::filesystem::path workspace_;
    std::filesystem::path servers_dir_;
    NetworkPolicy network_policy_;
    FileSystemPolicy filesystem_policy_;

    mutable std::shared_mutex client_mutex_;
    std::shared_ptr<ToolClient> tool_client_;

    mutable std::atomic<uint64_t> total_executions_{0};
    mutable std::atomic<uint64_t> timeouts_{0};
};

} // namespace execbox
