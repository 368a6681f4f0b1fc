#include "executor/code_executor.hpp"
#include "executor/child_process.hpp"
#include "executor/harness.hpp"
#include "core/random.hpp"
#include "core/utils.hpp"
#include "parser/python_lexer.hpp"
#include "parser/python_parser.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <format>
#include <fstream>
#include <mutex>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

namespace execbox {

namespace {

constexpr size_t kReadChunk = 64 * 1024;
constexpr size_t kMaxBridgeLine = 16 * 1024 * 1024;
constexpr const char* kDefaultPath = "/usr/local/bin:/usr/bin:/bin";

fs::path prepare_workspace(const fs::path& workspace) {
    fs::create_directories(workspace);
    return fs::weakly_canonical(fs::absolute(workspace));
}

/**
 * @brief Owns the per-execution script file; removed on every exit path
 */
class ScriptFile {
public:
    explicit ScriptFile(fs::path path) : path_(std::move(path)) {}
    ~ScriptFile() {
        std::error_code ec;
        fs::remove(path_, ec);
        if (ec) {
            utils::log::warn(std::format("Failed to remove script {}: {}",
                                         path_.string(), ec.message()));
        }
    }
    ScriptFile(const ScriptFile&) = delete;
    ScriptFile& operator=(const ScriptFile&) = delete;

    [[nodiscard]] bool write(const std::string& content) const {
        std::ofstream out(path_, std::ios::binary | std::ios::trunc);
        if (!out) return false;
        out << content;
        out.flush();
        return static_cast<bool>(out);
    }

    [[nodiscard]] const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

// Read what is available; false once the descriptor hit EOF or failed
bool drain(int fd, std::string& sink) {
    char buf[kReadChunk];
    const ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) {
        sink.append(buf, static_cast<size_t>(n));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) return true;
    return false;
}

bool send_all(int fd, std::string_view data) {
    while (!data.empty()) {
        const ssize_t n = ::send(fd, data.data(), data.size(), MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data.remove_prefix(static_cast<size_t>(n));
    }
    return true;
}

std::string last_non_empty_line(std::string_view text) {
    size_t end = text.size();
    while (end > 0) {
        const auto nl = text.rfind('\n', end - 1);
        const size_t start = nl == std::string_view::npos ? 0 : nl + 1;
        std::string line = utils::trim(std::string(text.substr(start, end - start)));
        if (!line.empty()) return line;
        if (nl == std::string_view::npos) break;
        end = nl;
    }
    return {};
}

std::vector<std::string> sorted_tool_stems(const fs::path& server_dir) {
    std::vector<std::string> stems;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(server_dir, ec)) {
        const auto& p = entry.path();
        if (!entry.is_regular_file() || p.extension() != ".py") continue;
        if (p.filename() == "__init__.py") continue;
        stems.push_back(p.stem().string());
    }
    std::sort(stems.begin(), stems.end());
    return stems;
}

std::vector<std::string> sorted_server_dirs(const fs::path& servers_dir) {
    std::vector<std::string> names;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(servers_dir, ec)) {
        if (entry.is_directory() && entry.path().filename() != "__pycache__") {
            names.push_back(entry.path().filename().string());
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool is_plain_name(std::string_view name) {
    return !name.empty() && name != "." && name != ".." &&
           name.find('/') == std::string_view::npos && name.find('\0') == std::string_view::npos;
}

nlohmann::json serve_bridge_request(std::string_view line,
                                    const std::shared_ptr<ToolClient>& client) {
    const auto request = nlohmann::json::parse(line, nullptr, false);
    if (request.is_discarded() || !request.is_object()) {
        return {{"id", nullptr},
                {"error", "Malformed tool bridge request"},
                {"error_type", "ProtocolError"}};
    }

    nlohmann::json reply = {{"id", request.contains("id") ? request["id"] : nlohmann::json()}};

    const auto tool = request.find("tool");
    if (tool == request.end() || !tool->is_string()) {
        reply["error"] = "Tool bridge request is missing 'tool'";
        reply["error_type"] = "ProtocolError";
        return reply;
    }

    nlohmann::json arguments = nlohmann::json::object();
    if (auto it = request.find("arguments"); it != request.end() && it->is_object()) {
        arguments = *it;
    }

    if (!client) {
        reply["error"] = "Tool client not initialized";
        reply["error_type"] = "RuntimeError";
        return reply;
    }

    try {
        const auto result = client->call_tool(tool->get<std::string>(), arguments);
        reply["content"] = result.content;
        reply["is_error"] = result.is_error;
        reply["error_message"] = result.error_message ? nlohmann::json(*result.error_message)
                                                      : nlohmann::json();
        reply["metadata"] = result.metadata.value_or(nlohmann::json());
    } catch (const ToolCallError& e) {
        reply["error"] = e.what();
        reply["error_type"] = "ToolCallError";
    } catch (const ProviderError& e) {
        reply["error"] = e.what();
        reply["error_type"] = "ProviderError";
    } catch (const std::exception& e) {
        utils::log::error(std::format("Tool bridge call '{}' failed: {}",
                                      tool->get<std::string>(), e.what()));
        reply["error"] = e.what();
        reply["error_type"] = "RuntimeError";
    }
    return reply;
}

/**
 * @brief Serves tool bridge requests on its own thread
 *
 * The poll loop only queues request lines, so it keeps watching the deadline
 * while a provider call is in flight. Replies go out on a duplicate of the
 * bridge descriptor owned by the worker. If the execution ends mid-call the
 * worker is detached; it finishes that call against its own references to
 * the client and exits without touching the child.
 */
class BridgeWorker {
public:
    BridgeWorker(int bridge_fd, std::shared_ptr<ToolClient> client)
        : state_(std::make_shared<State>()) {
        state_->fd = ::fcntl(bridge_fd, F_DUPFD_CLOEXEC, 0);
        if (state_->fd < 0) {
            throw std::system_error(errno, std::generic_category(), "fcntl(F_DUPFD_CLOEXEC)");
        }
        state_->client = std::move(client);
        thread_ = std::thread(&BridgeWorker::run, state_);
    }

    ~BridgeWorker() {
        bool busy = false;
        {
            std::lock_guard lock(state_->mutex);
            state_->stopped = true;
            busy = state_->busy;
        }
        state_->cv.notify_one();
        if (busy) {
            utils::log::warn("Tool call still in flight at end of execution; abandoning it");
            thread_.detach();
        } else {
            thread_.join();
        }
    }

    BridgeWorker(const BridgeWorker&) = delete;
    BridgeWorker& operator=(const BridgeWorker&) = delete;

    void submit(std::string line) {
        {
            std::lock_guard lock(state_->mutex);
            state_->queue.push_back(std::move(line));
        }
        state_->cv.notify_one();
    }

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<std::string> queue;
        bool stopped = false;
        bool busy = false;
        int fd = -1;
        std::shared_ptr<ToolClient> client;

        ~State() {
            if (fd >= 0) ::close(fd);
        }
    };

    static void run(std::shared_ptr<State> state) {
        for (;;) {
            std::string line;
            {
                std::unique_lock lock(state->mutex);
                state->cv.wait(lock, [&] { return state->stopped || !state->queue.empty(); });
                if (state->stopped) return;
                line = std::move(state->queue.front());
                state->queue.pop_front();
                state->busy = true;
            }

            const std::string reply = serve_bridge_request(line, state->client).dump() + "\n";
            const bool sent = send_all(state->fd, reply);

            std::lock_guard lock(state->mutex);
            state->busy = false;
            if (!sent) {
                utils::log::debug("Tool bridge reply could not be delivered");
                return;
            }
        }
    }

    std::shared_ptr<State> state_;
    std::thread thread_;
};

} // anonymous namespace

CodeExecutor::CodeExecutor(ExecutorConfig config,
                           NetworkPolicy network_policy,
                           std::shared_ptr<ToolClient> tool_client)
    : config_(std::move(config)),
      workspace_(prepare_workspace(config_.workspace)),
      servers_dir_(workspace_ / "servers"),
      network_policy_(std::move(network_policy)),
      filesystem_policy_(workspace_, config_.allow_writes),
      tool_client_(std::move(tool_client)) {

    utils::log::info(std::format(
        "Code executor ready: workspace={} python={} timeout={}s memory={}MB cpu={}s "
        "network_policy={} filesystem_policy={}",
        workspace_.string(), config_.python, config_.timeout_seconds, config_.max_memory_mb,
        config_.max_cpu_seconds, config_.enforce_network ? "on" : "off",
        config_.enforce_filesystem ? "on" : "off"));
}

ExecutionLimits CodeExecutor::default_limits() const {
    ExecutionLimits limits;
    limits.timeout_seconds = config_.timeout_seconds;
    limits.max_memory_mb = config_.max_memory_mb;
    limits.max_cpu_seconds = config_.max_cpu_seconds;
    return limits;
}

void CodeExecutor::set_tool_client(std::shared_ptr<ToolClient> client) {
    std::unique_lock lock(client_mutex_);
    tool_client_ = std::move(client);
}

std::shared_ptr<ToolClient> CodeExecutor::tool_client() const {
    std::shared_lock lock(client_mutex_);
    return tool_client_;
}

std::vector<std::string> CodeExecutor::child_environment() const {
    const char* path = std::getenv("PATH");
    return {
        std::format("PATH={}", path && *path ? path : kDefaultPath),
        std::format("HOME={}", workspace_.string()),
        std::format("PYTHONPATH={}:{}", workspace_.string(), servers_dir_.string()),
        "PYTHONIOENCODING=utf-8",
        "PYTHONDONTWRITEBYTECODE=1",
    };
}

ExecutionResult CodeExecutor::execute(std::string_view source) const {
    return execute(source, default_limits());
}

std::future<ExecutionResult> CodeExecutor::execute_async(std::string source) const {
    return std::async(std::launch::async, [this, source = std::move(source)]() {
        return execute(source);
    });
}

ExecutionResult CodeExecutor::execute(std::string_view source,
                                      const ExecutionLimits& limits) const {
    utils::Timer timer;
    total_executions_.fetch_add(1, std::memory_order_relaxed);

    auto finish = [&timer](ExecutionResult result) {
        result.duration_ms = static_cast<uint64_t>(timer.elapsed_ms().count());
        return result;
    };

    // Source that does not parse never reaches an interpreter
    std::set<uint32_t> string_lines;
    {
        auto parsed = python::Parser::parse(source);
        if (parsed.is_error()) {
            return finish(ExecutionResult::failure(
                parsed.error_message(), error_category_to_string(parsed.error_category())));
        }
        try {
            python::Lexer lexer(source);
            (void)lexer.tokenize();
            string_lines = lexer.string_continuation_lines();
        } catch (const python::SyntaxError& e) {
            return finish(ExecutionResult::failure(
                std::format("Syntax error: {} at line {}", e.what(), e.line), "SyntaxError"));
        }
    }

    HarnessOptions harness;
    harness.workspace = workspace_;
    harness.servers_dir = servers_dir_;
    harness.max_memory_bytes = static_cast<uint64_t>(limits.max_memory_mb) * 1024 * 1024;
    harness.max_cpu_seconds = limits.max_cpu_seconds;
    harness.network_policy = config_.enforce_network ? &network_policy_ : nullptr;
    harness.filesystem_policy = config_.enforce_filesystem ? &filesystem_policy_ : nullptr;

    ScriptFile script(workspace_ / std::format(".exec_{}.py", random::hex(8)));
    if (!script.write(build_harness(harness, source, string_lines))) {
        return finish(ExecutionResult::failure(
            std::format("Failed to write script file {}", script.path().string()),
            "ProcessError"));
    }

    SpawnOptions spawn;
    spawn.argv = {config_.python, "-s", script.path().string()};
    spawn.env = child_environment();
    spawn.working_dir = workspace_;
    spawn.max_memory_bytes = harness.max_memory_bytes;
    spawn.max_cpu_seconds = limits.max_cpu_seconds;
    spawn.with_bridge = true;

    std::optional<ChildProcess> child;
    try {
        child.emplace(ChildProcess::spawn(spawn));
    } catch (const std::system_error& e) {
        utils::log::error(std::format("Failed to start interpreter: {}", e.what()));
        return finish(ExecutionResult::failure(
            std::format("Failed to start interpreter '{}': {}", config_.python, e.what()),
            "ProcessError"));
    }

    std::optional<BridgeWorker> bridge;
    try {
        bridge.emplace(child->bridge_fd(), tool_client());
    } catch (const std::system_error& e) {
        utils::log::error(std::format("Failed to start tool bridge: {}", e.what()));
        child->kill_group();
        (void)child->wait();
        return finish(ExecutionResult::failure(
            std::format("Failed to start tool bridge: {}", e.what()), "ProcessError"));
    }

    std::string out;
    std::string err;
    std::string bridge_buffer;
    bool timed_out = false;
    bool output_exceeded = false;

    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::seconds(limits.timeout_seconds);

    while (child->stdout_fd() >= 0 || child->stderr_fd() >= 0) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            timed_out = true;
            break;
        }

        pollfd pfds[3];
        nfds_t count = 0;
        for (int fd : {child->stdout_fd(), child->stderr_fd(), child->bridge_fd()}) {
            if (fd < 0) continue;
            pfds[count] = pollfd{fd, POLLIN, 0};
            ++count;
        }

        const int rc = ::poll(pfds, count, static_cast<int>(remaining.count()));
        if (rc < 0) {
            if (errno == EINTR) continue;
            utils::log::error(std::format("poll failed: {}", std::strerror(errno)));
            break;
        }
        if (rc == 0) continue;

        for (nfds_t i = 0; i < count; ++i) {
            if (pfds[i].revents == 0) continue;
            const int fd = pfds[i].fd;

            if (fd == child->stdout_fd()) {
                if (!drain(fd, out)) child->close_stdout();
            } else if (fd == child->stderr_fd()) {
                if (!drain(fd, err)) child->close_stderr();
            } else if (fd == child->bridge_fd()) {
                if (!drain(fd, bridge_buffer)) {
                    child->close_bridge();
                    continue;
                }
                size_t nl;
                while ((nl = bridge_buffer.find('\n')) != std::string::npos) {
                    const std::string line = bridge_buffer.substr(0, nl);
                    bridge_buffer.erase(0, nl + 1);
                    if (utils::trim(line).empty()) continue;
                    bridge->submit(line);
                }
                if (bridge_buffer.size() > kMaxBridgeLine) {
                    utils::log::warn("Tool bridge request too large; closing bridge");
                    child->close_bridge();
                }
            }
        }

        if (out.size() + err.size() > config_.max_output_bytes) {
            output_exceeded = true;
            break;
        }
    }

    // Output closed; give the process the rest of the deadline to exit
    int status = 0;
    if (!timed_out && !output_exceeded) {
        for (;;) {
            if (auto done = child->try_wait()) {
                status = *done;
                break;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                timed_out = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    if (timed_out || output_exceeded) {
        child->kill_group();
        status = child->wait();
    }

    if (timed_out) {
        timeouts_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Execution timed out after {}s (pid {} killed)",
                                     limits.timeout_seconds, child->pid()));
        auto result = ExecutionResult::failure(
            std::format("Execution timeout after {}s", limits.timeout_seconds),
            "ExecutionTimeout");
        result.stdout_text = std::move(out);
        result.stderr_text = std::move(err);
        return finish(std::move(result));
    }

    if (output_exceeded) {
        utils::log::warn(std::format("Execution output exceeded {} bytes (pid {} killed)",
                                     config_.max_output_bytes, child->pid()));
        auto result = ExecutionResult::failure(
            std::format("Output limit exceeded: more than {} bytes written",
                        config_.max_output_bytes),
            "OutputLimitExceeded");
        result.stdout_text = out.substr(0, config_.max_output_bytes);
        result.stderr_text = err.substr(0, config_.max_output_bytes);
        return finish(std::move(result));
    }

    if (WIFSIGNALED(status) && WTERMSIG(status) == SIGXCPU) {
        auto result = ExecutionResult::failure(
            std::format("CPU time limit exceeded after {}s", limits.max_cpu_seconds),
            "ExecutionTimeout");
        result.stdout_text = std::move(out);
        result.stderr_text = std::move(err);
        return finish(std::move(result));
    }

    auto result = decode_output(std::move(out), std::move(err), status);
    if (!result.success && result.error_type == "PolicyViolation") {
        utils::log::warn(std::format("Sandbox policy violation: {}", result.error.value_or("")));
    }
    return finish(std::move(result));
}

ExecutionResult CodeExecutor::decode_output(std::string stdout_text,
                                            std::string stderr_text,
                                            int wait_status) {
    const std::string line = last_non_empty_line(stdout_text);
    auto parsed = nlohmann::json::parse(line, nullptr, false);

    if (!parsed.is_discarded() && parsed.is_object() && parsed.contains("success") &&
        parsed["success"].is_boolean()) {
        ExecutionResult result;
        result.success = parsed["success"].get<bool>();
        if (auto it = parsed.find("result"); it != parsed.end()) result.result = *it;
        for (auto [key, slot] : {std::pair{"error", &result.error},
                                 std::pair{"error_type", &result.error_type},
                                 std::pair{"traceback", &result.traceback}}) {
            if (auto it = parsed.find(key); it != parsed.end() && it->is_string()) {
                *slot = it->get<std::string>();
            }
        }

        // The harness writes "\n" + line + "\n"; strip it from the program's output
        const auto at = stdout_text.rfind(line);
        stdout_text.erase(at);
        if (!stdout_text.empty() && stdout_text.back() == '\n') stdout_text.pop_back();

        result.stdout_text = std::move(stdout_text);
        result.stderr_text = std::move(stderr_text);
        return result;
    }

    if (WIFEXITED(wait_status) && WEXITSTATUS(wait_status) == 0) {
        ExecutionResult result;
        result.success = true;
        result.stdout_text = std::move(stdout_text);
        result.stderr_text = std::move(stderr_text);
        return result;
    }

    const std::string reason = last_non_empty_line(stderr_text);
    auto result = ExecutionResult::failure(
        std::format("Interpreter {} without producing a result{}",
                    describe_wait_status(wait_status),
                    reason.empty() ? std::string() : ": " + reason),
        "ProcessError");
    result.stdout_text = std::move(stdout_text);
    result.stderr_text = std::move(stderr_text);
    return result;
}

nlohmann::json CodeExecutor::handle_bridge_request(std::string_view line) const {
    return serve_bridge_request(line, tool_client());
}

nlohmann::json CodeExecutor::list_available_tools() const {
    nlohmann::json info = {
        {"servers", nlohmann::json::object()},
        {"errors", nlohmann::json::array()},
        {"servers_dir", servers_dir_.string()},
        {"workspace_dir", workspace_.string()},
    };

    std::error_code ec;
    if (!fs::is_directory(servers_dir_, ec)) {
        info["errors"].push_back(std::format(
            "Servers directory does not exist: {}. Tools may not have been generated. "
            "Check backend startup logs.", servers_dir_.string()));
        return info;
    }
    if (fs::is_empty(servers_dir_, ec)) {
        info["errors"].push_back(std::format(
            "Servers directory is empty: {}. No MCP servers found. "
            "Check MCP server connection and tool generation.", servers_dir_.string()));
        return info;
    }

    for (const auto& server_name : sorted_server_dirs(servers_dir_)) {
        const fs::path server_dir = servers_dir_ / server_name;
        const fs::path init_file = server_dir / "__init__.py";

        if (!fs::exists(init_file, ec)) {
            info["errors"].push_back(std::format(
                "Server '{}' missing __init__.py at {}. "
                "Tool generation may have failed for this server.",
                server_name, init_file.string()));
            continue;
        }

        const auto tools = sorted_tool_stems(server_dir);
        if (tools.empty()) {
            info["errors"].push_back(std::format(
                "Server '{}' has no tool files (only __init__.py). Expected tool files in {}",
                server_name, server_dir.string()));
        }

        info["servers"][server_name] = {
            {"tools", tools},
            {"path", fs::relative(server_dir, workspace_, ec).string()},
            {"absolute_path", server_dir.string()},
            {"tool_count", tools.size()},
        };
    }
    return info;
}

nlohmann::json CodeExecutor::verify_tool_exists(const std::string& server_name,
                                                const std::string& tool_name) const {
    nlohmann::json result = {
        {"exists", false},
        {"server_dir", nullptr},
        {"tool_file", nullptr},
        {"errors", nlohmann::json::array()},
        {"suggestions", nlohmann::json::array()},
    };

    std::error_code ec;
    if (!fs::is_directory(servers_dir_, ec)) {
        result["errors"].push_back(std::format(
            "Servers directory does not exist: {}. "
            "Tools may not have been generated during backend startup.",
            servers_dir_.string()));
        result["suggestions"].push_back("Check backend startup logs for tool generation errors");
        return result;
    }

    if (!is_plain_name(server_name) || !is_plain_name(tool_name)) {
        result["errors"].push_back(std::format(
            "Invalid server or tool name: '{}/{}'", server_name, tool_name));
        return result;
    }

    const fs::path server_dir = servers_dir_ / server_name;
    if (!fs::is_directory(server_dir, ec)) {
        const auto available = sorted_server_dirs(servers_dir_);
        result["errors"].push_back(std::format(
            "Server '{}' not found in {}. Available servers: {}",
            server_name, servers_dir_.string(),
            available.empty() ? std::string("none") : utils::join(available, ", ")));
        if (!available.empty()) {
            result["suggestions"].push_back(
                std::format("Did you mean one of: {}?", utils::join(available, ", ")));
        }
        return result;
    }
    result["server_dir"] = server_dir.string();

    std::string dashed = tool_name;
    std::replace(dashed.begin(), dashed.end(), '-', '_');
    std::string dotted = tool_name;
    std::replace(dotted.begin(), dotted.end(), '.', '_');

    for (const auto& candidate : {tool_name, dashed, dotted}) {
        const fs::path file = server_dir / (candidate + ".py");
        if (fs::is_regular_file(file, ec)) {
            result["tool_file"] = file.string();
            result["exists"] = true;
            return result;
        }
    }

    const auto available = sorted_tool_stems(server_dir);
    result["errors"].push_back(std::format(
        "Tool '{}' not found in server '{}'. Available tools: {}",
        tool_name, server_name,
        available.empty() ? std::string("none") : utils::join(available, ", ")));
    if (!available.empty()) {
        result["suggestions"].push_back(std::format(
            "Did you mean one of: {}? Or check the tool name spelling "
            "(use underscores, not hyphens)", utils::join(available, ", ")));
    }
    return result;
}

} // namespace execbox
