#pragma once

#include <sys/types.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace execbox {

struct SpawnOptions {
    std::vector<std::string> argv;
    std::vector<std::string> env;      // "KEY=value" entries; nothing is inherited
    std::filesystem::path working_dir;
    uint64_t max_memory_bytes = 0;     // RLIMIT_AS, 0 = unlimited
    uint32_t max_cpu_seconds = 0;      // RLIMIT_CPU, 0 = unlimited
    bool with_bridge = false;          // socketpair end installed as fd 3
};

/**
 * @brief A spawned child running in its own process group
 *
 * Before exec the child gets stdin from /dev/null, stdout and stderr piped to
 * the parent, its resource limits, no core dumps and PR_SET_NO_NEW_PRIVS.
 * Every other inherited descriptor is closed.
 *
 * Destroying a ChildProcess that was not reaped kills the whole group and
 * waits for it, so a child can never outlive its handle.
 */
class ChildProcess {
public:
    /**
     * @brief Fork and exec argv[0] (looked up on PATH)
     * @throws std::system_error when a pipe, fork or the exec itself fails
     */
    [[nodiscard]] static ChildProcess spawn(const SpawnOptions& options);

    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& other) noexcept;
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ~ChildProcess();

    [[nodiscard]] pid_t pid() const { return pid_; }
    [[nodiscard]] int stdout_fd() const { return stdout_fd_; }
    [[nodiscard]] int stderr_fd() const { return stderr_fd_; }
    [[nodiscard]] int bridge_fd() const { return bridge_fd_; }

    void close_stdout();
    void close_stderr();
    void close_bridge();

    /// SIGKILL the child's process group (no-op once reaped)
    void kill_group() noexcept;

    /// Non-blocking reap; returns the raw wait status once the child exited
    [[nodiscard]] std::optional<int> try_wait();

    /// Blocking reap; returns the raw wait status
    int wait();

    [[nodiscard]] bool reaped() const { return reaped_; }

private:
    ChildProcess() = default;
    void release() noexcept;

    pid_t pid_ = -1;
    bool reaped_ = false;
    int status_ = 0;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    int bridge_fd_ = -1;
};

/// Human readable exit description ("exit code 1", "killed by signal 9")
[[nodiscard]] std::string describe_wait_status(int status);

} // namespace execbox
