#include "executor/child_process.hpp"
#include "executor/harness.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <format>
#include <system_error>
#include <utility>

namespace execbox {

namespace {

void close_fd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

[[noreturn]] void throw_errno(const std::string& what) {
    throw std::system_error(errno, std::generic_category(), what);
}

// Closes every descriptor it holds unless released
struct FdSet {
    int fds[8] = {-1, -1, -1, -1, -1, -1, -1, -1};
    ~FdSet() {
        for (int& fd : fds) close_fd(fd);
    }
};

[[noreturn]] void report_exec_failure(int status_w) {
    const int err = errno;
    (void)!::write(status_w, &err, sizeof(err));
    ::_exit(127);
}

// Runs in the forked child: only async-signal-safe calls until exec.
[[noreturn]] void exec_child(const SpawnOptions& options,
                             char* const* argv, char* const* envp,
                             int out_w, int err_w, int bridge_child, int status_w) {
    // Keep the status pipe clear of the descriptors about to be installed
    if (status_w <= kBridgeFd) {
        const int moved = ::fcntl(status_w, F_DUPFD_CLOEXEC, kBridgeFd + 1);
        if (moved < 0) ::_exit(127);
        status_w = moved;
    }

    ::setpgid(0, 0);

    const int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull < 0 || ::dup2(devnull, STDIN_FILENO) < 0) report_exec_failure(status_w);
    if (::dup2(out_w, STDOUT_FILENO) < 0) report_exec_failure(status_w);
    if (::dup2(err_w, STDERR_FILENO) < 0) report_exec_failure(status_w);

    if (bridge_child >= 0) {
        if (bridge_child == kBridgeFd) {
            if (::fcntl(kBridgeFd, F_SETFD, 0) < 0) report_exec_failure(status_w);
        } else if (::dup2(bridge_child, kBridgeFd) < 0) {
            report_exec_failure(status_w);
        }
    }
    ::close_range(static_cast<unsigned>(kBridgeFd + 1), ~0U, CLOSE_RANGE_CLOEXEC);

    if (options.max_memory_bytes > 0) {
        const rlimit rl{options.max_memory_bytes, options.max_memory_bytes};
        if (::setrlimit(RLIMIT_AS, &rl) < 0) report_exec_failure(status_w);
    }
    if (options.max_cpu_seconds > 0) {
        const rlimit rl{options.max_cpu_seconds, options.max_cpu_seconds + 1ULL};
        if (::setrlimit(RLIMIT_CPU, &rl) < 0) report_exec_failure(status_w);
    }
    const rlimit no_core{0, 0};
    ::setrlimit(RLIMIT_CORE, &no_core);
    ::prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);

    if (!options.working_dir.empty() && ::chdir(options.working_dir.c_str()) < 0) {
        report_exec_failure(status_w);
    }

    // Reset signal dispositions the parent may have changed
    ::signal(SIGPIPE, SIG_DFL);

    ::execvpe(argv[0], argv, envp);
    report_exec_failure(status_w);
}

} // anonymous namespace

ChildProcess ChildProcess::spawn(const SpawnOptions& options) {
    if (options.argv.empty()) {
        throw std::system_error(EINVAL, std::generic_category(), "spawn: empty argv");
    }

    // Prepared before fork: the child may not allocate
    std::vector<char*> argv;
    for (const auto& arg : options.argv) argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);
    std::vector<char*> envp;
    for (const auto& var : options.env) envp.push_back(const_cast<char*>(var.c_str()));
    envp.push_back(nullptr);

    // [0,1] stdout, [2,3] stderr, [4,5] bridge, [6,7] exec status
    FdSet fds;
    if (::pipe2(&fds.fds[0], O_CLOEXEC) < 0) throw_errno("pipe2 (stdout)");
    if (::pipe2(&fds.fds[2], O_CLOEXEC) < 0) throw_errno("pipe2 (stderr)");
    if (options.with_bridge &&
        ::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, &fds.fds[4]) < 0) {
        throw_errno("socketpair (bridge)");
    }
    if (::pipe2(&fds.fds[6], O_CLOEXEC) < 0) throw_errno("pipe2 (exec status)");

    const pid_t pid = ::fork();
    if (pid < 0) throw_errno("fork");
    if (pid == 0) {
        exec_child(options, argv.data(), envp.data(),
                   fds.fds[1], fds.fds[3], fds.fds[5], fds.fds[7]);
    }

    // Mirror the child's setpgid so kill_group() works even if we get there first
    ::setpgid(pid, pid);

    ChildProcess child;
    child.pid_ = pid;
    child.stdout_fd_ = std::exchange(fds.fds[0], -1);
    child.stderr_fd_ = std::exchange(fds.fds[2], -1);
    child.bridge_fd_ = std::exchange(fds.fds[4], -1);
    close_fd(fds.fds[1]);
    close_fd(fds.fds[3]);
    close_fd(fds.fds[5]);
    close_fd(fds.fds[7]);

    // EOF means exec succeeded; an int means it failed with that errno
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(fds.fds[6], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        (void)child.wait();
        throw std::system_error(child_errno, std::generic_category(),
                                std::format("exec '{}'", options.argv.front()));
    }
    return child;
}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : pid_(std::exchange(other.pid_, -1)),
      reaped_(std::exchange(other.reaped_, false)),
      status_(other.status_),
      stdout_fd_(std::exchange(other.stdout_fd_, -1)),
      stderr_fd_(std::exchange(other.stderr_fd_, -1)),
      bridge_fd_(std::exchange(other.bridge_fd_, -1)) {}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
    if (this != &other) {
        release();
        pid_ = std::exchange(other.pid_, -1);
        reaped_ = std::exchange(other.reaped_, false);
        status_ = other.status_;
        stdout_fd_ = std::exchange(other.stdout_fd_, -1);
        stderr_fd_ = std::exchange(other.stderr_fd_, -1);
        bridge_fd_ = std::exchange(other.bridge_fd_, -1);
    }
    return *this;
}

ChildProcess::~ChildProcess() {
    release();
}

void ChildProcess::release() noexcept {
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
    close_fd(bridge_fd_);
    if (pid_ > 0 && !reaped_) {
        kill_group();
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
        reaped_ = true;
    }
    pid_ = -1;
}

void ChildProcess::close_stdout() { close_fd(stdout_fd_); }
void ChildProcess::close_stderr() { close_fd(stderr_fd_); }
void ChildProcess::close_bridge() { close_fd(bridge_fd_); }

void ChildProcess::kill_group() noexcept {
    if (pid_ <= 0 || reaped_) return;
    if (::kill(-pid_, SIGKILL) < 0) {
        ::kill(pid_, SIGKILL);
    }
}

std::optional<int> ChildProcess::try_wait() {
    if (reaped_) return status_;
    int status = 0;
    const pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == pid_) {
        reaped_ = true;
        status_ = status;
        return status_;
    }
    if (r < 0 && errno != EINTR) throw_errno("waitpid");
    return std::nullopt;
}

int ChildProcess::wait() {
    if (reaped_) return status_;
    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &status, 0);
    } while (r < 0 && errno == EINTR);
    if (r < 0) throw_errno("waitpid");
    reaped_ = true;
    status_ = status;
    return status_;
}

std::string describe_wait_status(int status) {
    if (WIFEXITED(status)) return std::format("exit code {}", WEXITSTATUS(status));
    if (WIFSIGNALED(status)) {
        const int sig = WTERMSIG(status);
        const char* name = ::sigabbrev_np(sig);
        return name ? std::format("killed by signal {} (SIG{})", sig, name)
                    : std::format("killed by signal {}", sig);
    }
    return std::format("wait status {}", status);
}

} // namespace execbox
