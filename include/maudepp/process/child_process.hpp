#pragma once

// Platform check - ChildProcess requires POSIX APIs
#if !defined(__unix__) && !defined(__APPLE__) && !defined(__linux__)
#error "ChildProcess is only available on POSIX-compatible systems (Linux, macOS, BSD)"
#endif

#include "maudepp/error.hpp"

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>  // pid_t

namespace maudepp {

// ═══════════════════════════════════════════════════════════════════════════
// Child Process
// ═══════════════════════════════════════════════════════════════════════════
// fork/exec with the child's stdin and stdout connected to pipes. The pipe
// ends can be released to an asio stream_descriptor, which then owns them.

/// Where the child's stderr goes
enum class StderrHandling {
    Merge,       // Same pipe as stdout (engine diagnostics interleave with output)
    Discard,     // Redirect to /dev/null
    Passthrough  // Inherit the parent's stderr
};

struct ChildProcessOptions {
    std::string command;
    std::vector<std::string> args;
    StderrHandling stderr_handling{StderrHandling::Merge};
};

class ChildProcess {
public:
    explicit ChildProcess(ChildProcessOptions options);
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ChildProcess(ChildProcess&&) = delete;
    ChildProcess& operator=(ChildProcess&&) = delete;

    /// Fork and exec. A command that cannot be executed exits with status 127.
    [[nodiscard]] Result<void> spawn();

    [[nodiscard]] pid_t pid() const;

    /// Hand the write end of stdin to the caller (-1 if already released)
    [[nodiscard]] int release_stdin() noexcept;

    /// Hand the read end of stdout to the caller (-1 if already released)
    [[nodiscard]] int release_stdout() noexcept;

    [[nodiscard]] int stdin_fd() const noexcept { return stdin_fd_; }
    [[nodiscard]] int stdout_fd() const noexcept { return stdout_fd_; }

    /// Write all bytes to the child's stdin (retries partial writes and EINTR)
    [[nodiscard]] Result<void> write_all(std::string_view data);

    /// Read whatever is available within timeout. Empty string = timeout, nullopt = EOF.
    [[nodiscard]] Result<std::optional<std::string>> read_some(std::chrono::milliseconds timeout);

    /// Non-blocking: reaps the child if it has exited
    [[nodiscard]] bool is_alive();

    /// Block until the child exits, return its exit status
    int wait();

    /// SIGTERM, brief grace period, then SIGKILL. Reaps the child.
    void terminate();

    /// Exit code, or -signal when killed by a signal. Set once the child is reaped.
    [[nodiscard]] std::optional<int> exit_status() const;

    /// Wait for fd to be readable
    [[nodiscard]] static bool wait_for_readable(int fd, std::chrono::milliseconds timeout);

private:
    void record_status(int status);
    void close_fds() noexcept;

    ChildProcessOptions options_;
    int stdin_fd_{-1};
    int stdout_fd_{-1};
    pid_t child_pid_{-1};
    std::optional<int> exit_status_;
    mutable std::mutex mutex_;
};

}  // namespace maudepp
