#include "maudepp/process/child_process.hpp"
#include "maudepp/log/logger.hpp"

#include <sys/wait.h>
#include <poll.h>
#include <unistd.h>
#include <signal.h>
#include <fcntl.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <mutex>

namespace maudepp {

namespace {

constexpr useconds_t kProcessTerminationWaitUs = 100'000;  // 100ms wait before SIGKILL

// Writes to a dead child must fail with EPIPE instead of killing the host
void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, []() { signal(SIGPIPE, SIG_IGN); });
}

int make_pipe(int fds[2]) {
#if defined(__linux__)
    return pipe2(fds, O_CLOEXEC);
#else
    if (pipe(fds) == -1) {
        return -1;
    }
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return 0;
#endif
}

Error spawn_error(const std::string& what) {
    return Error{ErrorKind::Crash, what + ": " + std::string(strerror(errno))};
}

}  // namespace

ChildProcess::ChildProcess(ChildProcessOptions options)
    : options_(std::move(options))
{}

ChildProcess::~ChildProcess() {
    terminate();
    close_fds();
}

Result<void> ChildProcess::spawn() {
    {
        std::lock_guard lock(mutex_);
        if (child_pid_ > 0) {
            return tl::unexpected(Error::protocol_error("Process already spawned"));
        }
    }

    ignore_sigpipe();

    // argv must be fully built before fork(): the child may only call
    // async-signal-safe functions, so no allocation after fork.
    std::vector<std::string> argv_storage;
    argv_storage.reserve(options_.args.size() + 1);
    argv_storage.push_back(options_.command);
    for (const auto& arg : options_.args) {
        argv_storage.push_back(arg);
    }

    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto& str : argv_storage) {
        argv.push_back(str.data());
    }
    argv.push_back(nullptr);

    int stdin_pipe[2];   // we write to stdin_pipe[1]
    int stdout_pipe[2];  // we read from stdout_pipe[0]

    // Close-on-exec so children spawned by other workers do not inherit our pipe ends
    if (make_pipe(stdin_pipe) == -1) {
        return tl::unexpected(spawn_error("Failed to create pipes"));
    }
    if (make_pipe(stdout_pipe) == -1) {
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        return tl::unexpected(spawn_error("Failed to create pipes"));
    }

    const int devnull = (options_.stderr_handling == StderrHandling::Discard)
        ? open("/dev/null", O_WRONLY)
        : -1;

    pid_t pid = fork();

    if (pid == -1) {
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        if (devnull != -1) {
            close(devnull);
        }
        return tl::unexpected(spawn_error("Failed to fork"));
    }

    if (pid == 0) {
        // Child process - NO ALLOCATIONS ALLOWED
        dup2(stdin_pipe[0], STDIN_FILENO);
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);

        dup2(stdout_pipe[1], STDOUT_FILENO);

        switch (options_.stderr_handling) {
            case StderrHandling::Merge:
                dup2(stdout_pipe[1], STDERR_FILENO);
                break;
            case StderrHandling::Discard:
                if (devnull != -1) {
                    dup2(devnull, STDERR_FILENO);
                    close(devnull);
                }
                break;
            case StderrHandling::Passthrough:
                break;
        }
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);

        // Own process group so terminate() reaches helpers (script, unbuffer) and the engine
        setpgid(0, 0);

        execvp(options_.command.c_str(), argv.data());
        _exit(127);
    }

    close(stdin_pipe[0]);
    close(stdout_pipe[1]);
    if (devnull != -1) {
        close(devnull);
    }

    {
        std::lock_guard lock(mutex_);
        child_pid_ = pid;
        stdin_fd_ = stdin_pipe[1];
        stdout_fd_ = stdout_pipe[0];
        exit_status_.reset();
    }

    MAUDEPP_LOG_DEBUG("Spawned " + options_.command + " (pid " + std::to_string(pid) + ")");
    return {};
}

pid_t ChildProcess::pid() const {
    std::lock_guard lock(mutex_);
    return child_pid_;
}

int ChildProcess::release_stdin() noexcept {
    std::lock_guard lock(mutex_);
    const int fd = stdin_fd_;
    stdin_fd_ = -1;
    return fd;
}

int ChildProcess::release_stdout() noexcept {
    std::lock_guard lock(mutex_);
    const int fd = stdout_fd_;
    stdout_fd_ = -1;
    return fd;
}

Result<void> ChildProcess::write_all(std::string_view data) {
    if (stdin_fd_ == -1) {
        return tl::unexpected(Error::protocol_error("stdin is not open"));
    }

    const char* ptr = data.data();
    std::size_t remaining = data.size();

    while (remaining > 0) {
        ssize_t written = write(stdin_fd_, ptr, remaining);
        if (written == -1) {
            if (errno == EINTR) {
                continue;
            }
            return tl::unexpected(Error::protocol_error(
                "Failed to write to process: " + std::string(strerror(errno))
            ));
        }
        ptr += written;
        remaining -= static_cast<std::size_t>(written);
    }
    return {};
}

Result<std::optional<std::string>> ChildProcess::read_some(std::chrono::milliseconds timeout) {
    if (stdout_fd_ == -1) {
        return tl::unexpected(Error::protocol_error("stdout is not open"));
    }
    if (wait_for_readable(stdout_fd_, timeout) == false) {
        return std::optional<std::string>{std::string{}};
    }

    std::array<char, 4096> buffer;
    ssize_t n;
    do {
        n = ::read(stdout_fd_, buffer.data(), buffer.size());
    } while (n == -1 && errno == EINTR);

    if (n < 0) {
        return tl::unexpected(Error::protocol_error(
            "Failed to read from process: " + std::string(strerror(errno))
        ));
    }
    if (n == 0) {
        return std::optional<std::string>{};
    }
    return std::optional<std::string>{std::string(buffer.data(), static_cast<std::size_t>(n))};
}

bool ChildProcess::is_alive() {
    std::lock_guard lock(mutex_);
    if (child_pid_ <= 0 || exit_status_.has_value()) {
        return false;
    }
    int status;
    pid_t result = waitpid(child_pid_, &status, WNOHANG);
    if (result == child_pid_) {
        record_status(status);
        return false;
    }
    return result == 0;
}

int ChildProcess::wait() {
    pid_t pid;
    {
        std::lock_guard lock(mutex_);
        if (exit_status_.has_value()) {
            return *exit_status_;
        }
        pid = child_pid_;
    }
    if (pid <= 0) {
        return -1;
    }

    int status = 0;
    pid_t result;
    do {
        result = waitpid(pid, &status, 0);
    } while (result == -1 && errno == EINTR);

    std::lock_guard lock(mutex_);
    if (result == pid) {
        record_status(status);
    } else if (exit_status_.has_value() == false) {
        exit_status_ = -1;
    }
    return *exit_status_;
}

void ChildProcess::terminate() {
    pid_t pid;
    {
        std::lock_guard lock(mutex_);
        if (child_pid_ <= 0 || exit_status_.has_value()) {
            return;
        }
        pid = child_pid_;
    }

    // Negative pid signals the whole process group
    kill(-pid, SIGTERM);
    kill(pid, SIGTERM);

    int status = 0;
    int wait_result = waitpid(pid, &status, WNOHANG);

    if (wait_result == 0) {
        usleep(kProcessTerminationWaitUs);
        wait_result = waitpid(pid, &status, WNOHANG);

        if (wait_result == 0) {
            kill(-pid, SIGKILL);
            kill(pid, SIGKILL);
            wait_result = waitpid(pid, &status, 0);
        }
    }

    std::lock_guard lock(mutex_);
    if (wait_result == pid) {
        record_status(status);
    } else if (exit_status_.has_value() == false) {
        // Reaped elsewhere
        exit_status_ = -SIGTERM;
    }
}

std::optional<int> ChildProcess::exit_status() const {
    std::lock_guard lock(mutex_);
    return exit_status_;
}

bool ChildProcess::wait_for_readable(int fd, std::chrono::milliseconds timeout) {
    struct pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;

    int result;
    do {
        result = poll(&pfd, 1, static_cast<int>(timeout.count()));
    } while (result == -1 && errno == EINTR);
    return result > 0 && (pfd.revents & (POLLIN | POLLHUP));
}

void ChildProcess::record_status(int status) {
    // Must be called with mutex held
    if (WIFEXITED(status)) {
        exit_status_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_status_ = -WTERMSIG(status);  // Negative indicates signal
    } else {
        exit_status_ = -1;
    }
}

void ChildProcess::close_fds() noexcept {
    std::lock_guard lock(mutex_);
    if (stdin_fd_ != -1) {
        close(stdin_fd_);
        stdin_fd_ = -1;
    }
    if (stdout_fd_ != -1) {
        close(stdout_fd_);
        stdout_fd_ = -1;
    }
}

}  // namespace maudepp
