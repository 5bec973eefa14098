#ifndef MAUDEPP_BACKEND_STREAM_BACKEND_HPP
#define MAUDEPP_BACKEND_STREAM_BACKEND_HPP

// ═══════════════════════════════════════════════════════════════════════════
// Stream Backend
// ═══════════════════════════════════════════════════════════════════════════
// One engine process driven through its interactive text protocol. The
// engine's stdout is read by a coroutine on the backend's own io_context
// thread; every piece of worker state is touched only on that strand.
//
//   Starting -> WaitingForBanner -> Idle <-> AwaitingResponse -> Stopped
//
// Callers block on a future while their command sits in the mailbox or is
// in flight. A timed-out command leaves the engine running; its late
// response is recognised by prompt counting and dropped.

#include "maudepp/backend.hpp"
#include "maudepp/backend/pending_call.hpp"
#include "maudepp/backend/pty_wrapper.hpp"
#include "maudepp/backend/response_framer.hpp"
#include "maudepp/config.hpp"
#include "maudepp/process/child_process.hpp"

#include <asio/awaitable.hpp>
#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/posix/stream_descriptor.hpp>
#include <asio/strand.hpp>

#include <atomic>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace maudepp {

class StreamBackend final : public IBackend {
public:
    enum class State {
        Starting,
        WaitingForBanner,
        Idle,
        AwaitingResponse,
        Stopped
    };

    explicit StreamBackend(BackendConfig config);
    ~StreamBackend() override;

    StreamBackend(const StreamBackend&) = delete;
    StreamBackend& operator=(const StreamBackend&) = delete;
    StreamBackend(StreamBackend&&) = delete;
    StreamBackend& operator=(StreamBackend&&) = delete;

    using IBackend::execute;

    [[nodiscard]] Result<void> start() override;
    [[nodiscard]] Result<std::string> execute(const Command& command) override;
    [[nodiscard]] Result<void> load_file(const std::string& path) override;
    [[nodiscard]] bool is_alive() const noexcept override;
    void stop() override;

    [[nodiscard]] BackendKind kind() const noexcept override { return BackendKind::Stream; }
    [[nodiscard]] std::string state() const override;
    void set_exit_handler(ExitHandler handler) override;

    /// Engine process id (-1 before start)
    [[nodiscard]] pid_t pid() const;

    /// The program and arguments actually spawned (valid after start)
    [[nodiscard]] const LaunchCommand& launch_command() const noexcept { return launch_; }

    [[nodiscard]] static std::string_view to_string(State state) noexcept;

private:
    [[nodiscard]] Result<std::string> submit(CallKind kind, std::string payload, std::chrono::milliseconds timeout);

    // Strand-only
    void enqueue(const PendingCallPtr& call);
    void start_next();
    void on_output(std::string_view chunk);
    void on_call_timeout(std::uint64_t id);
    void on_eof();
    void fail_all(const Error& error);
    void shutdown_on_strand();
    asio::awaitable<void> reader_loop();

    [[nodiscard]] std::string strip_echo(std::string response, const std::string& payload) const;

    BackendConfig config_;
    LaunchCommand launch_;

    asio::io_context io_;
    asio::strand<asio::io_context::executor_type> strand_;
    std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
    std::thread io_thread_;

    std::unique_ptr<ChildProcess> process_;
    std::unique_ptr<asio::posix::stream_descriptor> stdin_stream_;
    std::unique_ptr<asio::posix::stream_descriptor> stdout_stream_;

    ResponseFramer framer_;
    std::deque<PendingCallPtr> mailbox_;
    PendingCallPtr current_;

    std::atomic<State> state_{State::Starting};
    std::atomic<bool> started_{false};
    std::atomic<bool> stopping_{false};
    std::atomic<std::uint64_t> next_id_{1};
    std::optional<int> exit_status_;  // strand-only
    bool exit_notified_{false};       // strand-only
    ExitHandler exit_handler_;
};

}  // namespace maudepp

#endif  // MAUDEPP_BACKEND_STREAM_BACKEND_HPP
