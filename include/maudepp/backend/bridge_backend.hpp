#ifndef MAUDEPP_BACKEND_BRIDGE_BACKEND_HPP
#define MAUDEPP_BACKEND_BRIDGE_BACKEND_HPP

// ═══════════════════════════════════════════════════════════════════════════
// Bridge Backend
// ═══════════════════════════════════════════════════════════════════════════
// Talks to the engine through the maude-bridge executable. The host opens a
// loopback listener and spawns the bridge with
//
//   maude-bridge <session> <cookie> <engine_path> <host:port>
//
// The bridge starts the engine, dials the listener, sends hello and prints
// READY on stdout. The host then accepts the connection and checks the
// hello against the session id and cookie it generated.
//
//   Starting -> AwaitingReady -> Connecting(n) -> Connected <-> HealthChecking
//                                                   |
//                                                   v
//                                                Stopped
//
// While connected, EOF on the socket or on the bridge's stdout means the
// bridge is gone: the worker stops and the in-flight caller gets crash.

#include "maudepp/backend.hpp"
#include "maudepp/backend/bridge_protocol.hpp"
#include "maudepp/backend/pending_call.hpp"
#include "maudepp/config.hpp"
#include "maudepp/process/child_process.hpp"

#include <asio/awaitable.hpp>
#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/posix/stream_descriptor.hpp>
#include <asio/steady_timer.hpp>
#include <asio/strand.hpp>

#include <atomic>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace maudepp {

class BridgeBackend final : public IBackend {
public:
    enum class State {
        Starting,
        AwaitingReady,
        Connecting,
        Connected,
        HealthChecking,
        Stopped
    };

    explicit BridgeBackend(BackendConfig config);
    ~BridgeBackend() override;

    BridgeBackend(const BridgeBackend&) = delete;
    BridgeBackend& operator=(const BridgeBackend&) = delete;
    BridgeBackend(BridgeBackend&&) = delete;
    BridgeBackend& operator=(BridgeBackend&&) = delete;

    using IBackend::execute;

    [[nodiscard]] Result<void> start() override;
    [[nodiscard]] Result<std::string> execute(const Command& command) override;
    [[nodiscard]] Result<void> load_file(const std::string& path) override;
    [[nodiscard]] bool is_alive() const noexcept override;
    void stop() override;

    [[nodiscard]] BackendKind kind() const noexcept override { return BackendKind::Bridge; }
    [[nodiscard]] std::string state() const override;
    void set_exit_handler(ExitHandler handler) override;

    [[nodiscard]] const std::string& session_id() const noexcept { return session_id_; }

    /// Bridge process id (-1 before start)
    [[nodiscard]] pid_t bridge_pid() const;

    /// Number of health pings that went unanswered since start
    [[nodiscard]] std::size_t missed_pings() const noexcept { return missed_pings_.load(); }

    [[nodiscard]] static std::string_view to_string(State state) noexcept;

private:
    [[nodiscard]] Result<std::string> submit(CallKind kind, std::string payload, std::chrono::milliseconds timeout);
    [[nodiscard]] Result<void> open_listener();

    // Strand-only
    asio::awaitable<Result<void>> connect_loop();
    asio::awaitable<Result<void>> try_accept();
    asio::awaitable<void> ready_reader_loop();
    asio::awaitable<void> socket_reader_loop();
    asio::awaitable<void> health_loop();
    void enqueue(const PendingCallPtr& call);
    void start_next();
    void send_message(const Json& message, std::uint64_t call_id);
    void on_message(const Json& message);
    void on_call_timeout(std::uint64_t id);
    void on_remote_exit();
    void fail_all(const Error& error);
    void shutdown_on_strand();

    BackendConfig config_;
    std::string session_id_;
    std::string cookie_;

    asio::io_context io_;
    asio::strand<asio::io_context::executor_type> strand_;
    std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
    std::thread io_thread_;

    std::unique_ptr<ChildProcess> process_;
    std::unique_ptr<asio::posix::stream_descriptor> bridge_stdout_;
    asio::ip::tcp::acceptor acceptor_;
    asio::ip::tcp::socket socket_;
    asio::steady_timer health_timer_;

    FrameDecoder decoder_;
    std::string ready_buffer_;
    bool ready_seen_{false};       // strand-only
    bool bridge_exited_{false};    // strand-only
    std::uint64_t outstanding_ping_{0};

    std::deque<PendingCallPtr> mailbox_;
    PendingCallPtr current_;

    std::atomic<State> state_{State::Starting};
    std::atomic<std::size_t> connect_attempt_{0};
    std::atomic<bool> alive_{false};
    std::atomic<bool> started_{false};
    std::atomic<bool> stopping_{false};
    std::atomic<std::uint64_t> next_id_{1};
    std::atomic<std::size_t> missed_pings_{0};
    bool exit_notified_{false};
    ExitHandler exit_handler_;
};

}  // namespace maudepp

#endif  // MAUDEPP_BACKEND_BRIDGE_BACKEND_HPP
