#include "maudepp/backend/bridge_backend.hpp"
#include "maudepp/backend/backoff_policy.hpp"
#include "maudepp/backend/output_classifier.hpp"
#include "maudepp/log/logger.hpp"
#include "maudepp/process/executable_locator.hpp"

#include <asio/bind_executor.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/post.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/use_future.hpp>
#include <asio/write.hpp>

#include <algorithm>
#include <array>
#include <filesystem>
#include <random>

namespace maudepp {

namespace {

constexpr auto kStopGracePeriod = std::chrono::milliseconds{300};
constexpr auto kStopPollInterval = std::chrono::milliseconds{10};
constexpr std::string_view kReadySignal = "READY";

std::atomic<std::uint64_t> g_session_counter{1};

std::string generate_cookie() {
    static constexpr char kHex[] = "0123456789abcdef";
    std::random_device rd;
    std::mt19937_64 rng(rd());
    std::uniform_int_distribution<int> dist(0, 15);

    std::string cookie(32, '0');
    for (auto& c : cookie) {
        c = kHex[dist(rng)];
    }
    return cookie;
}

Error stopped_error() {
    return Error{ErrorKind::Crash, "Backend stopped"};
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════════════

BridgeBackend::BridgeBackend(BackendConfig config)
    : config_(std::move(config))
    , session_id_("maude_bridge_" + std::to_string(g_session_counter.fetch_add(1)))
    , cookie_(generate_cookie())
    , strand_(asio::make_strand(io_))
    , acceptor_(strand_)
    , socket_(strand_)
    , health_timer_(strand_)
    , decoder_(config_.bridge.max_message_size)
{
    work_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
        io_.get_executor()
    );
}

BridgeBackend::~BridgeBackend() {
    stop();
    if (io_thread_.joinable()) {
        if (io_thread_.get_id() == std::this_thread::get_id()) {
            io_thread_.detach();
        } else {
            io_thread_.join();
        }
    }
}

std::string_view BridgeBackend::to_string(State state) noexcept {
    switch (state) {
        case State::Starting:       return "starting";
        case State::AwaitingReady:  return "awaiting_ready";
        case State::Connecting:     return "connecting";
        case State::Connected:      return "connected";
        case State::HealthChecking: return "health_checking";
        case State::Stopped:        return "stopped";
    }
    return "unknown";
}

// ═══════════════════════════════════════════════════════════════════════════
// IBackend Interface
// ═══════════════════════════════════════════════════════════════════════════

Result<void> BridgeBackend::start() {
    if (started_.exchange(true)) {
        return tl::unexpected(Error::protocol_error("Backend already started"));
    }

    const auto& bridge_name = config_.bridge.bridge_path;
    auto bridge = find_in_path(bridge_name);
    if (bridge.has_value() == false) {
        state_ = State::Stopped;
        Error error{ErrorKind::FileNotFound, "Bridge executable not found: " + bridge_name};
        error.details = "path=" + bridge_name;
        return tl::unexpected(error);
    }

    ExecutableLocator locator(config_.engine_path, config_.bundle_dir);
    auto engine = locator.find();
    if (engine.has_value() == false) {
        state_ = State::Stopped;
        Error error{ErrorKind::FileNotFound, "Maude executable not found"};
        error.details = "configured=" + config_.engine_path;
        return tl::unexpected(error);
    }

    if (auto listening = open_listener(); !listening) {
        state_ = State::Stopped;
        return listening;
    }

    const auto endpoint = acceptor_.local_endpoint();
    const std::string host_address = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());

    process_ = std::make_unique<ChildProcess>(ChildProcessOptions{
        bridge->string(),
        {session_id_, cookie_, engine->string(), host_address,
         "--read-timeout-ms=" + std::to_string(config_.bridge.engine_read_timeout.count())},
        StderrHandling::Passthrough
    });
    if (auto spawned = process_->spawn(); !spawned) {
        state_ = State::Stopped;
        return spawned;
    }
    bridge_stdout_ = std::make_unique<asio::posix::stream_descriptor>(io_, process_->release_stdout());

    state_ = State::AwaitingReady;
    io_thread_ = std::thread([this]() { io_.run(); });
    asio::co_spawn(strand_, ready_reader_loop(), asio::detached);

    Result<void> connected;
    try {
        connected = asio::co_spawn(strand_, connect_loop(), asio::use_future).get();
    } catch (const std::system_error& e) {
        connected = tl::unexpected(Error::protocol_error("Bridge connect failed: " + std::string(e.what())));
    }

    if (!connected) {
        MAUDEPP_LOG_ERROR("Bridge " + session_id_ + " failed to start: " + connected.error().describe());
        stop();
        return connected;
    }

    MAUDEPP_LOG_INFO("Bridge " + session_id_ + " connected (pid " + std::to_string(bridge_pid()) + ")");

    for (const auto& path : config_.preload_files) {
        if (std::filesystem::exists(path) == false) {
            MAUDEPP_LOG_WARN("Preload file not found: " + path);
            continue;
        }
        if (auto loaded = load_file(path); !loaded) {
            MAUDEPP_LOG_WARN("Failed to preload " + path + ": " + loaded.error().describe());
        }
    }

    return {};
}

Result<std::string> BridgeBackend::execute(const Command& command) {
    return submit(
        CallKind::Execute,
        format_command(command.text),
        command.timeout.value_or(config_.default_timeout)
    );
}

Result<void> BridgeBackend::load_file(const std::string& path) {
    auto result = submit(CallKind::Load, path, config_.default_timeout);
    if (!result) {
        return tl::unexpected(result.error());
    }
    return {};
}

bool BridgeBackend::is_alive() const noexcept {
    const auto state = state_.load();
    return stopping_.load() == false && alive_.load() &&
           (state == State::Connected || state == State::HealthChecking);
}

void BridgeBackend::stop() {
    if (stopping_.exchange(true)) {
        return;
    }
    if (io_thread_.joinable() == false) {
        state_ = State::Stopped;
        return;
    }

    const bool on_io_thread = (io_thread_.get_id() == std::this_thread::get_id());

    if (on_io_thread == false) {
        // Polite stop first; the bridge replies and exits on its own
        auto stop_sent = std::make_shared<std::promise<void>>();
        auto stop_future = stop_sent->get_future();
        asio::post(strand_, [this, stop_sent]() {
            const auto state = state_.load();
            if (socket_.is_open() && (state == State::Connected || state == State::HealthChecking)) {
                const auto frame = encode_frame(make_stop(next_id_.fetch_add(1)));
                asio::error_code ec;
                asio::write(socket_, asio::buffer(frame), ec);
            }
            stop_sent->set_value();
        });
        stop_future.wait();

        const auto deadline = std::chrono::steady_clock::now() + kStopGracePeriod;
        while (process_->is_alive() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(kStopPollInterval);
        }
    }
    process_->terminate();

    if (on_io_thread) {
        shutdown_on_strand();
        work_guard_.reset();
        io_.stop();
        return;
    }

    auto done = std::make_shared<std::promise<void>>();
    auto done_future = done->get_future();
    asio::post(strand_, [this, done]() {
        shutdown_on_strand();
        done->set_value();
    });
    done_future.wait();

    work_guard_.reset();
    io_.stop();
    io_thread_.join();

    MAUDEPP_LOG_INFO("Bridge " + session_id_ + " stopped");
}

std::string BridgeBackend::state() const {
    const auto state = state_.load();
    if (state == State::Connecting) {
        return "connecting(" + std::to_string(connect_attempt_.load()) + ")";
    }
    return std::string(to_string(state));
}

void BridgeBackend::set_exit_handler(ExitHandler handler) {
    exit_handler_ = std::move(handler);
}

pid_t BridgeBackend::bridge_pid() const {
    return process_ ? process_->pid() : -1;
}

// ═══════════════════════════════════════════════════════════════════════════
// Internal: Caller Side
// ═══════════════════════════════════════════════════════════════════════════

Result<void> BridgeBackend::open_listener() {
    const asio::ip::tcp::endpoint endpoint{asio::ip::address_v4::loopback(), 0};
    asio::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor_.bind(endpoint, ec);
    }
    if (!ec) {
        acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    }
    if (!ec) {
        acceptor_.non_blocking(true, ec);
    }
    if (ec) {
        return tl::unexpected(Error::protocol_error("Failed to open bridge listener: " + ec.message()));
    }
    return {};
}

Result<std::string> BridgeBackend::submit(
    CallKind kind,
    std::string payload,
    std::chrono::milliseconds timeout
) {
    if (started_.load() == false) {
        return tl::unexpected(Error::not_connected("Bridge backend not started"));
    }
    if (stopping_.load() || state_.load() == State::Stopped) {
        return tl::unexpected(stopped_error());
    }
    if (is_alive() == false) {
        return tl::unexpected(Error::not_connected("Bridge " + session_id_ + " is not responding"));
    }

    auto call = std::make_shared<PendingCall>();
    call->id = next_id_.fetch_add(1);
    call->kind = kind;
    call->payload = std::move(payload);
    call->timeout = timeout;
    call->timer = std::make_unique<asio::steady_timer>(strand_);

    auto future = call->reply.get_future();
    asio::post(strand_, [this, call]() { enqueue(call); });

    return await_reply(future, timeout);
}

// ═══════════════════════════════════════════════════════════════════════════
// Internal: Connection Setup (strand)
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<Result<void>> BridgeBackend::connect_loop() {
    const auto retries = config_.bridge.connect_retries;
    ConstantBackoff backoff(config_.bridge.connect_delay);
    asio::steady_timer delay(strand_);

    for (std::size_t attempt = 0; attempt < retries; ++attempt) {
        if (bridge_exited_) {
            MAUDEPP_LOG_WARN("Bridge " + session_id_ + " exited before connecting");
            break;
        }

        if (ready_seen_) {
            state_ = State::Connecting;
            connect_attempt_ = attempt + 1;

            auto accepted = co_await try_accept();
            if (accepted) {
                asio::error_code ignored;
                acceptor_.close(ignored);

                state_ = State::Connected;
                alive_ = true;
                asio::co_spawn(strand_, socket_reader_loop(), asio::detached);
                asio::co_spawn(strand_, health_loop(), asio::detached);
                co_return Result<void>{};
            }
            MAUDEPP_LOG_DEBUG("Bridge connect attempt " + std::to_string(attempt + 1) + " failed: " +
                              accepted.error().message);
        }

        delay.expires_after(backoff.next_delay(attempt));
        co_await delay.async_wait(asio::use_awaitable);
    }

    co_return tl::unexpected(Error::connect_exhausted(session_id_, retries));
}

asio::awaitable<Result<void>> BridgeBackend::try_accept() {
    asio::error_code ec;
    acceptor_.accept(socket_, ec);
    if (ec) {
        co_return tl::unexpected(Error::not_connected("accept: " + ec.message()));
    }

    // Bound the wait for hello by the retry delay. Once the handshake has
    // settled, a handler that was already queued must leave the socket alone.
    auto settled = std::make_shared<bool>(false);
    asio::steady_timer deadline(strand_);
    deadline.expires_after(config_.bridge.connect_delay);
    deadline.async_wait([this, settled](const asio::error_code& timer_ec) {
        if (!timer_ec && *settled == false) {
            asio::error_code ignored;
            socket_.cancel(ignored);
        }
    });

    auto reject = [this, settled](Error error) -> Result<void> {
        *settled = true;
        asio::error_code ignored;
        socket_.close(ignored);
        decoder_ = FrameDecoder(config_.bridge.max_message_size);
        return tl::unexpected(std::move(error));
    };

    std::optional<Json> hello;
    std::array<char, 1024> buffer;
    while (hello.has_value() == false) {
        std::size_t n = 0;
        try {
            n = co_await socket_.async_read_some(asio::buffer(buffer), asio::use_awaitable);
        } catch (const std::system_error& e) {
            co_return reject(Error::not_connected("hello: " + std::string(e.what())));
        }
        decoder_.append(std::string_view(buffer.data(), n));

        auto next = decoder_.next();
        if (!next) {
            co_return reject(next.error());
        }
        hello = std::move(*next);
    }
    *settled = true;
    deadline.cancel();

    const bool valid =
        message_type(*hello) == BridgeMessageType::Hello &&
        hello->value("session", std::string{}) == session_id_ &&
        hello->value("cookie", std::string{}) == cookie_;

    if (valid == false) {
        co_return reject(Error::protocol_error("Bridge handshake rejected"));
    }

    co_return Result<void>{};
}

// ═══════════════════════════════════════════════════════════════════════════
// Internal: Readers (strand)
// ═══════════════════════════════════════════════════════════════════════════

asio::awaitable<void> BridgeBackend::ready_reader_loop() {
    std::array<char, 512> buffer;

    while (true) {
        std::size_t n = 0;
        try {
            n = co_await bridge_stdout_->async_read_some(asio::buffer(buffer), asio::use_awaitable);
        } catch (const std::system_error&) {
            break;
        }
        ready_buffer_.append(buffer.data(), n);
        if (ready_seen_ == false && ready_buffer_.find(kReadySignal) != std::string::npos) {
            ready_seen_ = true;
            MAUDEPP_LOG_DEBUG("Bridge " + session_id_ + " signalled ready");
        }
        // Only the ready signal matters
        if (ready_buffer_.size() > 4096) {
            ready_buffer_.erase(0, ready_buffer_.size() - 64);
        }
    }

    bridge_exited_ = true;
    on_remote_exit();
}

asio::awaitable<void> BridgeBackend::socket_reader_loop() {
    std::array<char, 4096> buffer;

    // Bytes that arrived with the hello are already in the decoder
    bool reading = true;
    while (reading) {
        while (true) {
            auto next = decoder_.next();
            if (!next) {
                MAUDEPP_LOG_ERROR("Bridge protocol error: " + next.error().message);
                reading = false;
                break;
            }
            if (next->has_value() == false) {
                break;
            }
            on_message(**next);
        }
        if (reading == false) {
            break;
        }

        std::size_t n = 0;
        try {
            n = co_await socket_.async_read_some(asio::buffer(buffer), asio::use_awaitable);
        } catch (const std::system_error& e) {
            if (e.code() != asio::error::eof && e.code() != asio::error::operation_aborted) {
                MAUDEPP_LOG_DEBUG("Bridge socket error: " + std::string(e.what()));
            }
            break;
        }
        decoder_.append(std::string_view(buffer.data(), n));
    }

    on_remote_exit();
}

asio::awaitable<void> BridgeBackend::health_loop() {
    while (stopping_.load() == false && state_.load() != State::Stopped) {
        health_timer_.expires_after(config_.bridge.health_check_interval);
        try {
            co_await health_timer_.async_wait(asio::use_awaitable);
        } catch (const std::system_error&) {
            co_return;
        }
        if (stopping_.load() || state_.load() == State::Stopped) {
            co_return;
        }
        if (current_) {
            continue;  // a call in flight proves liveness well enough
        }

        const auto ping_id = next_id_.fetch_add(1);
        outstanding_ping_ = ping_id;
        state_ = State::HealthChecking;
        send_message(make_ping(ping_id), 0);

        health_timer_.expires_after(config_.bridge.ping_timeout);
        try {
            co_await health_timer_.async_wait(asio::use_awaitable);
        } catch (const std::system_error&) {
            co_return;
        }
        if (state_.load() == State::Stopped) {
            co_return;
        }

        if (outstanding_ping_ == ping_id) {
            outstanding_ping_ = 0;
            ++missed_pings_;
            if (alive_.exchange(false)) {
                MAUDEPP_LOG_WARN("Bridge " + session_id_ + " did not answer ping, marking not alive");
            }
        }
        if (state_.load() == State::HealthChecking) {
            state_ = State::Connected;
        }
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Internal: Calls (strand)
// ═══════════════════════════════════════════════════════════════════════════

void BridgeBackend::enqueue(const PendingCallPtr& call) {
    if (state_ == State::Stopped) {
        call->complete(tl::unexpected(stopped_error()));
        return;
    }
    if (alive_.load() == false) {
        call->complete(tl::unexpected(Error::not_connected("Bridge " + session_id_ + " is not responding")));
        return;
    }

    call->timer->expires_after(call->timeout);
    call->timer->async_wait([this, id = call->id](const asio::error_code& ec) {
        if (ec) {
            return;
        }
        on_call_timeout(id);
    });

    mailbox_.push_back(call);
    start_next();
}

void BridgeBackend::start_next() {
    const auto state = state_.load();
    if (current_ || (state != State::Connected && state != State::HealthChecking)) {
        return;
    }
    while (mailbox_.empty() == false && current_ == nullptr) {
        auto call = std::move(mailbox_.front());
        mailbox_.pop_front();
        if (call->done == false) {
            current_ = std::move(call);
        }
    }
    if (current_ == nullptr) {
        return;
    }

    const auto message = (current_->kind == CallKind::Load)
        ? make_load_file(current_->id, current_->payload)
        : make_execute(current_->id, current_->payload);
    send_message(message, current_->id);
}

void BridgeBackend::send_message(const Json& message, std::uint64_t call_id) {
    auto frame = std::make_shared<std::string>(encode_frame(message));
    MAUDEPP_LOG_TRACE("bridge< " + message.dump());

    asio::async_write(
        socket_,
        asio::buffer(*frame),
        asio::bind_executor(strand_, [this, frame, call_id](const asio::error_code& ec, std::size_t) {
            if (!ec) {
                return;
            }
            MAUDEPP_LOG_WARN("Write to bridge failed: " + ec.message());
            if (call_id != 0 && current_ && current_->id == call_id) {
                current_->complete(tl::unexpected(Error::protocol_error("Write failed: " + ec.message())));
                current_.reset();
                start_next();
            }
        })
    );
}

void BridgeBackend::on_message(const Json& message) {
    MAUDEPP_LOG_TRACE("bridge> " + message.dump());

    const auto type = message_type(message);
    const auto id = message_id(message);

    if (type == BridgeMessageType::Pong) {
        if (id == outstanding_ping_) {
            outstanding_ping_ = 0;
        }
        if (alive_.exchange(true) == false) {
            MAUDEPP_LOG_INFO("Bridge " + session_id_ + " responding again");
        }
        if (state_.load() == State::HealthChecking) {
            state_ = State::Connected;
        }
        return;
    }

    if (current_ == nullptr || current_->id != id) {
        MAUDEPP_LOG_DEBUG("Discarding stale bridge reply (id " + std::to_string(id) + ")");
        return;
    }

    auto call = std::move(current_);
    current_.reset();

    if (call->kind == CallKind::Load) {
        auto loaded = load_reply_to_result(message);
        if (loaded) {
            call->complete(std::string{});
        } else {
            call->complete(tl::unexpected(loaded.error()));
        }
    } else {
        call->complete(execute_reply_to_result(message));
    }

    start_next();
}

void BridgeBackend::on_call_timeout(std::uint64_t id) {
    if (current_ && current_->id == id) {
        auto call = std::move(current_);
        current_.reset();
        MAUDEPP_LOG_WARN("Bridge call timed out after " + std::to_string(call->timeout.count()) + "ms");
        call->complete(tl::unexpected(Error::timeout(call->timeout.count())));
        start_next();
        return;
    }

    auto it = std::find_if(mailbox_.begin(), mailbox_.end(),
                           [id](const PendingCallPtr& call) { return call->id == id; });
    if (it != mailbox_.end()) {
        (*it)->complete(tl::unexpected(Error::timeout((*it)->timeout.count())));
        mailbox_.erase(it);
    }
}

void BridgeBackend::on_remote_exit() {
    const auto state = state_.load();
    if (stopping_.load() || state == State::Stopped) {
        return;
    }
    if (state != State::Connected && state != State::HealthChecking) {
        return;  // the connect loop reports failures during startup
    }

    state_ = State::Stopped;
    alive_ = false;

    process_->terminate();
    const int status = process_->exit_status().value_or(-1);

    MAUDEPP_LOG_ERROR("Bridge " + session_id_ + " exited unexpectedly with status " + std::to_string(status));

    asio::error_code ignored;
    health_timer_.cancel();
    socket_.close(ignored);

    fail_all(Error::crash(status));

    if (exit_handler_ && exit_notified_ == false) {
        exit_notified_ = true;
        exit_handler_(status);
    }
}

void BridgeBackend::fail_all(const Error& error) {
    if (current_) {
        current_->complete(tl::unexpected(error));
        current_.reset();
    }
    for (auto& call : mailbox_) {
        call->complete(tl::unexpected(error));
    }
    mailbox_.clear();
}

void BridgeBackend::shutdown_on_strand() {
    state_ = State::Stopped;
    alive_ = false;
    fail_all(stopped_error());

    asio::error_code ec;
    health_timer_.cancel();
    if (socket_.is_open()) {
        socket_.close(ec);
    }
    if (acceptor_.is_open()) {
        acceptor_.close(ec);
    }
    if (bridge_stdout_ && bridge_stdout_->is_open()) {
        bridge_stdout_->close(ec);
    }
}

}  // namespace maudepp
