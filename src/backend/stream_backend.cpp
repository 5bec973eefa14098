#include "maudepp/backend/stream_backend.hpp"
#include "maudepp/backend/output_classifier.hpp"
#include "maudepp/log/logger.hpp"
#include "maudepp/process/executable_locator.hpp"

#include <asio/bind_executor.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/post.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/write.hpp>

#include <algorithm>
#include <array>
#include <filesystem>

namespace maudepp {

namespace {

constexpr auto kQuitGracePeriod = std::chrono::milliseconds{200};
constexpr auto kQuitPollInterval = std::chrono::milliseconds{10};

Error stopped_error() {
    return Error{ErrorKind::Crash, "Backend stopped"};
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════════════

StreamBackend::StreamBackend(BackendConfig config)
    : config_(std::move(config))
    , strand_(asio::make_strand(io_))
    , framer_(config_.stream.prompt_marker)
{
    work_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
        io_.get_executor()
    );
}

StreamBackend::~StreamBackend() {
    stop();
    if (io_thread_.joinable()) {
        if (io_thread_.get_id() == std::this_thread::get_id()) {
            io_thread_.detach();
        } else {
            io_thread_.join();
        }
    }
}

std::string_view StreamBackend::to_string(State state) noexcept {
    switch (state) {
        case State::Starting:         return "starting";
        case State::WaitingForBanner: return "waiting_for_banner";
        case State::Idle:             return "idle";
        case State::AwaitingResponse: return "awaiting_response";
        case State::Stopped:          return "stopped";
    }
    return "unknown";
}

// ═══════════════════════════════════════════════════════════════════════════
// IBackend Interface
// ═══════════════════════════════════════════════════════════════════════════

Result<void> StreamBackend::start() {
    if (started_.exchange(true)) {
        return tl::unexpected(Error::protocol_error("Backend already started"));
    }

    ExecutableLocator locator(config_.engine_path, config_.bundle_dir);
    auto engine = locator.find();
    if (engine.has_value() == false) {
        state_ = State::Stopped;
        Error error{ErrorKind::FileNotFound, "Maude executable not found"};
        error.details = "configured=" + config_.engine_path;
        return tl::unexpected(error);
    }

    launch_ = build_launch_command(engine->string(), config_.stream.extra_args, config_.stream.use_pty);
    if (config_.stream.use_pty && launch_.uses_pty == false) {
        MAUDEPP_LOG_WARN("No PTY helper (unbuffer/script) found, running engine directly");
    }

    process_ = std::make_unique<ChildProcess>(ChildProcessOptions{
        launch_.program,
        launch_.args,
        StderrHandling::Merge
    });
    if (auto spawned = process_->spawn(); !spawned) {
        state_ = State::Stopped;
        return spawned;
    }

    stdin_stream_ = std::make_unique<asio::posix::stream_descriptor>(io_, process_->release_stdin());
    stdout_stream_ = std::make_unique<asio::posix::stream_descriptor>(io_, process_->release_stdout());

    state_ = State::WaitingForBanner;
    io_thread_ = std::thread([this]() { io_.run(); });
    asio::co_spawn(strand_, reader_loop(), asio::detached);

    auto banner = submit(CallKind::Banner, {}, config_.stream.banner_timeout);
    if (!banner) {
        MAUDEPP_LOG_ERROR("Engine did not become ready: " + banner.error().describe());
        stop();
        return tl::unexpected(banner.error());
    }

    MAUDEPP_LOG_INFO("Stream backend ready: " + launch_.program + " (pid " + std::to_string(pid()) + ")");

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

Result<std::string> StreamBackend::execute(const Command& command) {
    return submit(
        CallKind::Execute,
        format_command(command.text),
        command.timeout.value_or(config_.default_timeout)
    );
}

Result<void> StreamBackend::load_file(const std::string& path) {
    auto result = submit(CallKind::Load, "load " + path + "\n", config_.default_timeout);
    if (!result) {
        return tl::unexpected(result.error());
    }
    return {};
}

bool StreamBackend::is_alive() const noexcept {
    const auto state = state_.load();
    return stopping_.load() == false &&
           (state == State::Idle || state == State::AwaitingResponse);
}

void StreamBackend::stop() {
    if (stopping_.exchange(true)) {
        return;
    }
    if (io_thread_.joinable() == false) {
        state_ = State::Stopped;
        return;
    }

    const bool on_io_thread = (io_thread_.get_id() == std::this_thread::get_id());

    if (on_io_thread == false) {
        // Ask the engine to exit on its own first
        auto quit_sent = std::make_shared<std::promise<void>>();
        auto quit_future = quit_sent->get_future();
        asio::post(strand_, [this, quit_sent]() {
            if (stdin_stream_ && stdin_stream_->is_open() && state_ != State::Stopped) {
                asio::error_code ec;
                asio::write(*stdin_stream_, asio::buffer(std::string_view{"quit\n"}), ec);
            }
            quit_sent->set_value();
        });
        quit_future.wait();

        const auto deadline = std::chrono::steady_clock::now() + kQuitGracePeriod;
        while (process_->is_alive() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(kQuitPollInterval);
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

    MAUDEPP_LOG_INFO("Stream backend stopped");
}

std::string StreamBackend::state() const {
    return std::string(to_string(state_.load()));
}

void StreamBackend::set_exit_handler(ExitHandler handler) {
    exit_handler_ = std::move(handler);
}

pid_t StreamBackend::pid() const {
    return process_ ? process_->pid() : -1;
}

// ═══════════════════════════════════════════════════════════════════════════
// Internal: Caller Side
// ═══════════════════════════════════════════════════════════════════════════

Result<std::string> StreamBackend::submit(
    CallKind kind,
    std::string payload,
    std::chrono::milliseconds timeout
) {
    if (started_.load() == false) {
        return tl::unexpected(Error::not_connected("Stream backend not started"));
    }
    if (stopping_.load() || state_.load() == State::Stopped) {
        return tl::unexpected(stopped_error());
    }

    auto call = std::make_shared<PendingCall>();
    call->id = (kind == CallKind::Banner) ? 0 : next_id_.fetch_add(1);
    call->kind = kind;
    call->payload = std::move(payload);
    call->timeout = timeout;
    call->timer = std::make_unique<asio::steady_timer>(strand_);

    auto future = call->reply.get_future();
    asio::post(strand_, [this, call]() { enqueue(call); });

    return await_reply(future, timeout);
}

// ═══════════════════════════════════════════════════════════════════════════
// Internal: Strand Side
// ═══════════════════════════════════════════════════════════════════════════

void StreamBackend::enqueue(const PendingCallPtr& call) {
    if (state_ == State::Stopped) {
        call->complete(tl::unexpected(exit_status_ ? Error::crash(*exit_status_) : stopped_error()));
        return;
    }

    call->timer->expires_after(call->timeout);
    call->timer->async_wait([this, id = call->id](const asio::error_code& ec) {
        if (ec) {
            return;  // Cancelled: the call completed
        }
        on_call_timeout(id);
    });

    if (call->kind == CallKind::Banner) {
        if (state_ != State::WaitingForBanner) {
            call->complete(std::string{});
            return;
        }
        current_ = call;
        on_output({});  // banner may already be buffered
        return;
    }

    mailbox_.push_back(call);
    start_next();
}

void StreamBackend::start_next() {
    if (current_ || state_ != State::Idle) {
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

    state_ = State::AwaitingResponse;
    framer_.expect_response();

    MAUDEPP_LOG_TRACE("engine< " + current_->payload);

    auto payload = std::make_shared<std::string>(current_->payload);
    asio::async_write(
        *stdin_stream_,
        asio::buffer(*payload),
        asio::bind_executor(strand_, [this, payload, id = current_->id](const asio::error_code& ec, std::size_t) {
            if (!ec) {
                return;
            }
            MAUDEPP_LOG_WARN("Write to engine failed: " + ec.message());
            if (current_ && current_->id == id) {
                current_->complete(tl::unexpected(Error::protocol_error("Write failed: " + ec.message())));
                current_.reset();
                if (state_ == State::AwaitingResponse) {
                    state_ = State::Idle;
                }
                start_next();
            }
        })
    );
}

void StreamBackend::on_output(std::string_view chunk) {
    if (chunk.empty() == false) {
        framer_.append(chunk);
        MAUDEPP_LOG_TRACE("engine> " + std::string(chunk));
    }

    auto response = framer_.take_response();
    if (response.has_value() == false) {
        return;
    }

    if (state_ == State::WaitingForBanner) {
        state_ = State::Idle;
        if (current_ && current_->kind == CallKind::Banner) {
            current_->complete(std::string{});
            current_.reset();
        }
        start_next();
        return;
    }

    if (current_ == nullptr) {
        MAUDEPP_LOG_DEBUG("Discarding late engine response");
        return;
    }

    auto call = std::move(current_);
    current_.reset();
    state_ = State::Idle;

    auto text = strip_echo(std::move(*response), call->payload);
    if (call->kind == CallKind::Load) {
        const auto output = trim(text);
        if (has_engine_error(output)) {
            call->complete(tl::unexpected(classify_error(output)));
        } else {
            call->complete(output);
        }
    } else {
        call->complete(classify_response(text));
    }

    start_next();
}

void StreamBackend::on_call_timeout(std::uint64_t id) {
    if (current_ && current_->id == id) {
        auto call = std::move(current_);
        current_.reset();
        MAUDEPP_LOG_WARN("Engine call timed out after " + std::to_string(call->timeout.count()) + "ms");
        call->complete(tl::unexpected(Error::timeout(call->timeout.count())));

        if (call->kind != CallKind::Banner) {
            // The engine still owes the prompt; only the partial text goes
            framer_.discard_buffer();
            state_ = State::Idle;
            start_next();
        }
        return;
    }

    auto it = std::find_if(mailbox_.begin(), mailbox_.end(),
                           [id](const PendingCallPtr& call) { return call->id == id; });
    if (it != mailbox_.end()) {
        (*it)->complete(tl::unexpected(Error::timeout((*it)->timeout.count())));
        mailbox_.erase(it);
    }
}

void StreamBackend::on_eof() {
    if (stopping_.load()) {
        return;
    }

    process_->terminate();
    const int status = process_->exit_status().value_or(-1);
    exit_status_ = status;
    state_ = State::Stopped;

    MAUDEPP_LOG_ERROR("Engine exited unexpectedly with status " + std::to_string(status));
    fail_all(Error::crash(status));

    if (exit_handler_ && exit_notified_ == false) {
        exit_notified_ = true;
        exit_handler_(status);
    }
}

void StreamBackend::fail_all(const Error& error) {
    if (current_) {
        current_->complete(tl::unexpected(error));
        current_.reset();
    }
    for (auto& call : mailbox_) {
        call->complete(tl::unexpected(error));
    }
    mailbox_.clear();
}

void StreamBackend::shutdown_on_strand() {
    state_ = State::Stopped;
    fail_all(stopped_error());

    asio::error_code ec;
    if (stdin_stream_ && stdin_stream_->is_open()) {
        stdin_stream_->close(ec);
    }
    if (stdout_stream_ && stdout_stream_->is_open()) {
        stdout_stream_->close(ec);
    }
}

asio::awaitable<void> StreamBackend::reader_loop() {
    std::array<char, 4096> buffer;

    while (true) {
        std::size_t n = 0;
        try {
            n = co_await stdout_stream_->async_read_some(asio::buffer(buffer), asio::use_awaitable);
        } catch (const std::system_error& e) {
            if (e.code() != asio::error::eof && e.code() != asio::error::operation_aborted) {
                MAUDEPP_LOG_DEBUG("Engine read error: " + std::string(e.what()));
            }
            break;
        }
        on_output(std::string_view(buffer.data(), n));
    }

    on_eof();
}

std::string StreamBackend::strip_echo(std::string response, const std::string& payload) const {
    response.erase(std::remove(response.begin(), response.end(), '\r'), response.end());

    if (launch_.uses_pty == false) {
        return response;
    }

    // Terminal echo of the command precedes the engine output
    const auto echoed = trim(payload);
    const auto start = response.find_first_not_of(" \t\n");
    if (echoed.empty() == false && start != std::string::npos &&
        response.compare(start, echoed.size(), echoed) == 0) {
        const auto eol = response.find('\n', start);
        response.erase(0, eol == std::string::npos ? response.size() : eol + 1);
    }
    return response;
}

}  // namespace maudepp
