#ifndef MAUDEPP_BACKEND_PENDING_CALL_HPP
#define MAUDEPP_BACKEND_PENDING_CALL_HPP

#include "maudepp/error.hpp"

#include <asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <string>

namespace maudepp {

// ─────────────────────────────────────────────────────────────────────────────
// PendingCall - one caller waiting on a backend's strand
// ─────────────────────────────────────────────────────────────────────────────
// Created by the calling thread, then touched only on the backend strand.
// The timer runs from submission, so time spent queued behind another call
// counts against the caller's timeout.

enum class CallKind {
    Banner,   // startup prompt, no payload
    Execute,  // classified, result value extracted
    Load      // classified, value ignored
};

struct PendingCall {
    std::uint64_t id{0};
    CallKind kind{CallKind::Execute};
    std::string payload;
    std::chrono::milliseconds timeout{0};
    std::unique_ptr<asio::steady_timer> timer;
    std::promise<Result<std::string>> reply;
    bool done{false};

    /// Deliver the result once; later completions are ignored
    void complete(Result<std::string> result) {
        if (done) {
            return;
        }
        done = true;
        if (timer) {
            timer->cancel();
        }
        reply.set_value(std::move(result));
    }
};

using PendingCallPtr = std::shared_ptr<PendingCall>;

/// Caller-side wait: the strand always answers within the call timeout, the
/// grace period covers scheduling delay
inline Result<std::string> await_reply(
    std::future<Result<std::string>>& future,
    std::chrono::milliseconds timeout
) {
    constexpr std::chrono::milliseconds kReplyGrace{1'000};
    if (future.wait_for(timeout + kReplyGrace) != std::future_status::ready) {
        return tl::unexpected(Error::timeout(timeout.count()));
    }
    return future.get();
}

}  // namespace maudepp

#endif  // MAUDEPP_BACKEND_PENDING_CALL_HPP
