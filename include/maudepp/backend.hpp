#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Backend Contract
// ═══════════════════════════════════════════════════════════════════════════
// A backend owns exactly one engine session (one child process) and turns
// textual commands into framed responses. The pool and the facade talk to
// backends only through IBackend, so transports are interchangeable.
//
// Guarantees every implementation provides:
//   - execute() never interleaves two commands on the same instance;
//     concurrent callers are queued and served in FIFO order
//   - is_alive() never blocks and never throws, also after a crash
//   - stop() is idempotent
//   - the exit handler fires at most once, only for unsolicited exits

#include "maudepp/error.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace maudepp {

/// Transport used to reach the engine
enum class BackendKind {
    Stream,  ///< Text protocol over a (pseudo-terminal wrapped) child process
    Bridge,  ///< Framed messages through the maude-bridge executable
    Native   ///< In-process calls (no implementation)
};

[[nodiscard]] constexpr std::string_view to_string(BackendKind kind) noexcept {
    switch (kind) {
        case BackendKind::Stream: return "stream";
        case BackendKind::Bridge: return "bridge";
        case BackendKind::Native: return "native";
    }
    return "unknown";
}

/// Parse "stream" / "bridge" / "native" (also the legacy names "port", "cnode", "nif")
[[nodiscard]] std::optional<BackendKind> parse_backend_kind(std::string_view name) noexcept;

/// One command for the engine; timeout falls back to the backend default when unset
struct Command {
    std::string text;
    std::optional<std::chrono::milliseconds> timeout{};
};

/// Invoked (on the backend's own thread) when the session exits without stop()
using ExitHandler = std::function<void(int exit_status)>;

class IBackend {
public:
    virtual ~IBackend() = default;

    /// Spawn and initialise the session. Fails if already started.
    [[nodiscard]] virtual Result<void> start() = 0;

    /// Send one command and wait for its response (or the timeout)
    [[nodiscard]] virtual Result<std::string> execute(const Command& command) = 0;

    /// Load a source file into the session
    [[nodiscard]] virtual Result<void> load_file(const std::string& path) = 0;

    [[nodiscard]] virtual bool is_alive() const noexcept = 0;

    /// Graceful shutdown, then forced termination
    virtual void stop() = 0;

    [[nodiscard]] virtual BackendKind kind() const noexcept = 0;

    /// Current state machine state ("idle", "awaiting_response", "stopped", ...)
    [[nodiscard]] virtual std::string state() const = 0;

    /// Must be set before start()
    virtual void set_exit_handler(ExitHandler handler) = 0;

    // Convenience overload using the configured default timeout
    [[nodiscard]] Result<std::string> execute(std::string text) {
        return execute(Command{std::move(text), std::nullopt});
    }

    [[nodiscard]] Result<std::string> execute(std::string text, std::chrono::milliseconds timeout) {
        return execute(Command{std::move(text), timeout});
    }
};

}  // namespace maudepp
