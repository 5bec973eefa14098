#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Error Model
// ═══════════════════════════════════════════════════════════════════════════
// Shared error type for backends, the worker pool and the engine API.
//
// Every fallible operation returns Result<T>. Transport failures (timeout,
// crash, connect_exhausted, not_connected, pool errors) are never retried
// inside the library; the caller decides.

#include <tl/expected.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace maudepp {

/// Error kinds reported by backends, the pool and the engine
enum class ErrorKind {
    Timeout,           ///< No response within the call timeout
    Crash,             ///< Subprocess exited unexpectedly
    ConnectExhausted,  ///< Bridge channel not established within the retry budget
    NotConnected,      ///< Bridge call attempted outside the connected state
    ProtocolError,     ///< Malformed frame, write failure, unexpected reply
    ParseError,        ///< Engine could not parse a term
    SyntaxError,       ///< Engine rejected the command syntax
    ModuleNotFound,    ///< Referenced module does not exist
    AmbiguousTerm,     ///< Term has multiple parses
    FileNotFound,      ///< File to load does not exist
    LoadError,         ///< One or more workers failed to load a file
    PoolExhausted,     ///< No worker available and caller would not wait
    PoolTimeout,       ///< No worker became available in time
    InvalidConfig,     ///< Configuration rejected by validation
    NotImplemented,    ///< Backend kind without an implementation
    Unknown            ///< Unrecognised engine error output
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Timeout:          return "timeout";
        case ErrorKind::Crash:            return "crash";
        case ErrorKind::ConnectExhausted: return "connect_exhausted";
        case ErrorKind::NotConnected:     return "not_connected";
        case ErrorKind::ProtocolError:    return "protocol_error";
        case ErrorKind::ParseError:       return "parse_error";
        case ErrorKind::SyntaxError:      return "syntax_error";
        case ErrorKind::ModuleNotFound:   return "module_not_found";
        case ErrorKind::AmbiguousTerm:    return "ambiguous_term";
        case ErrorKind::FileNotFound:     return "file_not_found";
        case ErrorKind::LoadError:        return "load_error";
        case ErrorKind::PoolExhausted:    return "pool_exhausted";
        case ErrorKind::PoolTimeout:      return "pool_timeout";
        case ErrorKind::InvalidConfig:    return "invalid_config";
        case ErrorKind::NotImplemented:   return "not_implemented";
        case ErrorKind::Unknown:          return "unknown";
    }
    return "unknown";
}

struct Error {
    ErrorKind kind{ErrorKind::Unknown};
    std::string message;
    std::optional<std::string> details{};     ///< Extra context (exit status, path, counts)
    std::optional<std::string> raw_output{};  ///< Engine output the error was classified from

    // ─────────────────────────────────────────────────────────────────────────
    // Factory Methods
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] static Error timeout(long long timeout_ms) {
        return {ErrorKind::Timeout,
                "Operation timed out after " + std::to_string(timeout_ms) + "ms",
                "timeout_ms=" + std::to_string(timeout_ms)};
    }

    [[nodiscard]] static Error crash(int exit_status) {
        return {ErrorKind::Crash,
                "Engine process exited with status " + std::to_string(exit_status),
                "exit_status=" + std::to_string(exit_status)};
    }

    [[nodiscard]] static Error connect_exhausted(const std::string& session, std::size_t attempts) {
        return {ErrorKind::ConnectExhausted,
                "Failed to connect to bridge " + session + " after " +
                    std::to_string(attempts) + " attempts",
                "session=" + session};
    }

    [[nodiscard]] static Error not_connected(std::string msg = "Bridge not connected") {
        return {ErrorKind::NotConnected, std::move(msg)};
    }

    [[nodiscard]] static Error protocol_error(std::string msg) {
        return {ErrorKind::ProtocolError, std::move(msg)};
    }

    [[nodiscard]] static Error file_not_found(const std::string& path) {
        return {ErrorKind::FileNotFound, "File not found: " + path, "path=" + path};
    }

    [[nodiscard]] static Error partial_load(std::size_t failures) {
        return {ErrorKind::LoadError,
                "Partial load: " + std::to_string(failures) + " worker(s) failed to load",
                "failures=" + std::to_string(failures)};
    }

    [[nodiscard]] static Error pool_exhausted() {
        return {ErrorKind::PoolExhausted, "Pool is full, no workers available"};
    }

    [[nodiscard]] static Error pool_timeout() {
        return {ErrorKind::PoolTimeout, "Pool checkout timed out"};
    }

    [[nodiscard]] static Error invalid_config(std::string msg) {
        return {ErrorKind::InvalidConfig, std::move(msg)};
    }

    [[nodiscard]] static Error not_implemented(std::string msg) {
        return {ErrorKind::NotImplemented, std::move(msg)};
    }

    /// Timeouts and crashes may succeed on a fresh attempt; the rest indicate a bad command
    [[nodiscard]] bool recoverable() const noexcept {
        return kind == ErrorKind::Timeout || kind == ErrorKind::Crash;
    }

    /// "[kind] message"
    [[nodiscard]] std::string describe() const {
        return "[" + std::string(to_string(kind)) + "] " + message;
    }
};

/// Result type for every fallible operation
template <typename T>
using Result = tl::expected<T, Error>;

}  // namespace maudepp
