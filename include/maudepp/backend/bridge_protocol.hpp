#ifndef MAUDEPP_BACKEND_BRIDGE_PROTOCOL_HPP
#define MAUDEPP_BACKEND_BRIDGE_PROTOCOL_HPP

// ═══════════════════════════════════════════════════════════════════════════
// Bridge Protocol
// ═══════════════════════════════════════════════════════════════════════════
// Messages between the host and maude-bridge are JSON objects framed as
//
//   Content-Length: <n>\r\n\r\n<json body>
//
// Host -> bridge: execute, load_file, ping, stop
// Bridge -> host: hello (once, right after connecting), ok, error, pong
//
// Every request carries an id; the reply echoes it. Replies whose id does
// not match the request in flight are stale and dropped by the host.

#include "maudepp/error.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace maudepp {

using Json = nlohmann::json;

enum class BridgeMessageType {
    Hello,
    Execute,
    LoadFile,
    Ping,
    Stop,
    Ok,
    Error,
    Pong
};

[[nodiscard]] constexpr std::string_view to_string(BridgeMessageType type) noexcept {
    switch (type) {
        case BridgeMessageType::Hello:    return "hello";
        case BridgeMessageType::Execute:  return "execute";
        case BridgeMessageType::LoadFile: return "load_file";
        case BridgeMessageType::Ping:     return "ping";
        case BridgeMessageType::Stop:     return "stop";
        case BridgeMessageType::Ok:       return "ok";
        case BridgeMessageType::Error:    return "error";
        case BridgeMessageType::Pong:     return "pong";
    }
    return "unknown";
}

[[nodiscard]] std::optional<BridgeMessageType> parse_message_type(std::string_view name) noexcept;

/// Type of a decoded message (nullopt when "type" is missing or unknown)
[[nodiscard]] std::optional<BridgeMessageType> message_type(const Json& message);

/// Request id of a message (0 when absent)
[[nodiscard]] std::uint64_t message_id(const Json& message);

// ─────────────────────────────────────────────────────────────────────────────
// Message Builders
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] Json make_hello(const std::string& session, const std::string& cookie);
[[nodiscard]] Json make_execute(std::uint64_t id, const std::string& text);
[[nodiscard]] Json make_load_file(std::uint64_t id, const std::string& path);
[[nodiscard]] Json make_ping(std::uint64_t id);
[[nodiscard]] Json make_stop(std::uint64_t id);
[[nodiscard]] Json make_ok(std::uint64_t id, const std::string& output = {});
[[nodiscard]] Json make_error(std::uint64_t id, const std::string& reason, const std::string& output = {});
[[nodiscard]] Json make_pong(std::uint64_t id);

/// Map an execute reply to the caller's result (engine output is classified)
[[nodiscard]] Result<std::string> execute_reply_to_result(const Json& reply);

/// Map a load_file reply to the caller's result
[[nodiscard]] Result<void> load_reply_to_result(const Json& reply);

// ─────────────────────────────────────────────────────────────────────────────
// Framing
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] std::string encode_frame(const Json& message);

// Incremental decoder: feed bytes as they arrive, pull complete messages.

class FrameDecoder {
public:
    explicit FrameDecoder(std::size_t max_message_size = 16 * 1024 * 1024);

    void append(std::string_view bytes);

    /// Next complete message, nullopt if more bytes are needed.
    /// Malformed headers, oversize frames and invalid JSON are protocol errors.
    [[nodiscard]] Result<std::optional<Json>> next();

    [[nodiscard]] std::size_t buffered() const noexcept { return buffer_.size(); }

private:
    std::string buffer_;
    std::size_t max_message_size_;
};

}  // namespace maudepp

#endif  // MAUDEPP_BACKEND_BRIDGE_PROTOCOL_HPP
