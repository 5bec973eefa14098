#include "maudepp/backend/bridge_protocol.hpp"
#include "maudepp/backend/output_classifier.hpp"

#include <algorithm>
#include <cctype>

namespace maudepp {

namespace {

constexpr std::size_t kMaxHeaderSize = 1024;

}  // namespace

std::optional<BridgeMessageType> parse_message_type(std::string_view name) noexcept {
    for (auto type : {BridgeMessageType::Hello, BridgeMessageType::Execute,
                      BridgeMessageType::LoadFile, BridgeMessageType::Ping,
                      BridgeMessageType::Stop, BridgeMessageType::Ok,
                      BridgeMessageType::Error, BridgeMessageType::Pong}) {
        if (to_string(type) == name) {
            return type;
        }
    }
    return std::nullopt;
}

std::optional<BridgeMessageType> message_type(const Json& message) {
    if (message.is_object() == false) {
        return std::nullopt;
    }
    auto it = message.find("type");
    if (it == message.end() || it->is_string() == false) {
        return std::nullopt;
    }
    return parse_message_type(it->get<std::string>());
}

std::uint64_t message_id(const Json& message) {
    if (message.is_object() == false) {
        return 0;
    }
    auto it = message.find("id");
    if (it == message.end() || it->is_number_unsigned() == false) {
        return 0;
    }
    return it->get<std::uint64_t>();
}

// ─────────────────────────────────────────────────────────────────────────────
// Message Builders
// ─────────────────────────────────────────────────────────────────────────────

Json make_hello(const std::string& session, const std::string& cookie) {
    return {{"type", "hello"}, {"session", session}, {"cookie", cookie}};
}

Json make_execute(std::uint64_t id, const std::string& text) {
    return {{"type", "execute"}, {"id", id}, {"text", text}};
}

Json make_load_file(std::uint64_t id, const std::string& path) {
    return {{"type", "load_file"}, {"id", id}, {"path", path}};
}

Json make_ping(std::uint64_t id) {
    return {{"type", "ping"}, {"id", id}};
}

Json make_stop(std::uint64_t id) {
    return {{"type", "stop"}, {"id", id}};
}

Json make_ok(std::uint64_t id, const std::string& output) {
    return {{"type", "ok"}, {"id", id}, {"output", output}};
}

Json make_error(std::uint64_t id, const std::string& reason, const std::string& output) {
    Json message{{"type", "error"}, {"id", id}, {"reason", reason}};
    if (output.empty() == false) {
        message["output"] = output;
    }
    return message;
}

Json make_pong(std::uint64_t id) {
    return {{"type", "pong"}, {"id", id}};
}

Result<std::string> execute_reply_to_result(const Json& reply) {
    const auto type = message_type(reply);
    if (type == BridgeMessageType::Ok) {
        return classify_response(reply.value("output", std::string{}));
    }
    if (type == BridgeMessageType::Error) {
        const auto output = reply.value("output", std::string{});
        if (output.empty() == false) {
            return tl::unexpected(classify_error(output));
        }
        return tl::unexpected(Error::protocol_error("Bridge error: " + reply.value("reason", std::string{"unknown"})));
    }
    return tl::unexpected(Error::protocol_error("Unexpected bridge reply: " + reply.dump()));
}

Result<void> load_reply_to_result(const Json& reply) {
    const auto type = message_type(reply);
    if (type == BridgeMessageType::Ok) {
        return {};
    }
    if (type == BridgeMessageType::Error) {
        const auto output = reply.value("output", std::string{});
        if (output.empty() == false) {
            return tl::unexpected(classify_error(output));
        }
        return tl::unexpected(Error::protocol_error("Bridge error: " + reply.value("reason", std::string{"unknown"})));
    }
    return tl::unexpected(Error::protocol_error("Unexpected bridge reply: " + reply.dump()));
}

// ─────────────────────────────────────────────────────────────────────────────
// Framing
// ─────────────────────────────────────────────────────────────────────────────

std::string encode_frame(const Json& message) {
    const std::string body = message.dump();
    return "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
}

FrameDecoder::FrameDecoder(std::size_t max_message_size)
    : max_message_size_(max_message_size)
{
    buffer_.reserve(4096);
}

void FrameDecoder::append(std::string_view bytes) {
    buffer_.append(bytes.data(), bytes.size());
}

Result<std::optional<Json>> FrameDecoder::next() {
    const auto header_end = buffer_.find("\r\n\r\n");
    if (header_end == std::string::npos) {
        if (buffer_.size() > kMaxHeaderSize) {
            return tl::unexpected(Error::protocol_error("Header too large"));
        }
        return std::optional<Json>{};
    }

    // Parse Content-Length (case-insensitive)
    std::string headers_lower = buffer_.substr(0, header_end);
    std::transform(headers_lower.begin(), headers_lower.end(), headers_lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const std::string prefix = "content-length:";
    auto pos = headers_lower.find(prefix);
    if (pos == std::string::npos) {
        return tl::unexpected(Error::protocol_error("Missing Content-Length header"));
    }

    auto value_start = pos + prefix.size();
    while (value_start < header_end &&
           (headers_lower[value_start] == ' ' || headers_lower[value_start] == '\t')) {
        ++value_start;
    }
    auto value_end = headers_lower.find("\r\n", value_start);
    if (value_end == std::string::npos) {
        value_end = header_end;
    }
    const std::string length_str = headers_lower.substr(value_start, value_end - value_start);

    std::size_t content_length = 0;
    try {
        content_length = std::stoull(length_str);
    } catch (const std::exception&) {
        return tl::unexpected(Error::protocol_error("Invalid Content-Length value: " + length_str));
    }

    if (content_length > max_message_size_) {
        return tl::unexpected(Error::protocol_error("Message too large"));
    }

    const auto body_start = header_end + 4;
    if (buffer_.size() - body_start < content_length) {
        return std::optional<Json>{};
    }

    std::string body = buffer_.substr(body_start, content_length);
    buffer_.erase(0, body_start + content_length);

    try {
        return std::optional<Json>{Json::parse(body)};
    } catch (const Json::parse_error& e) {
        return tl::unexpected(Error::protocol_error("Failed to parse JSON: " + std::string(e.what())));
    }
}

}  // namespace maudepp
