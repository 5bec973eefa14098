#ifndef MAUDEPP_BACKEND_RESPONSE_FRAMER_HPP
#define MAUDEPP_BACKEND_RESPONSE_FRAMER_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace maudepp {

// ─────────────────────────────────────────────────────────────────────────────
// ResponseFramer - splits engine output into responses at the prompt marker
// ─────────────────────────────────────────────────────────────────────────────
// The engine prints its prompt once at startup and once after every command.
// The framer counts prompts still owed: one for the startup banner, plus one
// per command sent. Only the frame that settles the last owed prompt belongs
// to the current caller; earlier frames answer abandoned (timed-out) commands
// and are dropped, so a late response is never handed to the next caller.
//
// Usage:
//   ResponseFramer framer("Maude>");
//   framer.append(banner_bytes);
//   framer.take_response();          // banner, discarded by caller
//   framer.expect_response();        // command written
//   framer.append(bytes);
//   if (auto text = framer.take_response()) { ... }

class ResponseFramer {
public:
    explicit ResponseFramer(std::string prompt_marker);

    /// A command was written; one more prompt is owed
    void expect_response() noexcept;

    void append(std::string_view chunk);

    /// Whether the buffer holds a complete frame
    [[nodiscard]] bool complete() const noexcept;

    /// Text preceding the prompt that settles the last owed response.
    /// Frames for abandoned commands are consumed silently. The buffer is
    /// reset once a response is returned.
    [[nodiscard]] std::optional<std::string> take_response();

    /// Drop buffered bytes without touching the owed count
    void discard_buffer() noexcept;

    [[nodiscard]] std::size_t outstanding() const noexcept { return owed_; }
    [[nodiscard]] const std::string& buffer() const noexcept { return buffer_; }
    [[nodiscard]] const std::string& prompt_marker() const noexcept { return marker_; }

private:
    std::string marker_;
    std::string buffer_;
    std::size_t owed_{1};  // startup prompt
};

}  // namespace maudepp

#endif  // MAUDEPP_BACKEND_RESPONSE_FRAMER_HPP
