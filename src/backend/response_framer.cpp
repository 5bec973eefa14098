#include "maudepp/backend/response_framer.hpp"

namespace maudepp {

ResponseFramer::ResponseFramer(std::string prompt_marker)
    : marker_(std::move(prompt_marker))
{
    buffer_.reserve(4096);
}

void ResponseFramer::expect_response() noexcept {
    ++owed_;
}

void ResponseFramer::append(std::string_view chunk) {
    buffer_.append(chunk.data(), chunk.size());
}

bool ResponseFramer::complete() const noexcept {
    return buffer_.find(marker_) != std::string::npos;
}

std::optional<std::string> ResponseFramer::take_response() {
    while (true) {
        const auto pos = buffer_.find(marker_);
        if (pos == std::string::npos) {
            return std::nullopt;
        }

        if (owed_ > 1) {
            // Stale frame; the bytes after it may already belong to the next one
            --owed_;
            buffer_.erase(0, pos + marker_.size());
            continue;
        }

        if (owed_ == 0) {
            // Unsolicited prompt
            buffer_.clear();
            return std::nullopt;
        }

        owed_ = 0;
        std::string response = buffer_.substr(0, pos);
        buffer_.clear();
        return response;
    }
}

void ResponseFramer::discard_buffer() noexcept {
    buffer_.clear();
}

}  // namespace maudepp
