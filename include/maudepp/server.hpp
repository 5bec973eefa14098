#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Server Facade
// ═══════════════════════════════════════════════════════════════════════════
// One stable surface over every backend kind. The backend implementation is
// chosen by BackendConfig::kind; callers never name a concrete backend.
//
//   auto backend = maudepp::server::start(config);
//   if (backend) {
//       auto out = maudepp::server::execute(**backend, "reduce 1 + 2 .");
//       maudepp::server::stop(**backend);
//   }

#include "maudepp/backend.hpp"
#include "maudepp/config.hpp"
#include "maudepp/error.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace maudepp::server {

/// Timeout applied when neither the call nor the config names one
[[nodiscard]] constexpr std::chrono::milliseconds default_timeout() noexcept {
    return std::chrono::milliseconds{5'000};
}

/// Build the configured backend and start it
[[nodiscard]] Result<std::unique_ptr<IBackend>> start(const BackendConfig& config);

[[nodiscard]] Result<std::string> execute(
    IBackend& backend,
    std::string text,
    std::optional<std::chrono::milliseconds> timeout = std::nullopt
);

[[nodiscard]] Result<void> load_file(IBackend& backend, const std::string& path);

[[nodiscard]] bool is_alive(const IBackend& backend) noexcept;

void stop(IBackend& backend);

}  // namespace maudepp::server
