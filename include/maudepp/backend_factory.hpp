#pragma once

#include "maudepp/backend.hpp"
#include "maudepp/config.hpp"
#include "maudepp/error.hpp"

#include <memory>
#include <vector>

namespace maudepp {

// ─────────────────────────────────────────────────────────────────────────────
// Backend Factory
// ─────────────────────────────────────────────────────────────────────────────

/// Build the backend selected by config.kind. The backend is not started.
/// Fails with invalid_config for a config that does not validate and with
/// not_implemented for BackendKind::Native.
[[nodiscard]] Result<std::unique_ptr<IBackend>> make_backend(const BackendConfig& config);

/// Whether a backend kind can run on this machine.
/// Stream: always. Bridge: the bridge executable resolves to an executable file.
/// Native: never.
[[nodiscard]] bool available(BackendKind kind, const BackendConfig& config = BackendConfig{});

/// Every kind for which available() is true
[[nodiscard]] std::vector<BackendKind> available_backends(const BackendConfig& config = BackendConfig{});

}  // namespace maudepp
