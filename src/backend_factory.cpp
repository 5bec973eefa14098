#include "maudepp/backend_factory.hpp"
#include "maudepp/backend/bridge_backend.hpp"
#include "maudepp/backend/stream_backend.hpp"
#include "maudepp/log/logger.hpp"
#include "maudepp/process/executable_locator.hpp"

namespace maudepp {

Result<std::unique_ptr<IBackend>> make_backend(const BackendConfig& config) {
    if (auto valid = config.validate(); !valid) {
        return tl::unexpected(valid.error());
    }

    switch (config.kind) {
        case BackendKind::Stream:
            return std::make_unique<StreamBackend>(config);

        case BackendKind::Bridge:
            return std::make_unique<BridgeBackend>(config);

        case BackendKind::Native:
            break;
    }
    return tl::unexpected(Error::not_implemented(
        "Backend '" + std::string(to_string(config.kind)) + "' is not implemented"));
}

bool available(BackendKind kind, const BackendConfig& config) {
    switch (kind) {
        case BackendKind::Stream:
            return true;

        case BackendKind::Bridge: {
            const auto& name = config.bridge.bridge_path;
            const bool found = find_in_path(name).has_value();
            if (found == false) {
                MAUDEPP_LOG_DEBUG("Bridge executable not available: " + name);
            }
            return found;
        }

        case BackendKind::Native:
            return false;
    }
    return false;
}

std::vector<BackendKind> available_backends(const BackendConfig& config) {
    std::vector<BackendKind> kinds;
    for (auto kind : {BackendKind::Stream, BackendKind::Bridge, BackendKind::Native}) {
        if (available(kind, config)) {
            kinds.push_back(kind);
        }
    }
    return kinds;
}

}  // namespace maudepp
