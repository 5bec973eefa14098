#include "maudepp/server.hpp"
#include "maudepp/backend_factory.hpp"
#include "maudepp/log/logger.hpp"

namespace maudepp::server {

Result<std::unique_ptr<IBackend>> start(const BackendConfig& config) {
    auto backend = make_backend(config);
    if (!backend) {
        return backend;
    }

    if (auto started = (*backend)->start(); !started) {
        MAUDEPP_LOG_ERROR("Failed to start " + std::string(to_string(config.kind)) +
                          " backend: " + started.error().describe());
        return tl::unexpected(started.error());
    }
    return backend;
}

Result<std::string> execute(IBackend& backend, std::string text, std::optional<std::chrono::milliseconds> timeout) {
    return backend.execute(Command{std::move(text), timeout});
}

Result<void> load_file(IBackend& backend, const std::string& path) {
    return backend.load_file(path);
}

bool is_alive(const IBackend& backend) noexcept {
    return backend.is_alive();
}

void stop(IBackend& backend) {
    backend.stop();
}

}  // namespace maudepp::server
