#pragma once

#include "maudepp/backend.hpp"
#include "maudepp/error.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace maudepp {

using Json = nlohmann::json;

// ─────────────────────────────────────────────────────────────────────────────
// Stream Backend Options
// ─────────────────────────────────────────────────────────────────────────────

struct StreamOptions {
    // Run the engine under a pseudo-terminal helper (unbuffer / script).
    // When false, or when no helper is installed, the engine runs directly
    // in interactive mode on plain pipes.
    bool use_pty{true};

    // Literal text the engine prints when it is ready for the next command.
    std::string prompt_marker{"Maude>"};

    // How long to wait for the first prompt after spawning.
    std::chrono::milliseconds banner_timeout{10'000};

    // Appended after the standard flags (-no-banner -no-wrap -no-advise).
    std::vector<std::string> extra_args;
};

// ─────────────────────────────────────────────────────────────────────────────
// Bridge Backend Options
// ─────────────────────────────────────────────────────────────────────────────

struct BridgeOptions {
    // maude-bridge executable: a path, or a name looked up on PATH.
    std::string bridge_path{"maude-bridge"};

    // Connection attempts before start() gives up with connect_exhausted.
    std::size_t connect_retries{10};

    // Fixed delay between connection attempts.
    std::chrono::milliseconds connect_delay{500};

    // Interval between liveness pings while idle.
    std::chrono::milliseconds health_check_interval{5'000};

    // A ping without a pong within this window marks the worker not alive.
    std::chrono::milliseconds ping_timeout{2'000};

    // Upper bound on a single framed message.
    std::size_t max_message_size{16 * 1024 * 1024};

    // How long the bridge waits for one engine reply before answering read_failed.
    std::chrono::milliseconds engine_read_timeout{30'000};
};

// ─────────────────────────────────────────────────────────────────────────────
// Backend Configuration
// ─────────────────────────────────────────────────────────────────────────────
// Everything one backend instance needs to bring up one engine session.

struct BackendConfig {
    BackendKind kind{BackendKind::Stream};

    // Engine executable. Empty = resolve through the executable locator.
    std::string engine_path;

    // Directory holding bundled engine binaries (maude-<platform>, maude).
    std::string bundle_dir;

    // Files loaded into every session right after startup.
    std::vector<std::string> preload_files;

    // Timeout for commands that do not carry their own.
    std::chrono::milliseconds default_timeout{5'000};

    StreamOptions stream;
    BridgeOptions bridge;

    // ─────────────────────────────────────────────────────────────────────────
    // Builder-Style Helpers
    // ─────────────────────────────────────────────────────────────────────────

    BackendConfig& with_kind(BackendKind k);
    BackendConfig& with_engine_path(std::string path);
    BackendConfig& with_preload_file(std::string path);
    BackendConfig& with_default_timeout(std::chrono::milliseconds timeout);
    BackendConfig& with_pty(bool enabled);
    BackendConfig& with_prompt_marker(std::string marker);
    BackendConfig& with_bridge_path(std::string path);
    BackendConfig& with_connect_retries(std::size_t retries, std::chrono::milliseconds delay);
    BackendConfig& with_health_check(std::chrono::milliseconds interval, std::chrono::milliseconds ping_timeout);

    /// Reject values no backend can run with
    [[nodiscard]] Result<void> validate() const;
};

// ─────────────────────────────────────────────────────────────────────────────
// Pool Configuration
// ─────────────────────────────────────────────────────────────────────────────

struct PoolConfig {
    // Workers created at start and kept for the pool's lifetime.
    std::size_t size{4};

    // Extra workers created on demand and dismissed when checked back in.
    std::size_t max_overflow{2};

    // Upper bound on a whole broadcast.
    std::chrono::milliseconds broadcast_timeout{30'000};

    PoolConfig& with_size(std::size_t n);
    PoolConfig& with_max_overflow(std::size_t n);
    PoolConfig& with_broadcast_timeout(std::chrono::milliseconds timeout);

    [[nodiscard]] Result<void> validate() const;
};

// ─────────────────────────────────────────────────────────────────────────────
// Logging Configuration
// ─────────────────────────────────────────────────────────────────────────────

struct LoggingConfig {
    std::string level{"info"};

    // Empty = no file sink.
    std::string file;

    // Write to stdout as well as the file.
    bool console{true};
};

/// Install a global spdlog-backed logger built from the config.
/// Level "off" with no file restores the NullLogger.
void configure_logging(const LoggingConfig& config);

// ─────────────────────────────────────────────────────────────────────────────
// Engine Configuration - root of the configuration tree
// ─────────────────────────────────────────────────────────────────────────────
// JSON layout (every key optional):
//
//   {
//     "backend": "stream",
//     "maude_path": "/usr/local/bin/maude",
//     "bundle_dir": "priv/maude/bin",
//     "preload": ["prelude.maude"],
//     "timeout_ms": 5000,
//     "pool": {"size": 4, "max_overflow": 2, "broadcast_timeout_ms": 30000},
//     "stream": {"use_pty": true, "prompt": "Maude>", "banner_timeout_ms": 10000, "args": []},
//     "bridge": {"path": "maude-bridge", "connect_retries": 10, "connect_delay_ms": 500,
//                "health_check_interval_ms": 5000, "ping_timeout_ms": 2000},
//     "logging": {"level": "info", "file": "", "console": true}
//   }

struct EngineConfig {
    BackendConfig backend;
    PoolConfig pool;
    LoggingConfig logging;

    [[nodiscard]] static Result<EngineConfig> from_json(const Json& json);

    /// Read and parse a JSON configuration file
    [[nodiscard]] static Result<EngineConfig> load(const std::string& path);

    [[nodiscard]] Json to_json() const;

    [[nodiscard]] Result<void> validate() const;
};

}  // namespace maudepp
