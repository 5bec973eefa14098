#include "maudepp/config.hpp"
#include "maudepp/log/logger.hpp"
#include "maudepp/log/spdlog_logger.hpp"

#include <fstream>
#include <sstream>

namespace maudepp {

namespace {

std::chrono::milliseconds read_ms(const Json& object, const char* key, std::chrono::milliseconds fallback) {
    if (object.contains(key) == false) {
        return fallback;
    }
    const auto& value = object.at(key);
    if (value.is_number_integer() == false || value.get<long long>() < 0) {
        throw std::invalid_argument(std::string(key) + " must be a non-negative integer");
    }
    return std::chrono::milliseconds{value.get<long long>()};
}

std::size_t read_count(const Json& object, const char* key, std::size_t fallback) {
    if (object.contains(key) == false) {
        return fallback;
    }
    const auto& value = object.at(key);
    if (value.is_number_integer() == false || value.get<long long>() < 0) {
        throw std::invalid_argument(std::string(key) + " must be a non-negative integer");
    }
    return value.get<std::size_t>();
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// BackendConfig
// ─────────────────────────────────────────────────────────────────────────────

BackendConfig& BackendConfig::with_kind(BackendKind k) {
    kind = k;
    return *this;
}

BackendConfig& BackendConfig::with_engine_path(std::string path) {
    engine_path = std::move(path);
    return *this;
}

BackendConfig& BackendConfig::with_preload_file(std::string path) {
    preload_files.push_back(std::move(path));
    return *this;
}

BackendConfig& BackendConfig::with_default_timeout(std::chrono::milliseconds timeout) {
    default_timeout = timeout;
    return *this;
}

BackendConfig& BackendConfig::with_pty(bool enabled) {
    stream.use_pty = enabled;
    return *this;
}

BackendConfig& BackendConfig::with_prompt_marker(std::string marker) {
    stream.prompt_marker = std::move(marker);
    return *this;
}

BackendConfig& BackendConfig::with_bridge_path(std::string path) {
    bridge.bridge_path = std::move(path);
    return *this;
}

BackendConfig& BackendConfig::with_connect_retries(std::size_t retries, std::chrono::milliseconds delay) {
    bridge.connect_retries = retries;
    bridge.connect_delay = delay;
    return *this;
}

BackendConfig& BackendConfig::with_health_check(
    std::chrono::milliseconds interval,
    std::chrono::milliseconds ping_timeout
) {
    bridge.health_check_interval = interval;
    bridge.ping_timeout = ping_timeout;
    return *this;
}

Result<void> BackendConfig::validate() const {
    if (default_timeout.count() <= 0) {
        return tl::unexpected(Error::invalid_config("default_timeout must be positive"));
    }
    if (kind == BackendKind::Stream) {
        if (stream.prompt_marker.empty()) {
            return tl::unexpected(Error::invalid_config("prompt marker must not be empty"));
        }
        if (stream.banner_timeout.count() <= 0) {
            return tl::unexpected(Error::invalid_config("banner_timeout must be positive"));
        }
    }
    if (kind == BackendKind::Bridge) {
        if (bridge.bridge_path.empty()) {
            return tl::unexpected(Error::invalid_config("bridge backend requires bridge_path"));
        }
        if (bridge.connect_retries == 0) {
            return tl::unexpected(Error::invalid_config("connect_retries must be at least 1"));
        }
        if (bridge.health_check_interval.count() <= 0 || bridge.ping_timeout.count() <= 0) {
            return tl::unexpected(Error::invalid_config("health check intervals must be positive"));
        }
        if (bridge.engine_read_timeout.count() <= 0) {
            return tl::unexpected(Error::invalid_config("engine_read_timeout must be positive"));
        }
    }
    return {};
}

// ─────────────────────────────────────────────────────────────────────────────
// PoolConfig
// ─────────────────────────────────────────────────────────────────────────────

PoolConfig& PoolConfig::with_size(std::size_t n) {
    size = n;
    return *this;
}

PoolConfig& PoolConfig::with_max_overflow(std::size_t n) {
    max_overflow = n;
    return *this;
}

PoolConfig& PoolConfig::with_broadcast_timeout(std::chrono::milliseconds timeout) {
    broadcast_timeout = timeout;
    return *this;
}

Result<void> PoolConfig::validate() const {
    if (size == 0) {
        return tl::unexpected(Error::invalid_config("pool size must be at least 1"));
    }
    if (broadcast_timeout.count() <= 0) {
        return tl::unexpected(Error::invalid_config("broadcast_timeout must be positive"));
    }
    return {};
}

// ─────────────────────────────────────────────────────────────────────────────
// Logging
// ─────────────────────────────────────────────────────────────────────────────

void configure_logging(const LoggingConfig& config) {
    const LogLevel level = parse_log_level(config.level);

    if (level == LogLevel::Off && config.file.empty()) {
        set_logger(nullptr);
        return;
    }

    if (config.file.empty()) {
        set_logger(make_spdlog_console_logger(level));
    } else if (config.console) {
        set_logger(make_spdlog_console_file_logger(config.file, level));
    } else {
        set_logger(make_spdlog_file_logger(config.file, level));
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// EngineConfig
// ─────────────────────────────────────────────────────────────────────────────

Result<EngineConfig> EngineConfig::from_json(const Json& json) {
    if (json.is_object() == false) {
        return tl::unexpected(Error::invalid_config("configuration must be a JSON object"));
    }

    EngineConfig config;
    try {
        auto& backend = config.backend;

        if (json.contains("backend")) {
            const auto name = json.at("backend").get<std::string>();
            const auto kind = parse_backend_kind(name);
            if (kind.has_value() == false) {
                return tl::unexpected(Error::invalid_config("unknown backend: " + name));
            }
            backend.kind = *kind;
        }
        backend.engine_path = json.value("maude_path", backend.engine_path);
        backend.bundle_dir = json.value("bundle_dir", backend.bundle_dir);
        if (json.contains("preload")) {
            backend.preload_files = json.at("preload").get<std::vector<std::string>>();
        }
        backend.default_timeout = read_ms(json, "timeout_ms", backend.default_timeout);

        if (json.contains("stream")) {
            const auto& stream = json.at("stream");
            backend.stream.use_pty = stream.value("use_pty", backend.stream.use_pty);
            backend.stream.prompt_marker = stream.value("prompt", backend.stream.prompt_marker);
            backend.stream.banner_timeout = read_ms(stream, "banner_timeout_ms", backend.stream.banner_timeout);
            if (stream.contains("args")) {
                backend.stream.extra_args = stream.at("args").get<std::vector<std::string>>();
            }
        }

        if (json.contains("bridge")) {
            const auto& bridge = json.at("bridge");
            backend.bridge.bridge_path = bridge.value("path", backend.bridge.bridge_path);
            backend.bridge.connect_retries = read_count(bridge, "connect_retries", backend.bridge.connect_retries);
            backend.bridge.connect_delay = read_ms(bridge, "connect_delay_ms", backend.bridge.connect_delay);
            backend.bridge.health_check_interval =
                read_ms(bridge, "health_check_interval_ms", backend.bridge.health_check_interval);
            backend.bridge.ping_timeout = read_ms(bridge, "ping_timeout_ms", backend.bridge.ping_timeout);
            backend.bridge.engine_read_timeout =
                read_ms(bridge, "engine_read_timeout_ms", backend.bridge.engine_read_timeout);
        }

        if (json.contains("pool")) {
            const auto& pool = json.at("pool");
            config.pool.size = read_count(pool, "size", config.pool.size);
            config.pool.max_overflow = read_count(pool, "max_overflow", config.pool.max_overflow);
            config.pool.broadcast_timeout = read_ms(pool, "broadcast_timeout_ms", config.pool.broadcast_timeout);
        }

        if (json.contains("logging")) {
            const auto& logging = json.at("logging");
            config.logging.level = logging.value("level", config.logging.level);
            config.logging.file = logging.value("file", config.logging.file);
            config.logging.console = logging.value("console", config.logging.console);
        }
    } catch (const Json::exception& e) {
        return tl::unexpected(Error::invalid_config("invalid configuration: " + std::string(e.what())));
    } catch (const std::invalid_argument& e) {
        return tl::unexpected(Error::invalid_config(e.what()));
    }

    return config;
}

Result<EngineConfig> EngineConfig::load(const std::string& path) {
    std::ifstream in(path);
    if (in.is_open() == false) {
        return tl::unexpected(Error::file_not_found(path));
    }

    std::stringstream contents;
    contents << in.rdbuf();

    Json json;
    try {
        json = Json::parse(contents.str());
    } catch (const Json::parse_error& e) {
        return tl::unexpected(Error::invalid_config(path + ": " + e.what()));
    }
    return from_json(json);
}

Json EngineConfig::to_json() const {
    return Json{
        {"backend", std::string(to_string(backend.kind))},
        {"maude_path", backend.engine_path},
        {"bundle_dir", backend.bundle_dir},
        {"preload", backend.preload_files},
        {"timeout_ms", backend.default_timeout.count()},
        {"pool", {
            {"size", pool.size},
            {"max_overflow", pool.max_overflow},
            {"broadcast_timeout_ms", pool.broadcast_timeout.count()}
        }},
        {"stream", {
            {"use_pty", backend.stream.use_pty},
            {"prompt", backend.stream.prompt_marker},
            {"banner_timeout_ms", backend.stream.banner_timeout.count()},
            {"args", backend.stream.extra_args}
        }},
        {"bridge", {
            {"path", backend.bridge.bridge_path},
            {"connect_retries", backend.bridge.connect_retries},
            {"connect_delay_ms", backend.bridge.connect_delay.count()},
            {"health_check_interval_ms", backend.bridge.health_check_interval.count()},
            {"ping_timeout_ms", backend.bridge.ping_timeout.count()},
            {"engine_read_timeout_ms", backend.bridge.engine_read_timeout.count()}
        }},
        {"logging", {
            {"level", logging.level},
            {"file", logging.file},
            {"console", logging.console}
        }}
    };
}

Result<void> EngineConfig::validate() const {
    if (auto result = pool.validate(); !result) {
        return result;
    }
    return backend.validate();
}

}  // namespace maudepp
