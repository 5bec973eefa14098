#include "maudepp/engine.hpp"
#include "maudepp/backend_factory.hpp"
#include "maudepp/log/logger.hpp"
#include "maudepp/server.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <system_error>

#include <unistd.h>

namespace maudepp {

namespace {

// Slack on top of the command timeout while waiting for a worker
constexpr std::chrono::milliseconds kCheckoutSlack{1'000};

std::atomic<std::uint64_t> g_module_counter{0};

std::filesystem::path unique_module_path() {
    std::error_code ec;
    auto dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        dir = "/tmp";
    }
    const auto name = "maudepp_" + std::to_string(::getpid()) + "_" +
                      std::to_string(++g_module_counter) + ".maude";
    return dir / name;
}

// Removes the file on scope exit
class TempFileGuard {
public:
    explicit TempFileGuard(std::filesystem::path path)
        : path_(std::move(path))
    {}

    ~TempFileGuard() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace

Engine::Engine(EngineConfig config)
    : config_(std::move(config))
    , pool_(config_.pool, [backend = config_.backend]() { return make_backend(backend); })
{}

Engine::Engine(EngineConfig config, BackendFactory factory)
    : config_(std::move(config))
    , pool_(config_.pool, std::move(factory))
{}

Engine::~Engine() {
    stop();
}

Result<void> Engine::start() {
    if (auto valid = config_.validate(); !valid) {
        return valid;
    }
    MAUDEPP_LOG_INFO("Starting engine with " + std::string(to_string(config_.backend.kind)) + " backend");
    return pool_.start();
}

void Engine::stop() {
    pool_.stop();
}

PoolStatus Engine::status() const {
    return pool_.status();
}

// ─────────────────────────────────────────────────────────────────────────────
// Commands
// ─────────────────────────────────────────────────────────────────────────────

Result<std::string> Engine::execute(const std::string& command, std::optional<std::chrono::milliseconds> timeout) {
    const auto effective = resolve_timeout(timeout);

    return pool_.transaction([&](WorkerHandle& worker) {
        return server::execute(worker.backend(), command, effective);
    }, effective + kCheckoutSlack);
}

Result<std::string> Engine::reduce(const std::string& module, const std::string& term,
                                   std::optional<std::chrono::milliseconds> timeout) {
    return execute("reduce in " + module + " : " + term, timeout);
}

Result<std::string> Engine::rewrite(const std::string& module, const std::string& term,
                                    std::optional<std::size_t> max_rewrites,
                                    std::optional<std::chrono::milliseconds> timeout) {
    if (max_rewrites) {
        return execute("rewrite [" + std::to_string(*max_rewrites) + "] in " + module + " : " + term, timeout);
    }
    return execute("rewrite in " + module + " : " + term, timeout);
}

Result<std::string> Engine::parse(const std::string& module, const std::string& term,
                                  std::optional<std::chrono::milliseconds> timeout) {
    return execute("parse in " + module + " : " + term, timeout);
}

Result<std::string> Engine::search(const std::string& module, const std::string& term,
                                   const std::string& pattern, const SearchOptions& options) {
    std::string command = "search [" + std::to_string(options.max_solutions) + ", " +
                          std::to_string(options.max_depth) + "] in " + module + " : " + term +
                          " " + options.arrow + " " + pattern;
    if (options.condition) {
        command += " such that " + *options.condition;
    }
    return execute(command + " .", options.timeout);
}

Result<std::string> Engine::show_module(const std::string& module, std::optional<std::chrono::milliseconds> timeout) {
    return execute("show module " + module + " .", timeout);
}

Result<std::string> Engine::list_modules(std::optional<std::chrono::milliseconds> timeout) {
    return execute("show modules .", timeout);
}

Result<std::string> Engine::version() {
    if (auto answered = list_modules(); !answered) {
        return tl::unexpected(answered.error());
    }
    return std::string{"Maude (version available at runtime)"};
}

// ─────────────────────────────────────────────────────────────────────────────
// Loading
// ─────────────────────────────────────────────────────────────────────────────

Result<void> Engine::load_file(const std::string& path) {
    std::error_code ec;
    if (std::filesystem::exists(path, ec) == false) {
        return tl::unexpected(Error::file_not_found(path));
    }

    auto results = pool_.broadcast([path](WorkerHandle& worker) {
        return server::load_file(worker.backend(), path);
    });

    std::size_t failures = 0;
    for (const auto& result : results) {
        if (!result) {
            MAUDEPP_LOG_WARN("Load of " + path + " failed on a worker: " + result.error().describe());
            ++failures;
        }
    }

    if (failures > 0) {
        return tl::unexpected(Error::partial_load(failures));
    }
    MAUDEPP_LOG_DEBUG("Loaded " + path + " into " + std::to_string(results.size()) + " worker(s)");
    return {};
}

Result<void> Engine::load_module(const std::string& source) {
    TempFileGuard file(unique_module_path());
    {
        std::ofstream out(file.path(), std::ios::binary | std::ios::trunc);
        out << source;
        if (!out) {
            return tl::unexpected(Error{ErrorKind::LoadError,
                                        "Could not write module file " + file.path().string()});
        }
    }
    return load_file(file.path().string());
}

std::chrono::milliseconds Engine::resolve_timeout(std::optional<std::chrono::milliseconds> timeout) const {
    if (timeout) {
        return *timeout;
    }
    return config_.backend.default_timeout;
}

}  // namespace maudepp
