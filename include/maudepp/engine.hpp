#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Engine
// ═══════════════════════════════════════════════════════════════════════════
// Pool-backed entry point for running commands against the engine.
//
//   auto config = EngineConfig::load("maudepp.json");
//   Engine engine(*config);
//   if (auto started = engine.start(); !started) { ... }
//
//   engine.load_module("fmod COUNTER is protecting NAT . endfm");
//   auto value = engine.reduce("COUNTER", "s 0 + s 0");   // "2"
//
// Every command borrows one worker for its duration. Loads go to every idle
// worker so the sessions stay interchangeable.

#include "maudepp/config.hpp"
#include "maudepp/error.hpp"
#include "maudepp/pool/worker_pool.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>

namespace maudepp {

struct SearchOptions {
    std::size_t max_depth{100};
    std::size_t max_solutions{1};
    std::string arrow{"=>*"};             ///< =>1, =>+, =>* or =>!
    std::optional<std::string> condition;  ///< Appended as "such that ..."
    std::chrono::milliseconds timeout{30000};

    SearchOptions& with_max_depth(std::size_t depth) { max_depth = depth; return *this; }
    SearchOptions& with_max_solutions(std::size_t solutions) { max_solutions = solutions; return *this; }
    SearchOptions& with_arrow(std::string value) { arrow = std::move(value); return *this; }
    SearchOptions& with_condition(std::string value) { condition = std::move(value); return *this; }
    SearchOptions& with_timeout(std::chrono::milliseconds value) { timeout = value; return *this; }
};

class Engine {
public:
    explicit Engine(EngineConfig config);

    /// Use a custom backend factory instead of make_backend(config.backend)
    Engine(EngineConfig config, BackendFactory factory);

    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;
    Engine(Engine&&) = delete;
    Engine& operator=(Engine&&) = delete;

    [[nodiscard]] Result<void> start();
    void stop();
    [[nodiscard]] PoolStatus status() const;

    // ─────────────────────────────────────────────────────────────────────────
    // Commands
    // ─────────────────────────────────────────────────────────────────────────

    /// Run one raw command. Waits up to timeout + 1s for a worker.
    [[nodiscard]] Result<std::string> execute(
        const std::string& command,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt
    );

    /// reduce in MODULE : TERM
    [[nodiscard]] Result<std::string> reduce(
        const std::string& module,
        const std::string& term,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt
    );

    /// rewrite [N] in MODULE : TERM
    [[nodiscard]] Result<std::string> rewrite(
        const std::string& module,
        const std::string& term,
        std::optional<std::size_t> max_rewrites = std::nullopt,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt
    );

    /// parse in MODULE : TERM
    [[nodiscard]] Result<std::string> parse(
        const std::string& module,
        const std::string& term,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt
    );

    /// search [SOLUTIONS, DEPTH] in MODULE : TERM ARROW PATTERN [such that CONDITION] .
    /// Returns the engine's raw solution listing.
    [[nodiscard]] Result<std::string> search(
        const std::string& module,
        const std::string& term,
        const std::string& pattern,
        const SearchOptions& options = {}
    );

    /// show module MODULE .
    [[nodiscard]] Result<std::string> show_module(
        const std::string& module,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt
    );

    /// show modules .
    [[nodiscard]] Result<std::string> list_modules(
        std::optional<std::chrono::milliseconds> timeout = std::nullopt
    );

    /// The startup banner is suppressed, so this only confirms that a worker answers.
    [[nodiscard]] Result<std::string> version();

    // ─────────────────────────────────────────────────────────────────────────
    // Loading
    // ─────────────────────────────────────────────────────────────────────────

    /// Load a file into every idle worker. Any worker failure yields load_error.
    [[nodiscard]] Result<void> load_file(const std::string& path);

    /// Write source to a temporary file and load it. The file is always removed.
    [[nodiscard]] Result<void> load_module(const std::string& source);

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }
    [[nodiscard]] WorkerPool& pool() noexcept { return pool_; }

private:
    [[nodiscard]] std::chrono::milliseconds resolve_timeout(std::optional<std::chrono::milliseconds> timeout) const;

    EngineConfig config_;
    WorkerPool pool_;
};

}  // namespace maudepp
