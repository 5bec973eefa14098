#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Worker Pool
// ═══════════════════════════════════════════════════════════════════════════
// A fixed set of backend workers plus a bounded number of overflow workers
// created on demand. Callers check a worker out, use it exclusively, and
// check it back in.
//
//   WorkerPool pool(PoolConfig{}.with_size(2), [&] { return make_backend(cfg); });
//   pool.start();
//
//   auto out = pool.transaction([](WorkerHandle& w) {
//       return w->execute("reduce 1 + 2");
//   }, 5s);
//
//   auto loads = pool.broadcast([](WorkerHandle& w) {
//       return w->load_file("prelude.maude");
//   });
//
// Pool bookkeeping is guarded by one mutex and a condition variable; calls
// into backends (start, stop, execute) never run under that lock.
//
// A worker whose session exited on its own is dropped when it is next seen
// idle or checked in. Missing permanent workers are replaced lazily by the
// next checkout that finds no idle worker.

#include "maudepp/backend.hpp"
#include "maudepp/config.hpp"
#include "maudepp/error.hpp"

#include <asio/post.hpp>
#include <asio/thread_pool.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace maudepp {

/// Creates one backend (not started)
using BackendFactory = std::function<Result<std::unique_ptr<IBackend>>()>;

// ─────────────────────────────────────────────────────────────────────────────
// Worker Handle
// ─────────────────────────────────────────────────────────────────────────────
// Non-owning reference to a checked-out worker. Valid until checked in.

class WorkerHandle {
public:
    WorkerHandle() = default;
    WorkerHandle(std::uint64_t id, IBackend* backend) noexcept
        : id_(id)
        , backend_(backend)
    {}

    [[nodiscard]] std::uint64_t id() const noexcept { return id_; }
    [[nodiscard]] bool valid() const noexcept { return backend_ != nullptr; }

    [[nodiscard]] IBackend& backend() const noexcept { return *backend_; }
    IBackend* operator->() const noexcept { return backend_; }

private:
    std::uint64_t id_{0};
    IBackend* backend_{nullptr};
};

// ─────────────────────────────────────────────────────────────────────────────
// Pool Status
// ─────────────────────────────────────────────────────────────────────────────

enum class PoolState {
    Ready,     ///< At least one idle worker
    Overflow,  ///< No idle worker, overflow capacity left
    Full,      ///< No idle worker, overflow exhausted
    Stopped
};

[[nodiscard]] constexpr std::string_view to_string(PoolState state) noexcept {
    switch (state) {
        case PoolState::Ready:    return "ready";
        case PoolState::Overflow: return "overflow";
        case PoolState::Full:     return "full";
        case PoolState::Stopped:  return "stopped";
    }
    return "unknown";
}

struct PoolStatus {
    std::size_t size{0};       ///< Configured permanent workers
    std::size_t live{0};       ///< Live permanent workers
    std::size_t overflow{0};   ///< Live overflow workers
    std::size_t available{0};  ///< Idle live workers
    std::size_t in_use{0};     ///< Checked-out workers
    PoolState state{PoolState::Stopped};
};

// ─────────────────────────────────────────────────────────────────────────────
// Worker Pool
// ─────────────────────────────────────────────────────────────────────────────

class WorkerPool {
public:
    WorkerPool(PoolConfig config, BackendFactory factory);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    WorkerPool(WorkerPool&&) = delete;
    WorkerPool& operator=(WorkerPool&&) = delete;

    /// Create and start `size` workers. If any fails, the others are stopped.
    [[nodiscard]] Result<void> start();

    /// Stop every worker. In-flight calls fail; later checkouts are refused.
    void stop();

    /// Wait up to timeout for an idle live worker, growing into overflow when allowed.
    /// With block = false, fails immediately with pool_exhausted instead of waiting.
    [[nodiscard]] Result<WorkerHandle> checkout(std::chrono::milliseconds timeout, bool block = true);

    /// Return a worker. Unknown handles are ignored.
    void checkin(const WorkerHandle& handle);

    [[nodiscard]] PoolStatus status() const;

    [[nodiscard]] const PoolConfig& config() const noexcept { return config_; }

    // ─────────────────────────────────────────────────────────────────────────
    // Scoped Use
    // ─────────────────────────────────────────────────────────────────────────

    /// checkout -> fn(handle) -> checkin. fn returns a Result; a checkout
    /// failure is returned in its place. Exceptions from fn propagate after checkin.
    template <typename Fn>
    auto transaction(Fn&& fn, std::chrono::milliseconds timeout)
        -> std::invoke_result_t<Fn&, WorkerHandle&>
    {
        auto handle = checkout(timeout);
        if (!handle) {
            return tl::unexpected(handle.error());
        }
        CheckinGuard guard(*this, *handle);
        return fn(*handle);
    }

    /// Run fn on every idle live worker concurrently. One entry per dispatched
    /// worker; calls still running after broadcast_timeout yield pool_timeout.
    /// Each worker is checked in as soon as its own call finishes.
    template <typename Fn>
    auto broadcast(Fn&& fn)
        -> std::vector<std::invoke_result_t<std::decay_t<Fn>&, WorkerHandle&>>
    {
        using R = std::invoke_result_t<std::decay_t<Fn>&, WorkerHandle&>;

        auto handles = checkout_idle();
        std::vector<R> results;
        if (handles.empty()) {
            return results;
        }

        auto shared_fn = std::make_shared<std::decay_t<Fn>>(std::forward<Fn>(fn));
        std::vector<std::future<R>> futures;
        futures.reserve(handles.size());

        for (auto& handle : handles) {
            auto task = std::make_shared<std::packaged_task<R()>>(
                [this, handle, shared_fn]() mutable {
                    CheckinGuard guard(*this, handle);
                    return (*shared_fn)(handle);
                }
            );
            futures.push_back(task->get_future());
            asio::post(broadcast_threads_, [task]() { (*task)(); });
        }

        const auto deadline = std::chrono::steady_clock::now() + config_.broadcast_timeout;
        results.reserve(futures.size());
        for (auto& future : futures) {
            if (future.wait_until(deadline) == std::future_status::ready) {
                results.push_back(future.get());
            } else {
                results.push_back(tl::unexpected(Error::pool_timeout()));
            }
        }
        return results;
    }

private:
    struct Worker {
        std::uint64_t id{0};
        std::shared_ptr<IBackend> backend;  // shared with stop() while it runs
        bool overflow{false};
        bool busy{false};
        bool exited{false};
    };

    class CheckinGuard {
    public:
        CheckinGuard(WorkerPool& pool, WorkerHandle handle)
            : pool_(pool)
            , handle_(handle)
        {}
        ~CheckinGuard() { pool_.checkin(handle_); }

        CheckinGuard(const CheckinGuard&) = delete;
        CheckinGuard& operator=(const CheckinGuard&) = delete;

    private:
        WorkerPool& pool_;
        WorkerHandle handle_;
    };

    // Create and start one worker outside the lock
    [[nodiscard]] Result<std::unique_ptr<Worker>> create_worker(bool overflow);

    // Check out every idle live worker without waiting
    [[nodiscard]] std::vector<WorkerHandle> checkout_idle();

    void on_worker_exit(std::uint64_t id, int exit_status);

    // Lock held. Moves idle dead workers into graveyard.
    void reap_dead_locked(std::vector<std::unique_ptr<Worker>>& graveyard);

    [[nodiscard]] bool is_dead_locked(const Worker& worker) const;
    [[nodiscard]] std::size_t permanent_count_locked() const;
    [[nodiscard]] std::size_t capacity() const noexcept { return config_.size + config_.max_overflow; }

    PoolConfig config_;
    BackendFactory factory_;

    mutable std::mutex mutex_;
    std::condition_variable available_cv_;
    std::vector<std::unique_ptr<Worker>> workers_;
    std::size_t pending_creations_{0};
    std::uint64_t next_worker_id_{1};
    bool started_{false};
    bool stopped_{false};

    asio::thread_pool broadcast_threads_;
};

}  // namespace maudepp
