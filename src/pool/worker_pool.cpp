#include "maudepp/pool/worker_pool.hpp"
#include "maudepp/log/logger.hpp"

#include <algorithm>
#include <iterator>

namespace maudepp {

namespace {

Error pool_stopped() {
    return {ErrorKind::PoolExhausted, "Pool is stopped"};
}

}  // namespace

WorkerPool::WorkerPool(PoolConfig config, BackendFactory factory)
    : config_(std::move(config))
    , factory_(std::move(factory))
    , broadcast_threads_(std::max<std::size_t>(1, config_.size + config_.max_overflow))
{}

WorkerPool::~WorkerPool() {
    stop();
}

// ─────────────────────────────────────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────────────────────────────────────

Result<void> WorkerPool::start() {
    if (auto valid = config_.validate(); !valid) {
        return valid;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (started_ || stopped_) {
            return tl::unexpected(Error::invalid_config("Pool already started"));
        }
        started_ = true;
    }

    std::vector<std::unique_ptr<Worker>> created;
    created.reserve(config_.size);

    for (std::size_t i = 0; i < config_.size; ++i) {
        auto worker = create_worker(false);
        if (!worker) {
            MAUDEPP_LOG_ERROR("Pool start failed on worker " + std::to_string(i + 1) + ": " +
                              worker.error().describe());
            for (auto& w : created) {
                w->backend->stop();
            }
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_ = true;
            return tl::unexpected(worker.error());
        }
        created.push_back(std::move(*worker));
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& w : created) {
            workers_.push_back(std::move(w));
        }
    }
    available_cv_.notify_all();

    MAUDEPP_LOG_INFO("Pool started with " + std::to_string(config_.size) + " worker(s)");
    return {};
}

void WorkerPool::stop() {
    // Owning copies: a concurrent checkin may destroy its worker meanwhile
    std::vector<std::shared_ptr<IBackend>> backends;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_ && workers_.empty()) {
            return;
        }
        stopped_ = true;
        for (const auto& w : workers_) {
            backends.push_back(w->backend);
        }
    }
    available_cv_.notify_all();

    // Pending calls fail fast once their backend is stopped, which lets
    // outstanding broadcast tasks drain before the join below
    for (const auto& backend : backends) {
        backend->stop();
    }
    broadcast_threads_.join();

    std::vector<std::unique_ptr<Worker>> graveyard;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Checked-out workers are released by their own checkin
        auto idle = std::partition(workers_.begin(), workers_.end(),
                                   [](const auto& w) { return w->busy; });
        std::move(idle, workers_.end(), std::back_inserter(graveyard));
        workers_.erase(idle, workers_.end());
    }

    if (backends.empty() == false) {
        MAUDEPP_LOG_INFO("Pool stopped");
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Checkout / Checkin
// ─────────────────────────────────────────────────────────────────────────────

Result<WorkerHandle> WorkerPool::checkout(std::chrono::milliseconds timeout, bool block) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::vector<std::unique_ptr<Worker>> graveyard;  // destroyed after the lock is released
    std::unique_lock<std::mutex> lock(mutex_);

    while (true) {
        if (stopped_ || started_ == false) {
            return tl::unexpected(pool_stopped());
        }

        reap_dead_locked(graveyard);

        for (auto& w : workers_) {
            if (w->busy == false && w->backend->is_alive()) {
                w->busy = true;
                return WorkerHandle{w->id, w->backend.get()};
            }
        }

        if (workers_.size() + pending_creations_ < capacity()) {
            const bool overflow = permanent_count_locked() + pending_creations_ >= config_.size;
            ++pending_creations_;
            lock.unlock();

            auto created = create_worker(overflow);

            lock.lock();
            --pending_creations_;
            if (!created) {
                MAUDEPP_LOG_WARN("Could not create worker: " + created.error().describe());
                available_cv_.notify_all();
                return tl::unexpected(created.error());
            }
            if (stopped_) {
                lock.unlock();
                (*created)->backend->stop();
                return tl::unexpected(pool_stopped());
            }

            (*created)->busy = true;
            WorkerHandle handle{(*created)->id, (*created)->backend.get()};
            workers_.push_back(std::move(*created));
            return handle;
        }

        if (block == false) {
            return tl::unexpected(Error::pool_exhausted());
        }

        if (available_cv_.wait_until(lock, deadline) == std::cv_status::timeout &&
            std::chrono::steady_clock::now() >= deadline) {
            // One last look before giving up
            reap_dead_locked(graveyard);
            for (auto& w : workers_) {
                if (w->busy == false && w->backend->is_alive() && stopped_ == false) {
                    w->busy = true;
                    return WorkerHandle{w->id, w->backend.get()};
                }
            }
            return tl::unexpected(Error::pool_timeout());
        }
    }
}

void WorkerPool::checkin(const WorkerHandle& handle) {
    std::unique_ptr<Worker> dismissed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(workers_.begin(), workers_.end(),
                               [&](const auto& w) { return w->id == handle.id(); });
        if (it == workers_.end() || (*it)->busy == false) {
            return;
        }

        auto& worker = **it;
        worker.busy = false;

        if (stopped_ || is_dead_locked(worker)) {
            MAUDEPP_LOG_DEBUG("Dropping worker " + std::to_string(worker.id));
            dismissed = std::move(*it);
            workers_.erase(it);
        } else if (worker.overflow) {
            if (permanent_count_locked() < config_.size) {
                // Takes the place of a permanent worker that died
                worker.overflow = false;
            } else {
                MAUDEPP_LOG_DEBUG("Dismissing overflow worker " + std::to_string(worker.id));
                dismissed = std::move(*it);
                workers_.erase(it);
            }
        }
    }
    available_cv_.notify_one();

    if (dismissed) {
        dismissed->backend->stop();
    }
}

std::vector<WorkerHandle> WorkerPool::checkout_idle() {
    std::vector<WorkerHandle> handles;
    std::vector<std::unique_ptr<Worker>> graveyard;
    std::lock_guard<std::mutex> lock(mutex_);

    if (stopped_ || started_ == false) {
        return handles;
    }
    reap_dead_locked(graveyard);

    for (auto& w : workers_) {
        if (w->busy == false && w->backend->is_alive()) {
            w->busy = true;
            handles.emplace_back(w->id, w->backend.get());
        }
    }
    return handles;
}

// ─────────────────────────────────────────────────────────────────────────────
// Status
// ─────────────────────────────────────────────────────────────────────────────

PoolStatus WorkerPool::status() const {
    std::lock_guard<std::mutex> lock(mutex_);

    PoolStatus status;
    status.size = config_.size;
    if (stopped_ || started_ == false) {
        status.state = PoolState::Stopped;
        return status;
    }

    for (const auto& w : workers_) {
        if (is_dead_locked(*w)) {
            continue;
        }
        if (w->overflow) {
            ++status.overflow;
        } else {
            ++status.live;
        }
        if (w->busy) {
            ++status.in_use;
        } else if (w->backend->is_alive()) {
            ++status.available;
        }
    }

    if (status.available > 0) {
        status.state = PoolState::Ready;
    } else if (workers_.size() + pending_creations_ < capacity()) {
        status.state = PoolState::Overflow;
    } else {
        status.state = PoolState::Full;
    }
    return status;
}

// ─────────────────────────────────────────────────────────────────────────────
// Internals
// ─────────────────────────────────────────────────────────────────────────────

Result<std::unique_ptr<WorkerPool::Worker>> WorkerPool::create_worker(bool overflow) {
    auto backend = factory_();
    if (!backend) {
        return tl::unexpected(backend.error());
    }

    auto worker = std::make_unique<Worker>();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        worker->id = next_worker_id_++;
    }
    worker->overflow = overflow;
    worker->backend = std::move(*backend);

    const auto id = worker->id;
    worker->backend->set_exit_handler([this, id](int exit_status) {
        on_worker_exit(id, exit_status);
    });

    if (auto started = worker->backend->start(); !started) {
        return tl::unexpected(started.error());
    }

    MAUDEPP_LOG_DEBUG("Worker " + std::to_string(id) + " started" + (overflow ? " (overflow)" : ""));
    return worker;
}

void WorkerPool::on_worker_exit(std::uint64_t id, int exit_status) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(workers_.begin(), workers_.end(),
                               [&](const auto& w) { return w->id == id; });
        if (it == workers_.end()) {
            return;
        }
        (*it)->exited = true;
    }
    MAUDEPP_LOG_WARN("Worker " + std::to_string(id) + " exited with status " + std::to_string(exit_status));
    available_cv_.notify_all();
}

void WorkerPool::reap_dead_locked(std::vector<std::unique_ptr<Worker>>& graveyard) {
    auto dead = std::stable_partition(workers_.begin(), workers_.end(), [this](const auto& w) {
        return w->busy || is_dead_locked(*w) == false;
    });
    std::move(dead, workers_.end(), std::back_inserter(graveyard));
    workers_.erase(dead, workers_.end());
}

bool WorkerPool::is_dead_locked(const Worker& worker) const {
    return worker.exited || worker.backend->state() == "stopped";
}

std::size_t WorkerPool::permanent_count_locked() const {
    return static_cast<std::size_t>(std::count_if(workers_.begin(), workers_.end(), [this](const auto& w) {
        return w->overflow == false && is_dead_locked(*w) == false;
    }));
}

}  // namespace maudepp
