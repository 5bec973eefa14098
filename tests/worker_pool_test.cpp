// ─────────────────────────────────────────────────────────────────────────────
// WorkerPool Tests
// ─────────────────────────────────────────────────────────────────────────────
// Pool bookkeeping against in-memory backends.

#include <catch2/catch_test_macros.hpp>

#include "maudepp/pool/worker_pool.hpp"
#include "mocks/mock_backend.hpp"

#include <algorithm>
#include <future>
#include <stdexcept>
#include <thread>

using namespace maudepp;
using namespace maudepp::testing;
using namespace std::chrono_literals;

namespace {

PoolConfig small_pool(std::size_t size, std::size_t overflow) {
    return PoolConfig{}.with_size(size).with_max_overflow(overflow).with_broadcast_timeout(2s);
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("WorkerPool starts size workers", "[pool]") {
    auto log = std::make_shared<MockBackendLog>();
    WorkerPool pool(small_pool(3, 1), mock_factory(log));

    REQUIRE(pool.status().state == PoolState::Stopped);
    REQUIRE(pool.start().has_value());

    auto status = pool.status();
    REQUIRE(log->starts == 3);
    REQUIRE(status.size == 3);
    REQUIRE(status.live == 3);
    REQUIRE(status.overflow == 0);
    REQUIRE(status.available == 3);
    REQUIRE(status.in_use == 0);
    REQUIRE(status.state == PoolState::Ready);
}

TEST_CASE("WorkerPool start fails when a worker cannot start", "[pool]") {
    auto log = std::make_shared<MockBackendLog>();
    log->fail_start = true;
    WorkerPool pool(small_pool(2, 0), mock_factory(log));

    auto result = pool.start();
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == ErrorKind::Crash);
    REQUIRE(pool.status().state == PoolState::Stopped);
}

TEST_CASE("WorkerPool rejects a zero size", "[pool]") {
    auto log = std::make_shared<MockBackendLog>();
    WorkerPool pool(small_pool(0, 0), mock_factory(log));

    auto result = pool.start();
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == ErrorKind::InvalidConfig);
}

TEST_CASE("WorkerPool stop stops every worker and refuses checkouts", "[pool]") {
    auto log = std::make_shared<MockBackendLog>();
    WorkerPool pool(small_pool(2, 0), mock_factory(log));
    REQUIRE(pool.start().has_value());

    pool.stop();
    pool.stop();

    REQUIRE(log->stops == 2);
    REQUIRE(pool.status().state == PoolState::Stopped);
    REQUIRE_FALSE(pool.checkout(10ms).has_value());
}

TEST_CASE("WorkerPool stop while a transaction holds a worker", "[pool][transaction]") {
    auto log = std::make_shared<MockBackendLog>();
    log->execute_delay = 200ms;
    WorkerPool pool(small_pool(2, 0), mock_factory(log));
    REQUIRE(pool.start().has_value());

    auto in_flight = std::async(std::launch::async, [&pool]() {
        return pool.transaction([](WorkerHandle& worker) {
            return worker->execute("reduce 1 .");
        }, 100ms);
    });
    std::this_thread::sleep_for(50ms);

    pool.stop();
    auto result = in_flight.get();

    REQUIRE(result.has_value());
    REQUIRE(*result == "echo: reduce 1 .");
    REQUIRE(log->stops == 2);
    REQUIRE(pool.status().state == PoolState::Stopped);

    pool.stop();
    REQUIRE(log->stops == 2);
}

TEST_CASE("WorkerPool stop while a broadcast is running", "[pool][broadcast]") {
    auto log = std::make_shared<MockBackendLog>();
    log->execute_delay = 200ms;
    WorkerPool pool(small_pool(3, 0), mock_factory(log));
    REQUIRE(pool.start().has_value());

    auto in_flight = std::async(std::launch::async, [&pool]() {
        return pool.broadcast([](WorkerHandle& worker) {
            return worker->execute("reduce 1 .");
        });
    });
    std::this_thread::sleep_for(50ms);

    pool.stop();
    auto results = in_flight.get();

    REQUIRE(results.size() == 3);
    REQUIRE(log->stops == 3);
    REQUIRE(pool.status().state == PoolState::Stopped);
}

// ═══════════════════════════════════════════════════════════════════════════
// Checkout / Checkin
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("WorkerPool checkout and checkin move workers between sets", "[pool]") {
    auto log = std::make_shared<MockBackendLog>();
    WorkerPool pool(small_pool(2, 0), mock_factory(log));
    REQUIRE(pool.start().has_value());

    auto first = pool.checkout(100ms);
    REQUIRE(first.has_value());
    REQUIRE(first->valid());
    REQUIRE(pool.status().in_use == 1);
    REQUIRE(pool.status().available == 1);

    auto second = pool.checkout(100ms);
    REQUIRE(second.has_value());
    REQUIRE(second->id() != first->id());

    auto status = pool.status();
    REQUIRE(status.available == 0);
    REQUIRE(status.in_use == 2);
    REQUIRE(status.state == PoolState::Full);

    pool.checkin(*first);
    pool.checkin(*second);
    REQUIRE(pool.status().available == 2);
}

TEST_CASE("WorkerPool checkout times out when every worker is busy", "[pool]") {
    auto log = std::make_shared<MockBackendLog>();
    WorkerPool pool(small_pool(1, 0), mock_factory(log));
    REQUIRE(pool.start().has_value());

    auto held = pool.checkout(100ms);
    REQUIRE(held.has_value());

    const auto started = std::chrono::steady_clock::now();
    auto waited = pool.checkout(50ms);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE_FALSE(waited.has_value());
    REQUIRE(waited.error().kind == ErrorKind::PoolTimeout);
    REQUIRE(elapsed >= 50ms);

    SECTION("non-blocking checkout reports exhaustion") {
        auto immediate = pool.checkout(1s, false);
        REQUIRE_FALSE(immediate.has_value());
        REQUIRE(immediate.error().kind == ErrorKind::PoolExhausted);
    }

    pool.checkin(*held);
}

TEST_CASE("WorkerPool blocked checkout resumes when a worker is checked in", "[pool]") {
    auto log = std::make_shared<MockBackendLog>();
    WorkerPool pool(small_pool(1, 0), mock_factory(log));
    REQUIRE(pool.start().has_value());

    auto held = pool.checkout(100ms);
    REQUIRE(held.has_value());

    auto waiter = std::async(std::launch::async, [&pool]() {
        return pool.checkout(2s);
    });

    std::this_thread::sleep_for(50ms);
    pool.checkin(*held);

    auto resumed = waiter.get();
    REQUIRE(resumed.has_value());
    REQUIRE(resumed->id() == held->id());
    pool.checkin(*resumed);
}

TEST_CASE("WorkerPool grows into overflow and dismisses overflow on checkin", "[pool]") {
    auto log = std::make_shared<MockBackendLog>();
    WorkerPool pool(small_pool(1, 1), mock_factory(log));
    REQUIRE(pool.start().has_value());

    auto first = pool.checkout(100ms);
    REQUIRE(first.has_value());
    REQUIRE(pool.status().state == PoolState::Overflow);

    auto second = pool.checkout(100ms);
    REQUIRE(second.has_value());
    REQUIRE(log->count() == 2);

    auto status = pool.status();
    REQUIRE(status.size == 1);
    REQUIRE(status.live == 1);
    REQUIRE(status.overflow == 1);
    REQUIRE(status.state == PoolState::Full);

    pool.checkin(*second);
    REQUIRE(log->stops == 1);
    REQUIRE(pool.status().overflow == 0);

    pool.checkin(*first);
    REQUIRE(pool.status().available == 1);
}

TEST_CASE("WorkerPool ignores unknown and repeated checkins", "[pool]") {
    auto log = std::make_shared<MockBackendLog>();
    WorkerPool pool(small_pool(1, 0), mock_factory(log));
    REQUIRE(pool.start().has_value());

    pool.checkin(WorkerHandle{});
    pool.checkin(WorkerHandle{9999, nullptr});

    auto handle = pool.checkout(100ms);
    REQUIRE(handle.has_value());
    pool.checkin(*handle);
    pool.checkin(*handle);

    auto status = pool.status();
    REQUIRE(status.available == 1);
    REQUIRE(status.in_use == 0);
}

TEST_CASE("WorkerPool drops a worker that crashed while checked out", "[pool]") {
    auto log = std::make_shared<MockBackendLog>();
    WorkerPool pool(small_pool(1, 0), mock_factory(log));
    REQUIRE(pool.start().has_value());

    auto handle = pool.checkout(100ms);
    REQUIRE(handle.has_value());

    log->crash(0);
    auto result = handle->backend().execute("reduce 1 .");
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == ErrorKind::Crash);

    pool.checkin(*handle);
    REQUIRE(pool.status().live == 0);
    REQUIRE(pool.status().size == 1);

    SECTION("next checkout replaces the lost worker") {
        auto replacement = pool.checkout(100ms);
        REQUIRE(replacement.has_value());
        REQUIRE(replacement->id() != handle->id());
        REQUIRE(log->count() == 2);
        pool.checkin(*replacement);
        REQUIRE(pool.status().live == 1);
    }
}

TEST_CASE("WorkerPool never hands out an idle worker that exited", "[pool]") {
    auto log = std::make_shared<MockBackendLog>();
    WorkerPool pool(small_pool(2, 0), mock_factory(log));
    REQUIRE(pool.start().has_value());

    log->crash(0);

    auto status = pool.status();
    REQUIRE(status.size == 2);
    REQUIRE(status.live == 1);
    REQUIRE(status.available == 1);

    auto handle = pool.checkout(100ms);
    REQUIRE(handle.has_value());
    REQUIRE(handle->backend().is_alive());
    pool.checkin(*handle);
}

// ═══════════════════════════════════════════════════════════════════════════
// Transaction
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("WorkerPool transaction runs the function on a worker", "[pool][transaction]") {
    auto log = std::make_shared<MockBackendLog>();
    WorkerPool pool(small_pool(1, 0), mock_factory(log));
    REQUIRE(pool.start().has_value());

    auto result = pool.transaction([](WorkerHandle& worker) {
        return worker->execute("reduce 1 + 2 .");
    }, 100ms);

    REQUIRE(result.has_value());
    REQUIRE(*result == "echo: reduce 1 + 2 .");
    REQUIRE(pool.status().available == 1);
}

TEST_CASE("WorkerPool transaction checks in when the function throws", "[pool][transaction]") {
    auto log = std::make_shared<MockBackendLog>();
    WorkerPool pool(small_pool(1, 0), mock_factory(log));
    REQUIRE(pool.start().has_value());

    auto throwing = [&pool]() {
        return pool.transaction([](WorkerHandle&) -> Result<std::string> {
            throw std::runtime_error("callback failed");
        }, 100ms);
    };

    REQUIRE_THROWS_AS(throwing(), std::runtime_error);

    auto status = pool.status();
    REQUIRE(status.available == 1);
    REQUIRE(status.in_use == 0);
}

TEST_CASE("WorkerPool transaction returns the checkout error", "[pool][transaction]") {
    auto log = std::make_shared<MockBackendLog>();
    WorkerPool pool(small_pool(1, 0), mock_factory(log));
    REQUIRE(pool.start().has_value());

    auto held = pool.checkout(100ms);
    REQUIRE(held.has_value());

    bool called = false;
    auto result = pool.transaction([&called](WorkerHandle&) -> Result<void> {
        called = true;
        return {};
    }, 20ms);

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == ErrorKind::PoolTimeout);
    REQUIRE(called == false);

    pool.checkin(*held);
}

TEST_CASE("WorkerPool third concurrent transaction waits for a checkin", "[pool][transaction]") {
    auto log = std::make_shared<MockBackendLog>();
    log->execute_delay = 200ms;
    WorkerPool pool(small_pool(2, 0), mock_factory(log));
    REQUIRE(pool.start().has_value());

    auto run = [&pool]() {
        return pool.transaction([](WorkerHandle& worker) {
            return worker->execute("rewrite init .");
        }, 2s);
    };

    const auto started = std::chrono::steady_clock::now();
    auto a = std::async(std::launch::async, run);
    auto b = std::async(std::launch::async, run);
    std::this_thread::sleep_for(50ms);

    // Both workers are busy; in_use never exceeds capacity
    auto status = pool.status();
    REQUIRE(status.in_use == 2);
    REQUIRE(status.available + status.in_use <= 2);

    auto c = std::async(std::launch::async, run);

    REQUIRE(a.get().has_value());
    REQUIRE(b.get().has_value());
    REQUIRE(c.get().has_value());

    const auto elapsed = std::chrono::steady_clock::now() - started;
    REQUIRE(elapsed >= 400ms);
    REQUIRE(log->count() == 2);
}

// ═══════════════════════════════════════════════════════════════════════════
// Broadcast
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("WorkerPool broadcast reaches every idle worker", "[pool][broadcast]") {
    auto log = std::make_shared<MockBackendLog>();
    WorkerPool pool(small_pool(4, 0), mock_factory(log));
    REQUIRE(pool.start().has_value());

    auto results = pool.broadcast([](WorkerHandle& worker) {
        return worker->load_file("prelude.maude");
    });

    REQUIRE(results.size() == 4);
    REQUIRE(std::all_of(results.begin(), results.end(), [](const auto& r) { return r.has_value(); }));
    REQUIRE(log->loaded.size() == 4);
    REQUIRE(pool.status().available == 4);
}

TEST_CASE("WorkerPool broadcast excludes a crashed worker", "[pool][broadcast]") {
    auto log = std::make_shared<MockBackendLog>();
    WorkerPool pool(small_pool(4, 0), mock_factory(log));
    REQUIRE(pool.start().has_value());

    log->crash(2);

    auto results = pool.broadcast([](WorkerHandle& worker) {
        return worker->load_file("prelude.maude");
    });

    REQUIRE(results.size() == 3);
}

TEST_CASE("WorkerPool broadcast skips checked-out workers", "[pool][broadcast]") {
    auto log = std::make_shared<MockBackendLog>();
    WorkerPool pool(small_pool(3, 0), mock_factory(log));
    REQUIRE(pool.start().has_value());

    auto held = pool.checkout(100ms);
    REQUIRE(held.has_value());

    auto results = pool.broadcast([](WorkerHandle& worker) {
        return worker->execute("show modules .");
    });
    REQUIRE(results.size() == 2);

    pool.checkin(*held);
}

TEST_CASE("WorkerPool broadcast runs workers concurrently", "[pool][broadcast]") {
    auto log = std::make_shared<MockBackendLog>();
    log->execute_delay = 300ms;
    WorkerPool pool(small_pool(3, 0), mock_factory(log));
    REQUIRE(pool.start().has_value());

    const auto started = std::chrono::steady_clock::now();
    auto results = pool.broadcast([](WorkerHandle& worker) {
        return worker->execute("reduce 0 .");
    });
    const auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(results.size() == 3);
    REQUIRE(elapsed < 800ms);
}

TEST_CASE("WorkerPool broadcast reports slow workers as pool_timeout", "[pool][broadcast]") {
    auto log = std::make_shared<MockBackendLog>();
    WorkerPool pool(PoolConfig{}.with_size(2).with_max_overflow(0).with_broadcast_timeout(100ms),
                    mock_factory(log));
    REQUIRE(pool.start().has_value());

    std::atomic<int> calls{0};
    auto results = pool.broadcast([&calls](WorkerHandle& worker) -> Result<std::string> {
        if (calls.fetch_add(1) == 0) {
            std::this_thread::sleep_for(400ms);
        }
        return worker->execute("reduce 0 .");
    });

    REQUIRE(results.size() == 2);
    const auto timeouts = std::count_if(results.begin(), results.end(), [](const auto& r) {
        return r.has_value() == false && r.error().kind == ErrorKind::PoolTimeout;
    });
    REQUIRE(timeouts == 1);

    // The slow worker comes back once its call finishes
    std::this_thread::sleep_for(500ms);
    REQUIRE(pool.status().available == 2);
}

TEST_CASE("WorkerPool broadcast on a stopped pool returns nothing", "[pool][broadcast]") {
    auto log = std::make_shared<MockBackendLog>();
    WorkerPool pool(small_pool(2, 0), mock_factory(log));

    auto results = pool.broadcast([](WorkerHandle& worker) {
        return worker->load_file("x.maude");
    });
    REQUIRE(results.empty());
}
