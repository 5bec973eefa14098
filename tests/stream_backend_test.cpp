// ─────────────────────────────────────────────────────────────────────────────
// StreamBackend Tests
// ─────────────────────────────────────────────────────────────────────────────
// Drives the backend against a scripted stand-in for the engine (see
// mocks/fake_engine.hpp), on plain pipes.

#include <catch2/catch_test_macros.hpp>

#include "maudepp/backend/stream_backend.hpp"
#include "mocks/fake_engine.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <thread>
#include <vector>

#include <unistd.h>

using namespace maudepp;
using namespace maudepp::testing;
using namespace std::chrono_literals;

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("StreamBackend starts after the first prompt", "[stream][lifecycle]") {
    FakeEngine engine;
    StreamBackend backend(engine.stream_config());

    REQUIRE(backend.state() == "starting");
    REQUIRE_FALSE(backend.is_alive());

    auto started = backend.start();
    REQUIRE(started.has_value());
    REQUIRE(backend.is_alive());
    REQUIRE(backend.state() == "idle");
    REQUIRE(backend.pid() > 0);
    REQUIRE(backend.kind() == BackendKind::Stream);
    REQUIRE(backend.launch_command().uses_pty == false);
    REQUIRE(backend.launch_command().args.front() == "-interactive");

    backend.stop();
    REQUIRE_FALSE(backend.is_alive());
    REQUIRE(backend.state() == "stopped");
}

TEST_CASE("StreamBackend refuses a second start", "[stream][lifecycle]") {
    FakeEngine engine;
    StreamBackend backend(engine.stream_config());
    REQUIRE(backend.start().has_value());

    REQUIRE_FALSE(backend.start().has_value());
    backend.stop();
}

TEST_CASE("StreamBackend double stop is safe", "[stream][lifecycle]") {
    FakeEngine engine;
    StreamBackend backend(engine.stream_config());
    REQUIRE(backend.start().has_value());

    backend.stop();
    backend.stop();
    REQUIRE(backend.state() == "stopped");
}

TEST_CASE("StreamBackend reports a missing engine", "[stream][lifecycle]") {
    auto config = BackendConfig{}.with_engine_path("/nonexistent/maude").with_pty(false);
    config.bundle_dir = "/nonexistent";
    StreamBackend backend(config);

    auto started = backend.start();
    if (started.has_value() == false) {
        REQUIRE(started.error().kind == ErrorKind::FileNotFound);
    } else {
        // A real engine is installed on PATH
        backend.stop();
    }
}

TEST_CASE("StreamBackend fails start when no prompt appears", "[stream][lifecycle]") {
    const auto script = std::filesystem::temp_directory_path() /
                        ("maudepp_silent_engine_" + std::to_string(::getpid()) + ".sh");
    {
        std::ofstream out(script);
        out << "#!/bin/sh\nexec sleep 5\n";
    }
    std::filesystem::permissions(script, std::filesystem::perms::owner_all);

    auto config = BackendConfig{}.with_engine_path(script.string()).with_pty(false);
    config.stream.banner_timeout = 200ms;
    StreamBackend backend(config);

    auto started = backend.start();
    REQUIRE_FALSE(started.has_value());
    REQUIRE(started.error().kind == ErrorKind::Timeout);
    REQUIRE_FALSE(backend.is_alive());
    REQUIRE(backend.state() == "stopped");

    std::filesystem::remove(script);
}

// ═══════════════════════════════════════════════════════════════════════════
// Commands
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("StreamBackend execute returns the extracted result", "[stream][execute]") {
    FakeEngine engine;
    StreamBackend backend(engine.stream_config());
    REQUIRE(backend.start().has_value());

    auto result = backend.execute("reduce in NAT : 1 + 2");
    REQUIRE(result.has_value());
    REQUIRE(*result == "reduce in NAT : 1 + 2");
    REQUIRE(backend.state() == "idle");

    backend.stop();
}

TEST_CASE("StreamBackend classifies engine diagnostics", "[stream][execute]") {
    FakeEngine engine;
    StreamBackend backend(engine.stream_config());
    REQUIRE(backend.start().has_value());

    auto parse = backend.execute("bad term");
    REQUIRE_FALSE(parse.has_value());
    REQUIRE(parse.error().kind == ErrorKind::ParseError);
    REQUIRE(parse.error().raw_output.has_value());

    auto module = backend.execute("nomod");
    REQUIRE_FALSE(module.has_value());
    REQUIRE(module.error().kind == ErrorKind::ModuleNotFound);
    REQUIRE(module.error().message == "Module not found: NOSUCH");

    // The session is still usable
    REQUIRE(backend.execute("after").value_or("") == "after");
    backend.stop();
}

TEST_CASE("StreamBackend serialises concurrent callers", "[stream][execute]") {
    FakeEngine engine;
    StreamBackend backend(engine.stream_config());
    REQUIRE(backend.start().has_value());

    std::vector<std::future<Result<std::string>>> futures;
    for (int i = 0; i < 8; ++i) {
        futures.push_back(std::async(std::launch::async, [&backend, i]() {
            return backend.execute("term" + std::to_string(i));
        }));
    }

    for (int i = 0; i < 8; ++i) {
        auto result = futures[static_cast<std::size_t>(i)].get();
        REQUIRE(result.has_value());
        REQUIRE(*result == "term" + std::to_string(i));
    }

    backend.stop();
}

TEST_CASE("StreamBackend load_file succeeds on a quiet load", "[stream][load]") {
    FakeEngine engine;
    StreamBackend backend(engine.stream_config());
    REQUIRE(backend.start().has_value());

    REQUIRE(backend.load_file("/tmp/module.maude").has_value());

    auto failed = backend.load_file("/tmp/bad.maude");
    REQUIRE_FALSE(failed.has_value());
    REQUIRE(failed.error().kind == ErrorKind::Unknown);

    backend.stop();
}

// ═══════════════════════════════════════════════════════════════════════════
// Timeouts
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("StreamBackend times out without killing the engine", "[stream][timeout]") {
    FakeEngine engine;
    StreamBackend backend(engine.stream_config());
    REQUIRE(backend.start().has_value());

    const auto started = std::chrono::steady_clock::now();
    auto slow = backend.execute("sleep", 50ms);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE_FALSE(slow.has_value());
    REQUIRE(slow.error().kind == ErrorKind::Timeout);
    REQUIRE(elapsed < 1s);
    REQUIRE(backend.is_alive());

    // The late "late" answer must not reach this caller
    auto next = backend.execute("fresh", 3s);
    REQUIRE(next.has_value());
    REQUIRE(*next == "fresh");

    backend.stop();
}

TEST_CASE("StreamBackend counts queue time against the timeout", "[stream][timeout]") {
    FakeEngine engine;
    StreamBackend backend(engine.stream_config());
    REQUIRE(backend.start().has_value());

    auto slow = std::async(std::launch::async, [&backend]() {
        return backend.execute("sleep", 3s);
    });
    std::this_thread::sleep_for(100ms);

    auto queued = backend.execute("queued", 200ms);
    REQUIRE_FALSE(queued.has_value());
    REQUIRE(queued.error().kind == ErrorKind::Timeout);

    auto slow_result = slow.get();
    REQUIRE(slow_result.has_value());
    REQUIRE(*slow_result == "late");

    REQUIRE(backend.execute("again").value_or("") == "again");
    backend.stop();
}

// ═══════════════════════════════════════════════════════════════════════════
// Crashes
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("StreamBackend reports an engine crash once", "[stream][crash]") {
    FakeEngine engine;
    StreamBackend backend(engine.stream_config());

    std::atomic<int> exits{0};
    std::atomic<int> exit_status{0};
    backend.set_exit_handler([&](int status) {
        exit_status = status;
        ++exits;
    });
    REQUIRE(backend.start().has_value());

    auto result = backend.execute("crash");
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == ErrorKind::Crash);
    REQUIRE(result.error().recoverable());

    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (exits == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    REQUIRE(exits == 1);
    REQUIRE(exit_status == 3);
    REQUIRE_FALSE(backend.is_alive());
    REQUIRE(backend.state() == "stopped");

    auto after = backend.execute("anything");
    REQUIRE_FALSE(after.has_value());
    REQUIRE(after.error().kind == ErrorKind::Crash);

    backend.stop();
    REQUIRE(exits == 1);
}

TEST_CASE("StreamBackend stop does not invoke the exit handler", "[stream][crash]") {
    FakeEngine engine;
    StreamBackend backend(engine.stream_config());

    std::atomic<int> exits{0};
    backend.set_exit_handler([&](int) { ++exits; });
    REQUIRE(backend.start().has_value());

    backend.stop();
    std::this_thread::sleep_for(100ms);
    REQUIRE(exits == 0);
}
