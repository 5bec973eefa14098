// ─────────────────────────────────────────────────────────────────────────────
// BridgeBackend Tests
// ─────────────────────────────────────────────────────────────────────────────
// Runs the real maude-bridge executable in front of the scripted engine.

#include <catch2/catch_test_macros.hpp>

#include "maudepp/backend/bridge_backend.hpp"
#include "mocks/fake_engine.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <thread>

#include <unistd.h>

using namespace maudepp;
using namespace maudepp::testing;
using namespace std::chrono_literals;

namespace {

// Script that starts, never prints READY and never connects
class SilentBridge {
public:
    SilentBridge()
        : path_(std::filesystem::temp_directory_path() /
                ("maudepp_silent_bridge_" + std::to_string(::getpid()) + ".sh"))
    {
        std::ofstream out(path_);
        out << "#!/bin/sh\nexec sleep 5\n";
        out.close();
        std::filesystem::permissions(path_, std::filesystem::perms::owner_all);
    }

    ~SilentBridge() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    [[nodiscard]] std::string path() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

BackendConfig bridge_config(const FakeEngine& engine) {
    auto config = engine.stream_config();
    config.kind = BackendKind::Bridge;
#ifdef MAUDEPP_BRIDGE_PATH
    config.bridge.bridge_path = MAUDEPP_BRIDGE_PATH;
#endif
    config.bridge.connect_retries = 20;
    config.bridge.connect_delay = 250ms;
    return config;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Startup Failures
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("BridgeBackend reports a missing bridge executable", "[bridge][lifecycle]") {
    FakeEngine engine;
    auto config = bridge_config(engine);
    config.bridge.bridge_path = "/nonexistent/maude-bridge";

    BridgeBackend backend(config);
    auto started = backend.start();
    REQUIRE_FALSE(started.has_value());
    REQUIRE(started.error().kind == ErrorKind::FileNotFound);
    REQUIRE(backend.state() == "stopped");
}

TEST_CASE("BridgeBackend gives up when the bridge never signals ready", "[bridge][lifecycle]") {
    FakeEngine engine;
    SilentBridge silent;
    auto config = bridge_config(engine);
    config.bridge.bridge_path = silent.path();
    config.bridge.connect_retries = 3;
    config.bridge.connect_delay = 50ms;

    BridgeBackend backend(config);
    const auto started_at = std::chrono::steady_clock::now();
    auto started = backend.start();

    REQUIRE_FALSE(started.has_value());
    REQUIRE(started.error().kind == ErrorKind::ConnectExhausted);
    REQUIRE(std::chrono::steady_clock::now() - started_at < 3s);
    REQUIRE_FALSE(backend.is_alive());
    REQUIRE(backend.state() == "stopped");
}

TEST_CASE("BridgeBackend gives up when the bridge exits early", "[bridge][lifecycle]") {
    FakeEngine engine;
    auto config = bridge_config(engine);
    config.bridge.bridge_path = "/bin/false";
    config.bridge.connect_retries = 3;
    config.bridge.connect_delay = 50ms;

    BridgeBackend backend(config);
    auto started = backend.start();
    REQUIRE_FALSE(started.has_value());
    REQUIRE(started.error().kind == ErrorKind::ConnectExhausted);
}

TEST_CASE("BridgeBackend rejects calls before start", "[bridge][lifecycle]") {
    FakeEngine engine;
    BridgeBackend backend(bridge_config(engine));

    auto result = backend.execute("anything");
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == ErrorKind::NotConnected);
}

#ifdef MAUDEPP_BRIDGE_PATH

// ═══════════════════════════════════════════════════════════════════════════
// Connected Session
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("BridgeBackend connects through maude-bridge", "[bridge][lifecycle]") {
    FakeEngine engine;
    BridgeBackend backend(bridge_config(engine));

    REQUIRE(backend.state() == "starting");
    auto started = backend.start();
    REQUIRE(started.has_value());
    REQUIRE(backend.is_alive());
    REQUIRE(backend.state() == "connected");
    REQUIRE(backend.kind() == BackendKind::Bridge);
    REQUIRE(backend.bridge_pid() > 0);
    REQUIRE(backend.session_id().rfind("maude_bridge_", 0) == 0);

    REQUIRE_FALSE(backend.start().has_value());

    backend.stop();
    backend.stop();
    REQUIRE_FALSE(backend.is_alive());
    REQUIRE(backend.state() == "stopped");
}

TEST_CASE("BridgeBackend keeps the session past the hello deadline", "[bridge][lifecycle]") {
    FakeEngine engine;
    auto config = bridge_config(engine);
    config.bridge.connect_delay = 100ms;

    std::atomic<int> exits{0};
    BridgeBackend backend(config);
    backend.set_exit_handler([&](int) { ++exits; });
    REQUIRE(backend.start().has_value());

    // Well past the point where the hello timer would have fired
    std::this_thread::sleep_for(300ms);

    REQUIRE(exits == 0);
    REQUIRE(backend.is_alive());
    REQUIRE(backend.execute("after hello").value_or("") == "after hello");

    backend.stop();
    REQUIRE(exits == 0);
}

TEST_CASE("BridgeBackend executes commands", "[bridge][execute]") {
    FakeEngine engine;
    BridgeBackend backend(bridge_config(engine));
    REQUIRE(backend.start().has_value());

    auto result = backend.execute("reduce in NAT : 1 + 2");
    REQUIRE(result.has_value());
    REQUIRE(*result == "reduce in NAT : 1 + 2");

    auto parse = backend.execute("bad term");
    REQUIRE_FALSE(parse.has_value());
    REQUIRE(parse.error().kind == ErrorKind::ParseError);

    auto module = backend.execute("nomod");
    REQUIRE_FALSE(module.has_value());
    REQUIRE(module.error().kind == ErrorKind::ModuleNotFound);

    backend.stop();

    auto after = backend.execute("anything");
    REQUIRE_FALSE(after.has_value());
    REQUIRE(after.error().kind == ErrorKind::Crash);
}

TEST_CASE("BridgeBackend loads files", "[bridge][load]") {
    FakeEngine engine;
    BridgeBackend backend(bridge_config(engine));
    REQUIRE(backend.start().has_value());

    REQUIRE(backend.load_file("/tmp/module.maude").has_value());

    auto failed = backend.load_file("/tmp/bad.maude");
    REQUIRE_FALSE(failed.has_value());
    REQUIRE(failed.error().raw_output.has_value());

    backend.stop();
}

TEST_CASE("BridgeBackend drops replies to timed-out calls", "[bridge][timeout]") {
    FakeEngine engine;
    BridgeBackend backend(bridge_config(engine));
    REQUIRE(backend.start().has_value());

    auto slow = backend.execute("sleep", 100ms);
    REQUIRE_FALSE(slow.has_value());
    REQUIRE(slow.error().kind == ErrorKind::Timeout);

    auto next = backend.execute("fresh", 3s);
    REQUIRE(next.has_value());
    REQUIRE(*next == "fresh");

    backend.stop();
}

TEST_CASE("BridgeBackend never hands late engine output to the next call", "[bridge][timeout]") {
    FakeEngine engine;
    auto config = bridge_config(engine);
    config.bridge.engine_read_timeout = 200ms;

    BridgeBackend backend(config);
    REQUIRE(backend.start().has_value());

    // The bridge gives up on the engine long before the caller does
    auto slow = backend.execute("sleep", 3s);
    REQUIRE_FALSE(slow.has_value());
    REQUIRE(slow.error().kind == ErrorKind::ProtocolError);
    REQUIRE(slow.error().message == "Bridge error: read_failed");

    auto next = backend.execute("fresh", 3s);
    REQUIRE(next.has_value());
    REQUIRE(*next == "fresh");

    REQUIRE(backend.execute("again").value_or("") == "again");
    backend.stop();
}

TEST_CASE("BridgeBackend health checks keep an idle session alive", "[bridge][health]") {
    FakeEngine engine;
    auto config = bridge_config(engine);
    config.bridge.health_check_interval = 50ms;
    config.bridge.ping_timeout = 1s;

    BridgeBackend backend(config);
    REQUIRE(backend.start().has_value());

    std::this_thread::sleep_for(400ms);
    REQUIRE(backend.is_alive());
    REQUIRE(backend.missed_pings() == 0);
    REQUIRE(backend.execute("still here").value_or("") == "still here");

    backend.stop();
}

TEST_CASE("BridgeBackend reports a killed bridge once", "[bridge][crash]") {
    FakeEngine engine;
    BridgeBackend backend(bridge_config(engine));

    std::atomic<int> exits{0};
    std::atomic<int> exit_status{0};
    backend.set_exit_handler([&](int status) {
        exit_status = status;
        ++exits;
    });
    REQUIRE(backend.start().has_value());

    REQUIRE(::kill(backend.bridge_pid(), SIGKILL) == 0);

    const auto deadline = std::chrono::steady_clock::now() + 3s;
    while (exits == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    REQUIRE(exits == 1);
    REQUIRE(exit_status == -SIGKILL);
    REQUIRE_FALSE(backend.is_alive());
    REQUIRE(backend.state() == "stopped");

    backend.stop();
    REQUIRE(exits == 1);
}

TEST_CASE("BridgeBackend reports an engine crash behind the bridge", "[bridge][crash]") {
    FakeEngine engine;
    BridgeBackend backend(bridge_config(engine));

    std::atomic<int> exits{0};
    backend.set_exit_handler([&](int) { ++exits; });
    REQUIRE(backend.start().has_value());

    auto result = backend.execute("crash", 3s);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == ErrorKind::Crash);
    REQUIRE(result.error().recoverable());

    const auto deadline = std::chrono::steady_clock::now() + 3s;
    while (exits == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    REQUIRE(exits == 1);
    REQUIRE_FALSE(backend.is_alive());
    REQUIRE(backend.state() == "stopped");

    auto after = backend.execute("anything");
    REQUIRE_FALSE(after.has_value());
    REQUIRE(after.error().kind == ErrorKind::Crash);

    backend.stop();
    REQUIRE(exits == 1);
}

#endif  // MAUDEPP_BRIDGE_PATH
