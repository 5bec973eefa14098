// ─────────────────────────────────────────────────────────────────────────────
// Backend Factory and Server Facade Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "maudepp/backend_factory.hpp"
#include "maudepp/server.hpp"
#include "mocks/fake_engine.hpp"

#include <algorithm>

using namespace maudepp;
using namespace maudepp::testing;
using namespace std::chrono_literals;

// ═══════════════════════════════════════════════════════════════════════════
// make_backend
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("make_backend selects the implementation by kind", "[factory]") {
    SECTION("stream") {
        auto backend = make_backend(BackendConfig{}.with_kind(BackendKind::Stream));
        REQUIRE(backend.has_value());
        REQUIRE((*backend)->kind() == BackendKind::Stream);
        REQUIRE((*backend)->state() == "starting");
        REQUIRE_FALSE((*backend)->is_alive());
    }

    SECTION("bridge") {
        auto backend = make_backend(BackendConfig{}.with_kind(BackendKind::Bridge));
        REQUIRE(backend.has_value());
        REQUIRE((*backend)->kind() == BackendKind::Bridge);
        REQUIRE_FALSE((*backend)->is_alive());
    }

    SECTION("native") {
        auto backend = make_backend(BackendConfig{}.with_kind(BackendKind::Native));
        REQUIRE_FALSE(backend.has_value());
        REQUIRE(backend.error().kind == ErrorKind::NotImplemented);
    }
}

TEST_CASE("parse_backend_kind accepts names and aliases in any case", "[factory]") {
    REQUIRE(parse_backend_kind("stream") == BackendKind::Stream);
    REQUIRE(parse_backend_kind("PORT") == BackendKind::Stream);
    REQUIRE(parse_backend_kind("Bridge") == BackendKind::Bridge);
    REQUIRE(parse_backend_kind("cNode") == BackendKind::Bridge);
    REQUIRE(parse_backend_kind("NIF") == BackendKind::Native);
    REQUIRE_FALSE(parse_backend_kind("").has_value());
    REQUIRE_FALSE(parse_backend_kind("streams").has_value());
    REQUIRE_FALSE(parse_backend_kind("str").has_value());
    STATIC_REQUIRE(noexcept(parse_backend_kind("stream")));
}

TEST_CASE("make_backend validates the configuration", "[factory]") {
    auto backend = make_backend(BackendConfig{}.with_default_timeout(0ms));
    REQUIRE_FALSE(backend.has_value());
    REQUIRE(backend.error().kind == ErrorKind::InvalidConfig);
}

TEST_CASE("available reports usable backends", "[factory]") {
    REQUIRE(available(BackendKind::Stream));
    REQUIRE_FALSE(available(BackendKind::Native));
    REQUIRE_FALSE(available(BackendKind::Bridge, BackendConfig{}.with_bridge_path("/nonexistent/maude-bridge")));
    REQUIRE(available(BackendKind::Bridge, BackendConfig{}.with_bridge_path("/bin/sh")));

    auto kinds = available_backends(BackendConfig{}.with_bridge_path("/bin/sh"));
    REQUIRE(kinds.size() == 2);
    REQUIRE(kinds[0] == BackendKind::Stream);
    REQUIRE(kinds[1] == BackendKind::Bridge);

    auto without_bridge = available_backends(BackendConfig{}.with_bridge_path("/nonexistent/maude-bridge"));
    REQUIRE(std::find(without_bridge.begin(), without_bridge.end(), BackendKind::Bridge) == without_bridge.end());
}

// ═══════════════════════════════════════════════════════════════════════════
// server facade
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("server facade runs a stream session", "[server]") {
    FakeEngine engine;

    auto backend = server::start(engine.stream_config());
    REQUIRE(backend.has_value());
    REQUIRE(server::is_alive(**backend));

    auto result = server::execute(**backend, "reduce in NAT : 1 + 2");
    REQUIRE(result.has_value());
    REQUIRE(*result == "reduce in NAT : 1 + 2");

    auto timed_out = server::execute(**backend, "sleep", 50ms);
    REQUIRE_FALSE(timed_out.has_value());
    REQUIRE(timed_out.error().kind == ErrorKind::Timeout);

    REQUIRE(server::load_file(**backend, "/tmp/module.maude").has_value());

    server::stop(**backend);
    REQUIRE_FALSE(server::is_alive(**backend));
}

TEST_CASE("server start propagates backend failures", "[server]") {
    auto native = server::start(BackendConfig{}.with_kind(BackendKind::Native));
    REQUIRE_FALSE(native.has_value());
    REQUIRE(native.error().kind == ErrorKind::NotImplemented);

    auto missing = server::start(BackendConfig{}
        .with_kind(BackendKind::Bridge)
        .with_bridge_path("/nonexistent/maude-bridge"));
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().kind == ErrorKind::FileNotFound);
}

TEST_CASE("server default timeout", "[server]") {
    STATIC_REQUIRE(server::default_timeout() == 5000ms);
    REQUIRE(BackendConfig{}.default_timeout == server::default_timeout());
}
