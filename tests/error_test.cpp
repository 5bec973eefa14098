#include <catch2/catch_test_macros.hpp>

#include "maudepp/error.hpp"

using namespace maudepp;

TEST_CASE("ErrorKind to_string names every kind", "[error]") {
    REQUIRE(to_string(ErrorKind::Timeout) == "timeout");
    REQUIRE(to_string(ErrorKind::ConnectExhausted) == "connect_exhausted");
    REQUIRE(to_string(ErrorKind::ModuleNotFound) == "module_not_found");
    REQUIRE(to_string(ErrorKind::PoolTimeout) == "pool_timeout");
    REQUIRE(to_string(ErrorKind::NotImplemented) == "not_implemented");
}

TEST_CASE("Error factories carry context", "[error]") {
    auto timeout = Error::timeout(50);
    REQUIRE(timeout.kind == ErrorKind::Timeout);
    REQUIRE(timeout.message == "Operation timed out after 50ms");
    REQUIRE(timeout.details == "timeout_ms=50");

    auto crash = Error::crash(3);
    REQUIRE(crash.kind == ErrorKind::Crash);
    REQUIRE(crash.details == "exit_status=3");

    auto exhausted = Error::connect_exhausted("maude_bridge_4", 10);
    REQUIRE(exhausted.message.find("after 10 attempts") != std::string::npos);

    auto partial = Error::partial_load(2);
    REQUIRE(partial.kind == ErrorKind::LoadError);
    REQUIRE(partial.details == "failures=2");

    REQUIRE(Error::not_connected().message == "Bridge not connected");
}

TEST_CASE("Only transport faults are recoverable", "[error]") {
    REQUIRE(Error::timeout(1).recoverable());
    REQUIRE(Error::crash(1).recoverable());

    REQUIRE_FALSE(Error::pool_timeout().recoverable());
    REQUIRE_FALSE(Error::file_not_found("x").recoverable());
    REQUIRE_FALSE((Error{ErrorKind::ParseError, "No parse"}).recoverable());
}

TEST_CASE("Error describe prefixes the kind", "[error]") {
    REQUIRE(Error::pool_exhausted().describe() == "[pool_exhausted] Pool is full, no workers available");
}

TEST_CASE("Result holds either a value or an error", "[error]") {
    Result<std::string> ok = std::string("3");
    Result<std::string> failed = tl::unexpected(Error::timeout(10));

    REQUIRE(ok.has_value());
    REQUIRE(*ok == "3");
    REQUIRE_FALSE(failed.has_value());
    REQUIRE(failed.error().kind == ErrorKind::Timeout);
}
