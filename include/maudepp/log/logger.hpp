#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

namespace maudepp {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,  // Raw engine traffic
    Debug = 1,  // State machine transitions
    Info  = 2,  // Worker start/stop
    Warn  = 3,  // Recoverable issues (timeouts, missed pings)
    Error = 4,  // Crashes, failed starts
    Fatal = 5,
    Off   = 6
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name ("trace", "INFO", ...). Unknown names map to Info.
[[nodiscard]] LogLevel parse_log_level(std::string_view name) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Log Record - Immutable snapshot of a log event
// ─────────────────────────────────────────────────────────────────────────────

struct LogRecord {
    LogLevel level;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(
        LogLevel lvl,
        std::string msg,
        std::source_location loc = std::source_location::current()
    )
        : level(lvl)
        , message(std::move(msg))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger Interface - Swappable logging backend
// ─────────────────────────────────────────────────────────────────────────────

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    // Check if a level would be logged (for avoiding expensive formatting)
    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void trace(std::string_view msg, std::source_location loc = std::source_location::current()) {
        if (should_log(LogLevel::Trace)) {
            log(LogRecord(LogLevel::Trace, std::string(msg), loc));
        }
    }

    void debug(std::string_view msg, std::source_location loc = std::source_location::current()) {
        if (should_log(LogLevel::Debug)) {
            log(LogRecord(LogLevel::Debug, std::string(msg), loc));
        }
    }

    void info(std::string_view msg, std::source_location loc = std::source_location::current()) {
        if (should_log(LogLevel::Info)) {
            log(LogRecord(LogLevel::Info, std::string(msg), loc));
        }
    }

    void warn(std::string_view msg, std::source_location loc = std::source_location::current()) {
        if (should_log(LogLevel::Warn)) {
            log(LogRecord(LogLevel::Warn, std::string(msg), loc));
        }
    }

    void error(std::string_view msg, std::source_location loc = std::source_location::current()) {
        if (should_log(LogLevel::Error)) {
            log(LogRecord(LogLevel::Error, std::string(msg), loc));
        }
    }

    void fatal(std::string_view msg, std::source_location loc = std::source_location::current()) {
        if (should_log(LogLevel::Fatal)) {
            log(LogRecord(LogLevel::Fatal, std::string(msg), loc));
        }
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// NullLogger - Discards all logs (zero overhead when disabled)
// ─────────────────────────────────────────────────────────────────────────────

class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger Access
// ─────────────────────────────────────────────────────────────────────────────

// Get the global logger instance (defaults to NullLogger)
[[nodiscard]] ILogger& get_logger() noexcept;

// Set a new global logger (takes ownership); nullptr restores the NullLogger
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

// These check should_log() before evaluating arguments

#define MAUDEPP_LOG_TRACE(msg) \
    do { if (::maudepp::get_logger().should_log(::maudepp::LogLevel::Trace)) \
         ::maudepp::get_logger().trace(msg); } while(false)

#define MAUDEPP_LOG_DEBUG(msg) \
    do { if (::maudepp::get_logger().should_log(::maudepp::LogLevel::Debug)) \
         ::maudepp::get_logger().debug(msg); } while(false)

#define MAUDEPP_LOG_INFO(msg) \
    do { if (::maudepp::get_logger().should_log(::maudepp::LogLevel::Info)) \
         ::maudepp::get_logger().info(msg); } while(false)

#define MAUDEPP_LOG_WARN(msg) \
    do { if (::maudepp::get_logger().should_log(::maudepp::LogLevel::Warn)) \
         ::maudepp::get_logger().warn(msg); } while(false)

#define MAUDEPP_LOG_ERROR(msg) \
    do { if (::maudepp::get_logger().should_log(::maudepp::LogLevel::Error)) \
         ::maudepp::get_logger().error(msg); } while(false)

}  // namespace maudepp
