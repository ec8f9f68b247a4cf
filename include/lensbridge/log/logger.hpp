#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

namespace lensbridge {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,  // Raw stream lines, request bodies
    Debug = 1,  // Session discovery, skipped payloads
    Info  = 2,  // Bridge lifecycle, tool calls
    Warn  = 3,  // Recoverable upstream problems
    Error = 4,  // Failed calls
    Fatal = 5,  // Bridge cannot continue
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

/// Level used by the server binary: Debug with --debug, Info otherwise.
[[nodiscard]] constexpr LogLevel level_for_verbosity(bool verbose) noexcept {
    return verbose ? LogLevel::Debug : LogLevel::Info;
}

// ─────────────────────────────────────────────────────────────────────────────
// LogRecord
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
// ILogger
// ─────────────────────────────────────────────────────────────────────────────
// Backend-neutral sink. The bridge installs a SpdlogLogger at startup; the
// library itself never assumes a backend and defaults to NullLogger.

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void trace(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Trace, msg, loc);
    }

    void debug(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Debug, msg, loc);
    }

    void info(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Info, msg, loc);
    }

    void warn(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Warn, msg, loc);
    }

    void error(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Error, msg, loc);
    }

    void fatal(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Fatal, msg, loc);
    }

    // std::format helpers; arguments are only formatted when the level is on
    template<typename... Args>
    void trace_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(LogLevel::Trace)) {
            log(LogRecord(LogLevel::Trace, std::format(fmt, std::forward<Args>(args)...)));
        }
    }

    template<typename... Args>
    void debug_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(LogLevel::Debug)) {
            log(LogRecord(LogLevel::Debug, std::format(fmt, std::forward<Args>(args)...)));
        }
    }

    template<typename... Args>
    void info_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(LogLevel::Info)) {
            log(LogRecord(LogLevel::Info, std::format(fmt, std::forward<Args>(args)...)));
        }
    }

    template<typename... Args>
    void warn_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(LogLevel::Warn)) {
            log(LogRecord(LogLevel::Warn, std::format(fmt, std::forward<Args>(args)...)));
        }
    }

    template<typename... Args>
    void error_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(LogLevel::Error)) {
            log(LogRecord(LogLevel::Error, std::format(fmt, std::forward<Args>(args)...)));
        }
    }

private:
    void write(LogLevel level, std::string_view msg, std::source_location loc) {
        if (should_log(level)) {
            log(LogRecord(level, std::string(msg), loc));
        }
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// NullLogger
// ─────────────────────────────────────────────────────────────────────────────

class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Process Logger
// ─────────────────────────────────────────────────────────────────────────────

// Get the process logger (NullLogger until set_logger() is called)
[[nodiscard]] ILogger& get_logger() noexcept;

// Replace the process logger; nullptr restores the NullLogger
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

// Shorten an opaque token (session id) for log output: "0123abcd...wxyz"
[[nodiscard]] std::string redact_token(std::string_view token);

// Shorten an arbitrary payload for log output, appending "..." when cut
[[nodiscard]] std::string clip_for_log(std::string_view text, std::size_t max_length = 100);

#define LENSBRIDGE_LOG_TRACE(msg) \
    do { if (::lensbridge::get_logger().should_log(::lensbridge::LogLevel::Trace)) \
         ::lensbridge::get_logger().trace(msg); } while(false)

#define LENSBRIDGE_LOG_DEBUG(msg) \
    do { if (::lensbridge::get_logger().should_log(::lensbridge::LogLevel::Debug)) \
         ::lensbridge::get_logger().debug(msg); } while(false)

#define LENSBRIDGE_LOG_INFO(msg) \
    do { if (::lensbridge::get_logger().should_log(::lensbridge::LogLevel::Info)) \
         ::lensbridge::get_logger().info(msg); } while(false)

#define LENSBRIDGE_LOG_WARN(msg) \
    do { if (::lensbridge::get_logger().should_log(::lensbridge::LogLevel::Warn)) \
         ::lensbridge::get_logger().warn(msg); } while(false)

#define LENSBRIDGE_LOG_ERROR(msg) \
    do { if (::lensbridge::get_logger().should_log(::lensbridge::LogLevel::Error)) \
         ::lensbridge::get_logger().error(msg); } while(false)

#define LENSBRIDGE_LOG_FATAL(msg) \
    do { if (::lensbridge::get_logger().should_log(::lensbridge::LogLevel::Fatal)) \
         ::lensbridge::get_logger().fatal(msg); } while(false)

}  // namespace lensbridge
