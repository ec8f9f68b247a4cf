#include <catch2/catch_test_macros.hpp>

#include "lensbridge/log/logger.hpp"
#include "mocks/capture_logger.hpp"

#include <string>

using namespace lensbridge;
using lensbridge::testing::CaptureLogger;
using lensbridge::testing::ScopedCaptureLogger;

// ─────────────────────────────────────────────────────────────────────────────
// Levels
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("LogLevel to_string returns correct names", "[log]") {
    REQUIRE(to_string(LogLevel::Trace) == "TRACE");
    REQUIRE(to_string(LogLevel::Debug) == "DEBUG");
    REQUIRE(to_string(LogLevel::Info) == "INFO");
    REQUIRE(to_string(LogLevel::Warn) == "WARN");
    REQUIRE(to_string(LogLevel::Error) == "ERROR");
    REQUIRE(to_string(LogLevel::Fatal) == "FATAL");
    REQUIRE(to_string(LogLevel::Off) == "OFF");
}

TEST_CASE("level_for_verbosity picks debug only when verbose", "[log]") {
    REQUIRE(level_for_verbosity(true) == LogLevel::Debug);
    REQUIRE(level_for_verbosity(false) == LogLevel::Info);
}

// ─────────────────────────────────────────────────────────────────────────────
// Loggers
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("NullLogger discards all messages", "[log]") {
    NullLogger logger;

    REQUIRE(logger.should_log(LogLevel::Trace) == false);
    REQUIRE(logger.should_log(LogLevel::Fatal) == false);

    logger.info("dropped");
    logger.error_fmt("dropped {}", 1);
}

TEST_CASE("Logger filters below the minimum level", "[log]") {
    CaptureLogger logger(LogLevel::Warn);

    logger.trace("trace message");
    logger.debug("debug message");
    logger.info("info message");
    logger.warn("warn message");
    logger.error("error message");

    const auto records = logger.records();
    REQUIRE(records.size() == 2);
    REQUIRE(records[0].level == LogLevel::Warn);
    REQUIRE(records[1].message == "error message");
}

TEST_CASE("Formatted helpers build the message", "[log]") {
    CaptureLogger logger;

    logger.info_fmt("Calling tool: {}", "Huskylens2:get_recognition_result");
    logger.debug_fmt("Request {} timed out after {}ms", 7, 30000);

    REQUIRE(logger.contains(LogLevel::Info, "Calling tool: Huskylens2:get_recognition_result"));
    REQUIRE(logger.contains(LogLevel::Debug, "Request 7 timed out after 30000ms"));
}

TEST_CASE("Log records carry the call site", "[log]") {
    CaptureLogger logger;

    logger.info("here");

    const auto records = logger.records();
    REQUIRE(records.size() == 1);
    REQUIRE(std::string(records[0].location.file_name()).find("logger_test") != std::string::npos);
}

// ─────────────────────────────────────────────────────────────────────────────
// Process Logger
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("set_logger installs and removes the process logger", "[log]") {
    {
        ScopedCaptureLogger capture(LogLevel::Info);

        LENSBRIDGE_LOG_INFO("bridge started");
        LENSBRIDGE_LOG_DEBUG("not captured");

        REQUIRE(capture->contains(LogLevel::Info, "bridge started"));
        REQUIRE(capture->records().size() == 1);
    }

    // Back to the NullLogger
    REQUIRE(get_logger().should_log(LogLevel::Fatal) == false);
}

// ─────────────────────────────────────────────────────────────────────────────
// Redaction
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("redact_token shortens long session ids", "[log][redact]") {
    REQUIRE(redact_token("ab12") == "ab12");
    REQUIRE(redact_token("0123456789abcdef") == "0123456789abcdef");
    REQUIRE(redact_token("0123456789abcdef-9876") == "01234567...9876");
}

TEST_CASE("clip_for_log truncates and flattens payloads", "[log][redact]") {
    REQUIRE(clip_for_log("short") == "short");
    REQUIRE(clip_for_log("line\nbreak") == "line?break");
    REQUIRE(clip_for_log(std::string(120, 'x')) == std::string(100, 'x') + "...");
    REQUIRE(clip_for_log("abcdef", 3) == "abc...");
}
