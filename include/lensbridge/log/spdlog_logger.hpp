#pragma once

#include "lensbridge/log/logger.hpp"

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <vector>

namespace lensbridge {

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger
// ─────────────────────────────────────────────────────────────────────────────
// ILogger backend writing through spdlog. The server binary installs one at
// startup (console only, or console plus file with --log-file). Loggers are
// built directly from sinks and never enter spdlog's global registry.

inline constexpr const char* kBridgeLoggerName = "lensbridge";

class SpdlogLogger final : public ILogger {
public:
    /// Wrap an existing spdlog logger (tests use this with an ostream sink)
    explicit SpdlogLogger(std::shared_ptr<spdlog::logger> logger);

    /// Sinks sharing one level and the bridge pattern. Warnings and errors
    /// flush immediately so upstream failures reach the log file.
    SpdlogLogger(
        std::vector<spdlog::sink_ptr> sinks,
        LogLevel min_level = LogLevel::Info,
        std::string name = kBridgeLoggerName
    );

    ~SpdlogLogger() override = default;

    SpdlogLogger(const SpdlogLogger&) = delete;
    SpdlogLogger& operator=(const SpdlogLogger&) = delete;

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override;

    [[nodiscard]] std::shared_ptr<spdlog::logger> get_spdlog_logger() const noexcept {
        return logger_;
    }

    void set_level(LogLevel level) noexcept;

    void set_pattern(const std::string& pattern);

    void flush();

    [[nodiscard]] static spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept;

private:
    std::shared_ptr<spdlog::logger> logger_;
    LogLevel min_level_;
};

/// Console logger used by the bridge when no log file is requested
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_console_logger(
    LogLevel min_level = LogLevel::Info
);

/// Console plus append-mode file sink (--log-file)
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_console_file_logger(
    const std::string& filename,
    LogLevel min_level = LogLevel::Info
);

}  // namespace lensbridge
