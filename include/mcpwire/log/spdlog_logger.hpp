#pragma once

#include "mcpwire/log/logger.hpp"

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace mcpwire {

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger - ILogger backed by spdlog
// ─────────────────────────────────────────────────────────────────────────────
// The record's component is rendered as a "[component]" prefix on the message;
// source location is passed through to spdlog so %s / %# work in patterns.

class SpdlogLogger final : public ILogger {
public:
    static constexpr const char* kDefaultPattern =
        "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";

    /// Console (stderr, colored) sink
    explicit SpdlogLogger(LogLevel min_level = LogLevel::Info);

    /// Wrap an existing spdlog logger; its level is adopted
    explicit SpdlogLogger(std::shared_ptr<spdlog::logger> logger);

    /// Several sinks behind one logger
    SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel min_level = LogLevel::Info);

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

// ─────────────────────────────────────────────────────────────────────────────
// Factory Functions
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_console_logger(
    LogLevel min_level = LogLevel::Info
);

[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_file_logger(
    const std::string& filename,
    LogLevel min_level = LogLevel::Info
);

/// Size-capped file log, keeping `max_files` rotated copies
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_rotating_logger(
    const std::string& filename,
    std::size_t max_file_size,
    std::size_t max_files,
    LogLevel min_level = LogLevel::Info
);

/// Non-blocking console logger; records are formatted on a spdlog worker thread
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_async_console_logger(
    LogLevel min_level = LogLevel::Info,
    std::size_t queue_size = 8192
);

}  // namespace mcpwire
