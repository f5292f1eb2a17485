#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace mcpwire {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,  // Per-frame and per-message detail
    Debug = 1,  // Thread lifecycle, retries
    Info  = 2,  // Connection state transitions
    Warn  = 3,  // Faults that are being recovered
    Error = 4,  // Faults that surface to callers
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

// Accepts "trace", "debug", "info", "warn"/"warning", "error", "fatal", "off"
// in any case.
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Log Record
// ─────────────────────────────────────────────────────────────────────────────
// `component` names the subsystem that emitted the record ("pipe", "socket",
// "connection", ...). It is always a string literal, so a view is safe.

struct LogRecord {
    LogLevel level;
    std::string_view component;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(
        LogLevel lvl,
        std::string_view comp,
        std::string msg,
        std::source_location loc = std::source_location::current()
    )
        : level(lvl)
        , component(comp)
        , message(std::move(msg))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger Interface
// ─────────────────────────────────────────────────────────────────────────────

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void write(
        LogLevel level,
        std::string_view component,
        std::string_view msg,
        std::source_location loc = std::source_location::current()
    ) {
        if (should_log(level)) {
            log(LogRecord(level, component, std::string(msg), loc));
        }
    }

    // Formatting helpers. Arguments are only formatted when the level is enabled.
    template<typename... Args>
    void trace_fmt(std::string_view component, std::format_string<Args...> fmt, Args&&... args) {
        emit_fmt(LogLevel::Trace, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug_fmt(std::string_view component, std::format_string<Args...> fmt, Args&&... args) {
        emit_fmt(LogLevel::Debug, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info_fmt(std::string_view component, std::format_string<Args...> fmt, Args&&... args) {
        emit_fmt(LogLevel::Info, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn_fmt(std::string_view component, std::format_string<Args...> fmt, Args&&... args) {
        emit_fmt(LogLevel::Warn, component, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error_fmt(std::string_view component, std::format_string<Args...> fmt, Args&&... args) {
        emit_fmt(LogLevel::Error, component, fmt, std::forward<Args>(args)...);
    }

private:
    template<typename... Args>
    void emit_fmt(
        LogLevel level,
        std::string_view component,
        std::format_string<Args...> fmt,
        Args&&... args
    ) {
        if (should_log(level)) {
            log(LogRecord(level, component, std::format(fmt, std::forward<Args>(args)...)));
        }
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// NullLogger - default, discards everything
// ─────────────────────────────────────────────────────────────────────────────

class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger - stderr, optional ANSI colors
// ─────────────────────────────────────────────────────────────────────────────

class ConsoleLogger final : public ILogger {
public:
    explicit ConsoleLogger(LogLevel min_level = LogLevel::Info)
        : min_level_(min_level)
    {}

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(min_level_);
    }

    void set_level(LogLevel level) noexcept {
        min_level_ = level;
    }

    [[nodiscard]] LogLevel level() const noexcept {
        return min_level_;
    }

    void set_colors_enabled(bool enabled) noexcept {
        colors_enabled_ = enabled;
    }

private:
    LogLevel min_level_;
    bool colors_enabled_ = true;
};

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger Access
// ─────────────────────────────────────────────────────────────────────────────

// Returns the process-wide logger (NullLogger until one is installed).
[[nodiscard]] ILogger& get_logger() noexcept;

// Installs a new process-wide logger. nullptr restores the NullLogger.
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

#define MCPWIRE_LOG_AT(level, component, msg) \
    do { if (::mcpwire::get_logger().should_log(level)) \
         ::mcpwire::get_logger().write(level, component, msg); } while(false)

#define MCPWIRE_LOG_TRACE(component, msg) MCPWIRE_LOG_AT(::mcpwire::LogLevel::Trace, component, msg)
#define MCPWIRE_LOG_DEBUG(component, msg) MCPWIRE_LOG_AT(::mcpwire::LogLevel::Debug, component, msg)
#define MCPWIRE_LOG_INFO(component, msg)  MCPWIRE_LOG_AT(::mcpwire::LogLevel::Info, component, msg)
#define MCPWIRE_LOG_WARN(component, msg)  MCPWIRE_LOG_AT(::mcpwire::LogLevel::Warn, component, msg)
#define MCPWIRE_LOG_ERROR(component, msg) MCPWIRE_LOG_AT(::mcpwire::LogLevel::Error, component, msg)

}  // namespace mcpwire
