#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <iostream>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

namespace uplink {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,  // Per-chunk and per-header detail
    Debug = 1,  // Probe results, request headers, resume offsets
    Info  = 2,  // Download lifecycle (start, resume, complete)
    Warn  = 3,  // Retries, forced restarts, degraded checks
    Error = 4,  // Final download failure
    Fatal = 5,  // Unrecoverable
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

/// Parse a level name ("debug", "WARN", ...). Unknown names map to Info.
[[nodiscard]] LogLevel log_level_from_string(std::string_view name) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Log Record
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
// ILogger Interface
// ─────────────────────────────────────────────────────────────────────────────
// Backends implement log() and should_log(). Everything in the library logs
// through the global instance via the UPLINK_LOG_* macros below, so the
// hot streaming path pays only for a level check when logging is off.

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void write(
        LogLevel level,
        std::string_view msg,
        std::source_location loc = std::source_location::current()
    ) {
        if (should_log(level)) {
            log(LogRecord(level, std::string(msg), loc));
        }
    }

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
};

// ─────────────────────────────────────────────────────────────────────────────
// NullLogger - the default; discards everything
// ─────────────────────────────────────────────────────────────────────────────

class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger - stderr with colors
// ─────────────────────────────────────────────────────────────────────────────
// Shares the terminal with the live progress line, so every record first
// erases whatever partial line is on screen when colors are on. Source
// locations are only printed for Debug and Trace records.

class ConsoleLogger final : public ILogger {
public:
    explicit ConsoleLogger(LogLevel min_level = LogLevel::Info, std::ostream& out = std::cerr)
        : min_level_(min_level)
        , out_(&out)
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
    std::ostream* out_;
    bool colors_enabled_ = true;
};

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger Access
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] ILogger& get_logger() noexcept;

// Passing nullptr restores the NullLogger.
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

// Format-style logging macros. Arguments are only formatted when the level
// is enabled on the current global logger.

#define UPLINK_LOG_AT(level, ...) \
    do { \
        auto& uplink_logger_ = ::uplink::get_logger(); \
        if (uplink_logger_.should_log(level)) { \
            uplink_logger_.write(level, std::format(__VA_ARGS__)); \
        } \
    } while (false)

#define UPLINK_LOG_TRACE(...) UPLINK_LOG_AT(::uplink::LogLevel::Trace, __VA_ARGS__)
#define UPLINK_LOG_DEBUG(...) UPLINK_LOG_AT(::uplink::LogLevel::Debug, __VA_ARGS__)
#define UPLINK_LOG_INFO(...)  UPLINK_LOG_AT(::uplink::LogLevel::Info, __VA_ARGS__)
#define UPLINK_LOG_WARN(...)  UPLINK_LOG_AT(::uplink::LogLevel::Warn, __VA_ARGS__)
#define UPLINK_LOG_ERROR(...) UPLINK_LOG_AT(::uplink::LogLevel::Error, __VA_ARGS__)
#define UPLINK_LOG_FATAL(...) UPLINK_LOG_AT(::uplink::LogLevel::Fatal, __VA_ARGS__)

}  // namespace uplink
