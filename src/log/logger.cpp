#include "uplink/log/logger.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <mutex>

namespace uplink {

namespace {

namespace ansi {
constexpr std::string_view reset      = "\033[0m";
constexpr std::string_view bold       = "\033[1m";
constexpr std::string_view dim        = "\033[90m";
constexpr std::string_view clear_line = "\r\033[K";
}  // namespace ansi

[[nodiscard]] std::string_view level_color(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info:  return "\033[32m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::Fatal: return "\033[35m";
        case LogLevel::Off:   break;
    }
    return ansi::reset;
}

// Local wall-clock time, HH:MM:SS.mmm
[[nodiscard]] std::string clock_stamp(std::chrono::system_clock::time_point tp) {
    const auto seconds = std::chrono::system_clock::to_time_t(tp);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()
    ).count() % 1000;

    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif

    return std::format("{:02}:{:02}:{:02}.{:03}", local.tm_hour, local.tm_min, local.tm_sec, millis);
}

[[nodiscard]] std::string_view base_name(std::string_view path) noexcept {
    const auto slash = path.find_last_of("/\\");
    return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

}  // namespace

LogLevel log_level_from_string(std::string_view name) noexcept {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info")  return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "fatal" || lower == "critical") return LogLevel::Fatal;
    if (lower == "off")   return LogLevel::Off;
    return LogLevel::Info;
}

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger
// ─────────────────────────────────────────────────────────────────────────────

void ConsoleLogger::log(const LogRecord& record) {
    if (!should_log(record.level)) {
        return;
    }

    const bool detailed = record.level <= LogLevel::Debug;
    std::string line;

    if (colors_enabled_) {
        line = std::format("{}{}{} {}{}{:<5}{}",
                           ansi::clear_line, ansi::dim, clock_stamp(record.timestamp),
                           ansi::bold, level_color(record.level), to_string(record.level), ansi::reset);
        if (detailed) {
            line += std::format(" {}{}:{}{}", ansi::dim,
                                base_name(record.location.file_name()), record.location.line(), ansi::reset);
        }
    } else {
        line = std::format("{} {:<5}", clock_stamp(record.timestamp), to_string(record.level));
        if (detailed) {
            line += std::format(" {}:{}", base_name(record.location.file_name()), record.location.line());
        }
    }
    line += ' ';
    line += record.message;
    line += '\n';

    // Records from several download workers may arrive at once
    static std::mutex output_mutex;
    std::lock_guard<std::mutex> lock(output_mutex);
    *out_ << line << std::flush;
}

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger
// ─────────────────────────────────────────────────────────────────────────────

namespace {

std::unique_ptr<ILogger>& logger_instance() {
    static std::unique_ptr<ILogger> instance = std::make_unique<NullLogger>();
    return instance;
}

std::mutex& logger_mutex() {
    static std::mutex mutex;
    return mutex;
}

}  // namespace

ILogger& get_logger() noexcept {
    std::lock_guard<std::mutex> lock(logger_mutex());
    return *logger_instance();
}

void set_logger(std::unique_ptr<ILogger> logger) noexcept {
    std::lock_guard<std::mutex> lock(logger_mutex());
    if (logger) {
        logger_instance() = std::move(logger);
    } else {
        logger_instance() = std::make_unique<NullLogger>();
    }
}

}  // namespace uplink
