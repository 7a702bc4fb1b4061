#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace core {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

/**
 * Process-wide logger shared by the accept loop and every connection thread.
 *
 * DEBUG and INFO go to stdout, WARN and ERROR to stderr. Each line is written
 * whole under one mutex. Messages below the minimum level are dropped before
 * their arguments are formatted.
 */
class Logger {
public:
    static void log(LogLevel level, const std::string& message);

    static void setLevel(LogLevel level) { level_.store(level, std::memory_order_relaxed); }
    [[nodiscard]] static LogLevel level() { return level_.load(std::memory_order_relaxed); }
    [[nodiscard]] static bool enabled(LogLevel level) { return level >= Logger::level(); }

    /**
     * Parse "debug" / "info" / "warn" / "warning" / "error" (case-insensitive).
     */
    [[nodiscard]] static std::optional<LogLevel> parseLevel(const std::string& name);

    template<typename... Args>
    static void debug(const Args&... args) { write(LogLevel::DEBUG, args...); }

    template<typename... Args>
    static void info(const Args&... args) { write(LogLevel::INFO, args...); }

    template<typename... Args>
    static void warn(const Args&... args) { write(LogLevel::WARN, args...); }

    template<typename... Args>
    static void error(const Args&... args) { write(LogLevel::ERROR, args...); }

private:
    template<typename... Args>
    static void write(LogLevel level, const Args&... args) {
        if (!enabled(level)) return;
        std::ostringstream ss;
        (ss << ... << args);
        log(level, ss.str());
    }

    static std::mutex mutex_;
    static std::atomic<LogLevel> level_;
};

} // namespace core
