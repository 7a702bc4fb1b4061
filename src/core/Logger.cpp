#include "core/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <unistd.h>

namespace core {

std::mutex Logger::mutex_;
std::atomic<LogLevel> Logger::level_{LogLevel::INFO};

namespace {

const char* levelTag(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "[DEBUG]";
        case LogLevel::INFO:  return "[INFO] ";
        case LogLevel::WARN:  return "[WARN] ";
        case LogLevel::ERROR: return "[ERROR]";
    }
    return "[?]    ";
}

const char* levelColour(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[36m"; // Cyan
        case LogLevel::INFO:  return "\033[32m"; // Green
        case LogLevel::WARN:  return "\033[33m"; // Yellow
        case LogLevel::ERROR: return "\033[31m"; // Red
    }
    return "";
}

} // namespace

void Logger::log(LogLevel level, const std::string& message) {
    if (!enabled(level)) return;

    const bool toStderr = level >= LogLevel::WARN;
    std::ostream& out = toStderr ? std::cerr : std::cout;
    // Colour only on a terminal; redirected output stays plain text
    static const bool colourOut = isatty(STDOUT_FILENO) == 1;
    static const bool colourErr = isatty(STDERR_FILENO) == 1;
    const bool colour = toStderr ? colourErr : colourOut;

    const auto now = std::chrono::system_clock::now();
    const std::time_t time = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::tm local{};
    localtime_r(&time, &local);

    std::lock_guard<std::mutex> lock(mutex_);
    out << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << "." << std::setfill('0') << std::setw(3)
        << ms.count() << "] ";
    if (colour) {
        out << levelColour(level) << levelTag(level) << "\033[0m ";
    } else {
        out << levelTag(level) << " ";
    }
    out << message << std::endl;
}

std::optional<LogLevel> Logger::parseLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error" || lower == "critical") return LogLevel::ERROR;
    return std::nullopt;
}

} // namespace core
