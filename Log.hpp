// Log.hpp
//
// Leveled logging on top of fmt. Messages go to stderr with a level tag so
// results printed to stdout stay machine-readable.
#pragma once
#include <fmt/core.h>
#include <string>
#include <utility>

namespace NodeInterp {

enum class LogLevel { Error = 0, Warn, Info, Debug, Trace };

// Process-wide threshold; messages above it are dropped
void setLogLevel(LogLevel level);
LogLevel logLevel();
// Parses "error", "warn", "info", "debug", "trace"; throws std::invalid_argument
LogLevel parseLogLevel(const std::string& name);

namespace detail {
void writeLog(LogLevel level, const std::string& message);
}

template <typename... Args>
void logAt(LogLevel level, fmt::format_string<Args...> format, Args&&... args) {
    if (level > logLevel()) return;
    detail::writeLog(level, fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void logError(fmt::format_string<Args...> format, Args&&... args) {
    logAt(LogLevel::Error, format, std::forward<Args>(args)...);
}
template <typename... Args>
void logWarn(fmt::format_string<Args...> format, Args&&... args) {
    logAt(LogLevel::Warn, format, std::forward<Args>(args)...);
}
template <typename... Args>
void logInfo(fmt::format_string<Args...> format, Args&&... args) {
    logAt(LogLevel::Info, format, std::forward<Args>(args)...);
}
template <typename... Args>
void logDebug(fmt::format_string<Args...> format, Args&&... args) {
    logAt(LogLevel::Debug, format, std::forward<Args>(args)...);
}
template <typename... Args>
void logTrace(fmt::format_string<Args...> format, Args&&... args) {
    logAt(LogLevel::Trace, format, std::forward<Args>(args)...);
}

} // namespace NodeInterp
