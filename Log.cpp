// Log.cpp
#include "Log.hpp"
#include <atomic>
#include <cstdio>
#include <stdexcept>

namespace NodeInterp {

namespace {
std::atomic<int> currentLevel{static_cast<int>(LogLevel::Warn)};

const char* levelTag(LogLevel level) {
    switch (level) {
    case LogLevel::Error: return "error";
    case LogLevel::Warn: return "warn";
    case LogLevel::Info: return "info";
    case LogLevel::Debug: return "debug";
    case LogLevel::Trace: return "trace";
    }
    return "?";
}
} // namespace

void setLogLevel(LogLevel level) { currentLevel = static_cast<int>(level); }

LogLevel logLevel() { return static_cast<LogLevel>(currentLevel.load()); }

LogLevel parseLogLevel(const std::string& name) {
    if (name == "error") return LogLevel::Error;
    if (name == "warn") return LogLevel::Warn;
    if (name == "info") return LogLevel::Info;
    if (name == "debug") return LogLevel::Debug;
    if (name == "trace") return LogLevel::Trace;
    throw std::invalid_argument("Unknown log level: " + name);
}

namespace detail {
void writeLog(LogLevel level, const std::string& message) {
    fmt::print(stderr, "[{}] {}\n", levelTag(level), message);
}
} // namespace detail

} // namespace NodeInterp
