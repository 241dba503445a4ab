#pragma once

#include <format>
#include <string>
#include <utility>

namespace arbor::core {

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

const char* log_level_to_string(LogLevel level);

// Parse "trace", "debug", "info", "warn", "error" or "fatal"; anything else maps to Info
LogLevel log_level_from_string(const std::string& name);

// Log sink interface for custom log handlers
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void log(LogLevel level, const std::string& message) = 0;
};

void set_log_level(LogLevel level);
LogLevel get_log_level();

void log(LogLevel level, const char* message);

// Formatted variant, e.g. log(LogLevel::Info, "Loaded {} species", count)
template<typename... Args>
void log(LogLevel level, std::format_string<Args...> fmt, Args&&... args) {
    if (level < get_log_level()) return;
    std::string message = std::format(fmt, std::forward<Args>(args)...);
    log(level, message.c_str());
}

// Register/unregister custom log sinks
void add_log_sink(ILogSink* sink);
void remove_log_sink(ILogSink* sink);

} // namespace arbor::core
