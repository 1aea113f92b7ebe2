#pragma once

#include <format>
#include <string>
#include <utility>

namespace prefs::core {

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

// Log sink interface for custom log handlers
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void log(LogLevel level, const std::string& category, const std::string& message) = 0;
};

void log(LogLevel level, const char* message);
void set_log_level(LogLevel level);
LogLevel get_log_level();

// Formatted variant: core::log(LogLevel::Info, "[Store] Loaded {} keys", n);
template<typename... Args>
void log(LogLevel level, std::format_string<Args...> fmt, Args&&... args) {
    if (level < get_log_level()) return;
    std::string message = std::format(fmt, std::forward<Args>(args)...);
    log(level, message.c_str());
}

// Parse "trace", "debug", "info", "warn", "error", "fatal" (case-sensitive).
// Returns false and leaves `out` untouched for anything else.
bool parse_log_level(const std::string& name, LogLevel& out);
const char* log_level_name(LogLevel level);

// Register/unregister custom log sinks
void add_log_sink(ILogSink* sink);
void remove_log_sink(ILogSink* sink);

} // namespace prefs::core
