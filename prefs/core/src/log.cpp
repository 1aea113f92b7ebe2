#include <prefs/core/log.hpp>
#include <algorithm>
#include <atomic>
#include <cstdio>
#include <mutex>
#include <vector>

namespace prefs::core {

static std::atomic<LogLevel> s_log_level{LogLevel::Info};
static std::vector<ILogSink*> s_log_sinks;
static std::mutex s_sink_mutex;

void log(LogLevel level, const char* message) {
    if (level < s_log_level.load()) return;

    if (level >= LogLevel::Warn) {
        std::fprintf(stderr, "[%s] %s\n", log_level_name(level), message);
    } else {
        std::printf("[%s] %s\n", log_level_name(level), message);
    }

    // Forward to registered sinks
    std::lock_guard<std::mutex> lock(s_sink_mutex);
    for (auto* sink : s_log_sinks) {
        if (sink) {
            sink->log(level, "prefs", message);
        }
    }
}

void set_log_level(LogLevel level) {
    s_log_level = level;
}

LogLevel get_log_level() {
    return s_log_level.load();
}

bool parse_log_level(const std::string& name, LogLevel& out) {
    if (name == "trace") { out = LogLevel::Trace; return true; }
    if (name == "debug") { out = LogLevel::Debug; return true; }
    if (name == "info")  { out = LogLevel::Info;  return true; }
    if (name == "warn")  { out = LogLevel::Warn;  return true; }
    if (name == "error") { out = LogLevel::Error; return true; }
    if (name == "fatal") { out = LogLevel::Fatal; return true; }
    return false;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Fatal: return "fatal";
        default:              return "unknown";
    }
}

void add_log_sink(ILogSink* sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(s_sink_mutex);
    s_log_sinks.push_back(sink);
}

void remove_log_sink(ILogSink* sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(s_sink_mutex);
    s_log_sinks.erase(
        std::remove(s_log_sinks.begin(), s_log_sinks.end(), sink),
        s_log_sinks.end()
    );
}

} // namespace prefs::core
