#pragma once
#include <string>
#include <optional>

namespace llm_reporter {

// Console method that produced a line. Doubles as the dedup level.
enum class LogLevel {
    Log,
    Error,
    Warn,
    Info,
    Debug,
    Trace
};

inline const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Log:   return "log";
        case LogLevel::Error: return "error";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Info:  return "info";
        case LogLevel::Debug: return "debug";
        case LogLevel::Trace: return "trace";
    }
    return "log";
}

inline std::optional<LogLevel> parse_log_level(const std::string& name) {
    if (name == "log") return LogLevel::Log;
    if (name == "error") return LogLevel::Error;
    if (name == "warn") return LogLevel::Warn;
    if (name == "info") return LogLevel::Info;
    if (name == "debug") return LogLevel::Debug;
    if (name == "trace") return LogLevel::Trace;
    return std::nullopt;
}

constexpr int kLogLevelCount = 6;

} // namespace llm_reporter
