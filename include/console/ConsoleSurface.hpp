#pragma once
#include <array>
#include <functional>
#include <mutex>
#include "console/ConsoleTypes.hpp"

namespace llm_reporter {

using ConsoleFn = std::function<void(LogLevel, const ConsoleArgs&)>;

/**
 * The process console: one replaceable function slot per console method.
 * Test code writes through it; ConsoleInterceptor swaps slots to observe writes.
 */
class ConsoleSurface {
public:
    // Singleton access for the real process console
    static ConsoleSurface& instance() {
        static ConsoleSurface surface;
        return surface;
    }

    // Slots start out writing to stdout (log/info/debug/trace) or stderr (warn/error)
    ConsoleSurface();

    ConsoleFn get(LogLevel method) const;
    void set(LogLevel method, ConsoleFn fn);

    // Invokes the slot outside the lock so a handler may write to the console itself
    void call(LogLevel method, const ConsoleArgs& args) const;

    template<typename... Args>
    void log(const Args&... args) { call(LogLevel::Log, ConsoleArgs{json(args)...}); }
    template<typename... Args>
    void error(const Args&... args) { call(LogLevel::Error, ConsoleArgs{json(args)...}); }
    template<typename... Args>
    void warn(const Args&... args) { call(LogLevel::Warn, ConsoleArgs{json(args)...}); }
    template<typename... Args>
    void info(const Args&... args) { call(LogLevel::Info, ConsoleArgs{json(args)...}); }
    template<typename... Args>
    void debug(const Args&... args) { call(LogLevel::Debug, ConsoleArgs{json(args)...}); }
    template<typename... Args>
    void trace(const Args&... args) { call(LogLevel::Trace, ConsoleArgs{json(args)...}); }

private:
    std::array<ConsoleFn, kLogLevelCount> slots_;
    mutable std::mutex mutex_;
};

} // namespace llm_reporter
