#pragma once
#include <array>
#include <optional>
#include <mutex>
#include <spdlog/spdlog.h>
#include "console/ConsoleSurface.hpp"

namespace llm_reporter {

using InterceptHandler = std::function<void(LogLevel, const ConsoleArgs&)>;

/**
 * Owns the original-vs-wrapped slot table of a ConsoleSurface.
 * The wrapper feeds the handler first, then always runs the original slot;
 * handler exceptions are logged and never reach the caller.
 */
class ConsoleInterceptor {
public:
    explicit ConsoleInterceptor(ConsoleSurface& surface = ConsoleSurface::instance())
        : surface_(surface) {}

    ~ConsoleInterceptor() { unpatch_all(); }

    ConsoleInterceptor(const ConsoleInterceptor&) = delete;
    ConsoleInterceptor& operator=(const ConsoleInterceptor&) = delete;

    // Returns false if the method was already patched
    bool patch(LogLevel method, InterceptHandler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& original = originals_[static_cast<size_t>(method)];
        if (original) return false;

        ConsoleFn saved = surface_.get(method);
        original = saved;

        surface_.set(method, [handler = std::move(handler), saved](LogLevel level, const ConsoleArgs& args) {
            try {
                handler(level, args);
            } catch (const std::exception& e) {
                spdlog::error("Console interception failed for {}: {}", to_string(level), e.what());
            } catch (...) {
                spdlog::error("Console interception failed for {}: unknown exception", to_string(level));
            }
            if (saved) saved(level, args);
        });
        return true;
    }

    void patch_all(const InterceptHandler& handler) {
        for (int i = 0; i < kLogLevelCount; ++i) {
            patch(static_cast<LogLevel>(i), handler);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        patched_ = true;
    }

    bool unpatch(LogLevel method) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& original = originals_[static_cast<size_t>(method)];
        if (!original) return false;
        surface_.set(method, std::move(*original));
        original.reset();
        return true;
    }

    void unpatch_all() {
        for (int i = 0; i < kLogLevelCount; ++i) {
            unpatch(static_cast<LogLevel>(i));
        }
        std::lock_guard<std::mutex> lock(mutex_);
        patched_ = false;
    }

    bool is_method_patched(LogLevel method) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return originals_[static_cast<size_t>(method)].has_value();
    }

    bool is_patched() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return patched_;
    }

private:
    ConsoleSurface& surface_;
    std::array<std::optional<ConsoleFn>, kLogLevelCount> originals_;
    bool patched_ = false;
    mutable std::mutex mutex_;
};

} // namespace llm_reporter
