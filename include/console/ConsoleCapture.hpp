#pragma once
#include <string>
#include <memory>
#include <unordered_map>
#include <unordered_set>
#include <functional>
#include <mutex>
#include <chrono>
#include <cstdint>
#include "console/ConsoleTypes.hpp"
#include "console/ConsoleBuffer.hpp"
#include "console/ConsoleInterceptor.hpp"
#include "console/CleanupScheduler.hpp"
#include "dedup/LogDeduplicator.hpp"

namespace llm_reporter {

struct ConsoleCaptureConfig {
    bool enabled = true;
    int grace_period_ms = 100;
    size_t max_bytes = 50000;
    size_t max_lines = 100;
    bool include_debug_output = false;
    bool strip_ansi = true;
};

// Identity of the test whose body is running on the current thread
struct TestContext {
    std::string test_id;
    std::chrono::steady_clock::time_point start_time = std::chrono::steady_clock::now();
};

/**
 * Installs a TestContext for the current thread and restores the previous one on exit.
 * Work handed to another thread carries the TestContext value and opens its own scope there.
 */
class ScopedTestContext {
public:
    explicit ScopedTestContext(TestContext ctx);
    ~ScopedTestContext();

    ScopedTestContext(const ScopedTestContext&) = delete;
    ScopedTestContext& operator=(const ScopedTestContext&) = delete;

    static const TestContext* current();

private:
    TestContext ctx_;
    const TestContext* previous_;
};

enum class CaptureState {
    Unstarted,
    Capturing,
    StoppedPendingCleanup,
    Destroyed
};

struct CaptureStats {
    bool is_patched = false;
    size_t active_buffers = 0;
    size_t pending_cleanups = 0;
    size_t tracked_generations = 0;
};

class ConsoleCapture {
public:
    explicit ConsoleCapture(ConsoleCaptureConfig config = {},
                            std::shared_ptr<LogDeduplicator> deduplicator = nullptr,
                            ConsoleSurface& surface = ConsoleSurface::instance());
    ~ConsoleCapture();

    ConsoleCapture(const ConsoleCapture&) = delete;
    ConsoleCapture& operator=(const ConsoleCapture&) = delete;

    void start_capture(const std::string& test_id, bool force_new = false);
    CaptureResult stop_capture(const std::string& test_id);

    // For output collected outside the thread-local context (runner-flushed stdio)
    void ingest(const std::string& test_id, LogLevel level, const ConsoleArgs& args,
                std::optional<int64_t> elapsed_ms = std::nullopt);

    void clear_buffer(const std::string& test_id);
    void reset();

    // start -> body under a ScopedTestContext -> stop. A std::exception from the body lands in body_error.
    CaptureResult run_with_capture(const std::string& test_id,
                                   const std::function<void(const TestContext&)>& body);

    CaptureState state(const std::string& test_id) const;
    CaptureStats get_stats() const;

    void update_config(const ConsoleCaptureConfig& config);
    void set_deduplicator(std::shared_ptr<LogDeduplicator> deduplicator);

private:
    void on_console_call(LogLevel level, const ConsoleArgs& args);
    std::vector<ConsoleEvent> deduplicate(const std::string& test_id,
                                          const std::vector<ConsoleEvent>& events);

    // Callers hold mutex_
    ConsoleBuffer& ensure_buffer(const std::string& test_id);
    void invalidate_cleanup(const std::string& test_id);
    void schedule_cleanup(const std::string& test_id);

    void run_cleanup(const std::string& test_id, uint64_t generation);

    ConsoleCaptureConfig config_;
    std::shared_ptr<LogDeduplicator> deduplicator_;
    ConsoleInterceptor interceptor_;

    std::unordered_map<std::string, std::unique_ptr<ConsoleBuffer>> buffers_;
    std::unordered_map<std::string, uint64_t> generations_;
    std::unordered_set<std::string> destroyed_;
    mutable std::mutex mutex_;

    // Declared last: its worker joins before the maps above go away
    CleanupScheduler scheduler_;
};

} // namespace llm_reporter
