#include "console/ConsoleCapture.hpp"
#include "text_utils.hpp"
#include <spdlog/spdlog.h>

namespace llm_reporter {

namespace {
thread_local const TestContext* t_current_context = nullptr;
}

// --- 1. TEST CONTEXT ---

ScopedTestContext::ScopedTestContext(TestContext ctx)
    : ctx_(std::move(ctx)), previous_(t_current_context) {
    t_current_context = &ctx_;
}

ScopedTestContext::~ScopedTestContext() {
    t_current_context = previous_;
}

const TestContext* ScopedTestContext::current() {
    return t_current_context;
}

// --- 2. LIFECYCLE ---

ConsoleCapture::ConsoleCapture(ConsoleCaptureConfig config,
                               std::shared_ptr<LogDeduplicator> deduplicator,
                               ConsoleSurface& surface)
    : config_(config), deduplicator_(std::move(deduplicator)), interceptor_(surface) {}

ConsoleCapture::~ConsoleCapture() {
    scheduler_.cancel_all();
    interceptor_.unpatch_all();
}

ConsoleBuffer& ConsoleCapture::ensure_buffer(const std::string& test_id) {
    auto& slot = buffers_[test_id];
    if (!slot) {
        slot = std::make_unique<ConsoleBuffer>(
            ConsoleBufferConfig{config_.max_bytes, config_.max_lines, config_.strip_ansi});
    }
    return *slot;
}

void ConsoleCapture::start_capture(const std::string& test_id, bool force_new) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!config_.enabled) return;
    invalidate_cleanup(test_id);
    destroyed_.erase(test_id);

    auto it = buffers_.find(test_id);
    if (it != buffers_.end()) {
        if (!force_new) return;
        spdlog::debug("Restarting capture for {} with a fresh buffer", test_id);
        it->second.reset();
    }
    ensure_buffer(test_id);

    if (!interceptor_.is_patched()) {
        interceptor_.patch_all([this](LogLevel level, const ConsoleArgs& args) {
            on_console_call(level, args);
        });
    }
}

CaptureResult ConsoleCapture::stop_capture(const std::string& test_id) {
    std::vector<ConsoleEvent> events;
    std::shared_ptr<LogDeduplicator> dedup;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!config_.enabled) return {};
        auto it = buffers_.find(test_id);
        if (it == buffers_.end()) return {};

        events = it->second->get_events();
        schedule_cleanup(test_id);
        dedup = deduplicator_;
    }

    CaptureResult result;
    if (dedup && dedup->is_enabled()) {
        result.entries = deduplicate(test_id, events);
    } else {
        result.entries = std::move(events);
    }
    return result;
}

void ConsoleCapture::ingest(const std::string& test_id, LogLevel level, const ConsoleArgs& args,
                            std::optional<int64_t> elapsed_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!config_.enabled) return;
    if ((level == LogLevel::Debug || level == LogLevel::Trace) && !config_.include_debug_output) {
        return;
    }
    // Output after stop_capture restarts the grace period instead of reviving the capture
    bool stopped = scheduler_.is_pending(test_id) || destroyed_.count(test_id) > 0;
    invalidate_cleanup(test_id);
    destroyed_.erase(test_id);
    ensure_buffer(test_id).add(level, args, elapsed_ms, ConsoleOrigin::Task, false, std::nullopt, test_id);
    if (stopped) schedule_cleanup(test_id);
}

void ConsoleCapture::clear_buffer(const std::string& test_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    scheduler_.cancel(test_id);
    generations_.erase(test_id);
    if (buffers_.erase(test_id) > 0) {
        destroyed_.insert(test_id);
    }
}

void ConsoleCapture::reset() {
    std::shared_ptr<LogDeduplicator> dedup;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        scheduler_.cancel_all();
        buffers_.clear();
        generations_.clear();
        destroyed_.clear();
        dedup = deduplicator_;
    }
    if (dedup) dedup->clear();
    interceptor_.unpatch_all();
}

CaptureResult ConsoleCapture::run_with_capture(const std::string& test_id,
                                               const std::function<void(const TestContext&)>& body) {
    start_capture(test_id);

    std::optional<std::string> body_error;
    {
        ScopedTestContext scope(TestContext{test_id, std::chrono::steady_clock::now()});
        try {
            body(*ScopedTestContext::current());
        } catch (const std::exception& e) {
            spdlog::debug("Test body {} threw: {}", test_id, e.what());
            body_error = e.what();
        }
    }

    CaptureResult result = stop_capture(test_id);
    result.body_error = std::move(body_error);
    return result;
}

// --- 3. INTERCEPTION ---

void ConsoleCapture::on_console_call(LogLevel level, const ConsoleArgs& args) {
    const TestContext* ctx = ScopedTestContext::current();
    if (!ctx) return;

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - ctx->start_time).count();

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = buffers_.find(ctx->test_id);
    if (it == buffers_.end()) {
        spdlog::debug("Dropping console {} for {}: no active capture", to_string(level), ctx->test_id);
        return;
    }
    it->second->add(level, args, elapsed, ConsoleOrigin::Intercepted, false, std::nullopt, ctx->test_id);
}

// --- 4. DEDUPLICATION ---

std::vector<ConsoleEvent> ConsoleCapture::deduplicate(const std::string& test_id,
                                                      const std::vector<ConsoleEvent>& events) {
    std::shared_ptr<LogDeduplicator> dedup;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dedup = deduplicator_;
    }
    // Per-test scope counts repeats within this test only
    if (dedup->config().scope == DeduplicationScope::PerTest) {
        dedup = std::make_shared<LogDeduplicator>(dedup->config());
    }

    std::vector<std::pair<std::string, ConsoleEvent>> firsts;
    std::unordered_set<std::string> seen;
    for (const auto& event : events) {
        LogEntry entry{event.text, event.level, Clock::now(), test_id};
        std::string key = dedup->generate_key(entry);
        dedup->is_duplicate(entry);
        if (seen.insert(key).second) {
            firsts.emplace_back(key, event);
        }
    }

    std::vector<ConsoleEvent> out;
    out.reserve(firsts.size());
    for (auto& [key, event] : firsts) {
        auto meta = dedup->get_metadata(key);
        if (meta && meta->count > 1) {
            DedupInfo info;
            info.count = meta->count;
            info.first_seen = to_iso_string(meta->first_seen);
            info.last_seen = to_iso_string(meta->last_seen);
            info.sources.assign(meta->sources.begin(), meta->sources.end());
            event.dedup = std::move(info);
        }
        out.push_back(std::move(event));
    }
    return out;
}

// --- 5. DEFERRED CLEANUP ---

void ConsoleCapture::invalidate_cleanup(const std::string& test_id) {
    if (scheduler_.cancel(test_id)) {
        spdlog::debug("Cancelled pending cleanup for {}", test_id);
    }
    auto it = generations_.find(test_id);
    if (it != generations_.end()) it->second++;
}

void ConsoleCapture::schedule_cleanup(const std::string& test_id) {
    uint64_t generation = ++generations_[test_id];
    scheduler_.schedule(test_id, std::chrono::milliseconds(config_.grace_period_ms),
                        [this, test_id, generation] { run_cleanup(test_id, generation); });
}

void ConsoleCapture::run_cleanup(const std::string& test_id, uint64_t generation) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = generations_.find(test_id);
    if (it == generations_.end() || it->second != generation) {
        spdlog::debug("Skipping stale cleanup for {} (generation {})", test_id, generation);
        return;
    }
    buffers_.erase(test_id);
    generations_.erase(it);
    destroyed_.insert(test_id);
}

// --- 6. INTROSPECTION ---

CaptureState ConsoleCapture::state(const std::string& test_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (buffers_.count(test_id)) {
        return scheduler_.is_pending(test_id) ? CaptureState::StoppedPendingCleanup
                                              : CaptureState::Capturing;
    }
    return destroyed_.count(test_id) ? CaptureState::Destroyed : CaptureState::Unstarted;
}

CaptureStats ConsoleCapture::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CaptureStats stats;
    stats.is_patched = interceptor_.is_patched();
    stats.active_buffers = buffers_.size();
    stats.pending_cleanups = scheduler_.pending_count();
    stats.tracked_generations = generations_.size();
    return stats;
}

void ConsoleCapture::update_config(const ConsoleCaptureConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
}

void ConsoleCapture::set_deduplicator(std::shared_ptr<LogDeduplicator> deduplicator) {
    std::lock_guard<std::mutex> lock(mutex_);
    deduplicator_ = std::move(deduplicator);
}

} // namespace llm_reporter
