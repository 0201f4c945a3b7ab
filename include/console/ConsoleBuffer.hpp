#pragma once
#include <string>
#include <vector>
#include <unordered_set>
#include <optional>
#include "console/ConsoleTypes.hpp"

namespace llm_reporter {

struct ConsoleBufferConfig {
    size_t max_bytes = 50000;
    size_t max_lines = 100;
    bool strip_ansi = true;
};

struct ConsoleBufferStats {
    size_t bytes = 0;
    size_t events = 0;
    bool truncated = false;
};

/**
 * Ordered console events for a single test.
 * Byte and line capped; the first overflow appends one marker and freezes the buffer.
 * Not synchronized: ConsoleCapture serializes access.
 */
class ConsoleBuffer {
public:
    static constexpr const char* kTruncationMarker = "[Console output truncated - limit reached]";

    explicit ConsoleBuffer(ConsoleBufferConfig config = {});

    // False when the line was dropped (limit hit, frozen, or key already recorded here)
    bool add(LogLevel level,
             const ConsoleArgs& args,
             std::optional<int64_t> timestamp_ms = std::nullopt,
             ConsoleOrigin origin = ConsoleOrigin::Intercepted,
             bool is_duplicate = false,
             const std::optional<std::string>& dedup_key = std::nullopt,
             const std::optional<std::string>& test_id = std::nullopt);

    std::vector<ConsoleEvent> get_events() const { return events_; }
    ConsoleBufferStats get_stats() const;
    bool is_truncated() const { return truncated_; }

    void clear();

private:
    void add_truncation_marker();

    ConsoleBufferConfig config_;
    std::vector<ConsoleEvent> events_;
    std::unordered_set<std::string> seen_keys_;
    size_t total_bytes_ = 0;
    bool truncated_ = false;
};

} // namespace llm_reporter
