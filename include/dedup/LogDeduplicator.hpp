#pragma once
#include <string>
#include <vector>
#include <set>
#include <map>
#include <unordered_map>
#include <optional>
#include <mutex>
#include <chrono>
#include <cstdint>
#include "log_level.hpp"
#include "dedup/deduplication_config.hpp"
#include "dedup/message_normalizer.hpp"

namespace llm_reporter {

using Clock = std::chrono::system_clock;

struct LogEntry {
    std::string message;
    LogLevel level = LogLevel::Log;
    Clock::time_point timestamp = Clock::now();
    std::optional<std::string> test_id;
};

struct DedupEntry {
    std::string key;
    LogLevel level = LogLevel::Log;
    std::string original_message;
    std::string normalized_message;
    Clock::time_point first_seen;
    Clock::time_point last_seen;
    int count = 1;
    std::set<std::string> sources;
};

struct DeduplicationStats {
    size_t total_logs = 0;
    size_t unique_logs = 0;
    size_t duplicates_removed = 0;
    size_t cache_size = 0;
    double processing_time_ms = 0.0;
};

/**
 * Bounded (level, normalized message) store.
 * Eviction drops the entry with the oldest last_seen; ties go to the entry inserted first.
 * Thread-safe: tests running on separate threads share one instance.
 */
class LogDeduplicator {
public:
    explicit LogDeduplicator(DeduplicationConfig config = {});

    bool is_duplicate(const LogEntry& entry);
    std::string generate_key(const LogEntry& entry) const;

    std::optional<DedupEntry> get_metadata(const std::string& key) const;
    std::vector<DedupEntry> get_all_entries() const;
    DeduplicationStats get_stats() const;

    void clear();

    bool is_enabled() const { return config_.enabled; }
    const DeduplicationConfig& config() const { return config_; }

private:
    using OrderKey = std::pair<Clock::time_point, uint64_t>;

    struct Slot {
        DedupEntry entry;
        uint64_t seq;
        std::map<OrderKey, std::string>::iterator order_it;
    };

    void evict_oldest();  // caller holds mutex_

    DeduplicationConfig config_;
    NormalizationOptions norm_;

    std::unordered_map<std::string, Slot> entries_;
    std::map<OrderKey, std::string> lru_index_;
    uint64_t next_seq_ = 0;

    DeduplicationStats stats_;
    mutable std::mutex mutex_;
};

} // namespace llm_reporter
