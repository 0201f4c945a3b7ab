#include "dedup/LogDeduplicator.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace llm_reporter {

LogDeduplicator::LogDeduplicator(DeduplicationConfig config)
    : config_(std::move(config)) {
    validate_deduplication_config(config_);
    norm_.strip_ansi = config_.strip_ansi_codes;
    norm_.strip_timestamps = config_.strip_timestamps;
    norm_.normalize_whitespace = config_.normalize_whitespace;
}

std::string LogDeduplicator::generate_key(const LogEntry& entry) const {
    std::string normalized = normalize_message(entry.message, norm_);
    return std::string(to_string(entry.level)) + ":" + hash_message(normalized);
}

bool LogDeduplicator::is_duplicate(const LogEntry& entry) {
    if (!config_.enabled) return false;

    auto start = std::chrono::steady_clock::now();
    std::string key = generate_key(entry);

    std::lock_guard<std::mutex> lock(mutex_);
    stats_.total_logs++;

    bool duplicate = false;
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        Slot& slot = it->second;
        slot.entry.count++;
        slot.entry.last_seen = entry.timestamp;
        if (config_.include_sources && entry.test_id) {
            slot.entry.sources.insert(*entry.test_id);
        }

        // Re-index under the new last_seen, keeping the original insertion rank
        lru_index_.erase(slot.order_it);
        slot.order_it = lru_index_.emplace(OrderKey{entry.timestamp, slot.seq}, key).first;

        stats_.duplicates_removed++;
        duplicate = true;
    } else {
        if (entries_.size() >= static_cast<size_t>(config_.max_cache_entries)) {
            evict_oldest();
        }

        Slot slot;
        slot.entry.key = key;
        slot.entry.level = entry.level;
        slot.entry.original_message = entry.message;
        slot.entry.normalized_message = normalize_message(entry.message, norm_);
        slot.entry.first_seen = entry.timestamp;
        slot.entry.last_seen = entry.timestamp;
        slot.entry.count = 1;
        if (config_.include_sources && entry.test_id) {
            slot.entry.sources.insert(*entry.test_id);
        }
        slot.seq = next_seq_++;
        slot.order_it = lru_index_.emplace(OrderKey{entry.timestamp, slot.seq}, key).first;

        entries_.emplace(key, std::move(slot));
        stats_.unique_logs++;
    }

    stats_.cache_size = entries_.size();
    stats_.processing_time_ms += std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();
    return duplicate;
}

void LogDeduplicator::evict_oldest() {
    if (lru_index_.empty()) return;
    auto oldest = lru_index_.begin();
    spdlog::debug("Dedup cache full ({}), evicting {}", entries_.size(), oldest->second);
    entries_.erase(oldest->second);
    lru_index_.erase(oldest);
}

std::optional<DedupEntry> LogDeduplicator::get_metadata(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;
    return it->second.entry;
}

std::vector<DedupEntry> LogDeduplicator::get_all_entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::pair<uint64_t, const DedupEntry*>> ordered;
    ordered.reserve(entries_.size());
    for (const auto& [key, slot] : entries_) {
        ordered.emplace_back(slot.seq, &slot.entry);
    }
    std::sort(ordered.begin(), ordered.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<DedupEntry> out;
    out.reserve(ordered.size());
    for (const auto& [seq, entry] : ordered) out.push_back(*entry);
    return out;
}

DeduplicationStats LogDeduplicator::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    DeduplicationStats copy = stats_;
    copy.cache_size = entries_.size();
    return copy;
}

void LogDeduplicator::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    lru_index_.clear();
    next_seq_ = 0;
    stats_ = DeduplicationStats{};
}

} // namespace llm_reporter
