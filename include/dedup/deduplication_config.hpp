#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace llm_reporter {

enum class DeduplicationScope { Global, PerTest };

constexpr int kDefaultMaxCacheEntries = 10000;
constexpr int kMaxCacheEntriesLimit = 100000;

struct DeduplicationConfig {
    bool enabled = true;
    int max_cache_entries = kDefaultMaxCacheEntries;
    bool include_sources = false;
    bool normalize_whitespace = true;
    bool strip_timestamps = true;
    bool strip_ansi_codes = true;
    DeduplicationScope scope = DeduplicationScope::Global;
};

// Throws std::invalid_argument on out-of-range limits.
void validate_deduplication_config(const DeduplicationConfig& config);

// Accepts `true`, `false`, or a partial object; fills the rest with defaults.
DeduplicationConfig parse_deduplication_config(const nlohmann::json& j);

} // namespace llm_reporter
