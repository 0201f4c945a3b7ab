#include "dedup/deduplication_config.hpp"
#include <stdexcept>

namespace llm_reporter {

void validate_deduplication_config(const DeduplicationConfig& config) {
    if (config.max_cache_entries <= 0) {
        throw std::invalid_argument("maxCacheEntries must be a positive number");
    }
    if (config.max_cache_entries > kMaxCacheEntriesLimit) {
        throw std::invalid_argument("maxCacheEntries exceeds maximum limit of " +
                                    std::to_string(kMaxCacheEntriesLimit));
    }
}

DeduplicationConfig parse_deduplication_config(const nlohmann::json& j) {
    DeduplicationConfig config;
    if (j.is_null()) return config;

    if (j.is_boolean()) {
        config.enabled = j.get<bool>();
        return config;
    }
    if (!j.is_object()) {
        throw std::invalid_argument("deduplicateLogs must be a boolean or an object");
    }

    config.enabled = j.value("enabled", config.enabled);
    config.max_cache_entries = j.value("maxCacheEntries", config.max_cache_entries);
    config.include_sources = j.value("includeSources", config.include_sources);
    config.normalize_whitespace = j.value("normalizeWhitespace", config.normalize_whitespace);
    config.strip_timestamps = j.value("stripTimestamps", config.strip_timestamps);
    config.strip_ansi_codes = j.value("stripAnsiCodes", config.strip_ansi_codes);

    std::string scope = j.value("scope", std::string("global"));
    if (scope == "global") config.scope = DeduplicationScope::Global;
    else if (scope == "per-test") config.scope = DeduplicationScope::PerTest;
    else throw std::invalid_argument("Unknown deduplication scope: " + scope);

    validate_deduplication_config(config);
    return config;
}

} // namespace llm_reporter
