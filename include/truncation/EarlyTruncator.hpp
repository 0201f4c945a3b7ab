#pragma once
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "truncation/truncation_config.hpp"
#include "tokenization/token_counter.hpp"

namespace llm_reporter {

struct EarlyTruncationMetrics {
    int original_tokens = 0;
    int truncated_tokens = 0;
    int tokens_removed = 0;
    std::string strategy;
    std::chrono::system_clock::time_point timestamp;
};

struct EarlyTruncationResult {
    std::string content;
    EarlyTruncationMetrics metrics;
};

/**
 * Synchronous per-fragment truncation used while a report is assembled.
 * Works on token estimates only, so it never calls into a real tokenizer.
 */
class EarlyTruncator {
public:
    static constexpr size_t kMaxMetrics = 100;

    explicit EarlyTruncator(TruncationConfig config, std::shared_ptr<ITokenCounter> counter = nullptr);

    bool needs_truncation(const std::string& content) const;
    EarlyTruncationResult truncate(const std::string& content,
                                   std::optional<ConsoleCategory> category = std::nullopt);

    std::vector<EarlyTruncationMetrics> get_metrics() const;
    void update_config(const TruncationConfig& config);
    TruncationConfig config() const;

private:
    int max_tokens() const;

    std::string apply_simple(const std::string& content, int max_tokens) const;
    std::string apply_smart(const std::string& content, int max_tokens, std::optional<ConsoleCategory> category) const;
    std::string apply_priority(const std::string& content, int max_tokens, std::optional<ConsoleCategory> category) const;
    std::string apply_error(const std::string& content, int max_tokens) const;

    EarlyTruncationResult make_result(std::string content, int original_tokens, const std::string& strategy);

    mutable std::mutex mutex_;
    TruncationConfig config_;
    std::shared_ptr<ITokenCounter> counter_;
    std::deque<EarlyTruncationMetrics> metrics_;
};

} // namespace llm_reporter
