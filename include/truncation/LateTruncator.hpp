#pragma once
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "report/report_schema.hpp"
#include "truncation/truncation_config.hpp"
#include "tokenization/token_counter.hpp"

namespace llm_reporter {

struct LateTruncationMetrics {
    int original_tokens = 0;
    int truncated_tokens = 0;
    int tokens_removed = 0;
    std::vector<std::string> phases_applied;
    std::chrono::system_clock::time_point timestamp;
};

// Per-category character caps for console output
struct ConsoleCaps {
    size_t debug = 0;
    size_t info = 0;
    size_t warns = 0;
    size_t logs = 0;
    size_t errors = 0;
};

/**
 * Whole-report token budget enforcement. Phases run in order and stop
 * as soon as the pretty-printed report fits:
 *   1. remove-low-value        drop passed, then skipped
 *   2. trim-failures           fixed caps on console, stack, code, assertions
 *   3. progressive-tightening  up to 5 rounds of shrinking caps
 */
class LateTruncator {
public:
    static constexpr int kDefaultMaxTokens = 100000;
    static constexpr int kMaxRounds = 5;
    static constexpr size_t kMaxFailuresKept = 5;

    explicit LateTruncator(std::shared_ptr<ITokenCounter> counter = nullptr);

    ReporterOutput apply(const ReporterOutput& report, const TruncationConfig& config);
    bool needs_truncation(const ReporterOutput& report, const TruncationConfig& config) const;

    int estimate_tokens(const ReporterOutput& report) const;
    std::vector<LateTruncationMetrics> get_metrics() const;

private:
    bool remove_low_value_sections(ReporterOutput& report, int budget) const;
    void trim_failures(ReporterOutput& report) const;
    void progressive_tightening(ReporterOutput& report, int budget) const;

    TestFailure truncate_failure(const TestFailure& failure, const ConsoleCaps& caps) const;
    void record_metrics(int original, int truncated, std::vector<std::string> phases);

    std::shared_ptr<ITokenCounter> counter_;
    mutable std::mutex mutex_;
    std::deque<LateTruncationMetrics> metrics_;
};

// Fair per-line caps first; a single trimmed line when still over
std::vector<std::string> cap_console_category(const std::vector<std::string>& lines, size_t char_limit);

} // namespace llm_reporter
