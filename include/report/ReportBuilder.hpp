#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>
#include "report/report_schema.hpp"
#include "truncation/EarlyTruncator.hpp"
#include "truncation/LateTruncator.hpp"

namespace llm_reporter {

/**
 * Collects per-test results into a ReporterOutput. Failures are trimmed
 * fragment by fragment as they arrive; build() applies the report-wide budget.
 * Safe to feed from several test threads.
 */
class ReportBuilder {
public:
    explicit ReportBuilder(TruncationConfig config = {}, std::shared_ptr<ITokenCounter> counter = nullptr);

    void add_passed(TestResult result);
    void add_skipped(TestResult result);
    void add_failure(TestFailure failure, const CaptureResult& capture = {});

    void set_duration_ms(long long duration_ms);

    ReporterOutput build();

    const EarlyTruncator& early_truncator() const { return early_; }
    const LateTruncator& late_truncator() const { return late_; }

private:
    bool early_enabled() const { return config_.enabled && config_.enable_early_truncation; }

    TruncationConfig config_;
    EarlyTruncator early_;
    LateTruncator late_;

    std::mutex mutex_;
    std::vector<TestFailure> failures_;
    std::vector<TestResult> passed_;
    std::vector<TestResult> skipped_;
    std::optional<long long> duration_ms_;
    std::chrono::steady_clock::time_point started_ = std::chrono::steady_clock::now();
};

} // namespace llm_reporter
