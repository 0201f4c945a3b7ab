#include "report/ReportBuilder.hpp"
#include "text_utils.hpp"
#include <spdlog/spdlog.h>

namespace llm_reporter {

ReportBuilder::ReportBuilder(TruncationConfig config, std::shared_ptr<ITokenCounter> counter)
    : config_(config), early_(config, counter), late_(counter) {}

void ReportBuilder::add_passed(TestResult result) {
    result.status = "passed";
    std::lock_guard<std::mutex> lock(mutex_);
    passed_.push_back(std::move(result));
}

void ReportBuilder::add_skipped(TestResult result) {
    result.status = "skipped";
    std::lock_guard<std::mutex> lock(mutex_);
    skipped_.push_back(std::move(result));
}

void ReportBuilder::add_failure(TestFailure failure, const CaptureResult& capture) {
    if (failure.error.message.empty() && capture.body_error) {
        failure.error.message = *capture.body_error;
    }
    if (!capture.entries.empty()) {
        failure.console = ConsoleOutput::from_events(capture.entries);
    }

    if (early_enabled()) {
        failure.error.message = early_.truncate(failure.error.message, ConsoleCategory::Errors).content;

        if (failure.console) {
            for (auto category : {ConsoleCategory::Logs, ConsoleCategory::Errors, ConsoleCategory::Warns,
                                  ConsoleCategory::Info, ConsoleCategory::Debug}) {
                auto& lines = failure.console->category(category);
                if (lines.empty()) continue;
                std::string joined = join_lines(lines);
                if (!early_.needs_truncation(joined)) continue;
                lines = {early_.truncate(joined, category).content};
            }
        }
    }

    spdlog::debug("Recorded failure: {}", failure.test);
    std::lock_guard<std::mutex> lock(mutex_);
    failures_.push_back(std::move(failure));
}

void ReportBuilder::set_duration_ms(long long duration_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    duration_ms_ = duration_ms;
}

ReporterOutput ReportBuilder::build() {
    ReporterOutput report;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        report.summary.passed = static_cast<int>(passed_.size());
        report.summary.failed = static_cast<int>(failures_.size());
        report.summary.skipped = static_cast<int>(skipped_.size());
        report.summary.total = report.summary.passed + report.summary.failed + report.summary.skipped;
        report.summary.duration = duration_ms_ ? *duration_ms_
                                               : std::chrono::duration_cast<std::chrono::milliseconds>(
                                                     std::chrono::steady_clock::now() - started_).count();
        report.summary.timestamp = to_iso_string(std::chrono::system_clock::now());

        if (!failures_.empty()) report.failures = failures_;
        if (!passed_.empty()) report.passed = passed_;
        if (!skipped_.empty()) report.skipped = skipped_;
    }

    return late_.apply(report, config_);
}

} // namespace llm_reporter
