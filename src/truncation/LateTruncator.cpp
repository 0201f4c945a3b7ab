#include "truncation/LateTruncator.hpp"
#include "truncation/truncation_utils.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace llm_reporter {

namespace {

constexpr size_t kMaxMetrics = 100;

int budget_for(const TruncationConfig& config) {
    return config.max_tokens ? *config.max_tokens : LateTruncator::kDefaultMaxTokens;
}

bool late_enabled(const TruncationConfig& config) {
    return config.enabled && config.enable_late_truncation;
}

} // namespace

std::vector<std::string> cap_console_category(const std::vector<std::string>& lines, size_t char_limit) {
    if (char_limit == 0) return {};
    if (join_lines(lines).size() <= char_limit) return lines;

    auto capped = apply_fair_caps(lines, char_limit, 50);
    std::string combined = join_lines(capped);
    if (combined.size() > char_limit) {
        size_t cut = char_limit > 20 ? char_limit - 20 : 0;
        return {safe_trim_to_chars(combined, cut, true) + "\n...[truncated]"};
    }
    return capped;
}

LateTruncator::LateTruncator(std::shared_ptr<ITokenCounter> counter)
    : counter_(counter_or_default(std::move(counter))) {}

int LateTruncator::estimate_tokens(const ReporterOutput& report) const {
    return counter_->estimate_tokens(
        report.to_json().dump(2, ' ', false, nlohmann::json::error_handler_t::replace));
}

bool LateTruncator::needs_truncation(const ReporterOutput& report, const TruncationConfig& config) const {
    if (!late_enabled(config)) return false;
    return estimate_tokens(report) > budget_for(config);
}

ReporterOutput LateTruncator::apply(const ReporterOutput& report, const TruncationConfig& config) {
    if (!late_enabled(config)) return report;

    int budget = budget_for(config);
    int original = estimate_tokens(report);
    if (original <= budget) return report;

    ReporterOutput current = report;
    std::vector<std::string> phases;

    phases.push_back("remove-low-value");
    if (remove_low_value_sections(current, budget)) {
        record_metrics(original, estimate_tokens(current), std::move(phases));
        return current;
    }

    phases.push_back("trim-failures");
    trim_failures(current);
    if (estimate_tokens(current) <= budget) {
        record_metrics(original, estimate_tokens(current), std::move(phases));
        return current;
    }

    phases.push_back("progressive-tightening");
    progressive_tightening(current, budget);

    int final_tokens = estimate_tokens(current);
    if (final_tokens > budget) {
        spdlog::warn("Late truncation left the report at {} tokens (budget {})", final_tokens, budget);
    }
    record_metrics(original, final_tokens, std::move(phases));
    return current;
}

// --- PHASE 1 ---
bool LateTruncator::remove_low_value_sections(ReporterOutput& report, int budget) const {
    if (report.passed) {
        report.passed.reset();
        if (estimate_tokens(report) <= budget) return true;
    }
    if (report.skipped) {
        report.skipped.reset();
    }
    return estimate_tokens(report) <= budget;
}

// --- PHASE 2 ---
void LateTruncator::trim_failures(ReporterOutput& report) const {
    if (!report.failures) return;
    const ConsoleCaps caps{0, 100, 100, 100, 400};
    for (auto& failure : *report.failures) {
        failure = truncate_failure(failure, caps);
    }
}

// --- PHASE 3 ---
void LateTruncator::progressive_tightening(ReporterOutput& report, int budget) const {
    for (int round = 1; round <= kMaxRounds && estimate_tokens(report) > budget; ++round) {
        if (!report.failures || report.failures->empty()) break;

        double tightness = 1.0 - round * 0.2;
        ConsoleCaps caps;
        caps.debug = 0;
        caps.info = static_cast<size_t>(std::floor(50 * tightness));
        caps.warns = caps.info;
        caps.logs = caps.info;
        caps.errors = static_cast<size_t>(std::floor(200 * tightness));

        for (auto& failure : *report.failures) {
            failure = truncate_failure(failure, caps);
            if (round < 2) continue;

            TestError& error = failure.error;
            if (error.stack) {
                *error.stack = truncate_stack_trace(*error.stack, static_cast<size_t>(std::max(3, 10 - round * 2)));
            }
            if (error.message.size() > 512) {
                error.message = safe_trim_to_chars(error.message, 512 - round * 100) + "...";
            }
            if (error.context && error.context->code.size() > 1) {
                error.context->code = {"[code context truncated]"};
            }
        }

        if (round >= 4 && report.failures->size() > kMaxFailuresKept) {
            report.failures->resize(kMaxFailuresKept);
        }
        spdlog::debug("Late truncation round {}: {} tokens", round, estimate_tokens(report));
    }
}

TestFailure LateTruncator::truncate_failure(const TestFailure& failure, const ConsoleCaps& caps) const {
    TestFailure result = failure;

    if (result.console) {
        ConsoleOutput& console = *result.console;
        console.debug = cap_console_category(console.debug, caps.debug);
        console.info = cap_console_category(console.info, caps.info);
        console.warns = cap_console_category(console.warns, caps.warns);
        console.logs = cap_console_category(console.logs, caps.logs);
        console.errors = cap_console_category(console.errors, caps.errors);
    }

    TestError& error = result.error;
    if (error.stack) {
        *error.stack = truncate_stack_trace(*error.stack, 10, true);
    }
    if (error.context) {
        ErrorContext& ctx = *error.context;
        if (!ctx.code.empty()) {
            ctx.code = truncate_code_context(ctx.code, ctx.line_number, 2);
        }
        if (ctx.expected) ctx.expected = truncate_assertion_value(*ctx.expected, 200);
        if (ctx.actual) ctx.actual = truncate_assertion_value(*ctx.actual, 200);
    }
    if (error.assertion) {
        AssertionDetails& assertion = *error.assertion;
        if (!assertion.expected_type) assertion.expected_type = json_value_type(assertion.expected);
        if (!assertion.actual_type) assertion.actual_type = json_value_type(assertion.actual);
        assertion.expected = truncate_assertion_value(assertion.expected, 200);
        assertion.actual = truncate_assertion_value(assertion.actual, 200);
    }
    return result;
}

// --- METRICS ---
void LateTruncator::record_metrics(int original, int truncated, std::vector<std::string> phases) {
    spdlog::info("Late truncation: {} -> {} tokens ({} phase(s))", original, truncated, phases.size());

    LateTruncationMetrics metrics;
    metrics.original_tokens = original;
    metrics.truncated_tokens = truncated;
    metrics.tokens_removed = original - truncated;
    metrics.phases_applied = std::move(phases);
    metrics.timestamp = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    metrics_.push_back(std::move(metrics));
    while (metrics_.size() > kMaxMetrics) metrics_.pop_front();
}

std::vector<LateTruncationMetrics> LateTruncator::get_metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {metrics_.begin(), metrics_.end()};
}

} // namespace llm_reporter
