#include "truncation/LateTruncator.hpp"

#include <gtest/gtest.h>
#include <string>

using llm_reporter::cap_console_category;
using llm_reporter::ConsoleOutput;
using llm_reporter::LateTruncator;
using llm_reporter::ReporterOutput;
using llm_reporter::TestFailure;
using llm_reporter::TestResult;
using llm_reporter::TruncationConfig;

namespace {

TruncationConfig late_config(int max_tokens) {
    TruncationConfig config;
    config.enabled = true;
    config.max_tokens = max_tokens;
    return config;
}

TestResult result_named(int i, const std::string& status) {
    TestResult r;
    r.test = "case number " + std::to_string(i);
    r.file = "tests/example.test.ts";
    r.line = i;
    r.status = status;
    r.suite = {"outer", "inner"};
    return r;
}

TestFailure failure_named(int i) {
    TestFailure f;
    f.test = "failing case " + std::to_string(i);
    f.file = "tests/example.test.ts";
    f.line = 10 + i;
    f.error.message = "boom";
    f.error.type = "Error";
    return f;
}

ReporterOutput report_with(int passed, int skipped, int failed) {
    ReporterOutput report;
    report.summary.passed = passed;
    report.summary.skipped = skipped;
    report.summary.failed = failed;
    report.summary.total = passed + skipped + failed;
    report.summary.timestamp = "2024-01-01T00:00:00.000Z";

    if (passed > 0) {
        report.passed.emplace();
        for (int i = 0; i < passed; ++i) report.passed->push_back(result_named(i, "passed"));
    }
    if (skipped > 0) {
        report.skipped.emplace();
        for (int i = 0; i < skipped; ++i) report.skipped->push_back(result_named(i, "skipped"));
    }
    if (failed > 0) {
        report.failures.emplace();
        for (int i = 0; i < failed; ++i) report.failures->push_back(failure_named(i));
    }
    return report;
}

std::vector<std::string> long_lines(int count, size_t width) {
    std::vector<std::string> lines;
    for (int i = 0; i < count; ++i) lines.push_back(std::string(width, static_cast<char>('a' + i % 26)));
    return lines;
}

} // namespace

TEST(LateTruncatorTest, DisabledConfigReturnsReportUnchanged) {
    LateTruncator truncator;
    auto report = report_with(50, 5, 2);
    TruncationConfig config = late_config(10);
    config.enabled = false;

    EXPECT_FALSE(truncator.needs_truncation(report, config));
    EXPECT_EQ(truncator.apply(report, config).to_json(), report.to_json());

    config.enabled = true;
    config.enable_late_truncation = false;
    EXPECT_EQ(truncator.apply(report, config).to_json(), report.to_json());
    EXPECT_TRUE(truncator.get_metrics().empty());
}

TEST(LateTruncatorTest, ReportWithinBudgetIsUntouched) {
    LateTruncator truncator;
    auto report = report_with(3, 1, 1);
    auto out = truncator.apply(report, late_config(100000));
    EXPECT_EQ(out.to_json(), report.to_json());
    EXPECT_TRUE(truncator.get_metrics().empty());
}

TEST(LateTruncatorTest, PassedGoesBeforeSkipped) {
    LateTruncator truncator;
    auto report = report_with(200, 3, 1);

    ReporterOutput without_passed = report;
    without_passed.passed.reset();
    int budget = truncator.estimate_tokens(without_passed);

    auto out = truncator.apply(report, late_config(budget));
    EXPECT_FALSE(out.passed.has_value());
    ASSERT_TRUE(out.skipped.has_value());
    EXPECT_EQ(out.skipped->size(), 3u);
    ASSERT_TRUE(out.failures.has_value());
    EXPECT_EQ(out.summary.passed, 200);

    auto metrics = truncator.get_metrics();
    ASSERT_EQ(metrics.size(), 1u);
    EXPECT_EQ(metrics[0].phases_applied, std::vector<std::string>{"remove-low-value"});
    EXPECT_GT(metrics[0].tokens_removed, 0);
}

TEST(LateTruncatorTest, TrimFailuresDropsDebugAndTypesAssertions) {
    LateTruncator truncator;
    auto report = report_with(0, 0, 1);
    TestFailure& failure = report.failures->front();
    failure.console = ConsoleOutput{};
    failure.console->logs = {"starting"};
    failure.console->debug = long_lines(50, 100);
    failure.error.assertion = llm_reporter::AssertionDetails{};
    failure.error.assertion->expected = 1;
    failure.error.assertion->actual = "one";

    ReporterOutput expected = report;
    expected.failures->front().console->debug.clear();
    int budget = truncator.estimate_tokens(expected) + 30;

    auto out = truncator.apply(report, late_config(budget));
    ASSERT_TRUE(out.failures.has_value());
    const TestFailure& trimmed = out.failures->front();
    ASSERT_TRUE(trimmed.console.has_value());
    EXPECT_TRUE(trimmed.console->debug.empty());
    EXPECT_EQ(trimmed.console->logs, std::vector<std::string>{"starting"});
    ASSERT_TRUE(trimmed.error.assertion.has_value());
    EXPECT_EQ(trimmed.error.assertion->expected_type, std::string("number"));
    EXPECT_EQ(trimmed.error.assertion->actual_type, std::string("string"));

    auto metrics = truncator.get_metrics();
    ASSERT_EQ(metrics.size(), 1u);
    EXPECT_EQ(metrics[0].phases_applied, (std::vector<std::string>{"remove-low-value", "trim-failures"}));
}

TEST(LateTruncatorTest, ProgressiveRoundsKeepFiveFailures) {
    LateTruncator truncator;
    auto report = report_with(10, 0, 12);
    for (auto& failure : *report.failures) {
        failure.console = ConsoleOutput{};
        failure.console->errors = long_lines(20, 80);
        failure.error.message = std::string(2000, 'm');
    }

    auto out = truncator.apply(report, late_config(200));
    ASSERT_TRUE(out.failures.has_value());
    EXPECT_EQ(out.failures->size(), LateTruncator::kMaxFailuresKept);
    for (const auto& failure : *out.failures) {
        EXPECT_LT(failure.error.message.size(), 2000u);
    }
    // Counts describe the run, not what survived
    EXPECT_EQ(out.summary.failed, 12);

    auto metrics = truncator.get_metrics();
    ASSERT_EQ(metrics.size(), 1u);
    EXPECT_EQ(metrics[0].phases_applied.back(), "progressive-tightening");
    EXPECT_LT(metrics[0].truncated_tokens, metrics[0].original_tokens);
}

TEST(LateTruncatorTest, ConsoleCategoryCaps) {
    auto lines = long_lines(10, 300);
    EXPECT_TRUE(cap_console_category(lines, 0).empty());
    EXPECT_EQ(cap_console_category({"short"}, 100), std::vector<std::string>{"short"});

    auto capped = cap_console_category(lines, 400);
    ASSERT_FALSE(capped.empty());
    size_t total = 0;
    for (const auto& line : capped) total += line.size() + 1;
    EXPECT_LE(total, 400u + std::string("\n...[truncated]").size() + 1);
}
