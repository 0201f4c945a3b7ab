#include "report/ReportBuilder.hpp"

#include <gtest/gtest.h>
#include <thread>

using llm_reporter::CaptureResult;
using llm_reporter::ConsoleEvent;
using llm_reporter::DedupInfo;
using llm_reporter::LogLevel;
using llm_reporter::ReportBuilder;
using llm_reporter::ReporterOutput;
using llm_reporter::TestFailure;
using llm_reporter::TestResult;
using llm_reporter::TruncationConfig;

namespace {

TestResult result_named(const std::string& name) {
    TestResult r;
    r.test = name;
    r.file = "tests/math.test.ts";
    r.line = 3;
    r.duration = 12;
    return r;
}

TestFailure failure_named(const std::string& name) {
    TestFailure f;
    f.test = name;
    f.file = "tests/math.test.ts";
    f.line = 20;
    f.suite = {"math", "division"};
    f.error.type = "AssertionError";
    return f;
}

ConsoleEvent event(LogLevel level, const std::string& text, int count = 1) {
    ConsoleEvent e;
    e.level = level;
    e.text = text;
    if (count > 1) {
        DedupInfo info;
        info.count = count;
        e.dedup = info;
    }
    return e;
}

} // namespace

TEST(ReportBuilderTest, SummaryCountsEveryOutcome) {
    ReportBuilder builder;
    builder.add_passed(result_named("adds"));
    builder.add_passed(result_named("subtracts"));
    builder.add_skipped(result_named("divides by zero"));
    builder.add_failure(failure_named("divides"));
    builder.set_duration_ms(1234);

    ReporterOutput report = builder.build();
    EXPECT_EQ(report.summary.total, 4);
    EXPECT_EQ(report.summary.passed, 2);
    EXPECT_EQ(report.summary.failed, 1);
    EXPECT_EQ(report.summary.skipped, 1);
    EXPECT_EQ(report.summary.duration, 1234);
    EXPECT_FALSE(report.summary.timestamp.empty());

    ASSERT_TRUE(report.passed.has_value());
    EXPECT_EQ(report.passed->front().status, "passed");
    ASSERT_TRUE(report.skipped.has_value());
    EXPECT_EQ(report.skipped->front().status, "skipped");
}

TEST(ReportBuilderTest, EmptySectionsAreOmitted) {
    ReportBuilder builder;
    builder.add_passed(result_named("only"));
    auto j = builder.build().to_json();
    EXPECT_TRUE(j.contains("passed"));
    EXPECT_FALSE(j.contains("failures"));
    EXPECT_FALSE(j.contains("skipped"));
}

TEST(ReportBuilderTest, ConsoleEventsAreGroupedByLevel) {
    CaptureResult capture;
    capture.entries = {event(LogLevel::Log, "computing"), event(LogLevel::Warn, "slow path", 3),
                       event(LogLevel::Error, "bad divisor"), event(LogLevel::Debug, "raw=0"),
                       event(LogLevel::Trace, "enter divide"), event(LogLevel::Info, "done")};

    ReportBuilder builder;
    builder.add_failure(failure_named("divides"), capture);
    auto report = builder.build();

    ASSERT_TRUE(report.failures.has_value());
    const auto& console = report.failures->front().console;
    ASSERT_TRUE(console.has_value());
    EXPECT_EQ(console->logs, std::vector<std::string>{"computing"});
    EXPECT_EQ(console->warns, std::vector<std::string>{"slow path [x3]"});
    EXPECT_EQ(console->errors, std::vector<std::string>{"bad divisor"});
    EXPECT_EQ(console->info, std::vector<std::string>{"done"});
    EXPECT_EQ(console->debug, (std::vector<std::string>{"raw=0", "enter divide"}));
}

TEST(ReportBuilderTest, BodyErrorFillsMissingMessage) {
    CaptureResult capture;
    capture.body_error = "expected 2 to equal 3";

    ReportBuilder builder;
    builder.add_failure(failure_named("divides"), capture);

    TestFailure explicit_message = failure_named("multiplies");
    explicit_message.error.message = "kept as is";
    builder.add_failure(explicit_message, capture);

    auto report = builder.build();
    ASSERT_EQ(report.failures->size(), 2u);
    EXPECT_EQ((*report.failures)[0].error.message, "expected 2 to equal 3");
    EXPECT_EQ((*report.failures)[1].error.message, "kept as is");
    EXPECT_FALSE((*report.failures)[0].console.has_value());
}

TEST(ReportBuilderTest, EarlyTruncationShrinksLongFragments) {
    TruncationConfig config;
    config.enabled = true;
    config.max_tokens = 100;
    config.enable_late_truncation = false;

    TestFailure failure = failure_named("floods");
    for (int i = 0; i < 200; ++i) failure.error.message += "line " + std::to_string(i) + " of output\n";

    CaptureResult capture;
    for (int i = 0; i < 100; ++i) capture.entries.push_back(event(LogLevel::Log, "tick " + std::to_string(i)));

    ReportBuilder builder(config);
    builder.add_failure(failure, capture);
    auto report = builder.build();

    const auto& stored = report.failures->front();
    EXPECT_LT(stored.error.message.size(), failure.error.message.size());
    ASSERT_TRUE(stored.console.has_value());
    EXPECT_EQ(stored.console->logs.size(), 1u);
    EXPECT_FALSE(builder.early_truncator().get_metrics().empty());
}

TEST(ReportBuilderTest, ConcurrentFeedsAreAllCounted) {
    ReportBuilder builder;
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&builder, t] {
            for (int i = 0; i < 25; ++i) {
                builder.add_passed(result_named("t" + std::to_string(t) + "-" + std::to_string(i)));
            }
        });
    }
    for (auto& w : workers) w.join();
    EXPECT_EQ(builder.build().summary.passed, 100);
}

TEST(ReportBuilderTest, ReportSurvivesJsonRoundTrip) {
    CaptureResult capture;
    capture.entries = {event(LogLevel::Error, "bad divisor")};

    TestFailure failure = failure_named("divides");
    failure.error.message = "expected 2 to equal 3";
    failure.error.stack = "AssertionError: expected 2 to equal 3\n    at tests/math.test.ts:20:5";
    failure.error.assertion = llm_reporter::AssertionDetails{};
    failure.error.assertion->expected = 3;
    failure.error.assertion->actual = 2;
    failure.error.assertion->op = "strictEqual";

    ReportBuilder builder;
    builder.add_passed(result_named("adds"));
    builder.add_failure(failure, capture);
    auto report = builder.build();

    auto j = report.to_json();
    EXPECT_EQ(j["failures"][0]["error"]["assertion"]["operator"], "strictEqual");
    EXPECT_EQ(ReporterOutput::from_json(j).to_json(), j);
    EXPECT_THROW(ReporterOutput::from_json(nlohmann::json::object()), std::invalid_argument);
}
