#include "truncation/TruncationEngine.hpp"
#include "tokenization/token_counter.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>

using llm_reporter::ContentType;
using llm_reporter::EstimatingTokenCounter;
using llm_reporter::ITruncationStrategy;
using llm_reporter::kAggressiveFallbackMarker;
using llm_reporter::kTruncationFailedWarning;
using llm_reporter::TruncationContext;
using llm_reporter::TruncationEngine;
using llm_reporter::TruncationEngineConfig;
using llm_reporter::TruncationOptions;
using llm_reporter::TruncationResult;

namespace {

// Returns a fixed output, or throws when no output is given
class FixedStrategy : public ITruncationStrategy {
public:
    FixedStrategy(std::string name, int priority, std::optional<std::string> output,
                  std::shared_ptr<std::vector<std::string>> calls = nullptr)
        : name_(std::move(name)), priority_(priority), output_(std::move(output)), calls_(std::move(calls)) {}

    std::string name() const override { return name_; }
    int priority() const override { return priority_; }
    bool can_truncate(const std::string&, const TruncationContext&) const override { return true; }

    TruncationResult truncate(const std::string&, int, const TruncationContext&) override {
        if (calls_) calls_->push_back(name_);
        if (!output_) throw std::runtime_error("boom");
        return {*output_, 0, 0, true, name_, {}};
    }

    int estimate_savings(const std::string&, int, const TruncationContext&) override { return 7; }

private:
    std::string name_;
    int priority_;
    std::optional<std::string> output_;
    std::shared_ptr<std::vector<std::string>> calls_;
};

// Blocks inside truncate until released
class GatedStrategy : public ITruncationStrategy {
public:
    GatedStrategy(std::shared_ptr<std::promise<void>> entered, std::shared_future<void> release)
        : entered_(std::move(entered)), release_(std::move(release)) {}

    std::string name() const override { return "gated"; }
    int priority() const override { return 1; }
    bool can_truncate(const std::string&, const TruncationContext&) const override { return true; }

    TruncationResult truncate(const std::string&, int, const TruncationContext&) override {
        entered_->set_value();
        release_.wait();
        return {output_, 0, 0, true, name(), {}};
    }

    int estimate_savings(const std::string&, int, const TruncationContext&) override { return 0; }

private:
    std::shared_ptr<std::promise<void>> entered_;
    std::shared_future<void> release_;
    std::string output_ = "gated output";
};

TruncationEngineConfig bare_config(bool fallback) {
    TruncationEngineConfig config;
    config.register_default_strategies = false;
    config.enable_aggressive_fallback = fallback;
    return config;
}

TruncationOptions limit(int max_tokens) {
    TruncationOptions options;
    options.max_tokens = max_tokens;
    return options;
}

std::string words(int count) {
    std::string out;
    for (int i = 0; i < count; ++i) out += "word ";
    return out;
}

std::string numbered_lines(int count) {
    std::string out;
    for (int i = 1; i <= count; ++i) {
        if (i > 1) out += "\n";
        out += "processing item " + std::to_string(i) + " ok";
    }
    return out;
}

bool has_warning_containing(const TruncationResult& result, const std::string& needle) {
    return std::any_of(result.warnings.begin(), result.warnings.end(),
                       [&](const std::string& w) { return w.find(needle) != std::string::npos; });
}

} // namespace

TEST(TruncationEngineTest, ContentWithinBudgetIsUntouched) {
    TruncationEngine engine;
    auto result = engine.truncate("hello world", "gpt-4", ContentType::Text, limit(100));
    EXPECT_EQ(result.content, "hello world");
    EXPECT_EQ(result.strategy_used, "none");
    EXPECT_FALSE(result.was_truncated);
}

TEST(TruncationEngineTest, BlankContentIsReportedEmpty) {
    TruncationEngine engine;
    auto result = engine.truncate("  \n ", "gpt-4", ContentType::Text, limit(10));
    EXPECT_EQ(result.content, "");
    EXPECT_EQ(result.strategy_used, "empty-content");
}

TEST(TruncationEngineTest, DefaultStrategiesFitTheBudget) {
    TruncationEngine engine;
    auto result = engine.truncate(numbered_lines(200), "gpt-4", ContentType::Text, limit(50));

    EXPECT_TRUE(result.was_truncated);
    EXPECT_LE(result.token_count, 50);
    EXPECT_NE(result.strategy_used, "aggressive-fallback");
    EXPECT_EQ(result.token_count, EstimatingTokenCounter().estimate_tokens(result.content));
}

TEST(TruncationEngineTest, DefaultRegistryHasFourStrategies) {
    TruncationEngine engine;
    auto names = engine.strategy_names();
    ASSERT_EQ(names.size(), 4u);
    EXPECT_NE(engine.get_strategy("stack-trace"), nullptr);
    EXPECT_NE(engine.get_strategy("head-tail"), nullptr);
    EXPECT_EQ(engine.get_strategy("missing"), nullptr);
}

TEST(TruncationEngineTest, ThrowingStrategyBecomesWarning) {
    TruncationEngine engine(bare_config(false));
    engine.register_strategy(std::make_unique<FixedStrategy>("explodes", 10, std::nullopt));
    engine.register_strategy(std::make_unique<FixedStrategy>("short", 1, std::string("ok")));

    auto result = engine.truncate(words(100), "gpt-4", ContentType::Text, limit(20));
    EXPECT_EQ(result.strategy_used, "short");
    EXPECT_EQ(result.content, "ok");
    EXPECT_TRUE(has_warning_containing(result, "explodes failed: boom"));
}

TEST(TruncationEngineTest, PreferredStrategiesRunBeforePriorityOrder) {
    auto calls = std::make_shared<std::vector<std::string>>();
    TruncationEngine engine(bare_config(false));
    engine.register_strategy(std::make_unique<FixedStrategy>("high", 10, std::string("high"), calls));
    engine.register_strategy(std::make_unique<FixedStrategy>("low", 1, std::string("low"), calls));

    auto options = limit(20);
    options.preferred_strategies = {"low"};
    auto result = engine.truncate(words(100), "gpt-4", ContentType::Text, options);
    EXPECT_EQ(result.strategy_used, "low");
    ASSERT_EQ(calls->size(), 1u);

    calls->clear();
    result = engine.truncate(words(100), "gpt-4", ContentType::Text, limit(20));
    EXPECT_EQ(result.strategy_used, "high");
}

TEST(TruncationEngineTest, NoStrategiesWithoutFallbackFails) {
    TruncationEngine engine(bare_config(false));
    std::string content = words(100);
    auto result = engine.truncate(content, "gpt-4", ContentType::Text, limit(20));

    EXPECT_EQ(result.strategy_used, "no-strategies");
    EXPECT_EQ(result.content, content);
    EXPECT_FALSE(result.was_truncated);
    EXPECT_TRUE(has_warning_containing(result, kTruncationFailedWarning));
}

TEST(TruncationEngineTest, OversizedAttemptsReportClosest) {
    TruncationEngine engine(bare_config(false));
    engine.register_strategy(std::make_unique<FixedStrategy>("bloated", 5, words(50)));

    auto result = engine.truncate(words(100), "gpt-4", ContentType::Text, limit(20));
    EXPECT_EQ(result.strategy_used, "all-strategies-failed");
    EXPECT_TRUE(has_warning_containing(result, "bloated came closest"));
    EXPECT_TRUE(has_warning_containing(result, kTruncationFailedWarning));
}

TEST(TruncationEngineTest, MaxAttemptsStopsTheLoop) {
    auto calls = std::make_shared<std::vector<std::string>>();
    auto config = bare_config(false);
    config.max_attempts = 1;
    TruncationEngine engine(config);
    engine.register_strategy(std::make_unique<FixedStrategy>("first", 5, words(50), calls));
    engine.register_strategy(std::make_unique<FixedStrategy>("second", 1, std::string("fits"), calls));

    auto result = engine.truncate(words(100), "gpt-4", ContentType::Text, limit(20));
    EXPECT_EQ(result.strategy_used, "all-strategies-failed");
    EXPECT_EQ(*calls, std::vector<std::string>{"first"});
}

TEST(TruncationEngineTest, AggressiveFallbackFitsAndMarksOutput) {
    TruncationEngine engine(bare_config(true));
    auto result = engine.truncate(words(800), "gpt-4", ContentType::Text, limit(100));

    EXPECT_EQ(result.strategy_used, "aggressive-fallback");
    EXPECT_TRUE(result.was_truncated);
    EXPECT_LE(result.token_count, 100);
    std::string marker = kAggressiveFallbackMarker;
    ASSERT_GE(result.content.size(), marker.size());
    EXPECT_EQ(result.content.substr(result.content.size() - marker.size()), marker);
}

TEST(TruncationEngineTest, StatsCountOnlyTruncations) {
    TruncationEngine engine(bare_config(false));
    engine.register_strategy(std::make_unique<FixedStrategy>("short", 1, std::string("ok")));

    engine.truncate("tiny", "gpt-4", ContentType::Text, limit(20));
    engine.truncate(words(100), "gpt-4", ContentType::Log, limit(20));

    auto stats = engine.get_stats();
    EXPECT_EQ(stats.total_truncations, 1);
    EXPECT_EQ(stats.strategy_usage["short"], 1);
    EXPECT_EQ(stats.content_type_stats["log"], 1);
    EXPECT_GT(stats.total_tokens_saved, 0);

    engine.reset_stats();
    EXPECT_EQ(engine.get_stats().total_truncations, 0);
}

TEST(TruncationEngineTest, RegistryReplacesAndRemoves) {
    TruncationEngine engine(bare_config(false));
    engine.register_strategy(std::make_unique<FixedStrategy>("a", 1, std::string("first")));
    engine.register_strategy(std::make_unique<FixedStrategy>("a", 1, std::string("second")));
    EXPECT_EQ(engine.strategy_names().size(), 1u);

    auto result = engine.truncate(words(100), "gpt-4", ContentType::Text, limit(20));
    EXPECT_EQ(result.content, "second");

    EXPECT_TRUE(engine.unregister_strategy("a"));
    EXPECT_FALSE(engine.unregister_strategy("a"));
}

TEST(TruncationEngineTest, UnregisterDuringTruncateKeepsStrategyAlive) {
    TruncationEngine engine(bare_config(false));
    auto entered = std::make_shared<std::promise<void>>();
    std::promise<void> release;
    engine.register_strategy(std::make_unique<GatedStrategy>(entered, release.get_future().share()));

    auto running = std::async(std::launch::async, [&engine] {
        return engine.truncate(words(100), "gpt-4", ContentType::Text, limit(20));
    });
    entered->get_future().wait();

    EXPECT_TRUE(engine.unregister_strategy("gated"));
    EXPECT_TRUE(engine.strategy_names().empty());
    release.set_value();

    auto result = running.get();
    EXPECT_EQ(result.content, "gated output");
    EXPECT_EQ(result.strategy_used, "gated");
}

TEST(TruncationEngineTest, LookedUpStrategyOutlivesUnregister) {
    TruncationEngine engine(bare_config(false));
    engine.register_strategy(std::make_unique<FixedStrategy>("kept", 1, std::string("out")));
    auto held = engine.get_strategy("kept");
    ASSERT_NE(held, nullptr);
    EXPECT_TRUE(engine.unregister_strategy("kept"));
    EXPECT_EQ(held->name(), "kept");
    EXPECT_EQ(engine.get_strategy("kept"), nullptr);
}

TEST(TruncationEngineTest, LongSingleLinePayloadFitsBudget) {
    TruncationEngine engine;
    std::string payload = "{\"payload\":\"" + std::string(100000, 'x') + "\"}";
    auto result = engine.truncate(payload, "gpt-4", ContentType::Text, limit(1000));

    EXPECT_TRUE(result.was_truncated);
    EXPECT_LE(result.token_count, 1000);
    EXPECT_GT(result.token_count, 0);
}

TEST(TruncationEngineTest, EstimatesAndThresholds) {
    TruncationEngine engine;
    EXPECT_EQ(engine.estimate_savings("tiny", "gpt-4", ContentType::Text, limit(20)), 0);
    EXPECT_GT(engine.estimate_savings(words(400), "gpt-4", ContentType::Text, limit(20)), 0);

    // gpt-4 keeps a 15% margin: 100 requested means 85 usable
    EXPECT_TRUE(engine.needs_truncation(words(80), "gpt-4", 100));
    EXPECT_FALSE(engine.needs_truncation(words(60), "gpt-4", 100));
}

TEST(TruncationEngineTest, RejectsNonPositiveAttempts) {
    TruncationEngineConfig config;
    config.max_attempts = 0;
    EXPECT_THROW(TruncationEngine engine(config), std::invalid_argument);
}
