#include "truncation/context_window.hpp"

#include <gtest/gtest.h>

using llm_reporter::calculate_truncation_target;
using llm_reporter::ContentPriority;
using llm_reporter::ContentType;
using llm_reporter::create_truncation_context;
using llm_reporter::get_context_window_size;
using llm_reporter::get_effective_max_tokens;
using llm_reporter::get_model_context_info;
using llm_reporter::is_model_supported;
using llm_reporter::TruncationContextOptions;
using llm_reporter::would_exceed_context;

TEST(ContextWindowTest, EffectiveLimitsApplySafetyMargin) {
    EXPECT_EQ(get_effective_max_tokens("gpt-4"), 108800);
    EXPECT_EQ(get_effective_max_tokens("gpt-3.5-turbo"), 13108);
    EXPECT_EQ(get_effective_max_tokens("claude-3-opus"), 180000);
}

TEST(ContextWindowTest, CustomMaxIsCappedByWindow) {
    EXPECT_EQ(get_effective_max_tokens("gpt-4", 1000), 850);
    EXPECT_EQ(get_effective_max_tokens("gpt-4", 200), 170);
    EXPECT_EQ(get_effective_max_tokens("gpt-4", 10000000), 108800);
    EXPECT_EQ(get_effective_max_tokens("gpt-4", 0), 108800);
}

TEST(ContextWindowTest, UnknownModelsFallBackToDefault) {
    EXPECT_FALSE(is_model_supported("mystery-model"));
    EXPECT_EQ(get_context_window_size("mystery-model"), get_context_window_size("gpt-4"));
    EXPECT_TRUE(is_model_supported("gpt-4o"));
}

TEST(ContextWindowTest, ExceedCheckUsesEffectiveLimit) {
    EXPECT_FALSE(would_exceed_context(85, "gpt-4", 100));
    EXPECT_TRUE(would_exceed_context(86, "gpt-4", 100));
}

TEST(ContextWindowTest, ContextCarriesOptions) {
    TruncationContextOptions options;
    options.max_tokens = 500;
    options.priority = ContentPriority::High;
    options.metadata = {{"headRatio", 0.5}};
    auto ctx = create_truncation_context("gpt-4", ContentType::Log, options);
    EXPECT_EQ(ctx.max_tokens, 500);
    EXPECT_EQ(ctx.priority, ContentPriority::High);
    EXPECT_EQ(ctx.content_type, ContentType::Log);
    EXPECT_DOUBLE_EQ(ctx.metadata.value("headRatio", 0.0), 0.5);

    auto defaults = create_truncation_context("gpt-4", ContentType::Text);
    EXPECT_EQ(defaults.max_tokens, 108800);
}

TEST(ContextWindowTest, TruncationTargetDependsOnPriority) {
    EXPECT_EQ(calculate_truncation_target(50, 100, ContentPriority::Low), 50);
    EXPECT_EQ(calculate_truncation_target(1000, 100, ContentPriority::Disposable), 100);
    EXPECT_EQ(calculate_truncation_target(1000, 100, ContentPriority::Critical), 900);
    EXPECT_EQ(calculate_truncation_target(1000, 100, ContentPriority::Low), 400);
}

TEST(ContextWindowTest, ModelInfoThresholds) {
    auto info = get_model_context_info("gpt-4", 1000);
    EXPECT_EQ(info.context_window, 128000);
    EXPECT_EQ(info.effective_max_tokens, 850);
    EXPECT_EQ(info.warning_threshold, 680);
    EXPECT_EQ(info.required_threshold, 807);
}
