#include "truncation/priorities.hpp"

#include <gtest/gtest.h>

#include <regex>
#include <string>

using llm_reporter::ContentPriority;
using llm_reporter::ContentType;
using llm_reporter::ContentTypeConfig;
using llm_reporter::get_content_priority;
using llm_reporter::get_preserve_ratio;
using llm_reporter::get_section_weight;
using llm_reporter::ImportanceFactors;
using llm_reporter::PriorityManager;
using llm_reporter::PriorityRule;
using llm_reporter::should_preserve_content;

TEST(PrioritiesTest, TypeDefaultsApplyWithoutMatchingRules) {
    EXPECT_EQ(get_content_priority("plain words", ContentType::Text), ContentPriority::Medium);
    EXPECT_EQ(get_content_priority("{\"a\": 1}", ContentType::Json), ContentPriority::High);
    EXPECT_EQ(get_content_priority("anything", ContentType::Error), ContentPriority::Critical);
    EXPECT_EQ(get_content_priority("server started", ContentType::Log), ContentPriority::Low);
}

TEST(PrioritiesTest, RulesOnlyRaisePriority) {
    EXPECT_EQ(get_content_priority("connection error on retry", ContentType::Log), ContentPriority::Critical);
    EXPECT_EQ(get_content_priority("deprecated call", ContentType::Log), ContentPriority::Medium);
    // Debug keyword would lower a High default; it must not
    EXPECT_EQ(get_content_priority("debug dump", ContentType::Json), ContentPriority::High);
}

TEST(PrioritiesTest, TypeScopedRulesIgnoreOtherTypes) {
    EXPECT_EQ(get_content_priority("export class Foo", ContentType::Text), ContentPriority::Medium);
    EXPECT_EQ(get_content_priority("assertion really failed", ContentType::Test), ContentPriority::Critical);
}

TEST(PrioritiesTest, TestFailurePairsNeedWordBoundaries) {
    EXPECT_EQ(get_content_priority("Expect(value).to.equal(3)", ContentType::Test), ContentPriority::Critical);
    EXPECT_EQ(get_content_priority("expected to be truthy", ContentType::Test), ContentPriority::Critical);
    EXPECT_EQ(get_content_priority("expect value toggled", ContentType::Test), ContentPriority::High);
    EXPECT_EQ(get_content_priority("unexpected to", ContentType::Test), ContentPriority::High);
    // Both words must sit on the same line
    EXPECT_EQ(get_content_priority("expect value\nto", ContentType::Test), ContentPriority::High);
}

TEST(PrioritiesTest, LongSingleLineDoesNotExhaustStack) {
    const std::string filler(100000, 'a');
    EXPECT_EQ(get_content_priority("test " + filler, ContentType::Test), ContentPriority::High);
    EXPECT_EQ(get_content_priority("expect " + filler + " to", ContentType::Test), ContentPriority::Critical);
    EXPECT_EQ(get_content_priority(filler + " warning", ContentType::Log), ContentPriority::Medium);
}

TEST(PrioritiesTest, PreserveRatiosAndPressure) {
    EXPECT_DOUBLE_EQ(get_preserve_ratio(ContentPriority::Critical), 0.9);
    EXPECT_DOUBLE_EQ(get_preserve_ratio(ContentPriority::Disposable), 0.1);

    EXPECT_TRUE(should_preserve_content(ContentPriority::Critical, 0.9));
    EXPECT_FALSE(should_preserve_content(ContentPriority::Low, 0.5));
    EXPECT_FALSE(should_preserve_content(ContentPriority::Disposable, 0.0));
}

TEST(PrioritiesTest, SectionWeights) {
    EXPECT_EQ(get_section_weight("error_messages"), 100);
    EXPECT_EQ(get_section_weight("debug_logs"), 20);
    EXPECT_EQ(get_section_weight("unknown_section"), 50);
}

TEST(PrioritiesTest, ManagerAcceptsCustomRulesAndConfigs) {
    PriorityManager manager;
    manager.add_priority_rule(PriorityRule{llm_reporter::regex_matcher(std::regex("SEV1")), ContentPriority::Critical, std::nullopt, "pager"});
    EXPECT_EQ(manager.determine_priority("SEV1 incident", ContentType::Markdown), ContentPriority::Critical);

    manager.update_content_type_config(ContentType::Log,
                                       ContentTypeConfig{ContentType::Log, ContentPriority::High, false, 0.5});
    EXPECT_EQ(manager.determine_priority("boot", ContentType::Log), ContentPriority::High);
}

TEST(PrioritiesTest, ImportanceScoreIsBounded) {
    PriorityManager manager;
    double base = manager.score_content_importance("fatal error", ContentType::Error);
    EXPECT_DOUBLE_EQ(base, 100.0);

    double low = manager.score_content_importance("server started", ContentType::Log);
    EXPECT_DOUBLE_EQ(low, 40.0);

    ImportanceFactors factors{1.0, 1.0, true};
    EXPECT_DOUBLE_EQ(manager.score_content_importance("server started", ContentType::Log, factors), 100.0);
}
