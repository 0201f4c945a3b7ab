#include "console/ConsoleBuffer.hpp"
#include "console/arg_formatter.hpp"

#include <gtest/gtest.h>

using llm_reporter::ConsoleArgs;
using llm_reporter::ConsoleBuffer;
using llm_reporter::ConsoleBufferConfig;
using llm_reporter::ConsoleOrigin;
using llm_reporter::LogLevel;
using llm_reporter::serialize_console_arg;

TEST(ConsoleBufferTest, StoresEventsInOrder) {
    ConsoleBuffer buffer;
    EXPECT_TRUE(buffer.add(LogLevel::Log, ConsoleArgs{"first"}));
    EXPECT_TRUE(buffer.add(LogLevel::Error, ConsoleArgs{"second", 2}, 15, ConsoleOrigin::Task));

    auto events = buffer.get_events();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].text, "first");
    EXPECT_FALSE(events[0].args.has_value());
    EXPECT_EQ(events[1].text, "second 2");
    EXPECT_EQ(events[1].level, LogLevel::Error);
    EXPECT_EQ(events[1].origin, ConsoleOrigin::Task);
    EXPECT_EQ(events[1].timestamp_ms, 15);
    ASSERT_TRUE(events[1].args.has_value());
    EXPECT_EQ(events[1].args->size(), 2u);
}

TEST(ConsoleBufferTest, LineLimitAppendsSingleMarker) {
    ConsoleBuffer buffer(ConsoleBufferConfig{50000, 3, true});
    for (int i = 0; i < 3; ++i) {
        EXPECT_TRUE(buffer.add(LogLevel::Log, ConsoleArgs{"line " + std::to_string(i)}));
    }
    EXPECT_FALSE(buffer.add(LogLevel::Log, ConsoleArgs{"overflow"}));
    EXPECT_FALSE(buffer.add(LogLevel::Log, ConsoleArgs{"more"}));

    auto events = buffer.get_events();
    ASSERT_EQ(events.size(), 4u);
    EXPECT_EQ(events.back().text, ConsoleBuffer::kTruncationMarker);
    EXPECT_EQ(events.back().level, LogLevel::Warn);
    EXPECT_TRUE(buffer.is_truncated());
}

TEST(ConsoleBufferTest, ByteLimitAppendsMarker) {
    ConsoleBuffer buffer(ConsoleBufferConfig{10, 100, true});
    EXPECT_TRUE(buffer.add(LogLevel::Log, ConsoleArgs{"hello"}));
    EXPECT_FALSE(buffer.add(LogLevel::Log, ConsoleArgs{"world!"}));

    auto stats = buffer.get_stats();
    EXPECT_EQ(stats.bytes, 5u);
    EXPECT_EQ(stats.events, 2u);
    EXPECT_TRUE(stats.truncated);
}

TEST(ConsoleBufferTest, DedupKeyAdmitsOnlyFirstOccurrence) {
    ConsoleBuffer buffer;
    EXPECT_TRUE(buffer.add(LogLevel::Log, ConsoleArgs{"a"}, std::nullopt, ConsoleOrigin::Intercepted, false, "k1"));
    EXPECT_FALSE(buffer.add(LogLevel::Log, ConsoleArgs{"a"}, std::nullopt, ConsoleOrigin::Intercepted, false, "k1"));
    EXPECT_FALSE(buffer.add(LogLevel::Log, ConsoleArgs{"b"}, std::nullopt, ConsoleOrigin::Intercepted, true, "k2"));
    EXPECT_EQ(buffer.get_events().size(), 1u);
}

TEST(ConsoleBufferTest, StripsAnsiWhenConfigured) {
    ConsoleBuffer stripping;
    stripping.add(LogLevel::Log, ConsoleArgs{"\x1b[32mgreen\x1b[0m"});
    EXPECT_EQ(stripping.get_events()[0].text, "green");

    ConsoleBuffer raw(ConsoleBufferConfig{50000, 100, false});
    raw.add(LogLevel::Log, ConsoleArgs{"\x1b[32mgreen\x1b[0m"});
    EXPECT_EQ(raw.get_events()[0].text, "\x1b[32mgreen\x1b[0m");
}

TEST(ConsoleBufferTest, ClearResetsLimits) {
    ConsoleBuffer buffer(ConsoleBufferConfig{50000, 1, true});
    buffer.add(LogLevel::Log, ConsoleArgs{"one"});
    buffer.add(LogLevel::Log, ConsoleArgs{"two"});
    ASSERT_TRUE(buffer.is_truncated());

    buffer.clear();
    EXPECT_FALSE(buffer.is_truncated());
    EXPECT_TRUE(buffer.add(LogLevel::Log, ConsoleArgs{"three"}));
    EXPECT_EQ(buffer.get_events().size(), 1u);
}

TEST(ArgFormatterTest, SerializesScalarsAndStrings) {
    EXPECT_EQ(serialize_console_arg(nlohmann::json("text")), "text");
    EXPECT_EQ(serialize_console_arg(nlohmann::json(42)), "42");
    EXPECT_EQ(serialize_console_arg(nlohmann::json(true)), "true");
    EXPECT_EQ(serialize_console_arg(nlohmann::json(nullptr)), "null");
}

TEST(ArgFormatterTest, LimitsLongStringsAndLargeArrays) {
    std::string long_text(1500, 'x');
    std::string out = serialize_console_arg(nlohmann::json(long_text));
    EXPECT_EQ(out.size(), 1000u + std::string("... [truncated]").size());

    nlohmann::json arr = nlohmann::json::array();
    for (int i = 0; i < 15; ++i) arr.push_back(i);
    EXPECT_NE(serialize_console_arg(arr).find("... 5 more items"), std::string::npos);
}

TEST(ArgFormatterTest, LimitsNestingDepth) {
    nlohmann::json deep = {{"a", {{"b", {{"c", {{"d", 1}}}}}}}};
    std::string out = serialize_console_arg(deep);
    EXPECT_NE(out.find("[Object]"), std::string::npos);
    EXPECT_EQ(out.find("\"d\""), std::string::npos);
}

TEST(ArgFormatterTest, InvalidUtf8BecomesPlaceholder) {
    nlohmann::json obj = {{"bad", std::string("\xff\xfe")}};
    EXPECT_EQ(serialize_console_arg(obj), "[Failed to serialize]");
}
