#pragma once
#include <memory>
#include <vector>
#include <optional>
#include "truncation/strategies/ITruncationStrategy.hpp"
#include "tokenization/token_counter.hpp"

namespace llm_reporter {

struct StackFrame {
    std::string text;
    bool is_user_code = false;
    double importance = 0.0;
    std::optional<std::string> function_name;
    std::optional<std::string> file_name;
    std::optional<int> line_number;
    std::optional<int> column_number;
};

// Parses one "at ..." line; nullopt when the line is not a frame
std::optional<StackFrame> parse_stack_frame(const std::string& line);

/**
 * Error header and nested error lines always kept, then user frames (at least minUserFrames from metadata,
 * default 3), then dependency frames by score. Dropped runs collapse to "... N more frame(s)".
 */
class StackTraceStrategy : public ITruncationStrategy {
public:
    static constexpr int kDefaultMinUserFrames = 3;

    explicit StackTraceStrategy(std::shared_ptr<ITokenCounter> counter = nullptr);

    std::string name() const override { return "stack-trace"; }
    int priority() const override { return 6; }

    bool can_truncate(const std::string& content, const TruncationContext& ctx) const override;
    TruncationResult truncate(const std::string& content, int max_tokens,
                              const TruncationContext& ctx) override;
    int estimate_savings(const std::string& content, int max_tokens,
                         const TruncationContext& ctx) override;

private:
    std::string process(const std::string& content, int max_tokens, const TruncationContext& ctx) const;

    std::shared_ptr<ITokenCounter> counter_;
};

} // namespace llm_reporter
