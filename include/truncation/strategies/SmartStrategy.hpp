#pragma once
#include <memory>
#include <vector>
#include "truncation/strategies/ITruncationStrategy.hpp"
#include "truncation/strategies/HeadTailStrategy.hpp"
#include "tokenization/token_counter.hpp"

namespace llm_reporter {

/**
 * Scores lines by diagnostic value, grows each important line into a +-1 line block,
 * and keeps the best-scoring blocks that fit. Falls back to head/tail.
 */
class SmartStrategy : public ITruncationStrategy {
public:
    static constexpr double kImportanceThreshold = 0.3;

    explicit SmartStrategy(std::shared_ptr<ITokenCounter> counter = nullptr);

    std::string name() const override { return "smart"; }
    int priority() const override { return 4; }

    bool can_truncate(const std::string& content, const TruncationContext& ctx) const override;
    TruncationResult truncate(const std::string& content, int max_tokens,
                              const TruncationContext& ctx) override;
    int estimate_savings(const std::string& content, int max_tokens,
                         const TruncationContext& ctx) override;

    double line_importance(const std::string& line, ContentType type) const;

private:
    struct Block {
        size_t first;
        size_t last;
        double score;
    };

    std::vector<Block> build_blocks(const std::vector<std::string>& lines, ContentType type) const;
    std::string select_blocks(const std::vector<std::string>& lines, std::vector<Block> blocks,
                              int max_tokens, const TruncationContext& ctx) const;
    TruncationResult fall_back(const std::string& content, int max_tokens, const TruncationContext& ctx,
                               const std::string& reason);

    std::shared_ptr<ITokenCounter> counter_;
    HeadTailStrategy fallback_;
};

} // namespace llm_reporter
