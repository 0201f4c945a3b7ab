#pragma once
#include <memory>
#include <vector>
#include "truncation/strategies/ITruncationStrategy.hpp"
#include "tokenization/token_counter.hpp"

namespace llm_reporter {

/**
 * Keeps the first and last part of the content around a separator.
 * Metadata knobs: headRatio, tailRatio, separator, preserveLines.
 */
class HeadTailStrategy : public ITruncationStrategy {
public:
    explicit HeadTailStrategy(std::shared_ptr<ITokenCounter> counter = nullptr);

    std::string name() const override { return "head-tail"; }
    int priority() const override { return 2; }

    bool can_truncate(const std::string& content, const TruncationContext& ctx) const override;
    TruncationResult truncate(const std::string& content, int max_tokens,
                              const TruncationContext& ctx) override;
    int estimate_savings(const std::string& content, int max_tokens,
                         const TruncationContext& ctx) override;

private:
    std::string truncate_by_lines(const std::string& content, int max_tokens,
                                  double head_ratio, double tail_ratio, const std::string& separator) const;
    std::string truncate_by_characters(const std::string& content, int max_tokens,
                                       double head_ratio, double tail_ratio, const std::string& separator) const;

    std::shared_ptr<ITokenCounter> counter_;
};

} // namespace llm_reporter
