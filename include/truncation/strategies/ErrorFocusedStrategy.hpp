#pragma once
#include <memory>
#include <vector>
#include <optional>
#include "truncation/strategies/ITruncationStrategy.hpp"
#include "tokenization/token_counter.hpp"

namespace llm_reporter {

/**
 * Keeps +-2 line windows around error and assertion lines, best-scoring windows first.
 * The first error line always survives.
 */
class ErrorFocusedStrategy : public ITruncationStrategy {
public:
    explicit ErrorFocusedStrategy(std::shared_ptr<ITokenCounter> counter = nullptr);

    std::string name() const override { return "error-focused"; }
    int priority() const override { return 5; }

    bool can_truncate(const std::string& content, const TruncationContext& ctx) const override;
    TruncationResult truncate(const std::string& content, int max_tokens,
                              const TruncationContext& ctx) override;
    int estimate_savings(const std::string& content, int max_tokens,
                         const TruncationContext& ctx) override;

    std::vector<size_t> identify_error_lines(const std::vector<std::string>& lines) const;

private:
    struct Section {
        size_t first;
        size_t last;
        double priority;
        std::optional<std::string> partial;  // set when only a prefix fit
    };

    std::vector<Section> build_sections(const std::vector<std::string>& lines,
                                        const std::vector<size_t>& error_lines) const;
    std::string combine(const std::vector<std::string>& lines, std::vector<Section> sections) const;
    std::string extract(const std::string& content, int max_tokens, const TruncationContext& ctx) const;

    std::shared_ptr<ITokenCounter> counter_;
};

} // namespace llm_reporter
