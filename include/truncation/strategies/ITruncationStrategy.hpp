#pragma once
#include <string>
#include "truncation/TruncationTypes.hpp"

namespace llm_reporter {

class ITruncationStrategy {
public:
    virtual ~ITruncationStrategy() = default;

    virtual std::string name() const = 0;
    // Higher runs earlier when no preference is given
    virtual int priority() const = 0;

    virtual bool can_truncate(const std::string& content, const TruncationContext& ctx) const = 0;
    virtual TruncationResult truncate(const std::string& content, int max_tokens,
                                      const TruncationContext& ctx) = 0;
    virtual int estimate_savings(const std::string& content, int max_tokens,
                                 const TruncationContext& ctx) = 0;
};

} // namespace llm_reporter
