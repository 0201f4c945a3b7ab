#pragma once
#include <string>
#include <memory>

namespace llm_reporter {

// Token counting contract. Model-specific tokenizers plug in here.
class ITokenCounter {
public:
    virtual ~ITokenCounter() = default;
    virtual int count_tokens(const std::string& text, const std::string& model) = 0;
    virtual int estimate_tokens(const std::string& text) const = 0;
};

// ceil(bytes / chars_per_token). Used when no real tokenizer is available.
class EstimatingTokenCounter : public ITokenCounter {
public:
    explicit EstimatingTokenCounter(double chars_per_token = 4.0);

    int count_tokens(const std::string& text, const std::string& model) override;
    int estimate_tokens(const std::string& text) const override;

    double chars_per_token() const { return chars_per_token_; }

private:
    double chars_per_token_;
};

// Falls back to an EstimatingTokenCounter when `counter` is null
std::shared_ptr<ITokenCounter> counter_or_default(std::shared_ptr<ITokenCounter> counter);

} // namespace llm_reporter
