#include "tokenization/token_counter.hpp"
#include <cmath>
#include <stdexcept>

namespace llm_reporter {

EstimatingTokenCounter::EstimatingTokenCounter(double chars_per_token)
    : chars_per_token_(chars_per_token) {
    if (!(chars_per_token_ > 0.0)) {
        throw std::invalid_argument("chars_per_token must be positive");
    }
}

int EstimatingTokenCounter::count_tokens(const std::string& text, const std::string&) {
    return estimate_tokens(text);
}

int EstimatingTokenCounter::estimate_tokens(const std::string& text) const {
    if (text.empty()) return 0;
    return static_cast<int>(std::ceil(static_cast<double>(text.size()) / chars_per_token_));
}

std::shared_ptr<ITokenCounter> counter_or_default(std::shared_ptr<ITokenCounter> counter) {
    if (counter) return counter;
    return std::make_shared<EstimatingTokenCounter>();
}

} // namespace llm_reporter
