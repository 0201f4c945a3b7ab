#include "truncation/strategies/HeadTailStrategy.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <cmath>

namespace llm_reporter {

namespace {

std::string build_head_tail(const std::vector<std::string>& lines, size_t head, size_t tail,
                            const std::string& separator) {
    if (head + tail >= lines.size()) return join_lines(lines);
    std::string out = join_lines({lines.begin(), lines.begin() + head});
    out += separator;
    out += join_lines({lines.end() - tail, lines.end()});
    return out;
}

} // namespace

HeadTailStrategy::HeadTailStrategy(std::shared_ptr<ITokenCounter> counter)
    : counter_(counter_or_default(std::move(counter))) {}

bool HeadTailStrategy::can_truncate(const std::string&, const TruncationContext& ctx) const {
    return !ctx.preserve_structure || ctx.content_type != ContentType::Json;
}

TruncationResult HeadTailStrategy::truncate(const std::string& content, int max_tokens,
                                            const TruncationContext& ctx) {
    int original = counter_->count_tokens(content, ctx.model);
    if (original <= max_tokens) {
        return {content, original, 0, false, name(), {}};
    }

    double head_ratio = ctx.metadata.value("headRatio", 0.4);
    double tail_ratio = ctx.metadata.value("tailRatio", 0.4);
    std::string separator = ctx.metadata.value("separator", std::string("\n...\n"));
    bool preserve_lines = ctx.metadata.value("preserveLines", true);

    std::string truncated = preserve_lines
        ? truncate_by_lines(content, max_tokens, head_ratio, tail_ratio, separator)
        : truncate_by_characters(content, max_tokens, head_ratio, tail_ratio, separator);

    int final_tokens = counter_->count_tokens(truncated, ctx.model);
    return {truncated, final_tokens, original - final_tokens, truncated != content, name(), {}};
}

int HeadTailStrategy::estimate_savings(const std::string& content, int max_tokens,
                                       const TruncationContext& ctx) {
    int original = counter_->count_tokens(content, ctx.model);
    if (original <= max_tokens) return 0;
    int preserved = std::min(static_cast<int>(original * 0.75), max_tokens);
    return std::max(0, original - preserved);
}

std::string HeadTailStrategy::truncate_by_lines(const std::string& content, int max_tokens,
                                                double head_ratio, double tail_ratio,
                                                const std::string& separator) const {
    auto lines = split_lines(content);
    size_t total = lines.size();
    if (total <= 3) return content;

    size_t head = static_cast<size_t>(total * head_ratio);
    size_t tail = static_cast<size_t>(total * tail_ratio);
    if (head + tail >= total) {
        head = static_cast<size_t>(total * 0.4);
        tail = static_cast<size_t>(total * 0.4);
    }
    head = std::max<size_t>(1, head);
    tail = std::max<size_t>(1, tail);

    std::string out = build_head_tail(lines, head, tail, separator);
    while (head + tail > 2 && counter_->estimate_tokens(out) > max_tokens) {
        if (head > tail) --head;
        else --tail;
        out = build_head_tail(lines, head, tail, separator);
    }
    return out;
}

std::string HeadTailStrategy::truncate_by_characters(const std::string& content, int max_tokens,
                                                     double head_ratio, double tail_ratio,
                                                     const std::string& separator) const {
    long long available = static_cast<long long>(max_tokens) * 4 - static_cast<long long>(separator.size());
    if (available <= 0) return separator;

    size_t head = static_cast<size_t>(std::floor(available * head_ratio));
    size_t tail = static_cast<size_t>(std::floor(available * tail_ratio));
    if (head + tail >= content.size()) return content;

    std::string head_part = utf8_safe_substr(content, head);
    // Tail start moved forward past any continuation bytes
    size_t tail_start = content.size() - tail;
    while (tail_start < content.size() &&
           (static_cast<unsigned char>(content[tail_start]) & 0xC0) == 0x80) {
        ++tail_start;
    }
    return head_part + separator + content.substr(tail_start);
}

} // namespace llm_reporter
