#include "truncation/strategies/SmartStrategy.hpp"
#include "truncation/truncation_utils.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <regex>
#include <spdlog/spdlog.h>

namespace llm_reporter {

namespace {

const std::vector<std::string> kKeywords = {
    "error", "fail", "expect", "assert", "throw", "reject", "timeout", "missing",
    "undefined", "null", "cannot", "invalid", "typeerror", "referenceerror", "syntaxerror"};

const std::vector<std::string> kErrorMarkers = {"Error:", "Failed:", u8"✗", u8"❌", "AssertionError"};
const std::vector<std::string> kAssertionMarkers = {"expect(", "assert(", "should", "toBe", "toEqual", "toMatch"};
const std::vector<std::string> kUserCodeMarkers = {"src/", "test/", "spec/"};

bool contains_any(const std::string& text, const std::vector<std::string>& needles) {
    return std::any_of(needles.begin(), needles.end(),
                       [&](const std::string& n) { return text.find(n) != std::string::npos; });
}

bool is_error_line(const std::string& line) {
    static const std::regex error_word(R"(\b(error|fail|exception|throw)\b)", std::regex::icase);
    std::string lower = to_lower_copy(line);
    for (const auto& marker : kErrorMarkers) {
        if (lower.find(to_lower_copy(marker)) != std::string::npos) return true;
    }
    return std::regex_search(line, error_word);
}

// A word made only of digits
bool has_standalone_number(const std::string& text) {
    size_t pos = 0;
    while (pos < text.size()) {
        if (!is_word_char(text[pos])) {
            ++pos;
            continue;
        }
        size_t start = pos;
        while (pos < text.size() && is_word_char(text[pos])) ++pos;
        if (digit_run(text, start) == pos - start) return true;
    }
    return false;
}

// Two quote characters, either kind, on the line
bool has_quoted_span(const std::string& text) {
    size_t first = text.find_first_of("\"'");
    return first != std::string::npos && first < text.find_last_of("\"'");
}

std::string render(const std::vector<std::string>& lines, const std::vector<size_t>& selected) {
    std::vector<std::string> out;
    size_t last = 0;
    bool first = true;
    for (size_t idx : selected) {
        if (!first && idx > last + 1) out.push_back("...");
        out.push_back(lines[idx]);
        last = idx;
        first = false;
    }
    return join_lines(out);
}

} // namespace

SmartStrategy::SmartStrategy(std::shared_ptr<ITokenCounter> counter)
    : counter_(counter_or_default(std::move(counter))), fallback_(counter_) {}

bool SmartStrategy::can_truncate(const std::string&, const TruncationContext& ctx) const {
    return ctx.content_type != ContentType::Json || !ctx.preserve_structure;
}

double SmartStrategy::line_importance(const std::string& line, ContentType type) const {
    std::string trimmed = trim_copy(line);
    if (trimmed.empty()) return 0.0;

    double score = 0.1;
    std::string lower = to_lower_copy(trimmed);
    for (const auto& keyword : kKeywords) {
        if (lower.find(keyword) != std::string::npos) score += 0.3;
    }
    for (const auto& marker : kErrorMarkers) {
        if (trimmed.find(marker) != std::string::npos) score += 0.4;
    }
    for (const auto& marker : kAssertionMarkers) {
        if (trimmed.find(marker) != std::string::npos) score += 0.2;
    }
    for (const auto& marker : kUserCodeMarkers) {
        if (trimmed.find(marker) != std::string::npos) score += 0.2;
    }

    switch (type) {
        case ContentType::Error:
            if (is_error_line(line)) score += 0.5;
            break;
        case ContentType::Test:
            if (line.find("expect") != std::string::npos || line.find("assert") != std::string::npos) score += 0.4;
            break;
        case ContentType::Code:
            if (contains_any(line, kUserCodeMarkers) && line.find("node_modules") == std::string::npos) score += 0.3;
            break;
        default:
            break;
    }

    if (has_standalone_number(trimmed)) score += 0.1;
    if (has_quoted_span(trimmed)) score += 0.1;

    return std::min(score, 1.0);
}

std::vector<SmartStrategy::Block> SmartStrategy::build_blocks(const std::vector<std::string>& lines,
                                                              ContentType type) const {
    std::vector<Block> blocks;
    for (size_t i = 0; i < lines.size(); ++i) {
        double score = line_importance(lines[i], type);
        if (score < kImportanceThreshold) continue;

        size_t first = i > 0 ? i - 1 : 0;
        size_t last = std::min(lines.size() - 1, i + 1);
        if (!blocks.empty() && first <= blocks.back().last + 1) {
            blocks.back().last = std::max(blocks.back().last, last);
            blocks.back().score = std::max(blocks.back().score, score);
        } else {
            blocks.push_back({first, last, score});
        }
    }
    return blocks;
}

std::string SmartStrategy::select_blocks(const std::vector<std::string>& lines, std::vector<Block> blocks,
                                         int max_tokens, const TruncationContext& ctx) const {
    std::stable_sort(blocks.begin(), blocks.end(),
                     [](const Block& a, const Block& b) { return a.score > b.score; });

    std::vector<bool> keep(lines.size(), false);
    std::string best;
    for (const auto& block : blocks) {
        std::vector<bool> trial = keep;
        for (size_t i = block.first; i <= block.last; ++i) trial[i] = true;

        std::vector<size_t> selected;
        for (size_t i = 0; i < trial.size(); ++i) {
            if (trial[i]) selected.push_back(i);
        }
        std::string candidate = render(lines, selected);
        if (counter_->count_tokens(candidate, ctx.model) <= max_tokens) {
            keep = std::move(trial);
            best = std::move(candidate);
        }
    }
    return best;
}

TruncationResult SmartStrategy::fall_back(const std::string& content, int max_tokens,
                                          const TruncationContext& ctx, const std::string& reason) {
    TruncationResult result = fallback_.truncate(content, max_tokens, ctx);
    result.strategy_used = name() + "-fallback";
    result.warnings.push_back(reason);
    return result;
}

TruncationResult SmartStrategy::truncate(const std::string& content, int max_tokens,
                                         const TruncationContext& ctx) {
    int original = counter_->count_tokens(content, ctx.model);
    if (original <= max_tokens) {
        return {content, original, 0, false, name(), {}};
    }

    if (max_tokens < 10) {
        std::string tiny = handle_tiny_limit(max_tokens, content);
        int tokens = counter_->count_tokens(tiny, ctx.model);
        return {tiny, tokens, original - tokens, true, name(), {}};
    }

    std::string selected;
    try {
        auto lines = split_lines(content);
        selected = select_blocks(lines, build_blocks(lines, ctx.content_type), max_tokens, ctx);
    } catch (const std::exception& e) {
        spdlog::warn("Smart truncation failed, using head-tail: {}", e.what());
        return fall_back(content, max_tokens, ctx, "Smart analysis failed, used head-tail fallback");
    }

    if (selected.empty()) {
        return fall_back(content, max_tokens, ctx, "No important lines fit the budget, used head-tail fallback");
    }

    int final_tokens = counter_->count_tokens(selected, ctx.model);
    return {selected, final_tokens, original - final_tokens, true, name(), {}};
}

int SmartStrategy::estimate_savings(const std::string& content, int max_tokens,
                                    const TruncationContext& ctx) {
    int original = counter_->count_tokens(content, ctx.model);
    if (original <= max_tokens) return 0;

    auto lines = split_lines(content);
    size_t important = 0;
    for (const auto& line : lines) {
        if (line_importance(line, ctx.content_type) >= kImportanceThreshold) ++important;
    }
    double ratio = std::min(0.8, static_cast<double>(important) / lines.size() + 0.3);
    int preserved = std::min(static_cast<int>(original * ratio), max_tokens);
    return std::max(0, original - preserved);
}

} // namespace llm_reporter
