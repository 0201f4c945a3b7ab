#include "truncation/strategies/ErrorFocusedStrategy.hpp"
#include "truncation/truncation_utils.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace llm_reporter {

namespace {

constexpr size_t kContextLines = 2;
constexpr int kMinPartialTokens = 50;

const std::vector<std::string> kErrorPatterns = {
    "error:", "assertionerror:", "typeerror:", "referenceerror:", "syntaxerror:", "rangeerror:",
    "evalerror:", "urierror:", "failed:", "expected:", "actual:", "received:", "diff:",
    u8"✗", u8"❌", u8"×", "fail", "failed"};

const std::vector<std::string> kAssertionPatterns = {
    "expect(", "expect.", "assert(", "assert.", "should", "toBe", "toEqual", "toMatch",
    "toContain", "toHaveBeenCalled", "toThrow", "toReject", "not.toBe", "not.toEqual", "not.toMatch"};

const std::vector<std::string> kKeywords = {"fail", "error", "exception", "timeout", "undefined", "null"};

bool matches_error(const std::string& line) {
    std::string lower = to_lower_copy(line);
    return std::any_of(kErrorPatterns.begin(), kErrorPatterns.end(),
                       [&](const std::string& p) { return lower.find(p) != std::string::npos; });
}

bool matches_assertion(const std::string& line) {
    return std::any_of(kAssertionPatterns.begin(), kAssertionPatterns.end(),
                       [&](const std::string& p) { return line.find(p) != std::string::npos; });
}

bool has_keyword(const std::string& line) {
    std::string lower = to_lower_copy(line);
    return std::any_of(kKeywords.begin(), kKeywords.end(),
                       [&](const std::string& k) { return lower.find(k) != std::string::npos; });
}

bool has_user_code(const std::string& line) {
    if (line.find("node_modules") != std::string::npos) return false;
    return line.find("src/") != std::string::npos || line.find("test/") != std::string::npos ||
           line.find("spec/") != std::string::npos;
}

} // namespace

ErrorFocusedStrategy::ErrorFocusedStrategy(std::shared_ptr<ITokenCounter> counter)
    : counter_(counter_or_default(std::move(counter))) {}

bool ErrorFocusedStrategy::can_truncate(const std::string&, const TruncationContext& ctx) const {
    return ctx.content_type == ContentType::Error || ctx.content_type == ContentType::Test ||
           ctx.content_type == ContentType::Log;
}

std::vector<size_t> ErrorFocusedStrategy::identify_error_lines(const std::vector<std::string>& lines) const {
    std::vector<size_t> out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (matches_error(lines[i]) || matches_assertion(lines[i]) || has_keyword(lines[i])) {
            out.push_back(i);
        }
    }
    return out;
}

std::vector<ErrorFocusedStrategy::Section> ErrorFocusedStrategy::build_sections(
    const std::vector<std::string>& lines, const std::vector<size_t>& error_lines) const {
    std::vector<Section> merged;
    // error_lines is ascending, so windows arrive sorted by start
    for (size_t idx : error_lines) {
        size_t first = idx >= kContextLines ? idx - kContextLines : 0;
        size_t last = std::min(lines.size() - 1, idx + kContextLines);

        double priority = 1.0;
        if (matches_error(lines[idx])) priority += 0.5;
        if (matches_assertion(lines[idx])) priority += 0.3;
        if (has_user_code(lines[idx])) priority += 0.2;

        if (!merged.empty() && first <= merged.back().last + 1) {
            merged.back().last = std::max(merged.back().last, last);
            merged.back().priority = std::max(merged.back().priority, priority);
        } else {
            merged.push_back({first, last, priority, std::nullopt});
        }
    }
    return merged;
}

std::string ErrorFocusedStrategy::combine(const std::vector<std::string>& lines,
                                          std::vector<Section> sections) const {
    std::sort(sections.begin(), sections.end(),
              [](const Section& a, const Section& b) { return a.first < b.first; });

    std::vector<std::string> out;
    bool first = true;
    size_t last_end = 0;
    for (const auto& section : sections) {
        if (!first && section.first > last_end + 1) out.push_back("...");
        if (section.partial) {
            out.push_back(*section.partial);
        } else {
            for (size_t i = section.first; i <= section.last; ++i) out.push_back(lines[i]);
        }
        last_end = section.last;
        first = false;
    }
    return join_lines(out);
}

std::string ErrorFocusedStrategy::extract(const std::string& content, int max_tokens,
                                          const TruncationContext& ctx) const {
    auto lines = split_lines(content);
    auto error_lines = identify_error_lines(lines);

    if (error_lines.empty()) {
        size_t n = std::min<size_t>(10, lines.size());
        return join_lines({lines.begin(), lines.begin() + n});
    }

    auto sections = build_sections(lines, error_lines);
    std::stable_sort(sections.begin(), sections.end(),
                     [](const Section& a, const Section& b) { return a.priority > b.priority; });

    std::vector<Section> selected;
    for (const auto& section : sections) {
        std::vector<Section> trial = selected;
        trial.push_back(section);
        std::string candidate = combine(lines, trial);
        if (counter_->count_tokens(candidate, ctx.model) <= max_tokens) {
            selected = std::move(trial);
            continue;
        }

        int used = selected.empty() ? 0 : counter_->count_tokens(combine(lines, selected), ctx.model);
        int remaining = max_tokens - used;
        if (remaining > kMinPartialTokens) {
            std::string body = join_lines({lines.begin() + section.first, lines.begin() + section.last + 1});
            Section partial = section;
            partial.partial = utf8_safe_substr(body, static_cast<size_t>(remaining) * 4 - 10) + "...";
            trial.back() = partial;
            if (counter_->count_tokens(combine(lines, trial), ctx.model) <= max_tokens) {
                selected = std::move(trial);
            }
        }
        break;
    }

    // The first error line is never dropped
    size_t first_error = error_lines.front();
    bool covered = std::any_of(selected.begin(), selected.end(), [&](const Section& s) {
        return !s.partial && s.first <= first_error && first_error <= s.last;
    });
    if (!covered) {
        const std::string& line = lines[first_error];
        std::string kept = line;
        if (counter_->count_tokens(line, ctx.model) > max_tokens) {
            size_t budget = static_cast<size_t>(std::max(0, max_tokens)) * 4;
            kept = utf8_safe_substr(line, budget > 3 ? budget - 3 : 0) + "...";
        }
        if (selected.empty()) return kept;

        std::string rest = combine(lines, selected);
        std::string combined = kept + "\n...\n" + rest;
        if (counter_->count_tokens(combined, ctx.model) <= max_tokens) return combined;
        return kept;
    }
    return combine(lines, selected);
}

TruncationResult ErrorFocusedStrategy::truncate(const std::string& content, int max_tokens,
                                                const TruncationContext& ctx) {
    int original = counter_->count_tokens(content, ctx.model);
    if (original <= max_tokens) {
        return {content, original, 0, false, name(), {}};
    }

    try {
        std::string truncated = extract(content, max_tokens, ctx);
        int tokens = counter_->count_tokens(truncated, ctx.model);
        return {truncated, tokens, original - tokens, true, name(), {}};
    } catch (const std::exception& e) {
        spdlog::warn("Error-focused truncation failed: {}", e.what());
        auto lines = split_lines(content);
        size_t n = std::min<size_t>(15, lines.size());
        std::string fallback = join_lines({lines.begin(), lines.begin() + n});
        int tokens = counter_->count_tokens(fallback, ctx.model);
        return {fallback, tokens, original - tokens, true, name() + "-fallback",
                {"Error analysis failed, used fallback truncation"}};
    }
}

int ErrorFocusedStrategy::estimate_savings(const std::string& content, int max_tokens,
                                           const TruncationContext& ctx) {
    int original = counter_->count_tokens(content, ctx.model);
    if (original <= max_tokens) return 0;

    auto lines = split_lines(content);
    double error_ratio = static_cast<double>(identify_error_lines(lines).size()) / lines.size();
    double ratio = std::min(0.7, error_ratio * 2 + 0.3);
    int preserved = std::min(static_cast<int>(original * ratio), max_tokens);
    return std::max(0, original - preserved);
}

} // namespace llm_reporter
