#pragma once
#include <string>
#include <optional>
#include <algorithm>
#include "text_utils.hpp"

namespace llm_reporter {

struct TokenBudgetOptions {
    std::optional<size_t> head;  // default 60% of the room left after the marker
    std::optional<size_t> tail;  // default: the rest
    std::string marker = " \xE2\x80\xA6 ";
};

// Plain head/tail cut by byte count. Never splits a UTF-8 sequence.
class TokenBudgetTruncator {
public:
    std::string truncate(const std::string& text, size_t max, const TokenBudgetOptions& options = {}) const {
        if (text.size() <= max) return text;
        if (max < 10 || max <= options.marker.size()) return utf8_safe_substr(text, max);

        size_t available = max - options.marker.size();
        size_t head = std::min(options.head.value_or(available * 6 / 10), available);
        size_t tail = std::min(options.tail.value_or(available - head), available - head);

        return utf8_safe_substr(text, head) + options.marker + utf8_safe_suffix(text, tail);
    }

    bool needs_truncation(const std::string& text, size_t max) const { return text.size() > max; }

private:
    static std::string utf8_safe_suffix(const std::string& text, size_t length) {
        if (length == 0) return "";
        size_t start = text.size() - std::min(length, text.size());
        while (start < text.size() && (static_cast<unsigned char>(text[start]) & 0xC0) == 0x80) ++start;
        return text.substr(start);
    }
};

} // namespace llm_reporter
