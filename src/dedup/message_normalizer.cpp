#include "dedup/message_normalizer.hpp"
#include "text_utils.hpp"
#include <cctype>
#include <cstdint>
#include <functional>

namespace llm_reporter {

namespace {

// Returns the length of the match starting at `pos`, 0 for none
using Matcher = std::function<size_t(const std::string&, size_t)>;

bool digits_at(const std::string& text, size_t pos, size_t count) {
    return pos + count <= text.size() && digit_run(text, pos) >= count;
}

bool char_at(const std::string& text, size_t pos, char c) {
    return pos < text.size() && text[pos] == c;
}

// \x1b[<digits and semicolons>m
size_t match_ansi(const std::string& text, size_t pos) {
    if (!char_at(text, pos, '\x1b') || !char_at(text, pos + 1, '[')) return 0;
    size_t end = pos + 2;
    while (end < text.size() && ((text[end] >= '0' && text[end] <= '9') || text[end] == ';')) ++end;
    return char_at(text, end, 'm') ? end + 1 - pos : 0;
}

// YYYY-MM-DD
bool date_at(const std::string& text, size_t pos) {
    return digits_at(text, pos, 4) && char_at(text, pos + 4, '-') && digits_at(text, pos + 5, 2) &&
           char_at(text, pos + 7, '-') && digits_at(text, pos + 8, 2);
}

// HH:MM:SS
bool time_at(const std::string& text, size_t pos) {
    return digits_at(text, pos, 2) && char_at(text, pos + 2, ':') && digits_at(text, pos + 3, 2) &&
           char_at(text, pos + 5, ':') && digits_at(text, pos + 6, 2);
}

// YYYY-MM-DDTHH:MM:SS[.mmm][Z]
size_t match_iso(const std::string& text, size_t pos) {
    if (!date_at(text, pos) || !char_at(text, pos + 10, 'T') || !time_at(text, pos + 11)) return 0;
    size_t end = pos + 19;
    if (char_at(text, end, '.') && digits_at(text, end + 1, 3)) end += 4;
    if (char_at(text, end, 'Z')) ++end;
    return end - pos;
}

// YYYY-MM-DD<whitespace>HH:MM:SS
size_t match_datetime(const std::string& text, size_t pos) {
    if (!date_at(text, pos)) return 0;
    size_t gap = skip_whitespace(text, pos + 10);
    if (gap == pos + 10 || !time_at(text, gap)) return 0;
    return gap + 8 - pos;
}

// A standalone run of exactly 10 or 13 digits
size_t match_unix(const std::string& text, size_t pos) {
    if (pos > 0 && is_word_char(text[pos - 1])) return 0;
    size_t run = digit_run(text, pos);
    if (run != 10 && run != 13) return 0;
    if (pos + run < text.size() && is_word_char(text[pos + run])) return 0;
    return run;
}

// Leftmost, non-overlapping replacement
std::string replace_matches(const std::string& text, const Matcher& match, const std::string& replacement) {
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        size_t len = match(text, pos);
        if (len > 0) {
            out += replacement;
            pos += len;
        } else {
            out += text[pos++];
        }
    }
    return out;
}

} // namespace

std::string strip_ansi_codes(const std::string& text) {
    std::string current = text;
    while (current.find('\x1b') != std::string::npos) {
        std::string next = replace_matches(current, match_ansi, "");
        if (next == current) break;
        current = std::move(next);
    }
    return current;
}

std::string strip_timestamps(const std::string& text) {
    // Each stamp becomes a space so digits on either side never fuse into a new stamp.
    // Repeat until stable: removing a unix stamp can expose a date-time pair.
    std::string current = text;
    while (true) {
        std::string next = replace_matches(current, match_iso, " ");
        next = replace_matches(next, match_datetime, " ");
        next = replace_matches(next, match_unix, " ");
        if (next == current) return next;
        current = std::move(next);
    }
}

std::string collapse_whitespace(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool in_run = false;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            in_run = true;
            continue;
        }
        if (in_run && !out.empty()) out += ' ';
        in_run = false;
        out += c;
    }
    return out;
}

std::string normalize_message(const std::string& message, const NormalizationOptions& opts) {
    if (!opts.strip_ansi && !opts.strip_timestamps && !opts.normalize_whitespace) {
        return to_lower_copy(message);
    }

    std::string normalized = message;
    if (opts.strip_ansi) normalized = strip_ansi_codes(normalized);
    if (opts.strip_timestamps) normalized = strip_timestamps(normalized);
    if (opts.normalize_whitespace) normalized = collapse_whitespace(normalized);
    return to_lower_copy(normalized);
}

std::string hash_message(const std::string& normalized) {
    uint32_t hash = 5381;
    for (unsigned char c : normalized) {
        hash = hash * 33u + c;
    }

    static const char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    if (hash == 0) return "0";
    std::string out;
    while (hash > 0) {
        out.insert(out.begin(), digits[hash % 36]);
        hash /= 36;
    }
    return out;
}

} // namespace llm_reporter
