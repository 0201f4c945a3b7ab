#include "truncation/truncation_utils.hpp"
#include "text_utils.hpp"
#include <set>
#include <cctype>
#include <string>
#include <cmath>
#include <algorithm>

namespace llm_reporter {

std::string safe_trim_to_chars(const std::string& text, size_t target_chars,
                               bool prefer_boundaries, double safety) {
    if (text.size() <= target_chars) return text;

    size_t safe_target = static_cast<size_t>(std::floor(target_chars * (1.0 - safety)));
    std::string trimmed = utf8_safe_substr(text, safe_target);

    if (prefer_boundaries && safe_target > 100) {
        size_t boundary = trimmed.find_last_of(" \n.,");
        if (boundary != std::string::npos && boundary > safe_target * 0.8) {
            trimmed = text.substr(0, boundary + 1);
        }
    }
    return trimmed;
}

std::string join_with_ellipsis(const std::vector<std::string>& chunks, const std::string& ellipsis) {
    std::vector<std::string> kept;
    for (const auto& chunk : chunks) {
        if (!is_blank(chunk)) kept.push_back(chunk);
    }
    return join_lines(kept, ellipsis);
}

namespace {

bool starts_with_at(const std::string& text, size_t pos, const char* prefix) {
    return text.compare(pos, std::char_traits<char>::length(prefix), prefix) == 0;
}

bool space_at(const std::string& text, size_t pos) {
    return pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]));
}

// file:line:column anywhere on the line
bool has_file_position(const std::string& line) {
    for (size_t colon = line.find(':'); colon != std::string::npos; colon = line.find(':', colon + 1)) {
        size_t line_digits = digit_run(line, colon + 1);
        if (line_digits == 0) continue;
        size_t second = colon + 1 + line_digits;
        if (second < line.size() && line[second] == ':' && digit_run(line, second + 1) > 0) return true;
    }
    return false;
}

} // namespace

bool is_stack_frame_line(const std::string& line) {
    size_t p = skip_whitespace(line);
    if (starts_with_at(line, p, "at") && space_at(line, p + 2)) return true;
    if (starts_with_at(line, p, u8"↳") && space_at(line, p + std::char_traits<char>::length(u8"↳"))) return true;
    if (starts_with_at(line, p, u8"├") || starts_with_at(line, p, u8"└") || starts_with_at(line, p, u8"│")) {
        return true;
    }

    // "1) name" and "#0 name"
    size_t digits_from = p < line.size() && line[p] == '#' ? p + 1 : p;
    size_t digits = digit_run(line, digits_from);
    if (digits > 0) {
        size_t after = digits_from + digits;
        if (digits_from == p && after < line.size() && line[after] == ')' && space_at(line, after + 1)) return true;
        if (digits_from != p && space_at(line, after)) return true;
    }
    return has_file_position(line);
}

bool is_error_message_line(const std::string& line) {
    if (line.rfind("Error:", 0) == 0) return true;

    // TypeError:, AssertionError: ...
    if (!line.empty() && line[0] >= 'A' && line[0] <= 'Z') {
        size_t word_end = 0;
        while (word_end < line.size() && is_word_char(line[word_end])) ++word_end;
        if (word_end >= 6 && word_end < line.size() && line[word_end] == ':' &&
            line.compare(word_end - 5, 5, "Error") == 0) {
            return true;
        }
    }

    size_t p = skip_whitespace(line);
    for (const char* word : {"Expected", "Received", "Actual", "Assert"}) {
        if (starts_with_at(line, p, word)) return true;
    }
    for (const char* marker : {"FAIL", u8"✖", u8"✗", u8"×"}) {
        if (starts_with_at(line, 0, marker)) return true;
    }
    return false;
}

bool is_user_code_path(const std::string& path) {
    return path.find("node_modules") == std::string::npos &&
           path.find("internal/") == std::string::npos &&
           path.find("<anonymous>") == std::string::npos &&
           path.find("[native code]") == std::string::npos &&
           path.rfind("node:", 0) != 0 &&
           path.rfind("async ", 0) != 0 &&
           path.rfind("timers.", 0) != 0;
}

bool has_priority_keyword(const std::string& line) {
    static const char* keywords[] = {
        "error", "fail", "failure", "exception", "throw", "crash", "fatal",
        "assert", "expect", "should", "must", "require",
        "test", "describe", "it(", "spec", "scenario",
        "warning", "critical", "important", "bug", "issue", "problem"};
    std::string lower = to_lower_copy(line);
    for (const char* keyword : keywords) {
        if (lower.find(keyword) != std::string::npos) return true;
    }
    return false;
}

std::string handle_tiny_limit(int max_tokens, const std::string& content) {
    if (max_tokens < 5) return "...";

    if (max_tokens < 10) {
        for (const auto& line : split_lines(content)) {
            if (is_error_message_line(line)) {
                return safe_trim_to_chars(line, max_tokens * 3, false) + "...";
            }
        }
        return safe_trim_to_chars(content, max_tokens * 3, false) + "...";
    }

    size_t target = static_cast<size_t>(max_tokens) * 3;
    return safe_trim_to_chars(content, target - 10, true, 0.2) + "\n...[cut]";
}

std::vector<size_t> extract_lines_with_context(size_t line_count, const std::vector<size_t>& matches,
                                               size_t context) {
    std::set<size_t> selected;
    for (size_t idx : matches) {
        if (idx >= line_count) continue;
        size_t from = idx >= context ? idx - context : 0;
        size_t to = std::min(line_count - 1, idx + context);
        for (size_t i = from; i <= to; ++i) selected.insert(i);
    }
    return std::vector<size_t>(selected.begin(), selected.end());
}

size_t estimate_chars_for_tokens(int target_tokens, double avg_chars_per_token) {
    if (target_tokens <= 0) return 0;
    return static_cast<size_t>(std::floor(target_tokens * avg_chars_per_token));
}

std::string truncate_stack_trace(const std::string& stack, size_t max_frames, bool prioritize_user_code) {
    std::vector<std::string> header, user, node_modules, other;

    for (const auto& line : split_lines(stack)) {
        if (is_error_message_line(line)) {
            header.push_back(line);
        } else if (is_stack_frame_line(line)) {
            if (is_user_code_path(line)) user.push_back(line);
            else if (line.find("node_modules") != std::string::npos) node_modules.push_back(line);
            else other.push_back(line);
        }
    }

    std::vector<std::string> result = header;
    size_t frames = 0;
    auto take = [&](const std::vector<std::string>& source) {
        size_t n = std::min(source.size(), max_frames - frames);
        result.insert(result.end(), source.begin(), source.begin() + n);
        frames += n;
    };

    if (prioritize_user_code) take(user);
    if (frames < max_frames) take(other);
    if (frames < max_frames) take(node_modules);

    size_t total = user.size() + node_modules.size() + other.size();
    if (total > frames) {
        result.push_back("    ... " + std::to_string(total - frames) + " frames omitted");
    }
    return join_lines(result);
}

std::vector<std::string> truncate_code_context(const std::vector<std::string>& code,
                                               std::optional<int> line_number, int context_lines) {
    if (code.empty()) return {};

    int size = static_cast<int>(code.size());
    if (!line_number || *line_number < 0) {
        int n = std::min(context_lines * 2 + 1, size);
        return {code.begin(), code.begin() + n};
    }

    int start = std::max(0, *line_number - context_lines);
    int end = std::min(size, *line_number + context_lines + 1);
    if (start >= end) {
        // Line points past the snippet: keep its tail
        start = std::max(0, size - (context_lines * 2 + 1));
        end = size;
    }

    std::vector<std::string> result(code.begin() + start, code.begin() + end);
    if (start > 0) result.insert(result.begin(), "...");
    if (end < size) result.push_back("...");
    return result;
}

nlohmann::json truncate_assertion_value(const nlohmann::json& value, size_t max_chars) {
    if (value.is_null() || value.is_number() || value.is_boolean()) return value;

    if (value.is_string()) {
        const auto& s = value.get_ref<const std::string&>();
        if (s.size() <= max_chars) return value;
        return safe_trim_to_chars(s, max_chars - 3) + "...";
    }

    std::string str;
    try {
        str = value.dump(2);
    } catch (const nlohmann::json::exception&) {
        return "[object]";
    }
    if (str.size() <= max_chars) return value;

    std::string truncated = str.substr(0, max_chars - 10);
    size_t last_newline = truncated.rfind('\n');
    if (last_newline != std::string::npos && last_newline > max_chars * 0.5) {
        return truncated.substr(0, last_newline) + "\n  ...\n" + (value.is_object() ? "}" : "]");
    }
    return safe_trim_to_chars(str, max_chars - 3) + "...";
}

std::vector<std::string> apply_fair_caps(const std::vector<std::string>& items, size_t total_budget,
                                         size_t min_per_item) {
    std::vector<std::string> result;
    if (items.empty()) return result;

    size_t fair_share = std::max(min_per_item, total_budget / items.size());
    long long remaining = static_cast<long long>(total_budget);

    for (const auto& item : items) {
        if (remaining <= 0) break;
        size_t item_budget = std::min<size_t>(fair_share, static_cast<size_t>(remaining));
        if (item.size() <= item_budget) {
            result.push_back(item);
            remaining -= static_cast<long long>(item.size());
        } else {
            size_t cut = item_budget > 10 ? item_budget - 10 : 0;
            std::string truncated = safe_trim_to_chars(item, cut) + "\n...[cut]";
            remaining -= static_cast<long long>(truncated.size());
            result.push_back(std::move(truncated));
        }
    }
    return result;
}

} // namespace llm_reporter
