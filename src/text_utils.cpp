#include "text_utils.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <sstream>
#include <iomanip>

namespace llm_reporter {

std::string utf8_safe_substr(const std::string& str, size_t length) {
    if (str.length() <= length) return str;
    std::string sub = str.substr(0, length);
    if (sub.empty()) return sub;

    // Walk back over a trailing partial sequence
    size_t i = sub.size();
    size_t continuation = 0;
    while (i > 0 && (static_cast<unsigned char>(sub[i - 1]) & 0xC0) == 0x80) {
        --i;
        ++continuation;
    }
    if (i == 0) return "";

    unsigned char lead = static_cast<unsigned char>(sub[i - 1]);
    size_t expected = 0;
    if (lead >= 0xF0) expected = 3;
    else if (lead >= 0xE0) expected = 2;
    else if (lead >= 0xC0) expected = 1;

    if (lead >= 0xC0 && continuation < expected) {
        sub.resize(i - 1);
    }
    return sub;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t pos = text.find('\n', start);
        if (pos == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return lines;
}

std::string join_lines(const std::vector<std::string>& lines, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += sep;
        out += lines[i];
    }
    return out;
}

std::string trim_copy(const std::string& text) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    auto begin = std::find_if(text.begin(), text.end(), not_space);
    auto end = std::find_if(text.rbegin(), text.rend(), not_space).base();
    if (begin >= end) return "";
    return std::string(begin, end);
}

std::string to_lower_copy(const std::string& text) {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c); });
}

bool is_word_char(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return u < 0x80 && (std::isalnum(u) || c == '_');
}

size_t skip_whitespace(const std::string& text, size_t pos) {
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
    return pos;
}

size_t digit_run(const std::string& text, size_t pos) {
    size_t end = pos;
    while (end < text.size() && text[end] >= '0' && text[end] <= '9') ++end;
    return end - pos;
}

std::string to_iso_string(std::chrono::system_clock::time_point tp) {
    auto secs = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  tp.time_since_epoch()).count() % 1000;
    if (ms < 0) ms += 1000;

    std::tm tm{};
    gmtime_r(&secs, &tm);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
    return ss.str();
}

} // namespace llm_reporter
