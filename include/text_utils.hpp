#pragma once
#include <string>
#include <vector>
#include <chrono>

namespace llm_reporter {

// Cuts at most `length` bytes without splitting a UTF-8 sequence.
std::string utf8_safe_substr(const std::string& str, size_t length);

std::vector<std::string> split_lines(const std::string& text);
std::string join_lines(const std::vector<std::string>& lines, const std::string& sep = "\n");

std::string trim_copy(const std::string& text);
std::string to_lower_copy(const std::string& text);
bool is_blank(const std::string& text);

// ECMAScript \w: [A-Za-z0-9_]
bool is_word_char(char c);
// First non-whitespace position at or after `pos`; text.size() when none
size_t skip_whitespace(const std::string& text, size_t pos = 0);
// Length of the ASCII digit run starting at `pos`
size_t digit_run(const std::string& text, size_t pos);

// 2024-05-01T12:30:00.123Z
std::string to_iso_string(std::chrono::system_clock::time_point tp);

} // namespace llm_reporter
