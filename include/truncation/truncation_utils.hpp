#pragma once
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace llm_reporter {

// Cuts to targetChars * (1 - safety); for targets over 100 chars, backs off to a
// space/newline/period/comma if one lies past 80% of the cut.
std::string safe_trim_to_chars(const std::string& text, size_t target_chars,
                               bool prefer_boundaries = true, double safety = 0.1);

// Joins non-blank chunks
std::string join_with_ellipsis(const std::vector<std::string>& chunks, const std::string& ellipsis = "...");

bool is_stack_frame_line(const std::string& line);
bool is_error_message_line(const std::string& line);
bool is_user_code_path(const std::string& path);
bool has_priority_keyword(const std::string& line);

// Deterministic output for budgets too small for any heuristic
std::string handle_tiny_limit(int max_tokens, const std::string& content);

// Sorted, de-duplicated indices of matches plus `context` lines either side
std::vector<size_t> extract_lines_with_context(size_t line_count, const std::vector<size_t>& matches,
                                               size_t context = 1);

size_t estimate_chars_for_tokens(int target_tokens, double avg_chars_per_token = 3.5);

// Header lines, then user frames, other frames, node_modules frames up to max_frames
std::string truncate_stack_trace(const std::string& stack, size_t max_frames, bool prioritize_user_code = true);

// line_number is 0-based into `code`; "..." marks cut ends
std::vector<std::string> truncate_code_context(const std::vector<std::string>& code,
                                               std::optional<int> line_number, int context_lines = 2);

nlohmann::json truncate_assertion_value(const nlohmann::json& value, size_t max_chars = 200);

// Equal share per item (at least min_per_item) from a shared character budget
std::vector<std::string> apply_fair_caps(const std::vector<std::string>& items, size_t total_budget,
                                         size_t min_per_item = 100);

} // namespace llm_reporter
