#include "truncation/strategies/StackTraceStrategy.hpp"
#include "truncation/truncation_utils.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <numeric>
#include <cctype>
#include <spdlog/spdlog.h>

namespace llm_reporter {

namespace {

const std::vector<std::string> kUserCodePatterns = {"src/", "test/", "spec/", "lib/", "app/"};
const std::vector<std::string> kFunctionKeywords = {"test", "spec", "describe", "it", "expect",
                                                    "assert", "should", "error", "fail"};

// Position just past "at" and its whitespace, npos when the line is not a frame
size_t frame_body_start(const std::string& line) {
    size_t p = skip_whitespace(line);
    if (line.compare(p, 2, "at") != 0 || p + 2 >= line.size() ||
        !std::isspace(static_cast<unsigned char>(line[p + 2]))) {
        return std::string::npos;
    }
    return skip_whitespace(line, p + 2);
}

struct Location {
    std::string file;
    int line = 0;
    int column = 0;
};

std::optional<int> parse_position(const std::string& digits) {
    if (digits.empty() || digits.size() > 9 || digit_run(digits, 0) != digits.size()) return std::nullopt;
    return std::stoi(digits);
}

// "file:line:column", split from the right so the file may contain colons
std::optional<Location> parse_location(const std::string& text) {
    size_t col_sep = text.rfind(':');
    if (col_sep == std::string::npos || col_sep == 0) return std::nullopt;
    size_t line_sep = text.rfind(':', col_sep - 1);
    if (line_sep == std::string::npos || line_sep == 0) return std::nullopt;

    auto line = parse_position(text.substr(line_sep + 1, col_sep - line_sep - 1));
    auto column = parse_position(text.substr(col_sep + 1));
    if (!line || !column) return std::nullopt;
    return Location{text.substr(0, line_sep), *line, *column};
}

bool is_user_code_frame(const std::string& path) {
    if (path.empty() || path.find("node_modules") != std::string::npos) return false;
    return std::any_of(kUserCodePatterns.begin(), kUserCodePatterns.end(),
                       [&](const std::string& p) { return path.find(p) != std::string::npos; });
}

double frame_importance(const std::optional<std::string>& fn, const std::optional<std::string>& file,
                        bool user_code) {
    double score = 0.1;
    if (user_code) score += 0.4;

    if (fn) {
        std::string lower = to_lower_copy(*fn);
        for (const auto& keyword : kFunctionKeywords) {
            if (lower.find(keyword) != std::string::npos) {
                score += 0.2;
                break;
            }
        }
        if (fn->find("main") != std::string::npos || fn->find("entry") != std::string::npos) score += 0.1;
    }
    if (!fn || *fn == "anonymous" || *fn == "<anonymous>") score -= 0.1;
    if (file && (file->find("internal/") != std::string::npos || file->find("<built-in>") != std::string::npos)) {
        score -= 0.2;
    }
    return std::clamp(score, 0.0, 1.0);
}

} // namespace

std::optional<StackFrame> parse_stack_frame(const std::string& line) {
    std::string trimmed = trim_copy(line);
    size_t body_start = frame_body_start(trimmed);
    if (body_start == std::string::npos) return std::nullopt;

    StackFrame frame;
    frame.text = line;
    std::string body = trimmed.substr(body_start);

    // "at fn (file:line:col)"
    std::optional<Location> location;
    size_t open = body.find('(');
    if (open != std::string::npos && open > 0 && body.back() == ')' &&
        std::isspace(static_cast<unsigned char>(body[open - 1]))) {
        location = parse_location(body.substr(open + 1, body.size() - open - 2));
        if (location) frame.function_name = trim_copy(body.substr(0, open));
    }
    // "at file:line:col"
    if (!location) location = parse_location(body);

    if (location) {
        frame.file_name = location->file;
        frame.line_number = location->line;
        frame.column_number = location->column;
    } else if (!body.empty()) {
        frame.function_name = body;
    }

    frame.is_user_code = is_user_code_frame(frame.file_name ? *frame.file_name : line);
    frame.importance = frame_importance(frame.function_name, frame.file_name, frame.is_user_code);
    return frame;
}

StackTraceStrategy::StackTraceStrategy(std::shared_ptr<ITokenCounter> counter)
    : counter_(counter_or_default(std::move(counter))) {}

bool StackTraceStrategy::can_truncate(const std::string& content, const TruncationContext& ctx) const {
    if (ctx.content_type != ContentType::Error) return false;
    return frame_body_start(content) != std::string::npos || content.find("    at ") != std::string::npos;
}

std::string StackTraceStrategy::process(const std::string& content, int max_tokens,
                                        const TruncationContext& ctx) const {
    // Message lines ahead of the first frame and error lines between frames
    // (nested causes) are always kept, in their original order.
    struct Entry {
        std::string message;
        std::optional<size_t> frame;
    };
    std::vector<Entry> entries;
    std::vector<StackFrame> frames;
    for (const auto& line : split_lines(content)) {
        auto frame = parse_stack_frame(line);
        if (frame) {
            entries.push_back({"", frames.size()});
            frames.push_back(std::move(*frame));
        } else if (!is_blank(line) && (frames.empty() || is_error_message_line(line))) {
            entries.push_back({line, std::nullopt});
        }
    }
    if (frames.empty()) {
        std::vector<std::string> header;
        for (const auto& entry : entries) header.push_back(entry.message);
        return join_lines(header);
    }

    std::vector<bool> keep(frames.size(), false);
    auto render = [&](const std::vector<bool>& selection) {
        std::vector<std::string> out;
        size_t skipped = 0;
        auto flush = [&] {
            if (skipped == 0) return;
            out.push_back("    ... " + std::to_string(skipped) + " more frame(s)");
            skipped = 0;
        };
        for (const auto& entry : entries) {
            if (!entry.frame) {
                flush();
                out.push_back(entry.message);
            } else if (selection[*entry.frame]) {
                flush();
                out.push_back(frames[*entry.frame].text);
            } else {
                ++skipped;
            }
        }
        flush();
        return join_lines(out);
    };

    std::vector<size_t> user, deps;
    for (size_t i = 0; i < frames.size(); ++i) {
        (frames[i].is_user_code ? user : deps).push_back(i);
    }
    auto by_importance = [&](size_t a, size_t b) { return frames[a].importance > frames[b].importance; };
    std::stable_sort(user.begin(), user.end(), by_importance);
    std::stable_sort(deps.begin(), deps.end(), by_importance);

    int min_user = ctx.metadata.value("minUserFrames", kDefaultMinUserFrames);
    size_t guaranteed = std::min(user.size(), static_cast<size_t>(std::max(0, min_user)));
    for (size_t i = 0; i < guaranteed; ++i) keep[user[i]] = true;

    auto try_add = [&](size_t idx) {
        keep[idx] = true;
        if (counter_->count_tokens(render(keep), ctx.model) > max_tokens) keep[idx] = false;
    };
    for (size_t i = guaranteed; i < user.size(); ++i) try_add(user[i]);
    for (size_t idx : deps) try_add(idx);

    return render(keep);
}

TruncationResult StackTraceStrategy::truncate(const std::string& content, int max_tokens,
                                              const TruncationContext& ctx) {
    int original = counter_->count_tokens(content, ctx.model);
    if (original <= max_tokens) {
        return {content, original, 0, false, name(), {}};
    }

    try {
        std::string truncated = process(content, max_tokens, ctx);
        int tokens = counter_->count_tokens(truncated, ctx.model);
        return {truncated, tokens, original - tokens, true, name(), {}};
    } catch (const std::exception& e) {
        spdlog::warn("Stack trace parsing failed: {}", e.what());
        auto lines = split_lines(content);
        size_t n = std::min<size_t>(25, lines.size());
        std::string fallback = join_lines({lines.begin(), lines.begin() + n});
        int tokens = counter_->count_tokens(fallback, ctx.model);
        return {fallback, tokens, original - tokens, true, name() + "-fallback",
                {"Stack trace parsing failed, used fallback truncation"}};
    }
}

int StackTraceStrategy::estimate_savings(const std::string& content, int max_tokens,
                                         const TruncationContext& ctx) {
    int original = counter_->count_tokens(content, ctx.model);
    if (original <= max_tokens) return 0;

    size_t frame_count = 0, user_count = 0;
    for (const auto& line : split_lines(content)) {
        auto frame = parse_stack_frame(line);
        if (!frame) continue;
        ++frame_count;
        if (frame->is_user_code) ++user_count;
    }
    double kept = static_cast<double>(std::min<size_t>(user_count + 5, 15));
    double ratio = std::max(0.4, kept / std::max<size_t>(frame_count, 1));
    int preserved = std::min(static_cast<int>(original * ratio), max_tokens);
    return std::max(0, original - preserved);
}

} // namespace llm_reporter
