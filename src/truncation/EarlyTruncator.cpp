#include "truncation/EarlyTruncator.hpp"
#include "truncation/context_window.hpp"
#include "truncation/priorities.hpp"
#include "truncation/truncation_utils.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <cmath>
#include <set>
#include <spdlog/spdlog.h>

namespace llm_reporter {

EarlyTruncator::EarlyTruncator(TruncationConfig config, std::shared_ptr<ITokenCounter> counter)
    : config_(std::move(config)), counter_(counter_or_default(std::move(counter))) {}

int EarlyTruncator::max_tokens() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return get_effective_max_tokens(config_.model, config_.max_tokens);
}

bool EarlyTruncator::needs_truncation(const std::string& content) const {
    if (is_blank(content)) return false;
    return counter_->estimate_tokens(content) > max_tokens();
}

EarlyTruncationResult EarlyTruncator::truncate(const std::string& content, std::optional<ConsoleCategory> category) {
    int original = counter_->estimate_tokens(content);
    int budget = max_tokens();

    if (is_blank(content) || original <= budget) {
        return make_result(content, original, "none");
    }
    if (budget < 10) {
        return make_result(handle_tiny_limit(budget, content), original, "tiny-limit");
    }

    EarlyStrategy strategy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        strategy = config_.strategy;
    }

    switch (strategy) {
        case EarlyStrategy::Simple:
            return make_result(apply_simple(content, budget), original, "simple");
        case EarlyStrategy::Priority:
            return make_result(apply_priority(content, budget, category), original, "priority");
        case EarlyStrategy::Smart:
            break;
    }

    if (category == ConsoleCategory::Errors && is_stack_frame_line(content)) {
        return make_result(apply_error(content, budget), original, "error-strategy");
    }
    return make_result(apply_smart(content, budget, category), original, "smart");
}

// --- STRATEGIES ---

std::string EarlyTruncator::apply_simple(const std::string& content, int max_tokens) const {
    size_t target_chars = estimate_chars_for_tokens(max_tokens);
    auto lines = split_lines(content);
    if (lines.size() <= 3) return safe_trim_to_chars(content, target_chars);

    double section_chars = target_chars * 0.4;
    size_t section_lines = static_cast<size_t>(lines.size() * 0.4);

    std::vector<std::string> head;
    double used = 0;
    for (size_t i = 0; i < section_lines; ++i) {
        if (used + lines[i].size() > section_chars) break;
        head.push_back(lines[i]);
        used += lines[i].size() + 1;
    }

    std::vector<std::string> tail;
    used = 0;
    for (size_t i = 0; i < section_lines; ++i) {
        const std::string& line = lines[lines.size() - 1 - i];
        if (used + line.size() > section_chars) break;
        tail.insert(tail.begin(), line);
        used += line.size() + 1;
    }

    return join_with_ellipsis({join_lines(head), join_lines(tail)}, "\n...\n");
}

std::string EarlyTruncator::apply_smart(const std::string& content, int max_tokens,
                                        std::optional<ConsoleCategory> category) const {
    auto lines = split_lines(content);
    size_t target_chars = estimate_chars_for_tokens(max_tokens);

    std::vector<size_t> important;
    for (size_t i = 0; i < lines.size(); ++i) {
        const auto& line = lines[i];
        if (is_error_message_line(line) || has_priority_keyword(line) ||
            (category == ConsoleCategory::Errors && is_stack_frame_line(line) && is_user_code_path(line))) {
            important.push_back(i);
        }
    }

    std::vector<std::string> chunks;
    std::vector<std::string> current;
    size_t total = 0;
    size_t last = 0;
    bool have_last = false;
    for (size_t idx : extract_lines_with_context(lines.size(), important, 1)) {
        if (have_last && idx > last + 1 && !current.empty()) {
            chunks.push_back(join_lines(current));
            current.clear();
        }
        if (total + lines[idx].size() > target_chars * 0.9) break;
        current.push_back(lines[idx]);
        total += lines[idx].size() + 1;
        last = idx;
        have_last = true;
    }
    if (!current.empty()) chunks.push_back(join_lines(current));

    // Too little signal: head/tail keeps more context
    if (chunks.empty() || total < target_chars * 0.3) {
        return apply_simple(content, max_tokens);
    }
    return join_with_ellipsis(chunks, "\n...\n");
}

std::string EarlyTruncator::apply_priority(const std::string& content, int max_tokens,
                                           std::optional<ConsoleCategory> category) const {
    ContentPriority priority;
    if (category == ConsoleCategory::Errors) priority = ContentPriority::Critical;
    else if (category == ConsoleCategory::Warns) priority = ContentPriority::High;
    else if (category == ConsoleCategory::Info) priority = ContentPriority::Medium;
    else if (category == ConsoleCategory::Debug) priority = ContentPriority::Low;
    else priority = get_content_priority(content, ContentType::Log);

    static const double kPreserveRatio[] = {0.9, 0.7, 0.5, 0.3, 0.1};
    double ratio = kPreserveRatio[static_cast<int>(priority) - 1];
    size_t target_chars = estimate_chars_for_tokens(static_cast<int>(std::floor(max_tokens * ratio)));

    if (priority > ContentPriority::High) {
        return safe_trim_to_chars(content, target_chars, true, 0.1) + "\n...[truncated]";
    }

    auto lines = split_lines(content);
    std::vector<bool> keep(lines.size(), false);
    size_t total = 0;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (!(has_priority_keyword(lines[i]) || is_error_message_line(lines[i]))) continue;
        if (total + lines[i].size() < target_chars * 0.8) {
            keep[i] = true;
            total += lines[i].size() + 1;
        }
    }
    for (size_t i = 0; i < lines.size(); ++i) {
        if (keep[i]) continue;
        if (total + lines[i].size() < target_chars) {
            keep[i] = true;
            total += lines[i].size() + 1;
        }
    }

    std::vector<std::string> kept;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (keep[i]) kept.push_back(lines[i]);
    }
    return join_lines(kept) + "\n...[priority-based truncation]";
}

std::string EarlyTruncator::apply_error(const std::string& content, int max_tokens) const {
    auto lines = split_lines(content);
    size_t target_chars = estimate_chars_for_tokens(max_tokens);

    std::vector<std::string> result;
    size_t used = 0;
    for (const auto& line : lines) {
        if (!is_error_message_line(line)) continue;
        result.push_back(line);
        used += line.size() + 1;
        if (used > target_chars * 0.3) break;
    }

    std::vector<std::string> user_frames;
    size_t node_modules_frames = 0;
    for (const auto& line : lines) {
        if (!is_stack_frame_line(line)) continue;
        if (is_user_code_path(line)) {
            user_frames.push_back(line);
            if (user_frames.size() >= 5) break;
        } else if (line.find("node_modules") != std::string::npos) {
            ++node_modules_frames;
        }
    }

    if (!user_frames.empty()) {
        result.push_back("Stack trace (user code):");
        for (const auto& frame : user_frames) {
            if (used + frame.size() > target_chars * 0.8) break;
            result.push_back(frame);
            used += frame.size() + 1;
        }
        if (node_modules_frames > 0) {
            result.push_back("...[" + std::to_string(node_modules_frames) + " node_modules frames omitted]");
        }
    }
    return join_lines(result);
}

// --- METRICS ---

EarlyTruncationResult EarlyTruncator::make_result(std::string content, int original_tokens,
                                                  const std::string& strategy) {
    EarlyTruncationMetrics metrics;
    metrics.original_tokens = original_tokens;
    metrics.truncated_tokens = counter_->estimate_tokens(content);
    metrics.tokens_removed = std::max(0, original_tokens - metrics.truncated_tokens);
    metrics.strategy = strategy;
    metrics.timestamp = std::chrono::system_clock::now();

    if (metrics.tokens_removed > 0) {
        spdlog::debug("Early truncation ({}): {} -> {} tokens", strategy,
                      metrics.original_tokens, metrics.truncated_tokens);
        std::lock_guard<std::mutex> lock(mutex_);
        metrics_.push_back(metrics);
        while (metrics_.size() > kMaxMetrics) metrics_.pop_front();
    }
    return {std::move(content), metrics};
}

std::vector<EarlyTruncationMetrics> EarlyTruncator::get_metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {metrics_.begin(), metrics_.end()};
}

void EarlyTruncator::update_config(const TruncationConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
}

TruncationConfig EarlyTruncator::config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

} // namespace llm_reporter
