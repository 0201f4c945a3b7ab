#include "truncation/TruncationEngine.hpp"
#include "truncation/context_window.hpp"
#include "truncation/priorities.hpp"
#include "truncation/strategies/ErrorFocusedStrategy.hpp"
#include "truncation/strategies/HeadTailStrategy.hpp"
#include "truncation/strategies/SmartStrategy.hpp"
#include "truncation/strategies/StackTraceStrategy.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace llm_reporter {

// --- 1. CONSTRUCTOR ---
TruncationEngine::TruncationEngine(TruncationEngineConfig config, std::shared_ptr<ITokenCounter> counter)
    : config_(std::move(config)), counter_(counter_or_default(std::move(counter))) {
    if (config_.max_attempts <= 0) {
        throw std::invalid_argument("maxAttempts must be a positive number");
    }
    if (config_.register_default_strategies) {
        register_strategy(std::make_unique<HeadTailStrategy>(counter_));
        register_strategy(std::make_unique<SmartStrategy>(counter_));
        register_strategy(std::make_unique<ErrorFocusedStrategy>(counter_));
        register_strategy(std::make_unique<StackTraceStrategy>(counter_));
    }
}

// --- 2. REGISTRY ---
void TruncationEngine::register_strategy(std::unique_ptr<ITruncationStrategy> strategy) {
    if (!strategy) return;
    std::string name = strategy->name();
    spdlog::info("Registered truncation strategy: {} (priority {})", name, strategy->priority());
    std::lock_guard<std::mutex> lock(mutex_);
    strategies_[name] = StrategyPtr(std::move(strategy));
}

bool TruncationEngine::unregister_strategy(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return strategies_.erase(name) > 0;
}

std::shared_ptr<ITruncationStrategy> TruncationEngine::get_strategy(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = strategies_.find(name);
    return it != strategies_.end() ? it->second : nullptr;
}

std::vector<std::string> TruncationEngine::strategy_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& [name, _] : strategies_) names.push_back(name);
    return names;
}

std::vector<TruncationEngine::StrategyPtr> TruncationEngine::find_applicable(
    const std::string& content, const TruncationContext& ctx, const std::vector<std::string>& preferred) const {
    std::vector<StrategyPtr> preferred_found;
    std::vector<StrategyPtr> others;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& name : preferred) {
            auto it = strategies_.find(name);
            if (it == strategies_.end()) continue;
            if (std::find(preferred_found.begin(), preferred_found.end(), it->second) != preferred_found.end()) continue;
            preferred_found.push_back(it->second);
        }
        for (const auto& [name, strategy] : strategies_) {
            if (std::find(preferred.begin(), preferred.end(), name) != preferred.end()) continue;
            others.push_back(strategy);
        }
    }

    auto not_applicable = [&](const StrategyPtr& strategy) { return !strategy->can_truncate(content, ctx); };
    preferred_found.erase(std::remove_if(preferred_found.begin(), preferred_found.end(), not_applicable),
                          preferred_found.end());
    others.erase(std::remove_if(others.begin(), others.end(), not_applicable), others.end());
    std::stable_sort(others.begin(), others.end(),
                     [](const StrategyPtr& a, const StrategyPtr& b) { return a->priority() > b->priority(); });

    preferred_found.insert(preferred_found.end(), others.begin(), others.end());
    return preferred_found;
}

// --- 3. TRUNCATE ---
TruncationResult TruncationEngine::truncate(const std::string& content, const std::string& model,
                                            ContentType content_type, const TruncationOptions& options) {
    if (is_blank(content)) {
        return {"", 0, 0, false, "empty-content", {}};
    }

    const std::string& effective_model = model.empty() ? config_.default_model : model;
    int initial = counter_->count_tokens(content, effective_model);
    int max_tokens = options.max_tokens && *options.max_tokens > 0
                         ? *options.max_tokens
                         : get_effective_max_tokens(effective_model);

    if (initial <= max_tokens) {
        return {content, initial, 0, false, "none", {}};
    }

    TruncationContextOptions ctx_options;
    ctx_options.max_tokens = max_tokens;
    ctx_options.priority = options.priority ? *options.priority : get_content_priority(content, content_type);
    ctx_options.preserve_structure = options.preserve_structure;
    ctx_options.metadata = options.metadata;
    TruncationContext ctx = create_truncation_context(effective_model, content_type, ctx_options);

    auto applicable = find_applicable(content, ctx, options.preferred_strategies);
    if (applicable.empty()) {
        if (config_.enable_aggressive_fallback) {
            TruncationResult fallback = aggressive_fallback(content, ctx, initial);
            update_stats(fallback, content_type);
            return fallback;
        }
        return {content, initial, 0, false, "no-strategies", {kTruncationFailedWarning}};
    }

    std::optional<TruncationResult> closest;
    std::vector<std::string> warnings;
    int attempts = 0;
    for (const auto& strategy : applicable) {
        if (attempts >= config_.max_attempts) break;
        ++attempts;

        try {
            TruncationResult attempt = strategy->truncate(content, max_tokens, ctx);
            int actual = counter_->count_tokens(attempt.content, effective_model);
            attempt.token_count = actual;
            attempt.tokens_saved = initial - actual;
            attempt.was_truncated = true;
            if (attempt.strategy_used.empty()) attempt.strategy_used = strategy->name();

            if (actual <= max_tokens) {
                attempt.warnings.insert(attempt.warnings.begin(), warnings.begin(), warnings.end());
                update_stats(attempt, content_type);
                return attempt;
            }
            if (!closest || actual < closest->token_count) closest = std::move(attempt);
        } catch (const std::exception& e) {
            spdlog::warn("Truncation strategy {} failed: {}", strategy->name(), e.what());
            warnings.push_back("Strategy " + strategy->name() + " failed: " + e.what());
        }
    }

    if (closest) {
        warnings.push_back("Strategy " + closest->strategy_used + " came closest with " +
                           std::to_string(closest->token_count) + " tokens (limit " +
                           std::to_string(max_tokens) + ")");
    }

    if (config_.enable_aggressive_fallback) {
        TruncationResult fallback = aggressive_fallback(content, ctx, initial);
        fallback.warnings.insert(fallback.warnings.begin(), warnings.begin(), warnings.end());
        update_stats(fallback, content_type);
        return fallback;
    }

    spdlog::warn("Truncation failed: {} tokens exceed limit {}", initial, max_tokens);
    warnings.push_back(kTruncationFailedWarning);
    return {content, initial, 0, false, "all-strategies-failed", warnings};
}

TruncationResult TruncationEngine::aggressive_fallback(const std::string& content, const TruncationContext& ctx,
                                                       int initial_tokens) {
    int target = std::min(calculate_truncation_target(initial_tokens, ctx.max_tokens, ctx.priority), ctx.max_tokens);
    const std::string marker = kAggressiveFallbackMarker;
    int marker_tokens = counter_->count_tokens(marker, ctx.model);
    bool use_marker = marker_tokens < target;
    int content_budget = use_marker ? target - marker_tokens : target;

    double ratio = initial_tokens > 0 ? static_cast<double>(content_budget) / initial_tokens : 0.0;
    size_t target_len = static_cast<size_t>(std::floor(content.size() * ratio * 0.9));

    auto cut = [&](size_t len) {
        std::string truncated = utf8_safe_substr(content, len);
        size_t boundary = truncated.find_last_of(" \n.");
        if (boundary != std::string::npos && boundary > len * 0.8) {
            truncated = truncated.substr(0, boundary + 1);
        }
        return use_marker ? truncated + marker : truncated;
    };

    std::string truncated = cut(target_len);
    int tokens = counter_->count_tokens(truncated, ctx.model);
    while (tokens > ctx.max_tokens && target_len > 0) {
        target_len = target_len * 9 / 10;
        truncated = cut(target_len);
        tokens = counter_->count_tokens(truncated, ctx.model);
    }

    spdlog::warn("Aggressive fallback truncation: {} -> {} tokens", initial_tokens, tokens);
    return {truncated, tokens, initial_tokens - tokens, true, "aggressive-fallback",
            {"Used aggressive fallback truncation - content may be incomplete"}};
}

// --- 4. ESTIMATES ---
int TruncationEngine::estimate_savings(const std::string& content, const std::string& model,
                                       ContentType content_type, const TruncationOptions& options) {
    const std::string& effective_model = model.empty() ? config_.default_model : model;
    int initial = counter_->count_tokens(content, effective_model);
    int max_tokens = options.max_tokens && *options.max_tokens > 0
                         ? *options.max_tokens
                         : get_effective_max_tokens(effective_model);
    if (initial <= max_tokens) return 0;

    TruncationContextOptions ctx_options;
    ctx_options.max_tokens = max_tokens;
    ctx_options.priority = options.priority ? *options.priority : get_content_priority(content, content_type);
    TruncationContext ctx = create_truncation_context(effective_model, content_type, ctx_options);

    auto applicable = find_applicable(content, ctx, options.preferred_strategies);
    if (applicable.empty()) return initial - max_tokens;

    int best = 0;
    for (const auto& strategy : applicable) {
        try {
            best = std::max(best, strategy->estimate_savings(content, max_tokens, ctx));
        } catch (const std::exception& e) {
            spdlog::warn("Savings estimate from {} failed: {}", strategy->name(), e.what());
        }
    }
    return best;
}

bool TruncationEngine::needs_truncation(const std::string& content, const std::string& model,
                                        std::optional<int> max_tokens) {
    const std::string& effective_model = model.empty() ? config_.default_model : model;
    return would_exceed_context(counter_->count_tokens(content, effective_model), effective_model, max_tokens);
}

// --- 5. STATS ---
void TruncationEngine::update_stats(const TruncationResult& result, ContentType content_type) {
    if (!result.was_truncated) return;
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.total_truncations++;
    stats_.total_tokens_saved += result.tokens_saved;
    stats_.average_tokens_saved =
        static_cast<double>(stats_.total_tokens_saved) / stats_.total_truncations;
    stats_.strategy_usage[result.strategy_used]++;
    stats_.content_type_stats[to_string(content_type)]++;
}

TruncationStats TruncationEngine::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void TruncationEngine::reset_stats() {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_ = TruncationStats{};
}

} // namespace llm_reporter
