#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "truncation/TruncationTypes.hpp"
#include "truncation/strategies/ITruncationStrategy.hpp"
#include "tokenization/token_counter.hpp"

namespace llm_reporter {

struct TruncationEngineConfig {
    std::string default_model = "gpt-4";
    int max_attempts = 3;
    bool enable_aggressive_fallback = true;
    bool register_default_strategies = true;
};

struct TruncationOptions {
    std::optional<int> max_tokens;
    std::optional<ContentPriority> priority;
    bool preserve_structure = false;
    std::vector<std::string> preferred_strategies;
    nlohmann::json metadata = nlohmann::json::object();
};

constexpr const char* kAggressiveFallbackMarker = "\n... [Content truncated by aggressive fallback]";
constexpr const char* kTruncationFailedWarning = "Truncation failed - content exceeds token limits";

/**
 * Strategy registry plus the truncate loop: try applicable strategies in order,
 * accept the first verified fit, otherwise fall back.
 */
class TruncationEngine {
public:
    explicit TruncationEngine(TruncationEngineConfig config = {},
                              std::shared_ptr<ITokenCounter> counter = nullptr);

    // Replaces any strategy with the same name
    void register_strategy(std::unique_ptr<ITruncationStrategy> strategy);
    bool unregister_strategy(const std::string& name);
    // Shared so a strategy outlives an unregister that races a running truncate
    std::shared_ptr<ITruncationStrategy> get_strategy(const std::string& name) const;
    std::vector<std::string> strategy_names() const;

    TruncationResult truncate(const std::string& content, const std::string& model,
                              ContentType content_type, const TruncationOptions& options = {});

    int estimate_savings(const std::string& content, const std::string& model,
                         ContentType content_type, const TruncationOptions& options = {});

    bool needs_truncation(const std::string& content, const std::string& model,
                          std::optional<int> max_tokens = std::nullopt);

    TruncationStats get_stats() const;
    void reset_stats();

    const TruncationEngineConfig& config() const { return config_; }

private:
    using StrategyPtr = std::shared_ptr<ITruncationStrategy>;

    std::vector<StrategyPtr> find_applicable(const std::string& content, const TruncationContext& ctx,
                                             const std::vector<std::string>& preferred) const;
    TruncationResult aggressive_fallback(const std::string& content, const TruncationContext& ctx,
                                         int initial_tokens);
    void update_stats(const TruncationResult& result, ContentType content_type);

    TruncationEngineConfig config_;
    std::shared_ptr<ITokenCounter> counter_;

    mutable std::mutex mutex_;
    std::map<std::string, StrategyPtr> strategies_;
    TruncationStats stats_;
};

} // namespace llm_reporter
