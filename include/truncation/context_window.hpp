#pragma once
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>
#include "truncation/TruncationTypes.hpp"

namespace llm_reporter {

constexpr const char* kDefaultModel = "gpt-4";

struct ModelContextInfo {
    std::string model;
    int context_window = 0;
    double safety_margin = 0.0;
    int effective_max_tokens = 0;
    int warning_threshold = 0;   // 80% of effective
    int required_threshold = 0;  // 95% of effective
};

// Unknown models resolve to the gpt-4 entry
int get_context_window_size(const std::string& model);
double get_safety_margin(const std::string& model);
bool is_model_supported(const std::string& model);
std::vector<std::string> get_supported_models();

// floor(min(custom_max or window, window) * (1 - margin)); custom_max <= 0 counts as unset
int get_effective_max_tokens(const std::string& model, std::optional<int> custom_max = std::nullopt);

bool would_exceed_context(int token_count, const std::string& model,
                          std::optional<int> custom_max = std::nullopt);

struct TruncationContextOptions {
    std::optional<int> max_tokens;
    ContentPriority priority = ContentPriority::Medium;
    bool preserve_structure = false;
    nlohmann::json metadata = nlohmann::json::object();
};

TruncationContext create_truncation_context(const std::string& model, ContentType type,
                                            const TruncationContextOptions& options = {});

// Tokens to aim for; critical content keeps at least 90%, disposable just fits
int calculate_truncation_target(int current_tokens, int max_tokens, ContentPriority priority);

ModelContextInfo get_model_context_info(const std::string& model,
                                        std::optional<int> custom_max = std::nullopt);

} // namespace llm_reporter
