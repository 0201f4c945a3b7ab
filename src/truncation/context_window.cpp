#include "truncation/context_window.hpp"
#include <map>
#include <cmath>
#include <algorithm>

namespace llm_reporter {

namespace {

struct ModelLimits {
    int window;
    double margin;
};

const std::map<std::string, ModelLimits>& model_table() {
    static const std::map<std::string, ModelLimits> table = {
        {"gpt-4", {128000, 0.15}},
        {"gpt-4-turbo", {128000, 0.15}},
        {"gpt-4o", {128000, 0.15}},
        {"gpt-4o-mini", {128000, 0.15}},
        {"gpt-3.5-turbo", {16385, 0.2}},
        {"claude-3-opus", {200000, 0.1}},
        {"claude-3-sonnet", {200000, 0.1}},
        {"claude-3-haiku", {200000, 0.1}},
        {"claude-3-5-sonnet", {200000, 0.1}},
        {"claude-3-5-haiku", {200000, 0.1}},
    };
    return table;
}

const ModelLimits& lookup(const std::string& model) {
    auto it = model_table().find(model);
    if (it == model_table().end()) return model_table().at(kDefaultModel);
    return it->second;
}

} // namespace

int get_context_window_size(const std::string& model) {
    return lookup(model).window;
}

double get_safety_margin(const std::string& model) {
    return lookup(model).margin;
}

bool is_model_supported(const std::string& model) {
    return model_table().count(model) > 0;
}

std::vector<std::string> get_supported_models() {
    std::vector<std::string> models;
    for (const auto& [name, limits] : model_table()) models.push_back(name);
    return models;
}

int get_effective_max_tokens(const std::string& model, std::optional<int> custom_max) {
    const auto& limits = lookup(model);
    int requested = (custom_max && *custom_max > 0) ? *custom_max : limits.window;
    int capped = std::min(requested, limits.window);
    return static_cast<int>(std::floor(capped * (1.0 - limits.margin)));
}

bool would_exceed_context(int token_count, const std::string& model, std::optional<int> custom_max) {
    return token_count > get_effective_max_tokens(model, custom_max);
}

TruncationContext create_truncation_context(const std::string& model, ContentType type,
                                            const TruncationContextOptions& options) {
    TruncationContext ctx;
    ctx.model = model;
    ctx.max_tokens = (options.max_tokens && *options.max_tokens > 0)
                         ? *options.max_tokens
                         : get_effective_max_tokens(model);
    ctx.content_type = type;
    ctx.priority = options.priority;
    ctx.preserve_structure = options.preserve_structure;
    ctx.metadata = options.metadata.is_object() ? options.metadata : nlohmann::json::object();
    return ctx;
}

int calculate_truncation_target(int current_tokens, int max_tokens, ContentPriority priority) {
    if (current_tokens <= max_tokens) return current_tokens;

    double fit = static_cast<double>(max_tokens) / current_tokens;
    double factor = fit;
    switch (priority) {
        case ContentPriority::Critical:   factor = std::max(0.9, fit); break;
        case ContentPriority::High:       factor = std::max(0.7, 0.85 * fit); break;
        case ContentPriority::Medium:     factor = std::max(0.6, 0.8 * fit); break;
        case ContentPriority::Low:        factor = std::max(0.4, 0.6 * fit); break;
        case ContentPriority::Disposable: factor = fit; break;
    }
    return static_cast<int>(std::floor(current_tokens * factor));
}

ModelContextInfo get_model_context_info(const std::string& model, std::optional<int> custom_max) {
    ModelContextInfo info;
    info.model = model;
    info.context_window = get_context_window_size(model);
    info.safety_margin = get_safety_margin(model);
    info.effective_max_tokens = get_effective_max_tokens(model, custom_max);
    info.warning_threshold = static_cast<int>(std::floor(info.effective_max_tokens * 0.8));
    info.required_threshold = static_cast<int>(std::floor(info.effective_max_tokens * 0.95));
    return info;
}

} // namespace llm_reporter
