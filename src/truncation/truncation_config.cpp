#include "truncation/truncation_config.hpp"
#include <stdexcept>

namespace llm_reporter {

const char* to_string(EarlyStrategy strategy) {
    switch (strategy) {
        case EarlyStrategy::Simple:   return "simple";
        case EarlyStrategy::Smart:    return "smart";
        case EarlyStrategy::Priority: return "priority";
    }
    return "smart";
}

std::optional<EarlyStrategy> parse_early_strategy(const std::string& name) {
    if (name == "simple") return EarlyStrategy::Simple;
    if (name == "smart") return EarlyStrategy::Smart;
    if (name == "priority") return EarlyStrategy::Priority;
    return std::nullopt;
}

const char* to_string(ConsoleCategory category) {
    switch (category) {
        case ConsoleCategory::Logs:   return "logs";
        case ConsoleCategory::Errors: return "errors";
        case ConsoleCategory::Warns:  return "warns";
        case ConsoleCategory::Info:   return "info";
        case ConsoleCategory::Debug:  return "debug";
    }
    return "logs";
}

TruncationConfig parse_truncation_config(const nlohmann::json& j) {
    TruncationConfig config;
    if (j.is_null()) return config;
    if (j.is_boolean()) {
        config.enabled = j.get<bool>();
        return config;
    }
    if (!j.is_object()) {
        throw std::invalid_argument("truncation must be a boolean or an object");
    }

    config.enabled = j.value("enabled", config.enabled);
    config.model = j.value("model", config.model);
    config.enable_early_truncation = j.value("enableEarlyTruncation", config.enable_early_truncation);
    config.enable_late_truncation = j.value("enableLateTruncation", config.enable_late_truncation);

    if (j.contains("maxTokens") && !j["maxTokens"].is_null()) {
        int max_tokens = j["maxTokens"].get<int>();
        if (max_tokens <= 0) {
            throw std::invalid_argument("maxTokens must be a positive number");
        }
        config.max_tokens = max_tokens;
    }

    std::string strategy = j.value("strategy", std::string(to_string(config.strategy)));
    auto parsed = parse_early_strategy(strategy);
    if (!parsed) {
        throw std::invalid_argument("Unknown truncation strategy: " + strategy);
    }
    config.strategy = *parsed;
    return config;
}

} // namespace llm_reporter
