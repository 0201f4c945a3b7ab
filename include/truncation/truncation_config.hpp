#pragma once
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace llm_reporter {

enum class EarlyStrategy { Simple, Smart, Priority };

const char* to_string(EarlyStrategy strategy);
std::optional<EarlyStrategy> parse_early_strategy(const std::string& name);

struct TruncationConfig {
    bool enabled = false;
    std::optional<int> max_tokens;
    std::string model = "gpt-4";
    EarlyStrategy strategy = EarlyStrategy::Smart;
    bool enable_early_truncation = true;
    bool enable_late_truncation = true;
};

// Report console categories, in report order
enum class ConsoleCategory { Logs, Errors, Warns, Info, Debug };

const char* to_string(ConsoleCategory category);

// Throws std::invalid_argument on an unknown strategy or a non-positive maxTokens
TruncationConfig parse_truncation_config(const nlohmann::json& j);

} // namespace llm_reporter
