#pragma once
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <nlohmann/json.hpp>

namespace llm_reporter {

enum class ContentType { Text, Json, Code, Error, Test, Log, Markdown };

// Lower value = preserved harder
enum class ContentPriority {
    Critical = 1,
    High = 2,
    Medium = 3,
    Low = 4,
    Disposable = 5
};

const char* to_string(ContentType type);
std::optional<ContentType> parse_content_type(const std::string& name);
const char* to_string(ContentPriority priority);

struct TruncationContext {
    std::string model;
    int max_tokens = 0;
    ContentType content_type = ContentType::Text;
    ContentPriority priority = ContentPriority::Medium;
    bool preserve_structure = false;
    nlohmann::json metadata = nlohmann::json::object();
};

struct TruncationResult {
    std::string content;
    int token_count = 0;
    int tokens_saved = 0;
    bool was_truncated = false;
    std::string strategy_used;
    std::vector<std::string> warnings;
};

struct TruncationStats {
    int total_truncations = 0;
    long long total_tokens_saved = 0;
    double average_tokens_saved = 0.0;
    std::map<std::string, int> strategy_usage;
    std::map<std::string, int> content_type_stats;
};

} // namespace llm_reporter
