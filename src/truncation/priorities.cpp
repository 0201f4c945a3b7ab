#include "truncation/priorities.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <unordered_map>

namespace llm_reporter {

// --- 1. ENUM NAMES ---

const char* to_string(ContentType type) {
    switch (type) {
        case ContentType::Text:     return "text";
        case ContentType::Json:     return "json";
        case ContentType::Code:     return "code";
        case ContentType::Error:    return "error";
        case ContentType::Test:     return "test";
        case ContentType::Log:      return "log";
        case ContentType::Markdown: return "markdown";
    }
    return "text";
}

std::optional<ContentType> parse_content_type(const std::string& name) {
    static const std::unordered_map<std::string, ContentType> names = {
        {"text", ContentType::Text}, {"json", ContentType::Json}, {"code", ContentType::Code},
        {"error", ContentType::Error}, {"test", ContentType::Test}, {"log", ContentType::Log},
        {"markdown", ContentType::Markdown}};
    auto it = names.find(name);
    if (it == names.end()) return std::nullopt;
    return it->second;
}

const char* to_string(ContentPriority priority) {
    switch (priority) {
        case ContentPriority::Critical:   return "critical";
        case ContentPriority::High:       return "high";
        case ContentPriority::Medium:     return "medium";
        case ContentPriority::Low:        return "low";
        case ContentPriority::Disposable: return "disposable";
    }
    return "medium";
}

// --- 2. MATCHERS ---

ContentMatcher regex_matcher(std::regex pattern) {
    return [pattern = std::move(pattern)](const std::string& content) {
        return std::regex_search(content, pattern);
    };
}

namespace {

bool starts_word(const std::string& text, size_t pos) {
    return pos == 0 || !is_word_char(text[pos - 1]);
}

bool ends_word(const std::string& text, size_t end) {
    return end >= text.size() || !is_word_char(text[end]);
}

bool line_has_pair(const std::string& line, const std::string& first, const std::string& second) {
    size_t start = line.find(first);
    while (start != std::string::npos && !starts_word(line, start)) {
        start = line.find(first, start + 1);
    }
    if (start == std::string::npos) return false;

    size_t pos = line.find(second, start + first.size());
    while (pos != std::string::npos) {
        if (ends_word(line, pos + second.size())) return true;
        pos = line.find(second, pos + 1);
    }
    return false;
}

} // namespace

ContentMatcher word_pair_matcher(std::vector<std::pair<std::string, std::string>> pairs) {
    return [pairs = std::move(pairs)](const std::string& content) {
        std::string lowered = to_lower_copy(content);
        size_t begin = 0;
        while (begin <= lowered.size()) {
            size_t end = lowered.find_first_of("\r\n", begin);
            if (end == std::string::npos) end = lowered.size();
            std::string line = lowered.substr(begin, end - begin);
            for (const auto& [first, second] : pairs) {
                if (line_has_pair(line, first, second)) return true;
            }
            begin = end + 1;
        }
        return false;
    };
}

// --- 3. DEFAULT TABLES ---

const std::map<ContentType, ContentTypeConfig>& default_content_type_configs() {
    static const std::map<ContentType, ContentTypeConfig> configs = {
        {ContentType::Text,     {ContentType::Text, ContentPriority::Medium, false, 0.7}},
        {ContentType::Json,     {ContentType::Json, ContentPriority::High, true, 0.5}},
        {ContentType::Code,     {ContentType::Code, ContentPriority::High, true, 0.4}},
        {ContentType::Error,    {ContentType::Error, ContentPriority::Critical, true, 0.2}},
        {ContentType::Test,     {ContentType::Test, ContentPriority::High, false, 0.6}},
        {ContentType::Log,      {ContentType::Log, ContentPriority::Low, false, 0.8}},
        {ContentType::Markdown, {ContentType::Markdown, ContentPriority::Medium, true, 0.6}},
    };
    return configs;
}

const std::vector<PriorityRule>& default_priority_rules() {
    static const auto icase = std::regex::ECMAScript | std::regex::icase;
    static const std::vector<PriorityRule> rules = {
        {regex_matcher(std::regex(R"(\b(error|exception|failed|failure|crash|panic)\b)", icase)),
         ContentPriority::Critical, std::nullopt, "Error-related content"},
        {word_pair_matcher({{"test", "failed"}, {"assertion", "failed"}, {"expect", "to"}}),
         ContentPriority::Critical, ContentType::Test, "Test failure information"},
        {regex_matcher(std::regex(R"(\b(function|class|interface|type|export|import)\b)", icase)),
         ContentPriority::High, ContentType::Code, "Important code structures"},
        {regex_matcher(std::regex(R"(\b(warning|warn|deprecated|todo|fixme)\b)", icase)),
         ContentPriority::Medium, std::nullopt, "Warning and maintenance notices"},
        {regex_matcher(std::regex(R"(\b(debug|trace|verbose|log)\b)", icase)),
         ContentPriority::Low, std::nullopt, "Debug and logging information"},
        {regex_matcher(std::regex(R"(\d{4}-\d{2}-\d{2}[T ]\d{2}:\d{2}:\d{2})")),
         ContentPriority::Disposable, std::nullopt, "Timestamp information"},
    };
    return rules;
}

double get_preserve_ratio(ContentPriority priority) {
    switch (priority) {
        case ContentPriority::Critical:   return 0.9;
        case ContentPriority::High:       return 0.7;
        case ContentPriority::Medium:     return 0.5;
        case ContentPriority::Low:        return 0.3;
        case ContentPriority::Disposable: return 0.1;
    }
    return 0.5;
}

int get_section_weight(const std::string& section) {
    static const std::unordered_map<std::string, int> weights = {
        {"error_messages", 100}, {"stack_traces", 95}, {"assertion_failures", 90},
        {"test_names", 85}, {"test_results", 80}, {"test_metadata", 70},
        {"source_code", 75}, {"function_signatures", 85}, {"import_statements", 60}, {"comments", 30},
        {"error_logs", 80}, {"warning_logs", 60}, {"info_logs", 40}, {"debug_logs", 20},
        {"summaries", 70}, {"descriptions", 50}, {"examples", 45},
        {"timestamps", 25}, {"file_paths", 55}, {"line_numbers", 40}, {"configuration", 35}};
    auto it = weights.find(section);
    return it == weights.end() ? 50 : it->second;
}

bool should_preserve_content(ContentPriority priority, double truncation_pressure) {
    double threshold = 0.0;
    switch (priority) {
        case ContentPriority::Critical:   threshold = 0.95; break;
        case ContentPriority::High:       threshold = 0.8; break;
        case ContentPriority::Medium:     threshold = 0.6; break;
        case ContentPriority::Low:        threshold = 0.3; break;
        case ContentPriority::Disposable: threshold = 0.0; break;
    }
    return truncation_pressure < threshold;
}

// --- 4. PRIORITY MANAGER ---

PriorityManager::PriorityManager()
    : configs_(default_content_type_configs()), rules_(default_priority_rules()) {}

PriorityManager::PriorityManager(std::map<ContentType, ContentTypeConfig> overrides,
                                 std::vector<PriorityRule> rules)
    : configs_(default_content_type_configs()), rules_(std::move(rules)) {
    for (auto& [type, config] : overrides) configs_[type] = config;
    if (rules_.empty()) rules_ = default_priority_rules();
}

ContentPriority PriorityManager::determine_priority(const std::string& content, ContentType type) const {
    ContentPriority priority = get_content_type_config(type).default_priority;

    for (const auto& rule : rules_) {
        if (rule.content_type && *rule.content_type != type) continue;
        if (rule.priority >= priority) continue;
        if (rule.matches && rule.matches(content)) {
            priority = rule.priority;
        }
    }
    return priority;
}

const ContentTypeConfig& PriorityManager::get_content_type_config(ContentType type) const {
    auto it = configs_.find(type);
    if (it == configs_.end()) return configs_.at(ContentType::Text);
    return it->second;
}

void PriorityManager::update_content_type_config(ContentType type, const ContentTypeConfig& config) {
    configs_[type] = config;
    configs_[type].type = type;
}

void PriorityManager::add_priority_rule(PriorityRule rule) {
    rules_.push_back(std::move(rule));
}

double PriorityManager::score_content_importance(const std::string& content, ContentType type,
                                                 const std::optional<ImportanceFactors>& factors) const {
    ContentPriority priority = determine_priority(content, type);
    double score = (6 - static_cast<int>(priority)) * 20.0;

    if (get_content_type_config(type).default_priority == ContentPriority::Critical) {
        score += 10;
    }
    if (factors) {
        score += factors->file_importance * 20;
        score += factors->context_relevance * 15;
        if (factors->user_specified) score += 25;
    }
    return std::clamp(score, 0.0, 100.0);
}

ContentPriority get_content_priority(const std::string& content, ContentType type) {
    static const PriorityManager manager;
    return manager.determine_priority(content, type);
}

} // namespace llm_reporter
