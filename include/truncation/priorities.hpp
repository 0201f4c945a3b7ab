#pragma once
#include <string>
#include <vector>
#include <map>
#include <regex>
#include <optional>
#include <functional>
#include "truncation/TruncationTypes.hpp"

namespace llm_reporter {

struct ContentTypeConfig {
    ContentType type = ContentType::Text;
    ContentPriority default_priority = ContentPriority::Medium;
    bool preserve_structure = false;
    double max_truncation_percent = 0.7;
};

// True when the rule applies to the content
using ContentMatcher = std::function<bool(const std::string&)>;

// regex_search over the whole content. Patterns need bounded repeats: std::regex
// recursion grows with each character an unbounded repeat consumes.
ContentMatcher regex_matcher(std::regex pattern);

// Case-insensitive `first ... second` on one line: `first` starts a word, `second` ends one
ContentMatcher word_pair_matcher(std::vector<std::pair<std::string, std::string>> pairs);

struct PriorityRule {
    ContentMatcher matches;
    ContentPriority priority;
    std::optional<ContentType> content_type;  // rule only applies to this type when set
    std::string description;
};

struct ImportanceFactors {
    double file_importance = 0.0;    // 0..1
    double context_relevance = 0.0;  // 0..1
    bool user_specified = false;
};

const std::vector<PriorityRule>& default_priority_rules();
const std::map<ContentType, ContentTypeConfig>& default_content_type_configs();

// Fraction of the allotted budget a fragment of this priority may keep
double get_preserve_ratio(ContentPriority priority);

// Weight (0..100) of a named report section, 50 for unknown names
int get_section_weight(const std::string& section);

// truncation_pressure: 0 = none, 1 = maximum
bool should_preserve_content(ContentPriority priority, double truncation_pressure);

class PriorityManager {
public:
    PriorityManager();
    PriorityManager(std::map<ContentType, ContentTypeConfig> overrides, std::vector<PriorityRule> rules);

    // Starts at the type default; matching rules can only raise it
    ContentPriority determine_priority(const std::string& content, ContentType type) const;

    const ContentTypeConfig& get_content_type_config(ContentType type) const;
    void update_content_type_config(ContentType type, const ContentTypeConfig& config);

    void add_priority_rule(PriorityRule rule);
    const std::vector<PriorityRule>& rules() const { return rules_; }

    double score_content_importance(const std::string& content, ContentType type,
                                    const std::optional<ImportanceFactors>& factors = std::nullopt) const;

private:
    std::map<ContentType, ContentTypeConfig> configs_;
    std::vector<PriorityRule> rules_;
};

ContentPriority get_content_priority(const std::string& content, ContentType type);

} // namespace llm_reporter
