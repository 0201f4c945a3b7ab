#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "console/ConsoleTypes.hpp"
#include "truncation/truncation_config.hpp"

namespace llm_reporter {

struct TestSummary {
    int total = 0;
    int passed = 0;
    int failed = 0;
    int skipped = 0;
    long long duration = 0;  // ms
    std::string timestamp;   // ISO 8601

    nlohmann::json to_json() const;
    static TestSummary from_json(const nlohmann::json& j);
};

struct ErrorContext {
    std::vector<std::string> code;
    std::optional<nlohmann::json> expected;
    std::optional<nlohmann::json> actual;
    std::optional<int> line_number;
    std::optional<int> column_number;

    nlohmann::json to_json() const;
    static ErrorContext from_json(const nlohmann::json& j);
};

struct AssertionDetails {
    nlohmann::json expected;
    nlohmann::json actual;
    std::optional<std::string> op;
    std::optional<std::string> expected_type;
    std::optional<std::string> actual_type;

    nlohmann::json to_json() const;
    static AssertionDetails from_json(const nlohmann::json& j);
};

struct TestError {
    std::string message;
    std::string type;
    std::optional<std::string> stack;
    std::optional<ErrorContext> context;
    std::optional<AssertionDetails> assertion;

    nlohmann::json to_json() const;
    static TestError from_json(const nlohmann::json& j);
};

struct ConsoleOutput {
    std::vector<std::string> logs;
    std::vector<std::string> errors;
    std::vector<std::string> warns;
    std::vector<std::string> info;
    std::vector<std::string> debug;

    std::vector<std::string>& category(ConsoleCategory c);
    const std::vector<std::string>& category(ConsoleCategory c) const;
    bool empty() const;

    // Debug and trace events land in `debug`; repeated lines carry their count
    static ConsoleOutput from_events(const std::vector<ConsoleEvent>& events);

    nlohmann::json to_json() const;
    static ConsoleOutput from_json(const nlohmann::json& j);
};

struct TestFailure {
    std::string test;
    std::string file;
    int line = 0;
    std::vector<std::string> suite;
    TestError error;
    std::optional<ConsoleOutput> console;

    nlohmann::json to_json() const;
    static TestFailure from_json(const nlohmann::json& j);
};

struct TestResult {
    std::string test;
    std::string file;
    int line = 0;
    std::optional<long long> duration;
    std::string status;  // "passed" | "skipped"
    std::vector<std::string> suite;

    nlohmann::json to_json() const;
    static TestResult from_json(const nlohmann::json& j);
};

struct ReporterOutput {
    TestSummary summary;
    std::optional<std::vector<TestFailure>> failures;
    std::optional<std::vector<TestResult>> passed;
    std::optional<std::vector<TestResult>> skipped;

    nlohmann::json to_json() const;
    // Throws std::invalid_argument when `summary` is missing
    static ReporterOutput from_json(const nlohmann::json& j);
};

// "string" | "number" | "boolean" | "null" | "array" | "Record<string, unknown>"
std::string json_value_type(const nlohmann::json& value);

} // namespace llm_reporter
