#include "report/report_schema.hpp"
#include <stdexcept>

namespace llm_reporter {

namespace {

template <typename T>
json to_json_array(const std::vector<T>& items) {
    json arr = json::array();
    for (const auto& item : items) arr.push_back(item.to_json());
    return arr;
}

template <typename T>
std::vector<T> from_json_array(const json& j) {
    std::vector<T> items;
    if (!j.is_array()) return items;
    for (const auto& item : j) items.push_back(T::from_json(item));
    return items;
}

std::vector<std::string> string_list(const json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_array()) return {};
    return j[key].get<std::vector<std::string>>();
}

template <typename T>
std::optional<T> optional_value(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return j[key].get<T>();
}

} // namespace

std::string json_value_type(const json& value) {
    if (value.is_null()) return "null";
    if (value.is_string()) return "string";
    if (value.is_number()) return "number";
    if (value.is_boolean()) return "boolean";
    if (value.is_array()) return "array";
    if (value.is_object()) return "Record<string, unknown>";
    return "string";
}

// --- SUMMARY ---
json TestSummary::to_json() const {
    return json{{"total", total}, {"passed", passed}, {"failed", failed},
                {"skipped", skipped}, {"duration", duration}, {"timestamp", timestamp}};
}

TestSummary TestSummary::from_json(const json& j) {
    TestSummary s;
    s.total = j.value("total", 0);
    s.passed = j.value("passed", 0);
    s.failed = j.value("failed", 0);
    s.skipped = j.value("skipped", 0);
    s.duration = j.value("duration", 0LL);
    s.timestamp = j.value("timestamp", "");
    return s;
}

// --- ERRORS ---
json ErrorContext::to_json() const {
    json j{{"code", code}};
    if (expected) j["expected"] = *expected;
    if (actual) j["actual"] = *actual;
    if (line_number) j["lineNumber"] = *line_number;
    if (column_number) j["columnNumber"] = *column_number;
    return j;
}

ErrorContext ErrorContext::from_json(const json& j) {
    ErrorContext c;
    c.code = string_list(j, "code");
    if (j.contains("expected")) c.expected = j["expected"];
    if (j.contains("actual")) c.actual = j["actual"];
    c.line_number = optional_value<int>(j, "lineNumber");
    c.column_number = optional_value<int>(j, "columnNumber");
    return c;
}

json AssertionDetails::to_json() const {
    json j{{"expected", expected}, {"actual", actual}};
    if (op) j["operator"] = *op;
    if (expected_type) j["expectedType"] = *expected_type;
    if (actual_type) j["actualType"] = *actual_type;
    return j;
}

AssertionDetails AssertionDetails::from_json(const json& j) {
    AssertionDetails a;
    a.expected = j.contains("expected") ? j["expected"] : json();
    a.actual = j.contains("actual") ? j["actual"] : json();
    a.op = optional_value<std::string>(j, "operator");
    a.expected_type = optional_value<std::string>(j, "expectedType");
    a.actual_type = optional_value<std::string>(j, "actualType");
    return a;
}

json TestError::to_json() const {
    json j{{"message", message}, {"type", type}};
    if (stack) j["stack"] = *stack;
    if (context) j["context"] = context->to_json();
    if (assertion) j["assertion"] = assertion->to_json();
    return j;
}

TestError TestError::from_json(const json& j) {
    TestError e;
    e.message = j.value("message", "");
    e.type = j.value("type", "Error");
    e.stack = optional_value<std::string>(j, "stack");
    if (j.contains("context") && j["context"].is_object()) e.context = ErrorContext::from_json(j["context"]);
    if (j.contains("assertion") && j["assertion"].is_object()) e.assertion = AssertionDetails::from_json(j["assertion"]);
    return e;
}

// --- CONSOLE ---
std::vector<std::string>& ConsoleOutput::category(ConsoleCategory c) {
    switch (c) {
        case ConsoleCategory::Logs:   return logs;
        case ConsoleCategory::Errors: return errors;
        case ConsoleCategory::Warns:  return warns;
        case ConsoleCategory::Info:   return info;
        case ConsoleCategory::Debug:  return debug;
    }
    return logs;
}

const std::vector<std::string>& ConsoleOutput::category(ConsoleCategory c) const {
    return const_cast<ConsoleOutput*>(this)->category(c);
}

bool ConsoleOutput::empty() const {
    return logs.empty() && errors.empty() && warns.empty() && info.empty() && debug.empty();
}

ConsoleOutput ConsoleOutput::from_events(const std::vector<ConsoleEvent>& events) {
    ConsoleOutput out;
    for (const auto& event : events) {
        std::string text = event.text;
        if (event.dedup && event.dedup->count > 1) {
            text += " [x" + std::to_string(event.dedup->count) + "]";
        }
        switch (event.level) {
            case LogLevel::Log:   out.logs.push_back(std::move(text)); break;
            case LogLevel::Error: out.errors.push_back(std::move(text)); break;
            case LogLevel::Warn:  out.warns.push_back(std::move(text)); break;
            case LogLevel::Info:  out.info.push_back(std::move(text)); break;
            case LogLevel::Debug:
            case LogLevel::Trace: out.debug.push_back(std::move(text)); break;
        }
    }
    return out;
}

json ConsoleOutput::to_json() const {
    json j = json::object();
    for (auto c : {ConsoleCategory::Logs, ConsoleCategory::Errors, ConsoleCategory::Warns,
                   ConsoleCategory::Info, ConsoleCategory::Debug}) {
        const auto& lines = category(c);
        if (!lines.empty()) j[to_string(c)] = lines;
    }
    return j;
}

ConsoleOutput ConsoleOutput::from_json(const json& j) {
    ConsoleOutput c;
    c.logs = string_list(j, "logs");
    c.errors = string_list(j, "errors");
    c.warns = string_list(j, "warns");
    c.info = string_list(j, "info");
    c.debug = string_list(j, "debug");
    return c;
}

// --- TESTS ---
json TestFailure::to_json() const {
    json j{{"test", test}, {"file", file}, {"line", line}, {"error", error.to_json()}};
    if (!suite.empty()) j["suite"] = suite;
    if (console && !console->empty()) j["console"] = console->to_json();
    return j;
}

TestFailure TestFailure::from_json(const json& j) {
    TestFailure f;
    f.test = j.value("test", "");
    f.file = j.value("file", "");
    f.line = j.value("line", 0);
    f.suite = string_list(j, "suite");
    if (j.contains("error") && j["error"].is_object()) f.error = TestError::from_json(j["error"]);
    if (j.contains("console") && j["console"].is_object()) f.console = ConsoleOutput::from_json(j["console"]);
    return f;
}

json TestResult::to_json() const {
    json j{{"test", test}, {"file", file}, {"line", line}, {"status", status}};
    if (duration) j["duration"] = *duration;
    if (!suite.empty()) j["suite"] = suite;
    return j;
}

TestResult TestResult::from_json(const json& j) {
    TestResult r;
    r.test = j.value("test", "");
    r.file = j.value("file", "");
    r.line = j.value("line", 0);
    r.duration = optional_value<long long>(j, "duration");
    r.status = j.value("status", "passed");
    r.suite = string_list(j, "suite");
    return r;
}

// --- REPORT ---
json ReporterOutput::to_json() const {
    json j{{"summary", summary.to_json()}};
    if (failures) j["failures"] = to_json_array(*failures);
    if (passed) j["passed"] = to_json_array(*passed);
    if (skipped) j["skipped"] = to_json_array(*skipped);
    return j;
}

ReporterOutput ReporterOutput::from_json(const json& j) {
    if (!j.is_object() || !j.contains("summary") || !j["summary"].is_object()) {
        throw std::invalid_argument("Report is missing the summary object");
    }
    ReporterOutput out;
    out.summary = TestSummary::from_json(j["summary"]);
    if (j.contains("failures")) out.failures = from_json_array<TestFailure>(j["failures"]);
    if (j.contains("passed")) out.passed = from_json_array<TestResult>(j["passed"]);
    if (j.contains("skipped")) out.skipped = from_json_array<TestResult>(j["skipped"]);
    return out;
}

} // namespace llm_reporter
