#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "log_level.hpp"

using json = nlohmann::json;

namespace llm_reporter {

// Raw arguments of one console call
using ConsoleArgs = std::vector<json>;

enum class ConsoleOrigin { Intercepted, Task };

inline const char* to_string(ConsoleOrigin origin) {
    return origin == ConsoleOrigin::Task ? "task" : "intercepted";
}

struct DedupInfo {
    int count = 1;
    std::string first_seen;
    std::string last_seen;
    std::vector<std::string> sources;
};

struct ConsoleEvent {
    LogLevel level = LogLevel::Log;
    std::string text;
    ConsoleOrigin origin = ConsoleOrigin::Intercepted;
    std::optional<int64_t> timestamp_ms;
    std::optional<std::vector<std::string>> args;
    std::optional<std::string> test_id;
    std::optional<DedupInfo> dedup;
};

struct CaptureResult {
    std::vector<ConsoleEvent> entries;
    // Set by run_with_capture when the test body threw
    std::optional<std::string> body_error;
};

} // namespace llm_reporter
