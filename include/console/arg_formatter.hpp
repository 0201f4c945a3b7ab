#pragma once
#include <string>
#include <vector>
#include "console/ConsoleTypes.hpp"

namespace llm_reporter {

constexpr size_t kMaxTopLevelStringBytes = 1000;
constexpr size_t kMaxNestedStringBytes = 200;
constexpr size_t kMaxArrayItems = 10;
constexpr int kMaxSerializeDepth = 3;

// Never throws. Anything that fails to render becomes "[Failed to serialize]".
std::string serialize_console_arg(const json& arg);

struct FormattedArgs {
    std::vector<std::string> serialized;
    std::string message;  // serialized args joined by a space
};

FormattedArgs format_console_args(const ConsoleArgs& args);

} // namespace llm_reporter
