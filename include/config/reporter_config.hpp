#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "console/ConsoleCapture.hpp"
#include "dedup/deduplication_config.hpp"
#include "truncation/truncation_config.hpp"

namespace llm_reporter {

struct ReporterConfig {
    DeduplicationConfig deduplication;
    ConsoleCaptureConfig console;
    TruncationConfig truncation;
};

ConsoleCaptureConfig parse_console_config(const nlohmann::json& j);

// Throws std::invalid_argument on invalid values
ReporterConfig parse_reporter_config(const nlohmann::json& j);

// Missing file -> defaults. Malformed JSON -> std::runtime_error.
ReporterConfig load_reporter_config(const std::string& path);

} // namespace llm_reporter
