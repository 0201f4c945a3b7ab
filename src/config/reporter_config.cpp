#include "config/reporter_config.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace llm_reporter {

namespace fs = std::filesystem;

ConsoleCaptureConfig parse_console_config(const json& j) {
    ConsoleCaptureConfig config;
    if (j.is_null()) return config;
    if (j.is_boolean()) {
        config.enabled = j.get<bool>();
        return config;
    }
    if (!j.is_object()) {
        throw std::invalid_argument("console must be a boolean or an object");
    }

    config.enabled = j.value("enabled", config.enabled);
    config.grace_period_ms = j.value("gracePeriodMs", config.grace_period_ms);
    config.include_debug_output = j.value("includeDebugOutput", config.include_debug_output);
    config.strip_ansi = j.value("stripAnsi", config.strip_ansi);

    int max_bytes = j.value("maxBytes", static_cast<int>(config.max_bytes));
    int max_lines = j.value("maxLines", static_cast<int>(config.max_lines));
    if (config.grace_period_ms < 0) throw std::invalid_argument("gracePeriodMs must not be negative");
    if (max_bytes <= 0) throw std::invalid_argument("maxBytes must be a positive number");
    if (max_lines <= 0) throw std::invalid_argument("maxLines must be a positive number");
    config.max_bytes = static_cast<size_t>(max_bytes);
    config.max_lines = static_cast<size_t>(max_lines);
    return config;
}

ReporterConfig parse_reporter_config(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Reporter config must be a JSON object");
    }

    ReporterConfig config;
    try {
        if (j.contains("deduplicateLogs")) config.deduplication = parse_deduplication_config(j["deduplicateLogs"]);
        if (j.contains("console")) config.console = parse_console_config(j["console"]);
        if (j.contains("truncation")) config.truncation = parse_truncation_config(j["truncation"]);
    } catch (const json::type_error& e) {
        throw std::invalid_argument(std::string("Invalid config value: ") + e.what());
    }
    return config;
}

ReporterConfig load_reporter_config(const std::string& path) {
    if (!fs::exists(path)) {
        spdlog::warn("⚠️ Config file {} not found, using defaults", path);
        return ReporterConfig{};
    }

    std::ifstream f(path);
    if (!f.is_open()) {
        spdlog::error("❌ Could not open config file {}", path);
        throw std::runtime_error("Could not open config file: " + path);
    }

    json j;
    try {
        j = json::parse(f);
    } catch (const json::parse_error& e) {
        spdlog::error("❌ Failed to parse config {}: {}", path, e.what());
        throw std::runtime_error("Failed to parse config " + path + ": " + e.what());
    }

    ReporterConfig config = parse_reporter_config(j);
    spdlog::info("⚙️ Loaded reporter config from {}", path);
    return config;
}

} // namespace llm_reporter
