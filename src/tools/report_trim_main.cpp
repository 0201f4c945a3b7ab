#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include "config/reporter_config.hpp"
#include "report/report_schema.hpp"
#include "truncation/LateTruncator.hpp"

namespace {

struct CliOptions {
    std::string report_path;
    std::optional<std::string> config_path;
    std::optional<int> max_tokens;
};

void print_usage() {
    std::cerr << "Usage: report_trim <report.json> [--config <config.json>] [--max-tokens <n>]\n";
}

std::optional<CliOptions> parse_args(int argc, char** argv) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            opts.config_path = argv[++i];
        } else if (arg == "--max-tokens" && i + 1 < argc) {
            opts.max_tokens = std::stoi(argv[++i]);
            if (*opts.max_tokens <= 0) throw std::invalid_argument("--max-tokens must be a positive number");
        } else if (arg == "-h" || arg == "--help") {
            return std::nullopt;
        } else if (!arg.empty() && arg[0] != '-' && opts.report_path.empty()) {
            opts.report_path = arg;
        } else {
            throw std::invalid_argument("Unexpected argument: " + arg);
        }
    }
    if (opts.report_path.empty()) return std::nullopt;
    return opts;
}

} // namespace

int main(int argc, char** argv) {
    // stdout carries the report only
    spdlog::set_default_logger(spdlog::stderr_color_mt("report_trim"));
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    try {
        std::optional<CliOptions> opts;
        try {
            opts = parse_args(argc, argv);
        } catch (const std::invalid_argument& e) {
            spdlog::error("❌ {}", e.what());
            print_usage();
            return 2;
        }
        if (!opts) {
            print_usage();
            return 2;
        }

        llm_reporter::ReporterConfig config;
        if (opts->config_path) config = llm_reporter::load_reporter_config(*opts->config_path);

        // The tool exists to trim, so late truncation runs even when the config leaves it off
        llm_reporter::TruncationConfig truncation = config.truncation;
        truncation.enabled = true;
        truncation.enable_late_truncation = true;
        if (opts->max_tokens) truncation.max_tokens = opts->max_tokens;

        std::ifstream f(opts->report_path);
        if (!f.is_open()) {
            spdlog::error("❌ Could not open report {}", opts->report_path);
            return 1;
        }
        auto report = llm_reporter::ReporterOutput::from_json(nlohmann::json::parse(f));

        llm_reporter::LateTruncator truncator;
        int before = truncator.estimate_tokens(report);
        auto trimmed = truncator.apply(report, truncation);
        spdlog::info("✅ Report trimmed: {} -> {} tokens", before, truncator.estimate_tokens(trimmed));

        std::cout << trimmed.to_json().dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
        return 0;
    } catch (const std::exception& e) {
        spdlog::error("❌ report_trim failed: {}", e.what());
        return 1;
    }
}
