#pragma once
#include <string>

namespace llm_reporter {

struct NormalizationOptions {
    bool strip_ansi = true;
    bool strip_timestamps = true;
    bool normalize_whitespace = true;
};

std::string strip_ansi_codes(const std::string& text);
std::string strip_timestamps(const std::string& text);
std::string collapse_whitespace(const std::string& text);

// ANSI -> timestamps -> whitespace -> lowercase. Idempotent for any options.
std::string normalize_message(const std::string& message, const NormalizationOptions& opts = {});

// DJB2 over the bytes, rendered base36.
std::string hash_message(const std::string& normalized);

} // namespace llm_reporter
