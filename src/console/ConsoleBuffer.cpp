#include "console/ConsoleBuffer.hpp"
#include "console/arg_formatter.hpp"
#include "dedup/message_normalizer.hpp"

namespace llm_reporter {

ConsoleBuffer::ConsoleBuffer(ConsoleBufferConfig config) : config_(config) {}

bool ConsoleBuffer::add(LogLevel level,
                        const ConsoleArgs& args,
                        std::optional<int64_t> timestamp_ms,
                        ConsoleOrigin origin,
                        bool is_duplicate,
                        const std::optional<std::string>& dedup_key,
                        const std::optional<std::string>& test_id) {
    if (truncated_) return false;

    if (dedup_key) {
        // Key is recorded even when the line itself is dropped as a duplicate
        if (!seen_keys_.insert(*dedup_key).second) return false;
        if (is_duplicate) return false;
    }

    FormattedArgs formatted = format_console_args(args);
    std::string text = config_.strip_ansi ? strip_ansi_codes(formatted.message) : formatted.message;

    size_t bytes = text.size();
    if (total_bytes_ + bytes > config_.max_bytes || events_.size() >= config_.max_lines) {
        add_truncation_marker();
        return false;
    }

    ConsoleEvent event;
    event.level = level;
    event.text = std::move(text);
    event.origin = origin;
    event.timestamp_ms = timestamp_ms;
    event.test_id = test_id;
    if (args.size() > 1 || (args.size() == 1 && (args[0].is_object() || args[0].is_array()))) {
        event.args = std::move(formatted.serialized);
    }

    events_.push_back(std::move(event));
    total_bytes_ += bytes;
    return true;
}

void ConsoleBuffer::add_truncation_marker() {
    if (truncated_) return;
    ConsoleEvent marker;
    marker.level = LogLevel::Warn;
    marker.text = kTruncationMarker;
    marker.origin = ConsoleOrigin::Intercepted;
    events_.push_back(std::move(marker));
    truncated_ = true;
}

ConsoleBufferStats ConsoleBuffer::get_stats() const {
    return {total_bytes_, events_.size(), truncated_};
}

void ConsoleBuffer::clear() {
    events_.clear();
    seen_keys_.clear();
    total_bytes_ = 0;
    truncated_ = false;
}

} // namespace llm_reporter
