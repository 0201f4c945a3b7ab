#include "console/arg_formatter.hpp"
#include "text_utils.hpp"
#include <exception>

namespace llm_reporter {

namespace {

json limit_value(const json& value, int depth) {
    if (value.is_string()) {
        const auto& s = value.get_ref<const std::string&>();
        if (s.size() > kMaxNestedStringBytes) {
            return utf8_safe_substr(s, kMaxNestedStringBytes) + "...";
        }
        return value;
    }

    if (value.is_object()) {
        if (depth >= kMaxSerializeDepth) return "[Object]";
        json out = json::object();
        for (auto it = value.begin(); it != value.end(); ++it) {
            out[it.key()] = limit_value(it.value(), depth + 1);
        }
        return out;
    }

    if (value.is_array()) {
        if (depth >= kMaxSerializeDepth) return "[Array]";
        json out = json::array();
        size_t i = 0;
        for (const auto& item : value) {
            if (i == kMaxArrayItems) {
                out.push_back("... " + std::to_string(value.size() - kMaxArrayItems) + " more items");
                break;
            }
            out.push_back(limit_value(item, depth + 1));
            ++i;
        }
        return out;
    }

    return value;
}

} // namespace

std::string serialize_console_arg(const json& arg) {
    try {
        if (arg.is_null()) return "null";

        if (arg.is_string()) {
            const auto& s = arg.get_ref<const std::string&>();
            if (s.size() > kMaxTopLevelStringBytes) {
                return utf8_safe_substr(s, kMaxTopLevelStringBytes) + "... [truncated]";
            }
            return s;
        }

        if (arg.is_object() || arg.is_array()) {
            // Keys come out sorted since json objects are ordered maps
            return limit_value(arg, 0).dump();
        }

        return arg.dump();
    } catch (const std::exception&) {
        return "[Failed to serialize]";
    }
}

FormattedArgs format_console_args(const ConsoleArgs& args) {
    FormattedArgs out;
    out.serialized.reserve(args.size());
    for (const auto& arg : args) {
        out.serialized.push_back(serialize_console_arg(arg));
    }
    out.message = join_lines(out.serialized, " ");
    return out;
}

} // namespace llm_reporter
