#include "peerchat/log/StructuredLogger.hpp"

#include <chrono>
#include <ctime>
#include <iostream>

namespace peerchat::log {

namespace {

constexpr char kHexDigits[] = "0123456789ABCDEF";

// Appends value as the body of a JSON string literal.
void append_json_string(std::string& out, std::string_view value) {
    out.push_back('"');
    for (const unsigned char ch : value) {
        switch (ch) {
            case '"':
                out.append("\\\"");
                break;
            case '\\':
                out.append("\\\\");
                break;
            case '\n':
                out.append("\\n");
                break;
            case '\r':
                out.append("\\r");
                break;
            case '\t':
                out.append("\\t");
                break;
            default:
                if (ch < 0x20 || ch == 0x7F) {
                    out.append("\\u00");
                    out.push_back(kHexDigits[ch >> 4]);
                    out.push_back(kHexDigits[ch & 0x0F]);
                } else {
                    out.push_back(static_cast<char>(ch));
                }
                break;
        }
    }
    out.push_back('"');
}

std::string_view level_name(StructuredLogger::Level level) {
    switch (level) {
        case StructuredLogger::Level::Debug:
            return "debug";
        case StructuredLogger::Level::Info:
            return "info";
        case StructuredLogger::Level::Warning:
            return "warning";
        case StructuredLogger::Level::Error:
            return "error";
    }
    return "info";
}

// ISO-8601 UTC with milliseconds, e.g. 2024-05-01T12:00:00.042Z.
std::string utc_timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now - seconds).count();
    const std::time_t now_c = std::chrono::system_clock::to_time_t(seconds);

    std::tm tm{};
    gmtime_r(&now_c, &tm);

    char buffer[32];
    const auto length = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &tm);
    std::string stamp(buffer, length);
    stamp.push_back('.');
    stamp.push_back(static_cast<char>('0' + (millis / 100) % 10));
    stamp.push_back(static_cast<char>('0' + (millis / 10) % 10));
    stamp.push_back(static_cast<char>('0' + millis % 10));
    stamp.push_back('Z');
    return stamp;
}

}  // namespace

StructuredLogger& StructuredLogger::instance() {
    static StructuredLogger logger;
    return logger;
}

std::string StructuredLogger::format_record(Level level, std::string_view event, const FieldList& fields) {
    std::string line;
    line.reserve(96 + fields.size() * 32);
    line.append("{\"ts\":");
    append_json_string(line, utc_timestamp());
    line.append(",\"level\":");
    append_json_string(line, level_name(level));
    line.append(",\"event\":");
    append_json_string(line, event);

    if (!fields.empty()) {
        line.append(",\"fields\":{");
        bool first = true;
        for (const auto& [key, value] : fields) {
            if (!first) {
                line.push_back(',');
            }
            first = false;
            append_json_string(line, key);
            line.push_back(':');
            append_json_string(line, value);
        }
        line.push_back('}');
    }
    line.append("}\n");
    return line;
}

void StructuredLogger::log(Level level, std::string_view event, FieldList fields) {
    std::scoped_lock lock(mutex_);
    if (!enabled_ || level < min_level_) {
        return;
    }

    const auto line = format_record(level, event, fields);
    std::ostream& sink = file_sink_.is_open() ? static_cast<std::ostream&>(file_sink_) : std::clog;
    sink << line;
    sink.flush();
}

void StructuredLogger::set_enabled(bool enabled) {
    std::scoped_lock lock(mutex_);
    enabled_ = enabled;
}

bool StructuredLogger::enabled() const noexcept {
    std::scoped_lock lock(mutex_);
    return enabled_;
}

void StructuredLogger::set_min_level(Level level) {
    std::scoped_lock lock(mutex_);
    min_level_ = level;
}

bool StructuredLogger::set_file_sink(const std::string& path) {
    std::scoped_lock lock(mutex_);
    if (file_sink_.is_open()) {
        file_sink_.close();
    }
    if (path.empty()) {
        return true;
    }
    file_sink_.open(path, std::ios::out | std::ios::app);
    return file_sink_.is_open();
}

std::optional<StructuredLogger::Level> StructuredLogger::parse_level(std::string_view text) {
    if (text == "debug") {
        return Level::Debug;
    }
    if (text == "info") {
        return Level::Info;
    }
    if (text == "warning" || text == "warn") {
        return Level::Warning;
    }
    if (text == "error") {
        return Level::Error;
    }
    return std::nullopt;
}

void log_event(StructuredLogger::Level level,
               std::string_view event,
               StructuredLogger::FieldList fields) {
    StructuredLogger::instance().log(level, event, std::move(fields));
}

}  // namespace peerchat::log
