#pragma once

#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace peerchat::log {

class StructuredLogger {
public:
    enum class Level {
        Debug,
        Info,
        Warning,
        Error
    };

    using Field = std::pair<std::string, std::string>;
    using FieldList = std::vector<Field>;

    static StructuredLogger& instance();

    void log(Level level, std::string_view event, FieldList fields = {});

    void set_enabled(bool enabled);
    [[nodiscard]] bool enabled() const noexcept;

    void set_min_level(Level level);

    // Redirects output to an append-mode file; an empty path restores std::clog.
    bool set_file_sink(const std::string& path);

    static std::optional<Level> parse_level(std::string_view text);

    // One JSON object terminated by a newline.
    static std::string format_record(Level level, std::string_view event, const FieldList& fields);

private:
    StructuredLogger() = default;

    StructuredLogger(const StructuredLogger&) = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    bool enabled_{true};
    Level min_level_{Level::Info};
    std::ofstream file_sink_;
    mutable std::mutex mutex_;
};

// Shorthand used across the engine.
void log_event(StructuredLogger::Level level,
               std::string_view event,
               StructuredLogger::FieldList fields = {});

}  // namespace peerchat::log
