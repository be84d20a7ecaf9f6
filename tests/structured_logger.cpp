#include "peerchat/log/StructuredLogger.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace peerchat::log;

namespace {

std::vector<std::string> read_lines(const std::filesystem::path& path) {
    std::vector<std::string> lines;
    std::ifstream input(path);
    std::string line;
    while (std::getline(input, line)) {
        lines.push_back(line);
    }
    return lines;
}

}  // namespace

int main() {
    // Record layout and escaping.
    {
        const auto line = StructuredLogger::format_record(StructuredLogger::Level::Warning,
                                                          "receiver.malformed",
                                                          {{"payload", "a\"b\\c\nd\x01"}, {"bytes", "7"}});
        assert(line.starts_with("{\"ts\":\""));
        assert(line.ends_with("}\n"));
        assert(line.find("\"level\":\"warning\"") != std::string::npos);
        assert(line.find("\"event\":\"receiver.malformed\"") != std::string::npos);
        assert(line.find("\"fields\":{\"payload\":\"a\\\"b\\\\c\\nd\\u0001\",\"bytes\":\"7\"}") != std::string::npos);
        assert(line.find('\n') == line.size() - 1);

        const auto bare = StructuredLogger::format_record(StructuredLogger::Level::Info, "node.started", {});
        assert(bare.find("fields") == std::string::npos);

        const auto ts_end = line.find('"', 7);
        const auto timestamp = line.substr(7, ts_end - 7);
        assert(timestamp.size() == 24);
        assert(timestamp[10] == 'T');
        assert(timestamp[19] == '.');
        assert(timestamp.back() == 'Z');
    }

    assert(StructuredLogger::parse_level("debug") == StructuredLogger::Level::Debug);
    assert(StructuredLogger::parse_level("warn") == StructuredLogger::Level::Warning);
    assert(!StructuredLogger::parse_level("loud").has_value());

    // File sink, level filter and the enable switch.
    {
        const auto dir = std::filesystem::temp_directory_path() / "peerchat_structured_logger_test";
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);
        const auto path = dir / "chat.log";

        auto& logger = StructuredLogger::instance();
        logger.set_enabled(true);
        logger.set_min_level(StructuredLogger::Level::Info);
        assert(logger.set_file_sink(path.string()));

        log_event(StructuredLogger::Level::Debug, "dispatch.chat", {{"sender", "alice"}});
        log_event(StructuredLogger::Level::Info, "node.started", {{"port", "12345"}});
        logger.set_enabled(false);
        log_event(StructuredLogger::Level::Error, "node.shutdown");
        logger.set_enabled(true);
        log_event(StructuredLogger::Level::Error, "probe.timeout");

        auto lines = read_lines(path);
        assert(lines.size() == 2);
        assert(lines[0].find("\"event\":\"node.started\"") != std::string::npos);
        assert(lines[1].find("\"event\":\"probe.timeout\"") != std::string::npos);

        assert(!logger.set_file_sink((dir / "missing" / "chat.log").string()));
        assert(logger.set_file_sink({}));
        logger.set_enabled(false);
        std::filesystem::remove_all(dir);
    }

    return 0;
}
