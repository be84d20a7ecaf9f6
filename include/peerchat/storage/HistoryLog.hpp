#pragma once

#include <cstddef>
#include <deque>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace peerchat {

// Chat transcript. Lines are prefixed with a local "YYYY-MM-DD HH:MM:SS - "
// timestamp. Without a path only the most recent lines are kept in memory.
class HistoryLog {
public:
    explicit HistoryLog(std::filesystem::path path = {}, std::size_t memory_lines = 200);

    bool append(const std::string& line);
    std::vector<std::string> tail(std::size_t count) const;

private:
    std::filesystem::path path_;
    std::size_t memory_lines_;
    std::deque<std::string> recent_;
    mutable std::mutex mutex_;

    static std::string timestamp_prefix();
};

}  // namespace peerchat
