#include "peerchat/storage/HistoryLog.hpp"

#include "peerchat/log/StructuredLogger.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <utility>

namespace peerchat {

HistoryLog::HistoryLog(std::filesystem::path path, std::size_t memory_lines)
    : path_(std::move(path)),
      memory_lines_(memory_lines == 0 ? 1 : memory_lines) {}

bool HistoryLog::append(const std::string& line) {
    const auto entry = timestamp_prefix() + line;
    std::scoped_lock lock(mutex_);
    if (path_.empty()) {
        recent_.push_back(entry);
        while (recent_.size() > memory_lines_) {
            recent_.pop_front();
        }
        return true;
    }

    std::ofstream stream(path_, std::ios::out | std::ios::app);
    if (!stream) {
        log::log_event(log::StructuredLogger::Level::Error,
                       "history.append_failed",
                       {{"path", path_.string()}});
        return false;
    }
    stream << entry << '\n';
    stream.flush();
    return static_cast<bool>(stream);
}

std::vector<std::string> HistoryLog::tail(std::size_t count) const {
    std::scoped_lock lock(mutex_);
    std::deque<std::string> window;
    if (path_.empty()) {
        window = recent_;
    } else {
        std::ifstream input(path_);
        std::string line;
        while (input && std::getline(input, line)) {
            window.push_back(std::move(line));
            if (window.size() > count) {
                window.pop_front();
            }
        }
    }

    while (window.size() > count) {
        window.pop_front();
    }
    return std::vector<std::string>(window.begin(), window.end());
}

std::string HistoryLog::timestamp_prefix() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t now_c = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&now_c, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << " - ";
    return oss.str();
}

}  // namespace peerchat
