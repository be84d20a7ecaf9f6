#include "peerchat/directory/PeerDirectory.hpp"

#include "peerchat/log/StructuredLogger.hpp"

#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace peerchat {

namespace {

using log::StructuredLogger;

void log_storage_failure(const std::string& operation, const std::string& error) {
    log::log_event(StructuredLogger::Level::Error,
                   "directory.persist_failed",
                   {{"operation", operation}, {"error", error}});
}

}  // namespace

PeerDirectory::PeerDirectory(std::filesystem::path storage_path)
    : storage_path_(std::move(storage_path)) {}

DirectoryLoadReport PeerDirectory::load() {
    std::scoped_lock lock(mutex_);
    DirectoryLoadReport report{};
    if (!persistent()) {
        return report;
    }

    std::error_code ec;
    if (!std::filesystem::exists(storage_path_, ec)) {
        std::string error;
        if (!ensure_storage_directory(error)) {
            report.error = error;
            return report;
        }
        std::ofstream create(storage_path_, std::ios::app);
        if (!create) {
            report.error = "Unable to create peers file " + storage_path_.string();
        }
        return report;
    }

    std::ifstream input(storage_path_);
    if (!input) {
        report.error = "Unable to read peers file " + storage_path_.string();
        return report;
    }

    std::string line;
    std::size_t line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        std::istringstream fields(line);
        std::string address;
        std::string port_text;
        fields >> address >> port_text;
        if (address.empty() && port_text.empty()) {
            continue;
        }
        const auto port = parse_port(port_text);
        if (address.empty() || !port.has_value()) {
            ++report.skipped;
            log::log_event(StructuredLogger::Level::Warning,
                           "directory.load_skipped_line",
                           {{"line", std::to_string(line_number)}, {"content", line}});
            continue;
        }
        peers_.insert_or_assign(address, *port);
        ++report.loaded;
    }

    if (input.bad()) {
        report.error = "I/O error while reading " + storage_path_.string();
    }
    return report;
}

DirectoryUpdate PeerDirectory::upsert(const std::string& address, std::uint16_t port) {
    std::scoped_lock lock(mutex_);
    return upsert_locked(address, port);
}

DirectoryUpdate PeerDirectory::insert_if_absent(const std::string& address, std::uint16_t port) {
    std::scoped_lock lock(mutex_);
    if (peers_.contains(address)) {
        return DirectoryUpdate{false, true, std::nullopt};
    }
    return upsert_locked(address, port);
}

DirectoryUpdate PeerDirectory::upsert_locked(const std::string& address, std::uint16_t port) {
    DirectoryUpdate update{};
    const auto it = peers_.find(address);
    if (it != peers_.end()) {
        update.found = true;
        if (it->second == port) {
            return update;
        }
        it->second = port;
        update.changed = true;
        std::string error;
        if (persistent() && !rewrite_records(error)) {
            log_storage_failure("rewrite", error);
            update.storage_error = error;
        }
        return update;
    }

    peers_.emplace(address, port);
    update.changed = true;
    std::string error;
    if (persistent() && !append_record(PeerRecord{address, port}, error)) {
        log_storage_failure("append", error);
        update.storage_error = error;
    }
    return update;
}

DirectoryUpdate PeerDirectory::remove(const std::string& address) {
    std::scoped_lock lock(mutex_);
    DirectoryUpdate update{};
    const auto it = peers_.find(address);
    if (it == peers_.end()) {
        return update;
    }

    peers_.erase(it);
    update.found = true;
    update.changed = true;
    std::string error;
    if (persistent() && !rewrite_records(error)) {
        log_storage_failure("rewrite", error);
        update.storage_error = error;
    }
    return update;
}

std::optional<std::uint16_t> PeerDirectory::port_of(const std::string& address) const {
    std::scoped_lock lock(mutex_);
    const auto it = peers_.find(address);
    if (it == peers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<PeerRecord> PeerDirectory::list() const {
    std::scoped_lock lock(mutex_);
    std::vector<PeerRecord> result;
    result.reserve(peers_.size());
    for (const auto& [address, port] : peers_) {
        result.push_back(PeerRecord{address, port});
    }
    return result;
}

std::size_t PeerDirectory::size() const {
    std::scoped_lock lock(mutex_);
    return peers_.size();
}

bool PeerDirectory::ensure_storage_directory(std::string& error) const {
    const auto parent = storage_path_.parent_path();
    if (parent.empty()) {
        return true;
    }
    std::error_code ec;
    if (std::filesystem::exists(parent, ec)) {
        if (!std::filesystem::is_directory(parent, ec)) {
            error = parent.string() + " is not a directory";
            return false;
        }
        return true;
    }
    if (!std::filesystem::create_directories(parent, ec)) {
        error = "Unable to create " + parent.string() + ": " + ec.message();
        return false;
    }
    return true;
}

bool PeerDirectory::append_record(const PeerRecord& record, std::string& error) const {
    if (!ensure_storage_directory(error)) {
        return false;
    }
    std::ofstream stream(storage_path_, std::ios::out | std::ios::app);
    if (!stream) {
        error = "Unable to open " + storage_path_.string() + " for append";
        return false;
    }
    stream << record.address << ' ' << record.port << '\n';
    stream.flush();
    if (!stream) {
        error = "Write to " + storage_path_.string() + " failed";
        return false;
    }
    return true;
}

bool PeerDirectory::rewrite_records(std::string& error) const {
    if (!ensure_storage_directory(error)) {
        return false;
    }

    auto temporary = storage_path_;
    temporary += ".tmp";
    {
        std::ofstream stream(temporary, std::ios::out | std::ios::trunc);
        if (!stream) {
            error = "Unable to open " + temporary.string() + " for writing";
            return false;
        }
        for (const auto& [address, port] : peers_) {
            stream << address << ' ' << port << '\n';
        }
        stream.flush();
        if (!stream) {
            error = "Write to " + temporary.string() + " failed";
            std::error_code ignored;
            std::filesystem::remove(temporary, ignored);
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(temporary, storage_path_, ec);
    if (ec) {
        error = "Unable to replace " + storage_path_.string() + ": " + ec.message();
        std::error_code ignored;
        std::filesystem::remove(temporary, ignored);
        return false;
    }
    return true;
}

}  // namespace peerchat
