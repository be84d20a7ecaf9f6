#pragma once

#include "peerchat/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace peerchat {

// Outcome of a directory mutation. A storage_error means the in-memory change
// was applied but could not be written to the peers file.
struct DirectoryUpdate {
    bool changed{false};
    bool found{false};
    std::optional<std::string> storage_error{};

    [[nodiscard]] bool persisted() const noexcept { return !storage_error.has_value(); }
};

struct DirectoryLoadReport {
    std::size_t loaded{0};
    std::size_t skipped{0};
    std::optional<std::string> error{};
};

// address -> listening port for every known peer. Each successful mutation is
// written through to the peers file ("address port" per line): new records
// are appended, port changes and removals rewrite the file.
class PeerDirectory {
public:
    explicit PeerDirectory(std::filesystem::path storage_path = {});

    DirectoryLoadReport load();

    DirectoryUpdate upsert(const std::string& address, std::uint16_t port);
    // Records address with the given port only when the address is unknown.
    DirectoryUpdate insert_if_absent(const std::string& address, std::uint16_t port);
    DirectoryUpdate remove(const std::string& address);

    std::optional<std::uint16_t> port_of(const std::string& address) const;
    std::vector<PeerRecord> list() const;
    std::size_t size() const;
    [[nodiscard]] bool persistent() const noexcept { return !storage_path_.empty(); }
    const std::filesystem::path& storage_path() const noexcept { return storage_path_; }

private:
    std::filesystem::path storage_path_;
    std::unordered_map<std::string, std::uint16_t> peers_;
    mutable std::mutex mutex_;

    DirectoryUpdate upsert_locked(const std::string& address, std::uint16_t port);
    bool ensure_storage_directory(std::string& error) const;
    bool append_record(const PeerRecord& record, std::string& error) const;
    bool rewrite_records(std::string& error) const;
};

}  // namespace peerchat
