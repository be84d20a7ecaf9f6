#pragma once

#include "peerchat/Types.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace peerchat {

// (name, address) -> last time the identity was heard from. Entries older
// than the TTL are dead: reads skip and evict them, so no sweeper is needed
// for correctness. Every operation is atomic with respect to the others.
class PresenceRegistry {
public:
    explicit PresenceRegistry(std::chrono::seconds ttl = std::chrono::seconds(300));

    void touch(const std::string& name,
               const std::string& address,
               Clock::time_point now = Clock::now());
    bool remove(const std::string& name, const std::string& address);
    std::size_t remove_by_address(const std::string& address);

    // Drops (old_name, address) and refreshes (new_name, address) in one step.
    void rename(const std::string& old_name,
                const std::string& new_name,
                const std::string& address,
                Clock::time_point now = Clock::now());

    // Live entries ordered by name then address. Stale entries are evicted.
    std::vector<PresenceEntry> list(Clock::time_point now = Clock::now());

    // Most recently seen live entry for name; ties go to the smallest address.
    std::optional<std::string> resolve_address(const std::string& name,
                                               Clock::time_point now = Clock::now());

    std::size_t sweep(Clock::time_point now = Clock::now());

    [[nodiscard]] std::chrono::seconds ttl() const noexcept { return ttl_; }

private:
    std::chrono::seconds ttl_;
    std::map<PresenceKey, Clock::time_point> entries_;
    mutable std::mutex mutex_;

    bool live(Clock::time_point last_seen, Clock::time_point now) const noexcept;
};

}  // namespace peerchat
