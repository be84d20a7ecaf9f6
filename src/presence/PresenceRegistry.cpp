#include "peerchat/presence/PresenceRegistry.hpp"

#include <utility>

namespace peerchat {

PresenceRegistry::PresenceRegistry(std::chrono::seconds ttl)
    : ttl_(ttl) {}

bool PresenceRegistry::live(Clock::time_point last_seen, Clock::time_point now) const noexcept {
    return now - last_seen < ttl_;
}

void PresenceRegistry::touch(const std::string& name, const std::string& address, Clock::time_point now) {
    std::scoped_lock lock(mutex_);
    entries_.insert_or_assign(PresenceKey{name, address}, now);
}

bool PresenceRegistry::remove(const std::string& name, const std::string& address) {
    std::scoped_lock lock(mutex_);
    return entries_.erase(PresenceKey{name, address}) > 0;
}

std::size_t PresenceRegistry::remove_by_address(const std::string& address) {
    std::scoped_lock lock(mutex_);
    return std::erase_if(entries_, [&](const auto& item) {
        return item.first.address == address;
    });
}

void PresenceRegistry::rename(const std::string& old_name,
                              const std::string& new_name,
                              const std::string& address,
                              Clock::time_point now) {
    std::scoped_lock lock(mutex_);
    entries_.erase(PresenceKey{old_name, address});
    entries_.insert_or_assign(PresenceKey{new_name, address}, now);
}

std::vector<PresenceEntry> PresenceRegistry::list(Clock::time_point now) {
    std::scoped_lock lock(mutex_);
    std::vector<PresenceEntry> result;
    result.reserve(entries_.size());
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (!live(it->second, now)) {
            it = entries_.erase(it);
            continue;
        }
        result.push_back(PresenceEntry{it->first.name, it->first.address, it->second});
        ++it;
    }
    return result;
}

std::optional<std::string> PresenceRegistry::resolve_address(const std::string& name, Clock::time_point now) {
    std::scoped_lock lock(mutex_);
    std::optional<std::string> best_address;
    Clock::time_point best_seen{};

    // Keys sort by (name, address), so the matching range is contiguous and
    // visited in ascending address order.
    auto it = entries_.lower_bound(PresenceKey{name, std::string{}});
    while (it != entries_.end() && it->first.name == name) {
        if (!live(it->second, now)) {
            it = entries_.erase(it);
            continue;
        }
        if (!best_address.has_value() || it->second > best_seen) {
            best_address = it->first.address;
            best_seen = it->second;
        }
        ++it;
    }
    return best_address;
}

std::size_t PresenceRegistry::sweep(Clock::time_point now) {
    std::scoped_lock lock(mutex_);
    return std::erase_if(entries_, [&](const auto& item) {
        return !live(item.second, now);
    });
}

}  // namespace peerchat
