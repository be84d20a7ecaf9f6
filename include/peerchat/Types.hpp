#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

namespace peerchat {

using Clock = std::chrono::steady_clock;

struct PeerRecord {
    std::string address;
    std::uint16_t port{0};

    bool operator==(const PeerRecord&) const = default;
};

// Presence is keyed by the (name, address) pair; the same host may be known
// under several names until the stale ones expire.
struct PresenceKey {
    std::string name;
    std::string address;

    bool operator==(const PresenceKey&) const = default;
    bool operator<(const PresenceKey& other) const {
        return std::tie(name, address) < std::tie(other.name, other.address);
    }
};

struct PresenceEntry {
    std::string name;
    std::string address;
    Clock::time_point last_seen{};
};

struct Endpoint {
    std::string host;
    std::uint16_t port{0};

    bool operator==(const Endpoint&) const = default;
};

std::optional<Endpoint> parse_endpoint(std::string_view text);
std::string endpoint_to_string(const Endpoint& endpoint);
std::optional<std::uint16_t> parse_port(std::string_view text);
// Dotted-quad IPv4 literal such as 10.0.0.1; hostnames are rejected.
bool is_numeric_ipv4(std::string_view text);

}  // namespace peerchat
