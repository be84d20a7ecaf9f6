#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace peerchat {

struct Config {
    std::string display_name{"anonymous"};
    std::string local_address{"127.0.0.1"};
    std::uint16_t listen_port{12345};
    // Port assumed for peers learned from JOIN/ACTIVE/PM without an explicit
    // reply port. Falls back to the local listening port when unset.
    std::optional<std::uint16_t> default_peer_port{};

    std::chrono::seconds presence_ttl{std::chrono::seconds(300)};
    std::chrono::milliseconds keepalive_interval{std::chrono::seconds(60)};
    std::chrono::milliseconds send_timeout{std::chrono::milliseconds(1000)};
    std::chrono::milliseconds probe_timeout{std::chrono::milliseconds(3000)};
    std::chrono::milliseconds receive_poll_interval{std::chrono::milliseconds(250)};

    // Empty paths keep the directory and history in memory only.
    std::string peers_file;
    std::string history_file;
    std::size_t history_tail_lines{50};

    bool log_enabled{true};
    std::string log_file;
    std::string log_level{"info"};
};

}  // namespace peerchat
