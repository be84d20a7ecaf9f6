#pragma once

#include "peerchat/directory/PeerDirectory.hpp"
#include "peerchat/network/DatagramTransport.hpp"
#include "peerchat/protocol/Message.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace peerchat::network {

struct BroadcastReport {
    std::size_t attempted{0};
    std::size_t delivered{0};
};

// Best-effort fan-out of encoded messages. Each send is independent and
// bounded by the transport send timeout; failures are logged and skipped.
class Broadcaster {
public:
    Broadcaster(DatagramTransport& transport, const PeerDirectory& directory);

    BroadcastReport broadcast(const protocol::Message& message);
    bool unicast(const std::string& host, std::uint16_t port, const protocol::Message& message);

    std::uint64_t failed_sends() const noexcept { return failed_sends_.load(std::memory_order_relaxed); }

    // Encoded line plus the trailing newline; std::nullopt when the message
    // cannot be encoded.
    static std::optional<std::string> frame(const protocol::Message& message);

private:
    DatagramTransport& transport_;
    const PeerDirectory& directory_;
    std::atomic<std::uint64_t> failed_sends_{0};
};

}  // namespace peerchat::network
