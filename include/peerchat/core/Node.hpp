#pragma once

#include "peerchat/Config.hpp"
#include "peerchat/Types.hpp"
#include "peerchat/core/CommandExecutor.hpp"
#include "peerchat/core/Dispatcher.hpp"
#include "peerchat/core/KeepaliveScheduler.hpp"
#include "peerchat/directory/PeerDirectory.hpp"
#include "peerchat/network/Broadcaster.hpp"
#include "peerchat/network/DatagramTransport.hpp"
#include "peerchat/network/ReceiverLoop.hpp"
#include "peerchat/presence/PresenceRegistry.hpp"
#include "peerchat/protocol/Message.hpp"
#include "peerchat/storage/HistoryLog.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace peerchat {

struct UserEntry {
    std::string name;
    std::string address;
    bool is_self{false};
};

// One chat peer: the shared directory and presence state plus the receiver,
// keepalive and command contexts that mutate it.
class Node {
public:
    using EventHandler = std::function<void(const ChatEvent&)>;

    struct Statistics {
        std::uint64_t datagrams_received{0};
        std::uint64_t malformed_datagrams{0};
        std::uint64_t dispatched{0};
        std::uint64_t broadcasts{0};
        std::uint64_t sends_failed{0};
    };

    explicit Node(Config config = {});
    ~Node();

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    // Throws std::runtime_error when the listening port cannot be bound.
    void start();
    // Broadcasts Leave and stops the background contexts. Safe to call twice.
    void shutdown();
    [[nodiscard]] bool running() const noexcept { return running_.load(std::memory_order_acquire); }

    void handle_inbound(const network::Datagram& datagram);
    CommandResponse handle_command(std::string_view name, std::string_view args = {});
    network::BroadcastReport send_chat(const std::string& text);
    void tick();

    void set_event_handler(EventHandler handler);

    std::vector<PeerRecord> peers() const;
    std::vector<UserEntry> users();
    std::string display_name() const;
    const std::string& local_address() const noexcept { return config_.local_address; }
    std::uint16_t listening_port() const noexcept;
    Statistics statistics() const;
    const Config& config() const noexcept { return config_; }

    PeerDirectory& directory() noexcept { return directory_; }
    PresenceRegistry& presence() noexcept { return presence_; }
    HistoryLog& history() noexcept { return history_; }

    LocalIdentity identity() const;
    // Swaps the local display name and its presence entry. Returns the
    // previous name.
    std::string rename_self(const std::string& new_name);

    network::BroadcastReport broadcast(const protocol::Message& message);
    bool unicast(const std::string& host, std::uint16_t port, const protocol::Message& message);

    // Sends a Ping carrying our reply port and waits for any datagram from
    // the endpoint. Returns false on timeout.
    bool probe(const Endpoint& endpoint, std::chrono::milliseconds timeout);

    void emit(const ChatEvent& event);

private:
    struct PendingProbe {
        Endpoint endpoint;
        bool answered{false};
    };

    Config config_;

    mutable std::mutex identity_mutex_;
    std::string display_name_;

    PeerDirectory directory_;
    PresenceRegistry presence_;
    HistoryLog history_;
    network::DatagramTransport transport_;
    network::Broadcaster broadcaster_;
    Dispatcher dispatcher_;
    CommandExecutor executor_;

    std::mutex probe_mutex_;
    std::condition_variable probe_cv_;
    std::optional<PendingProbe> probe_;

    mutable std::mutex handler_mutex_;
    EventHandler event_handler_;

    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> datagrams_received_{0};
    std::atomic<std::uint64_t> malformed_datagrams_{0};
    std::atomic<std::uint64_t> dispatched_{0};
    std::atomic<std::uint64_t> broadcasts_{0};

    network::ReceiverLoop receiver_;
    KeepaliveScheduler keepalive_;

    void touch_self();
    void complete_probe(const network::Datagram& datagram, const std::string& advertised_address);
};

}  // namespace peerchat
