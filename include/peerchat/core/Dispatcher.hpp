#pragma once

#include "peerchat/Types.hpp"
#include "peerchat/directory/PeerDirectory.hpp"
#include "peerchat/presence/PresenceRegistry.hpp"
#include "peerchat/protocol/Message.hpp"
#include "peerchat/storage/HistoryLog.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace peerchat {

struct ChatEvent {
    enum class Kind {
        Chat,
        Private,
        PrivateSent,
        Joined,
        Left,
        Renamed,
        Info
    };

    Kind kind{Kind::Info};
    std::string from;
    std::string address;
    std::string text;
};

struct LocalIdentity {
    std::string name;
    std::string address;
};

struct OutboundMessage {
    std::string host;
    std::uint16_t port{0};
    protocol::Message message;
};

struct DispatchResult {
    std::vector<ChatEvent> events;
    std::vector<OutboundMessage> replies;
    bool dropped{false};
};

// Applies one decoded inbound message to the directory and presence registry.
// Network replies are returned instead of sent so callers can transmit them
// without holding any lock.
class Dispatcher {
public:
    Dispatcher(PeerDirectory& directory,
               PresenceRegistry& presence,
               HistoryLog& history,
               std::uint16_t default_peer_port);

    DispatchResult dispatch(const protocol::Message& message,
                            const LocalIdentity& self,
                            Clock::time_point now = Clock::now());

    std::uint16_t default_peer_port() const noexcept { return default_peer_port_; }
    // Only valid before inbound dispatch starts.
    void set_default_peer_port(std::uint16_t port) noexcept { default_peer_port_ = port; }

private:
    PeerDirectory& directory_;
    PresenceRegistry& presence_;
    HistoryLog& history_;
    std::uint16_t default_peer_port_;

    void handle_chat(const protocol::ChatPayload& payload, DispatchResult& result);
    void handle_join(const protocol::JoinPayload& payload, const LocalIdentity& self, DispatchResult& result);
    void handle_leave(const protocol::LeavePayload& payload, DispatchResult& result);
    void handle_ping(const protocol::PingPayload& payload, const LocalIdentity& self, DispatchResult& result);
    void handle_active(const protocol::ActivePayload& payload);
    void handle_rename(const protocol::RenamePayload& payload, Clock::time_point now, DispatchResult& result);
    void handle_private(const protocol::PrivatePayload& payload, const LocalIdentity& self, DispatchResult& result);

    void discover(const std::string& address);
    void reply_active(const std::string& address, const LocalIdentity& self, DispatchResult& result);
};

}  // namespace peerchat
