#include "peerchat/core/Dispatcher.hpp"

#include "peerchat/log/StructuredLogger.hpp"

#include <type_traits>
#include <utility>
#include <variant>

namespace peerchat {

namespace {

using log::StructuredLogger;

std::string event_name(protocol::MessageType type) {
    switch (type) {
        case protocol::MessageType::Chat:
            return "dispatch.chat";
        case protocol::MessageType::Join:
            return "dispatch.join";
        case protocol::MessageType::Leave:
            return "dispatch.leave";
        case protocol::MessageType::Ping:
            return "dispatch.ping";
        case protocol::MessageType::Active:
            return "dispatch.active";
        case protocol::MessageType::Rename:
            return "dispatch.rename";
        case protocol::MessageType::Private:
            return "dispatch.private";
    }
    return "dispatch.unknown";
}

// Only numeric IPv4 addresses learned from the wire enter the directory.
bool learnable(const std::string& address) {
    if (is_numeric_ipv4(address)) {
        return true;
    }
    log::log_event(StructuredLogger::Level::Debug, "directory.discovery_skipped", {{"address", address}});
    return false;
}

}  // namespace

Dispatcher::Dispatcher(PeerDirectory& directory,
                       PresenceRegistry& presence,
                       HistoryLog& history,
                       std::uint16_t default_peer_port)
    : directory_(directory),
      presence_(presence),
      history_(history),
      default_peer_port_(default_peer_port) {}

DispatchResult Dispatcher::dispatch(const protocol::Message& message,
                                    const LocalIdentity& self,
                                    Clock::time_point now) {
    DispatchResult result{};

    const auto sender = protocol::sender_of(message);
    presence_.touch(sender.name, sender.address, now);

    std::visit(
        [&](const auto& payload) {
            using PayloadType = std::decay_t<decltype(payload)>;
            if constexpr (std::is_same_v<PayloadType, protocol::ChatPayload>) {
                handle_chat(payload, result);
            } else if constexpr (std::is_same_v<PayloadType, protocol::JoinPayload>) {
                handle_join(payload, self, result);
            } else if constexpr (std::is_same_v<PayloadType, protocol::LeavePayload>) {
                handle_leave(payload, result);
            } else if constexpr (std::is_same_v<PayloadType, protocol::PingPayload>) {
                handle_ping(payload, self, result);
            } else if constexpr (std::is_same_v<PayloadType, protocol::ActivePayload>) {
                handle_active(payload);
            } else if constexpr (std::is_same_v<PayloadType, protocol::RenamePayload>) {
                handle_rename(payload, now, result);
            } else if constexpr (std::is_same_v<PayloadType, protocol::PrivatePayload>) {
                handle_private(payload, self, result);
            }
        },
        message);

    log::log_event(StructuredLogger::Level::Debug,
                   event_name(protocol::type_of(message)),
                   {{"sender", sender.name},
                    {"address", sender.address},
                    {"dropped", result.dropped ? "1" : "0"}});
    return result;
}

void Dispatcher::handle_chat(const protocol::ChatPayload& payload, DispatchResult& result) {
    history_.append(payload.sender + ": " + payload.text);
    result.events.push_back(ChatEvent{ChatEvent::Kind::Chat, payload.sender, payload.address, payload.text});
}

void Dispatcher::handle_join(const protocol::JoinPayload& payload, const LocalIdentity& self, DispatchResult& result) {
    result.events.push_back(ChatEvent{ChatEvent::Kind::Joined, payload.name, payload.address, {}});
    discover(payload.address);
    reply_active(payload.address, self, result);
}

void Dispatcher::handle_leave(const protocol::LeavePayload& payload, DispatchResult& result) {
    // The peer record stays so the user can still reach the host later.
    presence_.remove(payload.name, payload.address);
    result.events.push_back(ChatEvent{ChatEvent::Kind::Left, payload.name, payload.address, {}});
}

void Dispatcher::handle_ping(const protocol::PingPayload& payload, const LocalIdentity& self, DispatchResult& result) {
    if (payload.reply_port.has_value()) {
        if (learnable(payload.address)) {
            directory_.upsert(payload.address, *payload.reply_port);
        }
    } else {
        discover(payload.address);
    }
    reply_active(payload.address, self, result);
}

void Dispatcher::handle_active(const protocol::ActivePayload& payload) {
    discover(payload.address);
}

void Dispatcher::handle_rename(const protocol::RenamePayload& payload, Clock::time_point now, DispatchResult& result) {
    presence_.rename(payload.old_name, payload.new_name, payload.address, now);
    result.events.push_back(
        ChatEvent{ChatEvent::Kind::Renamed, payload.old_name, payload.address, payload.new_name});
}

void Dispatcher::handle_private(const protocol::PrivatePayload& payload,
                                const LocalIdentity& self,
                                DispatchResult& result) {
    if (payload.target_name != self.name) {
        result.dropped = true;
        return;
    }
    history_.append("[private from " + payload.sender + "] " + payload.text);
    discover(payload.address);
    result.events.push_back(ChatEvent{ChatEvent::Kind::Private, payload.sender, payload.address, payload.text});
}

void Dispatcher::discover(const std::string& address) {
    if (!learnable(address)) {
        return;
    }
    const auto update = directory_.insert_if_absent(address, default_peer_port_);
    if (update.changed) {
        log::log_event(StructuredLogger::Level::Info,
                       "directory.auto_discovered",
                       {{"address", address}, {"port", std::to_string(default_peer_port_)}});
    }
}

void Dispatcher::reply_active(const std::string& address, const LocalIdentity& self, DispatchResult& result) {
    const auto port = directory_.port_of(address);
    if (!port.has_value()) {
        return;
    }
    result.replies.push_back(
        OutboundMessage{address, *port, protocol::Message{protocol::ActivePayload{self.name, self.address}}});
}

}  // namespace peerchat
