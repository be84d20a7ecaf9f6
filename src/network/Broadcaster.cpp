#include "peerchat/network/Broadcaster.hpp"

#include "peerchat/log/StructuredLogger.hpp"

namespace peerchat::network {

Broadcaster::Broadcaster(DatagramTransport& transport, const PeerDirectory& directory)
    : transport_(transport),
      directory_(directory) {}

namespace {

void log_rejected(const protocol::Message& message) {
    log::log_event(log::StructuredLogger::Level::Error,
                   "broadcast.encode_rejected",
                   {{"type", std::string(protocol::tag_of(protocol::type_of(message)))}});
}

}  // namespace

std::optional<std::string> Broadcaster::frame(const protocol::Message& message) {
    auto line = protocol::encode(message);
    if (line.has_value()) {
        line->push_back('\n');
    }
    return line;
}

BroadcastReport Broadcaster::broadcast(const protocol::Message& message) {
    const auto payload = frame(message);
    if (!payload.has_value()) {
        log_rejected(message);
        return {};
    }
    const auto peers = directory_.list();

    BroadcastReport report{};
    for (const auto& peer : peers) {
        ++report.attempted;
        if (transport_.send_to(peer.address, peer.port, *payload)) {
            ++report.delivered;
        } else {
            failed_sends_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    log::log_event(log::StructuredLogger::Level::Debug,
                   "broadcast.sent",
                   {{"type", std::string(protocol::tag_of(protocol::type_of(message)))},
                    {"attempted", std::to_string(report.attempted)},
                    {"delivered", std::to_string(report.delivered)}});
    return report;
}

bool Broadcaster::unicast(const std::string& host, std::uint16_t port, const protocol::Message& message) {
    const auto payload = frame(message);
    if (!payload.has_value()) {
        log_rejected(message);
        return false;
    }
    if (transport_.send_to(host, port, *payload)) {
        return true;
    }
    failed_sends_.fetch_add(1, std::memory_order_relaxed);
    return false;
}

}  // namespace peerchat::network
