#include "peerchat/core/Node.hpp"

#include "peerchat/log/StructuredLogger.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace peerchat {

namespace {

using log::StructuredLogger;

}  // namespace

Node::Node(Config config)
    : config_(std::move(config)),
      display_name_(config_.display_name),
      directory_(config_.peers_file),
      presence_(config_.presence_ttl),
      history_(config_.history_file),
      broadcaster_(transport_, directory_),
      dispatcher_(directory_, presence_, history_, config_.default_peer_port.value_or(config_.listen_port)),
      executor_(*this),
      receiver_(transport_, config_.receive_poll_interval),
      keepalive_(config_.keepalive_interval, [this] { tick(); }) {}

Node::~Node() {
    shutdown();
}

void Node::start() {
    if (running_.load(std::memory_order_acquire)) {
        return;
    }

    transport_.open(config_.listen_port, config_.send_timeout);
    if (!config_.default_peer_port.has_value()) {
        dispatcher_.set_default_peer_port(transport_.local_port());
    }

    touch_self();
    const auto report = directory_.load();
    if (report.error.has_value()) {
        emit(ChatEvent{ChatEvent::Kind::Info, {}, {}, "Could not read peers file: " + *report.error});
    }

    running_.store(true, std::memory_order_release);
    receiver_.start([this](const network::Datagram& datagram) { handle_inbound(datagram); });
    keepalive_.start();

    log::log_event(StructuredLogger::Level::Info,
                   "node.started",
                   {{"name", display_name()},
                    {"address", config_.local_address},
                    {"port", std::to_string(transport_.local_port())},
                    {"peers_loaded", std::to_string(report.loaded)}});

    if (report.loaded > 0) {
        const auto self = identity();
        broadcast(protocol::JoinPayload{self.name, self.address});
    }
}

void Node::shutdown() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }

    const auto self = identity();
    const auto report = broadcast(protocol::LeavePayload{self.name, self.address});

    keepalive_.stop();
    receiver_.stop();
    transport_.close();

    log::log_event(StructuredLogger::Level::Info,
                   "node.shutdown",
                   {{"name", self.name},
                    {"leave_attempted", std::to_string(report.attempted)},
                    {"leave_delivered", std::to_string(report.delivered)}});
}

void Node::handle_inbound(const network::Datagram& datagram) {
    datagrams_received_.fetch_add(1, std::memory_order_relaxed);

    const auto message = protocol::decode(datagram.payload);
    if (!message.has_value()) {
        malformed_datagrams_.fetch_add(1, std::memory_order_relaxed);
        log::log_event(StructuredLogger::Level::Warning,
                       "receiver.malformed",
                       {{"source", datagram.source_host + ":" + std::to_string(datagram.source_port)},
                        {"bytes", std::to_string(datagram.payload.size())}});
        return;
    }

    auto result = dispatcher_.dispatch(*message, identity());
    dispatched_.fetch_add(1, std::memory_order_relaxed);

    // Completed after dispatch so a connect in progress records its port last.
    complete_probe(datagram, protocol::sender_of(*message).address);

    for (const auto& reply : result.replies) {
        unicast(reply.host, reply.port, reply.message);
    }
    for (const auto& event : result.events) {
        emit(event);
    }
}

CommandResponse Node::handle_command(std::string_view name, std::string_view args) {
    return executor_.execute(name, args);
}

network::BroadcastReport Node::send_chat(const std::string& text) {
    if (text.empty() || text.find_first_of("\r\n") != std::string::npos) {
        return {};
    }
    const auto self = identity();
    history_.append(self.name + ": " + text);
    return broadcast(protocol::ChatPayload{self.name, self.address, text});
}

void Node::tick() {
    touch_self();
    const auto evicted = presence_.sweep();

    const auto self = identity();
    const auto report = broadcast(protocol::PingPayload{self.name, self.address, transport_.local_port()});

    log::log_event(StructuredLogger::Level::Debug,
                   "keepalive.tick",
                   {{"peers", std::to_string(report.attempted)},
                    {"delivered", std::to_string(report.delivered)},
                    {"evicted", std::to_string(evicted)}});
}

void Node::set_event_handler(EventHandler handler) {
    std::scoped_lock lock(handler_mutex_);
    event_handler_ = std::move(handler);
}

std::vector<PeerRecord> Node::peers() const {
    auto records = directory_.list();
    std::sort(records.begin(), records.end(), [](const PeerRecord& lhs, const PeerRecord& rhs) {
        return lhs.address < rhs.address;
    });
    return records;
}

std::vector<UserEntry> Node::users() {
    const auto self = identity();
    std::vector<UserEntry> result;
    for (const auto& entry : presence_.list()) {
        result.push_back(UserEntry{entry.name,
                                   entry.address,
                                   entry.name == self.name && entry.address == self.address});
    }
    return result;
}

std::string Node::display_name() const {
    std::scoped_lock lock(identity_mutex_);
    return display_name_;
}

std::uint16_t Node::listening_port() const noexcept {
    return transport_.local_port();
}

Node::Statistics Node::statistics() const {
    Statistics stats{};
    stats.datagrams_received = datagrams_received_.load(std::memory_order_relaxed);
    stats.malformed_datagrams = malformed_datagrams_.load(std::memory_order_relaxed);
    stats.dispatched = dispatched_.load(std::memory_order_relaxed);
    stats.broadcasts = broadcasts_.load(std::memory_order_relaxed);
    stats.sends_failed = broadcaster_.failed_sends();
    return stats;
}

LocalIdentity Node::identity() const {
    std::scoped_lock lock(identity_mutex_);
    return LocalIdentity{display_name_, config_.local_address};
}

std::string Node::rename_self(const std::string& new_name) {
    std::scoped_lock lock(identity_mutex_);
    auto previous = std::exchange(display_name_, new_name);
    presence_.rename(previous, new_name, config_.local_address);
    return previous;
}

network::BroadcastReport Node::broadcast(const protocol::Message& message) {
    broadcasts_.fetch_add(1, std::memory_order_relaxed);
    return broadcaster_.broadcast(message);
}

bool Node::unicast(const std::string& host, std::uint16_t port, const protocol::Message& message) {
    return broadcaster_.unicast(host, port, message);
}

bool Node::probe(const Endpoint& endpoint, std::chrono::milliseconds timeout) {
    {
        std::scoped_lock lock(probe_mutex_);
        probe_ = PendingProbe{endpoint, false};
    }

    const auto self = identity();
    const bool sent = unicast(endpoint.host,
                              endpoint.port,
                              protocol::PingPayload{self.name, self.address, transport_.local_port()});

    std::unique_lock lock(probe_mutex_);
    const bool answered = sent && probe_cv_.wait_for(lock, timeout, [this] {
        return probe_.has_value() && probe_->answered;
    });
    probe_.reset();

    if (!answered) {
        log::log_event(StructuredLogger::Level::Info,
                       "probe.timeout",
                       {{"endpoint", endpoint_to_string(endpoint)},
                        {"sent", sent ? "1" : "0"},
                        {"timeout_ms", std::to_string(timeout.count())}});
    }
    return answered;
}

void Node::emit(const ChatEvent& event) {
    EventHandler handler;
    {
        std::scoped_lock lock(handler_mutex_);
        handler = event_handler_;
    }
    if (!handler) {
        return;
    }
    try {
        handler(event);
    } catch (const std::exception& ex) {
        log::log_event(StructuredLogger::Level::Error, "node.event_handler_failed", {{"error", ex.what()}});
    }
}

void Node::touch_self() {
    const auto self = identity();
    presence_.touch(self.name, self.address);
}

void Node::complete_probe(const network::Datagram& datagram, const std::string& advertised_address) {
    {
        std::scoped_lock lock(probe_mutex_);
        if (!probe_.has_value() || probe_->answered) {
            return;
        }
        const auto& target = probe_->endpoint;
        const bool matches = advertised_address == target.host ||
                             (datagram.source_host == target.host && datagram.source_port == target.port);
        if (!matches) {
            return;
        }
        probe_->answered = true;
    }
    probe_cv_.notify_all();
}

}  // namespace peerchat
