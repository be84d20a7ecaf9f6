#include "peerchat/network/DatagramTransport.hpp"

#include "peerchat/log/StructuredLogger.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

namespace peerchat::network {

namespace {

using log::StructuredLogger;

constexpr std::size_t kMaxDatagramSize = 64 * 1024;

std::atomic<const DatagramTransport::TestHooks*> g_test_hooks{nullptr};

void set_send_timeout(int socket, std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<long>(timeout.count() / 1000);
    tv.tv_usec = static_cast<long>((timeout.count() % 1000) * 1000);
    setsockopt(socket, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

std::optional<sockaddr_in> resolve_ipv4(const std::string& host, std::uint16_t port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) == 1) {
        return addr;
    }

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;
    addrinfo* results = nullptr;
    if (getaddrinfo(host.c_str(), nullptr, &hints, &results) != 0 || results == nullptr) {
        return std::nullopt;
    }
    const auto* resolved = reinterpret_cast<const sockaddr_in*>(results->ai_addr);
    addr.sin_addr = resolved->sin_addr;
    freeaddrinfo(results);
    return addr;
}

}  // namespace

void DatagramTransport::set_test_hooks(const TestHooks* hooks) {
    g_test_hooks.store(hooks, std::memory_order_release);
}

DatagramTransport::~DatagramTransport() {
    close();
}

void DatagramTransport::open(std::uint16_t port, std::chrono::milliseconds send_timeout) {
    if (is_open()) {
        return;
    }

    const int socket = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (socket < 0) {
        throw std::runtime_error("Failed to create datagram socket: " + std::string(std::strerror(errno)));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(port);

    if (::bind(socket, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
        const auto error = errno;
        ::close(socket);
        if (error == EADDRINUSE) {
            throw std::runtime_error("Port " + std::to_string(port) + " is already in use");
        }
        throw std::runtime_error("Failed to bind datagram socket: " + std::string(std::strerror(error)));
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(socket, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = port;
    }

    set_send_timeout(socket, send_timeout);
    socket_.store(socket, std::memory_order_release);

    log::log_event(StructuredLogger::Level::Info,
                   "transport.bound",
                   {{"port", std::to_string(bound_port_)}});
}

void DatagramTransport::close() {
    const int socket = socket_.exchange(-1, std::memory_order_acq_rel);
    if (socket >= 0) {
        ::shutdown(socket, SHUT_RDWR);
        ::close(socket);
    }
}

bool DatagramTransport::is_open() const noexcept {
    return socket_.load(std::memory_order_acquire) >= 0;
}

std::uint16_t DatagramTransport::local_port() const noexcept {
    return bound_port_;
}

bool DatagramTransport::send_to(const std::string& host, std::uint16_t port, std::string_view payload) {
    const int socket = socket_.load(std::memory_order_acquire);
    if (socket < 0) {
        return false;
    }

    if (const auto* hooks = g_test_hooks.load(std::memory_order_acquire)) {
        if (hooks->drop_send && hooks->drop_send(host, port, payload)) {
            return true;
        }
    }

    const auto addr = resolve_ipv4(host, port);
    if (!addr.has_value()) {
        log::log_event(StructuredLogger::Level::Debug,
                       "transport.send_failed",
                       {{"host", host}, {"port", std::to_string(port)}, {"error", "unresolved host"}});
        return false;
    }

    const auto sent = ::sendto(socket,
                               payload.data(),
                               payload.size(),
                               0,
                               reinterpret_cast<const sockaddr*>(&*addr),
                               sizeof(*addr));
    if (sent < 0 || static_cast<std::size_t>(sent) != payload.size()) {
        log::log_event(StructuredLogger::Level::Debug,
                       "transport.send_failed",
                       {{"host", host},
                        {"port", std::to_string(port)},
                        {"error", sent < 0 ? std::string(std::strerror(errno)) : std::string("short write")}});
        return false;
    }
    return true;
}

std::optional<Datagram> DatagramTransport::receive(std::chrono::milliseconds timeout) {
    const int socket = socket_.load(std::memory_order_acquire);
    if (socket < 0) {
        return std::nullopt;
    }

    pollfd descriptor{};
    descriptor.fd = socket;
    descriptor.events = POLLIN;
    const auto ready = ::poll(&descriptor, 1, static_cast<int>(timeout.count()));
    if (ready <= 0 || (descriptor.revents & POLLIN) == 0) {
        return std::nullopt;
    }

    std::array<char, kMaxDatagramSize> buffer{};
    sockaddr_in source{};
    socklen_t source_len = sizeof(source);
    const auto received = ::recvfrom(socket,
                                     buffer.data(),
                                     buffer.size(),
                                     MSG_DONTWAIT,
                                     reinterpret_cast<sockaddr*>(&source),
                                     &source_len);
    if (received < 0) {
        return std::nullopt;
    }

    Datagram datagram{};
    datagram.payload.assign(buffer.data(), static_cast<std::size_t>(received));
    char host[INET_ADDRSTRLEN] = {0};
    if (inet_ntop(AF_INET, &source.sin_addr, host, sizeof(host)) != nullptr) {
        datagram.source_host = host;
    }
    datagram.source_port = ntohs(source.sin_port);

    if (const auto* hooks = g_test_hooks.load(std::memory_order_acquire)) {
        if (hooks->drop_receive && hooks->drop_receive(datagram)) {
            return std::nullopt;
        }
    }
    return datagram;
}

}  // namespace peerchat::network
