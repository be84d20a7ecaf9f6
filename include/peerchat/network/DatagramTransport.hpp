#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace peerchat::network {

struct Datagram {
    std::string payload;
    std::string source_host;
    std::uint16_t source_port{0};
};

// UDP/IPv4 socket bound to the chat port. Sends and receives may run on
// different threads; open() and close() must not race with either.
class DatagramTransport {
public:
    struct TestHooks {
        std::function<bool(const std::string& host, std::uint16_t port, std::string_view payload)> drop_send;
        std::function<bool(const Datagram&)> drop_receive;
    };

    static void set_test_hooks(const TestHooks* hooks);

    DatagramTransport() = default;
    ~DatagramTransport();

    DatagramTransport(const DatagramTransport&) = delete;
    DatagramTransport& operator=(const DatagramTransport&) = delete;

    // Throws std::runtime_error when the socket cannot be created or the
    // port is already bound. Port 0 picks an ephemeral port.
    void open(std::uint16_t port, std::chrono::milliseconds send_timeout);
    void close();

    [[nodiscard]] bool is_open() const noexcept;
    std::uint16_t local_port() const noexcept;

    bool send_to(const std::string& host, std::uint16_t port, std::string_view payload);
    std::optional<Datagram> receive(std::chrono::milliseconds timeout);

private:
    std::atomic<int> socket_{-1};
    std::uint16_t bound_port_{0};
};

}  // namespace peerchat::network
