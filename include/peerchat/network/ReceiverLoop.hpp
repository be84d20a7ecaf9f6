#pragma once

#include "peerchat/network/DatagramTransport.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <thread>

namespace peerchat::network {

// Owns the inbound side of the transport. Datagrams are handed to the handler
// one at a time on the loop thread, in arrival order.
class ReceiverLoop {
public:
    using Handler = std::function<void(const Datagram&)>;

    ReceiverLoop(DatagramTransport& transport, std::chrono::milliseconds poll_interval);
    ~ReceiverLoop();

    ReceiverLoop(const ReceiverLoop&) = delete;
    ReceiverLoop& operator=(const ReceiverLoop&) = delete;

    void start(Handler handler);
    void stop();
    [[nodiscard]] bool running() const noexcept;

private:
    DatagramTransport& transport_;
    std::chrono::milliseconds poll_interval_;
    Handler handler_{};
    std::atomic<bool> running_{false};
    std::thread thread_;

    void run();
};

}  // namespace peerchat::network
