#include "peerchat/network/ReceiverLoop.hpp"

#include "peerchat/log/StructuredLogger.hpp"

#include <exception>
#include <utility>

namespace peerchat::network {

ReceiverLoop::ReceiverLoop(DatagramTransport& transport, std::chrono::milliseconds poll_interval)
    : transport_(transport),
      poll_interval_(poll_interval.count() > 0 ? poll_interval : std::chrono::milliseconds(250)) {}

ReceiverLoop::~ReceiverLoop() {
    stop();
}

void ReceiverLoop::start(Handler handler) {
    if (running_.load(std::memory_order_acquire)) {
        return;
    }
    handler_ = std::move(handler);
    running_.store(true, std::memory_order_release);
    thread_ = std::thread(&ReceiverLoop::run, this);
}

void ReceiverLoop::stop() {
    running_.store(false, std::memory_order_release);
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

bool ReceiverLoop::running() const noexcept {
    return running_.load(std::memory_order_acquire);
}

void ReceiverLoop::run() {
    while (running_.load(std::memory_order_acquire)) {
        auto datagram = transport_.receive(poll_interval_);
        if (!datagram.has_value()) {
            continue;
        }
        try {
            handler_(*datagram);
        } catch (const std::exception& ex) {
            log::log_event(log::StructuredLogger::Level::Error,
                           "receiver.handler_failed",
                           {{"source", datagram->source_host}, {"error", ex.what()}});
        }
    }
}

}  // namespace peerchat::network
