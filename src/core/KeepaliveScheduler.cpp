#include "peerchat/core/KeepaliveScheduler.hpp"

#include "peerchat/log/StructuredLogger.hpp"

#include <exception>
#include <utility>

namespace peerchat {

namespace {
constexpr std::chrono::milliseconds kMinimumInterval{std::chrono::milliseconds(10)};
}

KeepaliveScheduler::KeepaliveScheduler(std::chrono::milliseconds interval, Task task)
    : interval_(interval < kMinimumInterval ? kMinimumInterval : interval),
      task_(std::move(task)) {}

KeepaliveScheduler::~KeepaliveScheduler() {
    stop();
}

void KeepaliveScheduler::start() {
    std::scoped_lock lock(mutex_);
    if (running_) {
        return;
    }
    running_ = true;
    stop_requested_ = false;
    thread_ = std::thread(&KeepaliveScheduler::run, this);
}

void KeepaliveScheduler::stop() {
    {
        std::scoped_lock lock(mutex_);
        if (!running_) {
            return;
        }
        stop_requested_ = true;
    }
    wake_.notify_all();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
    std::scoped_lock lock(mutex_);
    running_ = false;
}

bool KeepaliveScheduler::running() const {
    std::scoped_lock lock(mutex_);
    return running_ && !stop_requested_;
}

void KeepaliveScheduler::run() {
    while (true) {
        {
            std::unique_lock lock(mutex_);
            if (wake_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
                return;
            }
        }
        try {
            task_();
        } catch (const std::exception& ex) {
            log::log_event(log::StructuredLogger::Level::Error,
                           "keepalive.task_failed",
                           {{"error", ex.what()}});
        }
    }
}

}  // namespace peerchat
