#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace peerchat {

// Runs a task on a fixed period on its own thread. stop() wakes the thread
// immediately instead of waiting out the current period.
class KeepaliveScheduler {
public:
    using Task = std::function<void()>;

    KeepaliveScheduler(std::chrono::milliseconds interval, Task task);
    ~KeepaliveScheduler();

    KeepaliveScheduler(const KeepaliveScheduler&) = delete;
    KeepaliveScheduler& operator=(const KeepaliveScheduler&) = delete;

    void start();
    void stop();
    [[nodiscard]] bool running() const;

private:
    std::chrono::milliseconds interval_;
    Task task_;
    mutable std::mutex mutex_;
    std::condition_variable wake_;
    bool running_{false};
    bool stop_requested_{false};
    std::thread thread_;

    void run();
};

}  // namespace peerchat
