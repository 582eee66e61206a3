#pragma once
#include "types.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <signal.h>
#include <sys/types.h>

namespace hookchain {

// Timer racing a child process group. If not disarmed before the deadline it
// SIGKILLs the whole group and reports fired(). Arms on construction.
class Watchdog {
public:
    Watchdog(pid_t pgid, Millis timeout)
        : pgid_(pgid)
        , deadline_(Clock::now() + timeout)
    {
        thread_ = std::thread([this]() { run(); });
    }

    ~Watchdog() { disarm(); }

    Watchdog(const Watchdog&) = delete;
    Watchdog& operator=(const Watchdog&) = delete;

    // Idempotent. Once this returns the group will not be signalled.
    void disarm() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            disarmed_ = true;
        }
        cv_.notify_all();
        if (thread_.joinable()) thread_.join();
    }

    bool fired() const { return fired_; }

private:
    pid_t pgid_;
    Clock::time_point deadline_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool disarmed_ = false;
    std::atomic<bool> fired_{false};
    std::thread thread_;

    void run() {
        std::unique_lock<std::mutex> lock(mutex_);
        if (cv_.wait_until(lock, deadline_, [this]() { return disarmed_; })) return;
        fired_ = true;
        kill(-pgid_, SIGKILL);
    }
};

} // namespace hookchain
