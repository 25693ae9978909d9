#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace skyline {

// TimeoutSupervisor
// - arms a one-shot timer on construction
// - on expiry runs on_expire once, from the timer thread
// - stop() (also run by the destructor) disarms and joins
//
// on_expire must only touch thread-safe state (VM interrupt, cancel tokens).
class TimeoutSupervisor {
public:
    TimeoutSupervisor(std::chrono::milliseconds timeout, std::function<void()> on_expire);
    ~TimeoutSupervisor();

    TimeoutSupervisor(const TimeoutSupervisor&) = delete;
    TimeoutSupervisor& operator=(const TimeoutSupervisor&) = delete;

    void stop();
    bool fired() const { return fired_.load(std::memory_order_acquire); }

private:
    void run(std::chrono::steady_clock::time_point deadline);

    std::function<void()> on_expire_;
    std::mutex mu_;
    std::condition_variable cv_;
    bool stopped_{false};
    std::atomic<bool> fired_{false};
    std::thread thread_;
};

} // namespace skyline
