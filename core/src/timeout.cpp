#include "skyline/timeout.h"

#include <utility>

namespace skyline {

TimeoutSupervisor::TimeoutSupervisor(std::chrono::milliseconds timeout, std::function<void()> on_expire)
    : on_expire_(std::move(on_expire)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    thread_ = std::thread([this, deadline] { run(deadline); });
}

TimeoutSupervisor::~TimeoutSupervisor() {
    stop();
}

void TimeoutSupervisor::stop() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        stopped_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
}

void TimeoutSupervisor::run(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lk(mu_);
    if (cv_.wait_until(lk, deadline, [&] { return stopped_; })) return;
    fired_.store(true, std::memory_order_release);
    lk.unlock();
    if (on_expire_) on_expire_();
}

} // namespace skyline
