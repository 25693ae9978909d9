#pragma once

#include <atomic>

namespace skyline {

// CancelToken
// - cancel() may be called from any thread
// - a child token reports cancelled when it or any ancestor was cancelled
//
// The parent must outlive the child.
class CancelToken {
public:
    CancelToken() = default;
    explicit CancelToken(const CancelToken* parent) : parent_(parent) {}

    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    void cancel() { flag_.store(true, std::memory_order_release); }

    bool cancelled() const {
        if (flag_.load(std::memory_order_acquire)) return true;
        return parent_ != nullptr && parent_->cancelled();
    }

    // True only when an ancestor (not this token) was cancelled.
    bool parent_cancelled() const { return parent_ != nullptr && parent_->cancelled(); }

private:
    const CancelToken* parent_{nullptr};
    std::atomic<bool> flag_{false};
};

} // namespace skyline
