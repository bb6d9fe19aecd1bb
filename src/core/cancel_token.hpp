#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

// Cooperative cancellation for external calls: a shared flag plus an
// optional deadline. Copies share the flag; with_timeout() derives a child
// whose deadline is the earlier of its parent's and the new one.
class CancelToken {
public:
    using Clock = std::chrono::steady_clock;

    CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    static CancelToken with_deadline_in(std::chrono::milliseconds timeout) {
        CancelToken t;
        t.deadline_ = Clock::now() + timeout;
        return t;
    }

    CancelToken with_timeout(std::chrono::milliseconds timeout) const {
        CancelToken child = *this;
        auto candidate = Clock::now() + timeout;
        if (!child.deadline_ || candidate < *child.deadline_) {
            child.deadline_ = candidate;
        }
        return child;
    }

    void cancel() { flag_->store(true); }

    bool cancelled() const { return flag_->load(); }

    bool expired() const {
        return deadline_ && Clock::now() >= *deadline_;
    }

    bool should_stop() const { return cancelled() || expired(); }

    bool has_deadline() const { return deadline_.has_value(); }

    // Milliseconds left before the deadline, clamped at zero. -1 = no deadline.
    long long remaining_ms() const {
        if (!deadline_) return -1;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            *deadline_ - Clock::now()).count();
        return left > 0 ? left : 0;
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
    std::optional<Clock::time_point> deadline_;
};
