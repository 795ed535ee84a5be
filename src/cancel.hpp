#pragma once
#include <atomic>
#include <chrono>

namespace curbench {

// Shared cancellation signal for a fan-out of embedding calls.
// Cancelled when cancel() is called or the optional deadline passes.
// HTTP transfers poll it in one-second slices.
class CancelToken {
public:
    using Clock = std::chrono::steady_clock;

    CancelToken() = default;

    explicit CancelToken(std::chrono::milliseconds timeout)
        : has_deadline_(true), deadline_(Clock::now() + timeout) {}

    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    void cancel() { cancelled_.store(true, std::memory_order_relaxed); }

    bool cancelled() const {
        return cancelled_.load(std::memory_order_relaxed) || expired();
    }

    bool expired() const {
        return has_deadline_ && Clock::now() >= deadline_;
    }

private:
    std::atomic<bool> cancelled_{false};
    bool has_deadline_ = false;
    Clock::time_point deadline_{};
};

} // namespace curbench
