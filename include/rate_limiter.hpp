#ifndef SONASTREAM_RATE_LIMITER_HPP
#define SONASTREAM_RATE_LIMITER_HPP

#include "session.hpp"

#include <chrono>
#include <cstddef>
#include <functional>

// Per-second byte budget. Sends are admitted until the current one-second
// window is full, then the caller sleeps to the window boundary. Bursts of up
// to the full budget are allowed inside a window.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;
    // Returns false if the wait was interrupted
    using SleepFn = std::function<bool(Clock::duration, const CancellationToken&)>;

    explicit RateLimiter(std::size_t bytes_per_second, NowFn now = nullptr, SleepFn sleep = nullptr);

    // Waits until `bytes` fit in the budget and charges them.
    // Returns false (nothing charged) if the token fired while waiting.
    bool acquire(std::size_t bytes, const CancellationToken& cancel);

    std::size_t budget() const { return bytes_per_second_; }
    std::size_t bytes_in_window() const { return bytes_in_window_; }
    Clock::duration total_wait() const { return total_wait_; }

private:
    std::size_t bytes_per_second_;
    NowFn now_;
    SleepFn sleep_;

    Clock::time_point window_start_;
    std::size_t bytes_in_window_ = 0;
    Clock::duration total_wait_{0};
};

#endif // SONASTREAM_RATE_LIMITER_HPP
