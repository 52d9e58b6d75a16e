#include "rate_limiter.hpp"
#include <stdexcept>

using namespace std::chrono;

namespace {
constexpr seconds WINDOW(1);
}

RateLimiter::RateLimiter(std::size_t bytes_per_second, NowFn now, SleepFn sleep)
    : bytes_per_second_(bytes_per_second), now_(std::move(now)), sleep_(std::move(sleep)) {
    if (bytes_per_second_ == 0)
        throw std::invalid_argument("rate limit must be positive");
    if (!now_) now_ = [] { return Clock::now(); };
    if (!sleep_) sleep_ = sleep_unless_cancelled;
    window_start_ = now_();
}

bool RateLimiter::acquire(std::size_t bytes, const CancellationToken& cancel) {
    auto now = now_();
    if (now - window_start_ >= WINDOW) {
        window_start_ = now;
        bytes_in_window_ = 0;
    }

    if (bytes_in_window_ + bytes > bytes_per_second_) {
        auto wait = window_start_ + WINDOW - now;
        if (wait > Clock::duration::zero()) {
            if (!sleep_(wait, cancel)) return false;
            total_wait_ += wait;
        }
        window_start_ = now_();
        bytes_in_window_ = 0;
    }

    bytes_in_window_ += bytes;
    return true;
}
