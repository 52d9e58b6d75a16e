#include "rate_limiter.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <stdexcept>
#include <vector>

using namespace std::chrono;

namespace {

// Manual clock: sleeping advances time instantly
struct FakeClock {
    RateLimiter::Clock::time_point now{};
    std::vector<RateLimiter::Clock::duration> sleeps;
    bool allow_sleep = true;

    RateLimiter make(size_t budget) {
        return RateLimiter(
            budget,
            [this] { return now; },
            [this](RateLimiter::Clock::duration d, const CancellationToken&) {
                if (!allow_sleep) return false;
                sleeps.push_back(d);
                now += d;
                return true;
            });
    }
};

} // namespace

TEST(RateLimiter, RejectsZeroBudget) {
    EXPECT_THROW(RateLimiter(0), std::invalid_argument);
}

TEST(RateLimiter, AdmitsUpToTheBudgetWithoutWaiting) {
    FakeClock clock;
    RateLimiter limiter = clock.make(100);
    CancellationToken cancel;

    EXPECT_TRUE(limiter.acquire(60, cancel));
    EXPECT_TRUE(limiter.acquire(40, cancel));
    EXPECT_TRUE(clock.sleeps.empty());
    EXPECT_EQ(limiter.bytes_in_window(), 100u);
}

TEST(RateLimiter, WaitsUntilTheWindowBoundary) {
    FakeClock clock;
    RateLimiter limiter = clock.make(100);
    CancellationToken cancel;

    limiter.acquire(60, cancel);
    clock.now += milliseconds(300);
    EXPECT_TRUE(limiter.acquire(60, cancel));

    ASSERT_EQ(clock.sleeps.size(), 1u);
    EXPECT_EQ(duration_cast<milliseconds>(clock.sleeps[0]).count(), 700);
    EXPECT_EQ(limiter.bytes_in_window(), 60u);
    EXPECT_EQ(duration_cast<milliseconds>(limiter.total_wait()).count(), 700);
}

TEST(RateLimiter, WindowResetsAfterOneSecond) {
    FakeClock clock;
    RateLimiter limiter = clock.make(100);
    CancellationToken cancel;

    limiter.acquire(100, cancel);
    clock.now += seconds(1);
    EXPECT_TRUE(limiter.acquire(100, cancel));
    EXPECT_TRUE(clock.sleeps.empty());
}

TEST(RateLimiter, InterruptedWaitChargesNothing) {
    FakeClock clock;
    RateLimiter limiter = clock.make(100);
    CancellationToken cancel;

    limiter.acquire(60, cancel);
    clock.allow_sleep = false;
    EXPECT_FALSE(limiter.acquire(60, cancel));
    EXPECT_EQ(limiter.bytes_in_window(), 60u);
}

TEST(RateLimiter, AverageRateStaysWithinBudgetPlusOnePacket) {
    FakeClock clock;
    const size_t budget = 100;
    const size_t packet = 30;
    RateLimiter limiter = clock.make(budget);
    CancellationToken cancel;

    auto start = clock.now;
    size_t sent = 0;
    for (int i = 0; i < 50; ++i) {
        ASSERT_TRUE(limiter.acquire(packet, cancel));
        sent += packet;
    }
    double elapsed = duration<double>(clock.now - start).count();
    EXPECT_GE(elapsed, 1.0);
    EXPECT_LE(sent / elapsed, static_cast<double>(budget + packet));
}

TEST(RateLimiter, RealSleepHonoursCancellation) {
    RateLimiter limiter(10);
    CancellationToken cancel;
    ASSERT_TRUE(limiter.acquire(10, cancel));
    cancel.cancel();
    EXPECT_FALSE(limiter.acquire(10, cancel));
}
