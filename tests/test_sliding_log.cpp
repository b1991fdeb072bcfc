
#include <gtest/gtest.h>
#include <cstdint>
#include <deque>
#include <stdexcept>
#include "throttle/sliding_log.h"
#include "fake_clock.h"

using namespace std::chrono_literals;

TEST(SlidingLog, RetryAfterUntilOldestExpires) {
    FakeClock fc;
    throttle::SlidingLogLimiter rl(2, 1s, &fc);
    EXPECT_TRUE(rl.try_consume().allowed);
    fc.set(500ms);
    EXPECT_TRUE(rl.try_consume().allowed);
    fc.set(600ms);
    auto d = rl.try_consume();
    EXPECT_FALSE(d.allowed);
    EXPECT_EQ(d.retry_after, 400ms);

    fc.set(1010ms);
    auto d2 = rl.try_consume();
    EXPECT_TRUE(d2.allowed);
    EXPECT_EQ(d2.remaining, 0u);
    EXPECT_EQ(rl.logged(), 2u);
}

TEST(SlidingLog, PrunesSeveralEntriesAfterIdle) {
    FakeClock fc;
    throttle::SlidingLogLimiter rl(4, 100ms, &fc);
    for (int i = 0; i < 4; ++i) {
        EXPECT_TRUE(rl.try_consume().allowed);
        fc.advance(10ms);
    }
    EXPECT_EQ(rl.logged(), 4u);
    fc.advance(1h);
    auto d = rl.try_consume();
    EXPECT_TRUE(d.allowed);
    EXPECT_EQ(d.remaining, 3u);
    EXPECT_EQ(rl.logged(), 1u);
}

TEST(SlidingLog, RejectionIsNotLogged) {
    FakeClock fc;
    throttle::SlidingLogLimiter rl(1, 1s, &fc);
    EXPECT_TRUE(rl.try_consume().allowed);
    for (int i = 0; i < 5; ++i) {
        fc.advance(100ms);
        EXPECT_FALSE(rl.try_consume().allowed);
    }
    EXPECT_EQ(rl.logged(), 1u);
    fc.set(1s);
    EXPECT_TRUE(rl.try_consume().allowed);
}

// Replays a bursty schedule and checks every trailing window.
TEST(SlidingLog, NeverMoreThanQuotaInAnyWindow) {
    FakeClock fc;
    const uint64_t quota = 5;
    const auto window = 100ms;
    throttle::SlidingLogLimiter rl(quota, window, &fc);
    std::deque<uint64_t> admitted;
    uint64_t step = 0;
    for (int i = 0; i < 2000; ++i) {
        step = (step * 7 + 3) % 23; // deterministic uneven spacing
        fc.advance(std::chrono::milliseconds(step));
        auto d = rl.try_consume();
        EXPECT_GE(d.retry_after.count(), 0);
        if (!d.allowed) continue;
        const uint64_t now = fc.now_ns();
        admitted.push_back(now);
        while (now - admitted.front() >= static_cast<uint64_t>(std::chrono::nanoseconds(window).count())) {
            admitted.pop_front();
        }
        EXPECT_LE(admitted.size(), quota);
    }
}

TEST(SlidingLog, WrapsAroundRing) {
    FakeClock fc;
    throttle::SlidingLogLimiter rl(3, 30ms, &fc);
    for (int i = 0; i < 30; ++i) {
        auto d = rl.try_consume();
        EXPECT_TRUE(d.allowed) << "call " << i;
        EXPECT_LE(rl.logged(), 3u);
        fc.advance(10ms);
    }
}

TEST(SlidingLog, RejectsInvalidParameters) {
    FakeClock fc;
    EXPECT_THROW(throttle::SlidingLogLimiter(0, 1s, &fc), std::invalid_argument);
    EXPECT_THROW(throttle::SlidingLogLimiter(1, 0s, &fc), std::invalid_argument);
    EXPECT_THROW(throttle::SlidingLogLimiter(1, -1s, &fc), std::invalid_argument);
}

TEST(SlidingLog, ReportsParameters) {
    FakeClock fc;
    throttle::SlidingLogLimiter rl(4, 2s, &fc);
    EXPECT_EQ(rl.quota(), 4u);
    EXPECT_EQ(rl.window(), 2s);
    EXPECT_EQ(rl.logged(), 0u);
    EXPECT_EQ(rl.algorithm(), throttle::Algorithm::SlidingLog);
}

TEST(SlidingLog, ClockGoingBackwardsNeverYieldsNegativeWait) {
    FakeClock fc;
    fc.set(10s);
    throttle::SlidingLogLimiter rl(1, 1s, &fc);
    EXPECT_TRUE(rl.try_consume().allowed);
    fc.set(5s);
    auto d = rl.try_consume();
    EXPECT_FALSE(d.allowed);
    EXPECT_EQ(d.retry_after, 1s);
}

TEST(SlidingLog, UnaddressableQuotaIsRejected) {
    FakeClock fc;
    EXPECT_THROW(throttle::SlidingLogLimiter(UINT64_MAX, 1s, &fc), std::invalid_argument);
}
