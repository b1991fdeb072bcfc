
#include <gtest/gtest.h>
#include <stdexcept>
#include "throttle/token_bucket.h"
#include "fake_clock.h"

using namespace std::chrono_literals;

TEST(TokenBucket, StartsFullAndRefillsOneTokenPerInterval) {
    FakeClock fc;
    throttle::TokenBucketLimiter rl(2, 100ms, &fc);
    auto d1 = rl.try_consume();
    auto d2 = rl.try_consume();
    auto d3 = rl.try_consume();
    EXPECT_TRUE(d1.allowed);
    EXPECT_EQ(d1.remaining, 1u);
    EXPECT_TRUE(d2.allowed);
    EXPECT_EQ(d2.remaining, 0u);
    EXPECT_FALSE(d3.allowed);
    EXPECT_EQ(d3.retry_after, 100ms);

    fc.advance(100ms);
    EXPECT_TRUE(rl.try_consume().allowed);
    auto d4 = rl.try_consume();
    EXPECT_FALSE(d4.allowed);
    EXPECT_EQ(d4.retry_after, 100ms);
}

TEST(TokenBucket, RetryAfterIsTimeUntilNextToken) {
    FakeClock fc;
    throttle::TokenBucketLimiter rl(1, 100ms, &fc);
    EXPECT_TRUE(rl.try_consume().allowed);
    fc.advance(30ms);
    auto d = rl.try_consume();
    EXPECT_FALSE(d.allowed);
    EXPECT_EQ(d.retry_after, 70ms);
    fc.advance(69ms);
    EXPECT_EQ(rl.try_consume().retry_after, 1ms);
    fc.advance(1ms);
    EXPECT_TRUE(rl.try_consume().allowed);
}

// Partial progress toward the next token survives a refill.
TEST(TokenBucket, FractionalIntervalCarriesForward) {
    FakeClock fc;
    throttle::TokenBucketLimiter rl(3, 100ms, &fc);
    for (int i = 0; i < 3; ++i) EXPECT_TRUE(rl.try_consume().allowed);
    fc.set(150ms); // one token, 50ms toward the next
    EXPECT_TRUE(rl.try_consume().allowed);
    auto d = rl.try_consume();
    EXPECT_FALSE(d.allowed);
    EXPECT_EQ(d.retry_after, 50ms);
    fc.set(200ms);
    EXPECT_TRUE(rl.try_consume().allowed);
}

TEST(TokenBucket, NeverExceedsCapacity) {
    FakeClock fc;
    throttle::TokenBucketLimiter rl(3, 10ms, &fc);
    EXPECT_TRUE(rl.try_consume().allowed);
    fc.advance(10s);
    int admitted = 0;
    for (int i = 0; i < 10; ++i) admitted += rl.try_consume().allowed ? 1 : 0;
    EXPECT_EQ(admitted, 3);
}

TEST(TokenBucket, IdleLimiterBehavesLikeFresh) {
    FakeClock fc;
    throttle::TokenBucketLimiter idle(2, 100ms, &fc);
    EXPECT_TRUE(idle.try_consume().allowed);
    fc.advance(42ms);
    EXPECT_TRUE(idle.try_consume().allowed);
    fc.advance(24h * 365 * 100);
    throttle::TokenBucketLimiter fresh(2, 100ms, &fc);
    for (int i = 0; i < 4; ++i) {
        auto a = idle.try_consume();
        auto b = fresh.try_consume();
        EXPECT_EQ(a.allowed, b.allowed);
        EXPECT_EQ(a.remaining, b.remaining);
        EXPECT_EQ(a.retry_after, b.retry_after);
        fc.advance(30ms);
    }
}

TEST(TokenBucket, ConsumingFromFullBucketAfterIdleDoesNotBackfill) {
    FakeClock fc;
    throttle::TokenBucketLimiter rl(1, 100ms, &fc);
    fc.advance(1h);
    EXPECT_TRUE(rl.try_consume().allowed);
    auto d = rl.try_consume();
    EXPECT_FALSE(d.allowed);
    EXPECT_EQ(d.retry_after, 100ms);
}

TEST(TokenBucket, RejectsInvalidParameters) {
    FakeClock fc;
    EXPECT_THROW(throttle::TokenBucketLimiter(0, 1s, &fc), std::invalid_argument);
    EXPECT_THROW(throttle::TokenBucketLimiter(1, 0ns, &fc), std::invalid_argument);
    EXPECT_THROW(throttle::TokenBucketLimiter(1, -5s, &fc), std::invalid_argument);
}

TEST(TokenBucket, ReportsParameters) {
    FakeClock fc;
    throttle::TokenBucketLimiter rl(7, 20ms, &fc);
    EXPECT_EQ(rl.capacity(), 7u);
    EXPECT_EQ(rl.refill_interval(), 20ms);
    EXPECT_EQ(rl.algorithm(), throttle::Algorithm::TokenBucket);
}

TEST(TokenBucket, ClockGoingBackwardsNeverYieldsNegativeWait) {
    FakeClock fc;
    fc.set(10s);
    throttle::TokenBucketLimiter rl(1, 100ms, &fc);
    EXPECT_TRUE(rl.try_consume().allowed);
    fc.set(5s);
    auto d = rl.try_consume();
    EXPECT_FALSE(d.allowed);
    EXPECT_EQ(d.retry_after, 100ms);
}

// Refilling to capacity restarts the refill clock; the leftover 50ms
// accrued while the bucket was topping up is not banked.
TEST(TokenBucket, FillingToCapacityDropsPartialInterval) {
    FakeClock fc;
    throttle::TokenBucketLimiter rl(2, 100ms, &fc);
    EXPECT_TRUE(rl.try_consume().allowed);
    EXPECT_TRUE(rl.try_consume().allowed);
    fc.set(250ms);
    EXPECT_TRUE(rl.try_consume().allowed);
    EXPECT_TRUE(rl.try_consume().allowed);
    fc.set(300ms);
    auto d = rl.try_consume();
    EXPECT_FALSE(d.allowed);
    EXPECT_EQ(d.retry_after, 50ms);
}
