#pragma once
#include <chrono>
#include <cstdint>

#include "throttle/rate_limiter.h"

namespace throttle {

// Bucket of up to `capacity` permits, starting full, gaining one permit per
// refill interval. Refill advances by whole intervals so partial progress
// toward the next token survives between calls.
class THROTTLE_API TokenBucketLimiter final : public RateLimiter {
public:
    // Throws std::invalid_argument when capacity is zero or the interval is
    // not positive.
    explicit TokenBucketLimiter(uint64_t capacity, std::chrono::nanoseconds refill_interval,
                                const Clock* clock = nullptr);

    Decision try_consume() noexcept override;
    Algorithm algorithm() const noexcept override { return Algorithm::TokenBucket; }

    uint64_t capacity() const noexcept { return capacity_; }
    std::chrono::nanoseconds refill_interval() const noexcept {
        return std::chrono::nanoseconds(interval_ns_);
    }

private:
    void refill(uint64_t now_ns) noexcept;

    const Clock* clock_;
    uint64_t capacity_;
    uint64_t interval_ns_;
    uint64_t last_refill_ns_;
    uint64_t tokens_;
};

} // namespace throttle
