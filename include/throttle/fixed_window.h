#pragma once
#include <chrono>
#include <cstdint>

#include "throttle/rate_limiter.h"

namespace throttle {

// Counts admissions in consecutive, non-overlapping windows.
//
// Windows roll over lazily: an expired window is replaced by one starting at
// the instant of the next call. Up to 2 * quota requests can pass within less
// than one window when they straddle a boundary.
class THROTTLE_API FixedWindowLimiter final : public RateLimiter {
public:
    // Throws std::invalid_argument when quota is zero or window is not positive.
    explicit FixedWindowLimiter(uint64_t quota, std::chrono::nanoseconds window,
                                const Clock* clock = nullptr);

    Decision try_consume() noexcept override;
    Algorithm algorithm() const noexcept override { return Algorithm::FixedWindow; }

    uint64_t quota() const noexcept { return quota_; }
    std::chrono::nanoseconds window() const noexcept { return std::chrono::nanoseconds(window_ns_); }

private:
    const Clock* clock_;
    uint64_t quota_;
    uint64_t window_ns_;
    uint64_t window_start_ns_;
    uint64_t count_ = 0;
};

} // namespace throttle
