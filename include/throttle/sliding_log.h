#pragma once
#include <chrono>
#include <cstdint>
#include <vector>

#include "throttle/rate_limiter.h"

namespace throttle {

// Exact sliding window: keeps the admission instant of every request still
// inside the window, oldest first. The log is a ring of `quota` slots
// allocated up front, so try_consume() never allocates. Each entry is pruned
// at most once, so the per-call cost is amortized O(1).
class THROTTLE_API SlidingLogLimiter final : public RateLimiter {
public:
    // Throws std::invalid_argument when quota is zero or window is not positive.
    explicit SlidingLogLimiter(uint64_t quota, std::chrono::nanoseconds window,
                               const Clock* clock = nullptr);

    Decision try_consume() noexcept override;
    Algorithm algorithm() const noexcept override { return Algorithm::SlidingLog; }

    uint64_t quota() const noexcept { return quota_; }
    std::chrono::nanoseconds window() const noexcept { return std::chrono::nanoseconds(window_ns_); }
    size_t logged() const noexcept { return size_; }

private:
    const Clock* clock_;
    uint64_t quota_;
    uint64_t window_ns_;
    std::vector<uint64_t> ring_;
    size_t head_ = 0; // oldest entry
    size_t size_ = 0;
};

} // namespace throttle
