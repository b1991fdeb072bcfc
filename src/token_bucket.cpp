#include "throttle/token_bucket.h"
#include "detail.h"

namespace throttle {

TokenBucketLimiter::TokenBucketLimiter(uint64_t capacity, std::chrono::nanoseconds refill_interval,
                                       const Clock* clock)
    : clock_(clock ? clock : default_clock()),
      capacity_(detail::require_positive(capacity, "token bucket capacity")),
      interval_ns_(detail::require_positive(refill_interval, "token bucket refill interval")),
      last_refill_ns_(clock_->now_ns()),
      tokens_(capacity_) {}

void TokenBucketLimiter::refill(uint64_t now_ns) noexcept {
    // A full bucket accrues nothing; re-anchoring keeps an idle bucket
    // indistinguishable from a new one.
    if (tokens_ == capacity_) {
        last_refill_ns_ = now_ns;
        return;
    }

    const uint64_t to_add = detail::elapsed_ns(now_ns, last_refill_ns_) / interval_ns_;
    if (to_add == 0) return;

    // Reaching capacity drops the partial interval: time spent full earns
    // nothing, which is what makes a long-idle bucket equal a fresh one.
    if (to_add >= capacity_ - tokens_) {
        tokens_ = capacity_;
        last_refill_ns_ = now_ns;
        return;
    }

    // whole intervals only, the remainder carries over to the next call
    tokens_ += to_add;
    last_refill_ns_ += to_add * interval_ns_;
}

Decision TokenBucketLimiter::try_consume() noexcept {
    const uint64_t now = clock_->now_ns();
    refill(now);

    if (tokens_ > 0) {
        --tokens_;
        return Decision{true, tokens_, std::chrono::nanoseconds::zero()};
    }

    // refill() left less than one interval pending
    const uint64_t elapsed = detail::elapsed_ns(now, last_refill_ns_);
    return Decision{false, 0, detail::to_duration(interval_ns_ - elapsed)};
}

} // namespace throttle
