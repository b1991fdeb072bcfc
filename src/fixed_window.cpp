#include "throttle/fixed_window.h"
#include "detail.h"

namespace throttle {

FixedWindowLimiter::FixedWindowLimiter(uint64_t quota, std::chrono::nanoseconds window,
                                       const Clock* clock)
    : clock_(clock ? clock : default_clock()),
      quota_(detail::require_positive(quota, "fixed window quota")),
      window_ns_(detail::require_positive(window, "fixed window size")),
      window_start_ns_(clock_->now_ns()) {}

Decision FixedWindowLimiter::try_consume() noexcept {
    const uint64_t now = clock_->now_ns();

    // lazy rollover: the expired window is replaced by one starting now
    if (detail::elapsed_ns(now, window_start_ns_) >= window_ns_) {
        count_ = 0;
        window_start_ns_ = now;
    }

    if (count_ < quota_) {
        ++count_;
        return Decision{true, quota_ - count_, std::chrono::nanoseconds::zero()};
    }

    const uint64_t elapsed = detail::elapsed_ns(now, window_start_ns_);
    return Decision{false, 0, detail::to_duration(window_ns_ - elapsed)};
}

} // namespace throttle
