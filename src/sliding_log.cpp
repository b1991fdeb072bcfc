#include "throttle/sliding_log.h"
#include "detail.h"

namespace throttle {

SlidingLogLimiter::SlidingLogLimiter(uint64_t quota, std::chrono::nanoseconds window,
                                     const Clock* clock)
    : clock_(clock ? clock : default_clock()),
      quota_(detail::require_positive(quota, "sliding log quota")),
      window_ns_(detail::require_positive(window, "sliding log window")),
      ring_() {
    if (quota_ > ring_.max_size()) {
        throw std::invalid_argument("sliding log quota " + std::to_string(quota_) +
                                    " exceeds the addressable log size");
    }
    ring_.resize(static_cast<size_t>(quota_));
}

Decision SlidingLogLimiter::try_consume() noexcept {
    const uint64_t now = clock_->now_ns();
    const size_t slots = ring_.size();

    // an entry expires once a full window has passed since it was admitted
    while (size_ > 0 && detail::elapsed_ns(now, ring_[head_]) >= window_ns_) {
        head_ = (head_ + 1) % slots;
        --size_;
    }

    if (size_ < slots) {
        ring_[(head_ + size_) % slots] = now;
        ++size_;
        return Decision{true, static_cast<uint64_t>(slots - size_), std::chrono::nanoseconds::zero()};
    }

    const uint64_t age = detail::elapsed_ns(now, ring_[head_]);
    return Decision{false, 0, detail::to_duration(window_ns_ - age)};
}

} // namespace throttle
