#include "throttle/synchronized.h"

#include <stdexcept>

namespace throttle {

SynchronizedRateLimiter::SynchronizedRateLimiter(std::unique_ptr<RateLimiter> inner)
    : inner_(std::move(inner)) {
    if (!inner_) throw std::invalid_argument("SynchronizedRateLimiter needs a limiter");
}

Decision SynchronizedRateLimiter::try_consume() noexcept {
    std::lock_guard<std::mutex> lk(mtx_);
    return inner_->try_consume();
}

} // namespace throttle
