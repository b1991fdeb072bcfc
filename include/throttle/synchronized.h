#pragma once
#include <memory>
#include <mutex>

#include "throttle/rate_limiter.h"

namespace throttle {

// Serializes try_consume() on a wrapped limiter so one instance can be
// shared between threads without changing call sites.
class THROTTLE_API SynchronizedRateLimiter final : public RateLimiter {
public:
    // Throws std::invalid_argument on a null limiter.
    explicit SynchronizedRateLimiter(std::unique_ptr<RateLimiter> inner);

    Decision try_consume() noexcept override;
    Algorithm algorithm() const noexcept override { return inner_->algorithm(); }

private:
    std::unique_ptr<RateLimiter> inner_;
    std::mutex mtx_;
};

} // namespace throttle
