#include "throttle/throttle_c.h"

#include <chrono>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "throttle/fixed_window.h"
#include "throttle/sliding_log.h"
#include "throttle/token_bucket.h"
#include "throttle/version.h"

using throttle::RateLimiter;

namespace {

template <typename Limiter>
void* new_limiter(const char* what, uint64_t quota, uint64_t period_ns) {
    if (period_ns > static_cast<uint64_t>(std::chrono::nanoseconds::max().count())) {
        spdlog::error("{}: period {}ns exceeds the signed 64-bit nanosecond range", what, period_ns);
        return nullptr;
    }
    try {
        const auto period = std::chrono::nanoseconds(
            static_cast<std::chrono::nanoseconds::rep>(period_ns));
        RateLimiter* p = new Limiter(quota, period, nullptr);
        return static_cast<void*>(p);
    } catch (const std::exception& e) {
        spdlog::error("{}: {}", what, e.what());
        return nullptr;
    }
}

} // namespace

extern "C" THROTTLE_API const char* throttle_version(void) {
    return THROTTLE_VERSION;
}

extern "C" THROTTLE_API void* throttle_new_fixed_window(uint64_t quota, uint64_t window_ns) {
    return new_limiter<throttle::FixedWindowLimiter>("throttle_new_fixed_window", quota, window_ns);
}

extern "C" THROTTLE_API void* throttle_new_token_bucket(uint64_t capacity, uint64_t refill_interval_ns) {
    return new_limiter<throttle::TokenBucketLimiter>("throttle_new_token_bucket", capacity,
                                                     refill_interval_ns);
}

extern "C" THROTTLE_API void* throttle_new_sliding_log(uint64_t quota, uint64_t window_ns) {
    return new_limiter<throttle::SlidingLogLimiter>("throttle_new_sliding_log", quota, window_ns);
}

extern "C" THROTTLE_API throttle_decision_t throttle_try_consume(void* handle) {
    throttle_decision_t out{};
    if (!handle) {
        out.allowed = 0;
        out.remaining = 0;
        out.retry_after_ms = 0;
        return out;
    }
    auto* limiter = static_cast<RateLimiter*>(handle);
    throttle::Decision d = limiter->try_consume();
    out.allowed = d.allowed ? 1 : 0;
    out.remaining = d.remaining;
    out.retry_after_ms = throttle::retry_after_ms(d);
    return out;
}

extern "C" THROTTLE_API void throttle_free(void* handle) {
    delete static_cast<RateLimiter*>(handle);
}
