#include "throttle/config.h"

#include <charconv>
#include <limits>
#include <system_error>

#include <spdlog/spdlog.h>

#include "throttle/fixed_window.h"
#include "throttle/sliding_log.h"
#include "throttle/token_bucket.h"
#include "detail.h"

namespace throttle {

const char* to_string(Algorithm algorithm) noexcept {
    switch (algorithm) {
        case Algorithm::FixedWindow: return "fixed_window";
        case Algorithm::TokenBucket: return "token_bucket";
        case Algorithm::SlidingLog:  return "sliding_log";
    }
    return "unknown";
}

std::optional<Algorithm> parse_algorithm(std::string_view name) noexcept {
    if (name == "fixed_window" || name == "fixed") return Algorithm::FixedWindow;
    if (name == "token_bucket" || name == "bucket") return Algorithm::TokenBucket;
    if (name == "sliding_log" || name == "sliding" || name == "log") return Algorithm::SlidingLog;
    return std::nullopt;
}

std::optional<uint64_t> parse_quota(std::string_view text) noexcept {
    uint64_t value = 0;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc() || ptr != end || value == 0) return std::nullopt;
    return value;
}

std::optional<std::chrono::nanoseconds> period_from_ms(int64_t ms) noexcept {
    constexpr int64_t max_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::nanoseconds::max()).count();
    if (ms <= 0 || ms > max_ms) return std::nullopt;
    return std::chrono::milliseconds(ms);
}

std::optional<std::chrono::nanoseconds> parse_period_ms(std::string_view text) noexcept {
    int64_t ms = 0;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, ms);
    if (ec != std::errc() || ptr != end) return std::nullopt;
    return period_from_ms(ms);
}

void validate(const LimiterConfig& cfg) {
    const bool bucket = cfg.algorithm == Algorithm::TokenBucket;
    detail::require_positive(cfg.quota, bucket ? "token bucket capacity" : "quota");
    detail::require_positive(cfg.period, bucket ? "token bucket refill interval" : "window size");
}

std::unique_ptr<RateLimiter> make_limiter(const LimiterConfig& cfg, const Clock* clock) {
    std::unique_ptr<RateLimiter> limiter;
    switch (cfg.algorithm) {
        case Algorithm::FixedWindow:
            limiter = std::make_unique<FixedWindowLimiter>(cfg.quota, cfg.period, clock);
            break;
        case Algorithm::TokenBucket:
            limiter = std::make_unique<TokenBucketLimiter>(cfg.quota, cfg.period, clock);
            break;
        case Algorithm::SlidingLog:
            limiter = std::make_unique<SlidingLogLimiter>(cfg.quota, cfg.period, clock);
            break;
        default:
            throw std::invalid_argument("unknown rate limiting algorithm");
    }
    spdlog::debug("created {} limiter quota={} period_ns={}",
                  to_string(cfg.algorithm), cfg.quota, cfg.period.count());
    return limiter;
}

} // namespace throttle
