#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

#include "throttle/rate_limiter.h"

namespace throttle {

// Parameters for any of the three algorithms. `quota` is the window quota
// or the bucket capacity; `period` is the window size or the refill interval.
struct LimiterConfig {
    Algorithm algorithm = Algorithm::TokenBucket;
    uint64_t quota = 10;
    std::chrono::nanoseconds period = std::chrono::milliseconds(100);
};

THROTTLE_API const char* to_string(Algorithm algorithm) noexcept;

// Accepts the to_string() names plus the short forms "fixed", "bucket",
// "sliding" and "log".
THROTTLE_API std::optional<Algorithm> parse_algorithm(std::string_view name) noexcept;

// Parses a positive decimal count. Signs, spaces, zero and values that do
// not fit in uint64_t are rejected.
THROTTLE_API std::optional<uint64_t> parse_quota(std::string_view text) noexcept;

// Positive millisecond count that still fits in std::chrono::nanoseconds.
THROTTLE_API std::optional<std::chrono::nanoseconds> period_from_ms(int64_t ms) noexcept;
THROTTLE_API std::optional<std::chrono::nanoseconds> parse_period_ms(std::string_view text) noexcept;

// Throws std::invalid_argument when the config is rejected by the
// algorithm's constructor.
THROTTLE_API void validate(const LimiterConfig& cfg);

THROTTLE_API std::unique_ptr<RateLimiter> make_limiter(const LimiterConfig& cfg,
                                                       const Clock* clock = nullptr);

} // namespace throttle
