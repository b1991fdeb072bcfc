
#pragma once
#include <chrono>
#include <cstdint>

namespace throttle {

enum class Algorithm {
    FixedWindow,
    TokenBucket,
    SlidingLog,
};

struct Decision {
    bool allowed;
    uint64_t remaining;                    // whole permits left after this call
    std::chrono::nanoseconds retry_after;  // zero when allowed
};

// Rounds up so a caller sleeping this long never retries early.
inline uint64_t retry_after_ms(const Decision& d) noexcept {
    const auto ns = static_cast<uint64_t>(d.retry_after.count());
    return ns / 1000000ULL + ((ns % 1000000ULL) != 0ULL ? 1ULL : 0ULL);
}

} // namespace throttle
