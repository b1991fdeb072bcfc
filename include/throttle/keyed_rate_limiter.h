#pragma once
#include <memory>
#include <string_view>

#include "throttle/config.h"

namespace throttle {

// One independent limiter per key, created on first use from a shared
// LimiterConfig. Keys are spread over shards so lookups of unrelated keys
// rarely contend; each limiter is driven under its own mutex.
//
// Entries are never evicted: the table grows with every distinct key until
// clear() is called, so callers facing unbounded key sets must clear it
// periodically.
class THROTTLE_API KeyedRateLimiter {
public:
    struct Config {
        LimiterConfig limit;
        size_t shards = 128;
        size_t capacity_hint_per_shard = 1024;
    };

    explicit KeyedRateLimiter() : KeyedRateLimiter(Config{}, nullptr) {}
    // Throws std::invalid_argument when cfg.limit is rejected.
    explicit KeyedRateLimiter(const Config& cfg, const Clock* clock = nullptr);
    ~KeyedRateLimiter();

    Decision allow(std::string_view key) noexcept;
    void clear();
    size_t size() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace throttle
