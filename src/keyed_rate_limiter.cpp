#include <shared_mutex>
#include <unordered_map>
#include <string>
#include <vector>
#include <mutex>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "throttle/keyed_rate_limiter.h"

namespace throttle {

static inline uint64_t fnv1a_64(std::string_view s) {
    uint64_t h = 1469598103934665603ULL;
    for (unsigned char c : s) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    return h;
}

struct Entry {
    std::mutex mtx; // limiters are not thread-safe on their own
    std::unique_ptr<RateLimiter> limiter;
    explicit Entry(std::unique_ptr<RateLimiter> l) : limiter(std::move(l)) {}
};

struct Shard {
    std::unordered_map<std::string, std::unique_ptr<Entry>> map;
    mutable std::shared_mutex mtx; // shared for lookups, unique for insert/clear
};

struct KeyedRateLimiter::Impl {
    size_t shard_mask;
    std::vector<std::unique_ptr<Shard>> shards;
    LimiterConfig limit;
    const Clock* clock;

    Impl(const Config& cfg, const Clock* c)
        : limit(cfg.limit), clock(c ? c : default_clock()) {
        validate(limit);
        size_t shard_count = cfg.shards ? cfg.shards : 1;
        if ((shard_count & (shard_count - 1)) != 0) {
            size_t p = 1;
            while (p < shard_count) p <<= 1;
            shard_count = p;
        }
        shard_mask = shard_count - 1;
        shards.reserve(shard_count);
        for (size_t i = 0; i < shard_count; ++i) {
            auto s = std::make_unique<Shard>();
            s->map.reserve(cfg.capacity_hint_per_shard);
            shards.emplace_back(std::move(s));
        }
    }

    inline Shard& get_shard(std::string_view key) const {
        uint64_t h = fnv1a_64(key);
        return *shards[h & shard_mask];
    }

    // Caller holds the shard lock (either mode) so the entry cannot be
    // cleared underneath us.
    static Decision decide(Entry& e) noexcept {
        std::lock_guard<std::mutex> lk(e.mtx);
        return e.limiter->try_consume();
    }
};

KeyedRateLimiter::KeyedRateLimiter(const Config& cfg, const Clock* clock)
    : impl_(std::make_unique<Impl>(cfg, clock)) {
    spdlog::debug("keyed {} limiter ready: shards={} quota={} period_ns={}",
                  to_string(cfg.limit.algorithm), impl_->shards.size(), cfg.limit.quota,
                  cfg.limit.period.count());
}

KeyedRateLimiter::~KeyedRateLimiter() = default;

Decision KeyedRateLimiter::allow(std::string_view key) noexcept {
    try {
        Shard& shard = impl_->get_shard(key);
        std::string k(key);

        {
            std::shared_lock lk(shard.mtx);
            auto it = shard.map.find(k);
            if (it != shard.map.end()) {
                return Impl::decide(*it->second);
            }
        }
        {
            std::unique_lock lk(shard.mtx);
            auto it = shard.map.find(k);
            if (it == shard.map.end()) {
                auto e = std::make_unique<Entry>(make_limiter(impl_->limit, impl_->clock));
                it = shard.map.emplace(std::move(k), std::move(e)).first;
                spdlog::debug("new limiter for key '{}'", key);
            }
            return Impl::decide(*it->second);
        }
    } catch (const std::exception& ex) {
        spdlog::error("keyed limiter could not admit key '{}': {}", key, ex.what());
        return Decision{false, 0, std::chrono::nanoseconds::zero()};
    }
}

void KeyedRateLimiter::clear() {
    size_t dropped = 0;
    for (auto& s : impl_->shards) {
        std::unique_lock lk(s->mtx);
        dropped += s->map.size();
        s->map.clear();
    }
    spdlog::debug("keyed limiter cleared {} keys", dropped);
}

size_t KeyedRateLimiter::size() const noexcept {
    size_t sum = 0;
    for (auto& s : impl_->shards) {
        std::shared_lock lk(s->mtx);
        sum += s->map.size();
    }
    return sum;
}

} // namespace throttle
