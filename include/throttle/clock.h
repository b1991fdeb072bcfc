
#pragma once
#include <cstdint>
#include <chrono>

namespace throttle {

// Monotonic instant source in nanoseconds since an arbitrary epoch.
struct Clock {
    virtual ~Clock() = default;
    virtual uint64_t now_ns() const noexcept = 0;
};

struct SteadyClock final : public Clock {
    uint64_t now_ns() const noexcept override {
        using namespace std::chrono;
        return duration_cast<nanoseconds>(steady_clock::now().time_since_epoch()).count();
    }
};

// Stateless, so one instance serves every limiter built without a clock.
inline const Clock* default_clock() noexcept {
    static const SteadyClock clock;
    return &clock;
}

} // namespace throttle
