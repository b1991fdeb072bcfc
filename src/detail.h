#pragma once
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace throttle {
namespace detail {

inline uint64_t require_positive(uint64_t value, const char* what) {
    if (value == 0) {
        throw std::invalid_argument(std::string(what) + " must be positive");
    }
    return value;
}

inline uint64_t require_positive(std::chrono::nanoseconds value, const char* what) {
    if (value.count() <= 0) {
        throw std::invalid_argument(std::string(what) + " must be a positive duration, got " +
                                    std::to_string(value.count()) + "ns");
    }
    return static_cast<uint64_t>(value.count());
}

// A clock reading behind the anchor counts as no time passed.
inline uint64_t elapsed_ns(uint64_t now_ns, uint64_t since_ns) noexcept {
    return (now_ns > since_ns) ? (now_ns - since_ns) : 0ULL;
}

inline std::chrono::nanoseconds to_duration(uint64_t ns) noexcept {
    return std::chrono::nanoseconds(static_cast<std::chrono::nanoseconds::rep>(ns));
}

} // namespace detail
} // namespace throttle
