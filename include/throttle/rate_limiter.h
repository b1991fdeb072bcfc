#pragma once
#include "throttle/export.h"
#include "types.h"
#include "clock.h"

namespace throttle {

// Admission decision contract shared by every algorithm.
//
// Implementations are plain state machines advanced only by try_consume().
// They carry no lock: callers sharing one instance across threads must
// serialize access (see SynchronizedRateLimiter and KeyedRateLimiter).
class THROTTLE_API RateLimiter {
public:
    virtual ~RateLimiter() = default;

    // Admits or rejects one request. On admission the consumption is
    // recorded; on rejection no quota is used and retry_after holds the
    // wait before the next attempt can succeed.
    virtual Decision try_consume() noexcept = 0;

    virtual Algorithm algorithm() const noexcept = 0;
};

} // namespace throttle
