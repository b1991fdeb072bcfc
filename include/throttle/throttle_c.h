/* include/throttle/throttle_c.h */
#pragma once
#include <stdint.h>

#include "throttle/export.h"

#ifdef __cplusplus
extern "C" {
#endif

typedef struct throttle_decision_t {
    int allowed;
    uint64_t remaining;
    uint64_t retry_after_ms; /* rounded up; 0 when allowed */
} throttle_decision_t;

THROTTLE_API const char* throttle_version(void);

/* Each constructor returns NULL when a parameter is zero, when the period
 * exceeds INT64_MAX nanoseconds, or when the limiter cannot be allocated. */
THROTTLE_API void* throttle_new_fixed_window(uint64_t quota, uint64_t window_ns);
THROTTLE_API void* throttle_new_token_bucket(uint64_t capacity, uint64_t refill_interval_ns);
THROTTLE_API void* throttle_new_sliding_log(uint64_t quota, uint64_t window_ns);

THROTTLE_API throttle_decision_t throttle_try_consume(void* handle);

THROTTLE_API void throttle_free(void* handle);

#ifdef __cplusplus
}
#endif
