#pragma once

#include "throttle/types.h"
#include "throttle/clock.h"
#include "throttle/rate_limiter.h"
#include "throttle/fixed_window.h"
#include "throttle/token_bucket.h"
#include "throttle/sliding_log.h"
#include "throttle/config.h"
#include "throttle/synchronized.h"
#include "throttle/keyed_rate_limiter.h"
