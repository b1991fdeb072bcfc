
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <spdlog/spdlog.h>
#include "throttle/config.h"

int main(int argc, char** argv) {
    throttle::LimiterConfig cfg;
    cfg.algorithm = throttle::Algorithm::TokenBucket;
    cfg.quota = 10;
    cfg.period = std::chrono::milliseconds(200);

    int pos = 0;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            spdlog::set_level(spdlog::level::debug);
            continue;
        }
        switch (pos++) {
            case 0: {
                auto a = throttle::parse_algorithm(arg);
                if (!a) {
                    spdlog::error("unknown algorithm '{}' (fixed_window, token_bucket, sliding_log)", arg);
                    return 2;
                }
                cfg.algorithm = *a;
                break;
            }
            case 1: {
                auto q = throttle::parse_quota(arg);
                if (!q) {
                    spdlog::error("quota must be a positive integer, got '{}'", arg);
                    return 2;
                }
                cfg.quota = *q;
                break;
            }
            case 2: {
                auto p = throttle::parse_period_ms(arg);
                if (!p) {
                    spdlog::error("period_ms must be a positive integer in range, got '{}'", arg);
                    return 2;
                }
                cfg.period = *p;
                break;
            }
            default:
                spdlog::error("usage: {} [algorithm] [quota] [period_ms] [--verbose]", argv[0]);
                return 2;
        }
    }

    std::unique_ptr<throttle::RateLimiter> limiter;
    try {
        limiter = throttle::make_limiter(cfg);
    } catch (const std::exception& e) {
        spdlog::error("invalid limiter configuration: {}", e.what());
        return 2;
    }

    spdlog::info("Enter keys (Ctrl+D to exit). Using {} quota={} period={}ms",
                 throttle::to_string(cfg.algorithm), cfg.quota,
                 std::chrono::duration_cast<std::chrono::milliseconds>(cfg.period).count());
    std::string line;
    while (std::getline(std::cin, line)) {
        auto d = limiter->try_consume();
        std::cout << line << " -> allowed=" << (d.allowed ? "yes" : "no")
                  << " remaining=" << d.remaining
                  << " retry_after_ms=" << throttle::retry_after_ms(d) << "\n";
        if (!d.allowed) spdlog::debug("rejected '{}', retry in {}ns", line, d.retry_after.count());
    }
    return 0;
}
