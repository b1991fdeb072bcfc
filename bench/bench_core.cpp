
#include <benchmark/benchmark.h>
#include <chrono>
#include <string>
#include <vector>
#include "throttle/throttle.h"

static throttle::LimiterConfig config_for(int64_t arg) {
    throttle::LimiterConfig cfg;
    cfg.algorithm = static_cast<throttle::Algorithm>(arg);
    cfg.quota = 1000;
    cfg.period = std::chrono::milliseconds(1);
    return cfg;
}

static void BM_TryConsume(benchmark::State& state) {
    auto cfg = config_for(state.range(0));
    auto limiter = throttle::make_limiter(cfg);
    state.SetLabel(throttle::to_string(cfg.algorithm));
    for (auto _ : state) {
        auto d = limiter->try_consume();
        benchmark::DoNotOptimize(d);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_TryConsume)->DenseRange(0, 2);

static void BM_Synchronized(benchmark::State& state) {
    static throttle::SynchronizedRateLimiter* shared = nullptr;
    if (state.thread_index() == 0) {
        shared = new throttle::SynchronizedRateLimiter(throttle::make_limiter(config_for(state.range(0))));
    }
    for (auto _ : state) {
        auto d = shared->try_consume();
        benchmark::DoNotOptimize(d);
    }
    state.SetItemsProcessed(state.iterations());
    if (state.thread_index() == 0) {
        delete shared;
        shared = nullptr;
    }
}
BENCHMARK(BM_Synchronized)->DenseRange(0, 2)->Threads(1)->Threads(4);

static void BM_KeyedUniformKeys(benchmark::State& state) {
    throttle::KeyedRateLimiter::Config cfg;
    cfg.limit = config_for(state.range(0));
    cfg.limit.quota = 10;
    cfg.shards = 128;
    cfg.capacity_hint_per_shard = 1 << 10;
    throttle::KeyedRateLimiter rl(cfg);

    std::vector<std::string> keys;
    for (int i = 0; i < 100000; ++i) keys.emplace_back("key_" + std::to_string(i));

    size_t idx = 0;
    for (auto _ : state) {
        auto& k = keys[idx++ % keys.size()];
        rl.allow(k);
        benchmark::DoNotOptimize(k);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_KeyedUniformKeys)->DenseRange(0, 2);

static void BM_KeyedHotKey(benchmark::State& state) {
    throttle::KeyedRateLimiter::Config cfg;
    cfg.limit = config_for(state.range(0));
    throttle::KeyedRateLimiter rl(cfg);
    std::string k = "hot";
    for (auto _ : state) {
        rl.allow(k);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_KeyedHotKey)->DenseRange(0, 2);

BENCHMARK_MAIN();
