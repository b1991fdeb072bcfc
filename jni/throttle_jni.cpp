
#include <jni.h>
#include <chrono>
#include <stdexcept>
#include <string>
#include <spdlog/spdlog.h>
#include "throttle/config.h"

using throttle::RateLimiter;

static void throw_illegal_argument(JNIEnv* env, const char* msg) {
    jclass cls = env->FindClass("java/lang/IllegalArgumentException");
    if (cls) env->ThrowNew(cls, msg);
}

extern "C" JNIEXPORT jlong JNICALL
Java_io_throttle_NativeRateLimiter_create(JNIEnv* env, jclass,
                                          jstring jalgorithm, jint quota, jlong periodMillis) {
    if (!jalgorithm) {
        throw_illegal_argument(env, "algorithm must not be null");
        return 0;
    }
    const char* utf = env->GetStringUTFChars(jalgorithm, nullptr);
    if (!utf) return 0;
    std::string name(utf);
    env->ReleaseStringUTFChars(jalgorithm, utf);

    auto algorithm = throttle::parse_algorithm(name);
    if (!algorithm) {
        throw_illegal_argument(env, ("unknown algorithm: " + name).c_str());
        return 0;
    }
    if (quota <= 0) {
        throw_illegal_argument(env, "quota must be positive");
        return 0;
    }

    auto period = throttle::period_from_ms(periodMillis);
    if (!period) {
        throw_illegal_argument(env, "periodMillis must be positive and fit in nanoseconds");
        return 0;
    }

    throttle::LimiterConfig cfg;
    cfg.algorithm = *algorithm;
    cfg.quota = static_cast<uint64_t>(quota);
    cfg.period = *period;
    try {
        return reinterpret_cast<jlong>(throttle::make_limiter(cfg).release());
    } catch (const std::exception& e) {
        spdlog::error("NativeRateLimiter.create: {}", e.what());
        throw_illegal_argument(env, e.what());
        return 0;
    }
}

extern "C" JNIEXPORT jobject JNICALL
Java_io_throttle_NativeRateLimiter_tryConsume(JNIEnv* env, jclass, jlong handle) {
    if (!handle) return nullptr;
    auto* limiter = reinterpret_cast<RateLimiter*>(handle);
    throttle::Decision d = limiter->try_consume();

    jclass decisionCls = env->FindClass("io/throttle/NativeRateLimiter$Decision");
    if (!decisionCls) return nullptr;
    jmethodID ctor = env->GetMethodID(decisionCls, "<init>", "(ZJJ)V");
    if (!ctor) return nullptr;
    jobject obj = env->NewObject(decisionCls, ctor, (jboolean)d.allowed, (jlong)d.remaining,
                                 (jlong)throttle::retry_after_ms(d));
    return obj;
}

extern "C" JNIEXPORT void JNICALL
Java_io_throttle_NativeRateLimiter_free(JNIEnv*, jclass, jlong handle) {
    delete reinterpret_cast<RateLimiter*>(handle);
}
