#include "workload/SimdCacheWorkload.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>

#if defined(__x86_64__) || defined(__i386__)
#include <immintrin.h>
#define BURST_X86 1
#endif

using namespace burst;

namespace {

constexpr float kK1  = 0.6180339f;
constexpr float kK2  = 0.7071067f;
constexpr float kCap = 1.0e3f;

float kernel_scalar(const float* a, const float* b, float* out, size_t n, int steps) {
    float sum = 0.0f;
    for (size_t i = 0; i < n; ++i) {
        float x = a[i], y = b[i];
        for (int s = 0; s < steps; ++s) {
            x = std::min(std::max(x * kK1 + y, -kCap), kCap);
            y = std::min(std::max(y * kK2 - x, -kCap), kCap);
        }
        out[i] = x;
        sum += x;
    }
    return sum;
}

#ifdef BURST_X86

__attribute__((target("sse2")))
float kernel_sse(const float* a, const float* b, float* out, size_t n, int steps) {
    const __m128 k1 = _mm_set1_ps(kK1), k2 = _mm_set1_ps(kK2);
    const __m128 hi = _mm_set1_ps(kCap), lo = _mm_set1_ps(-kCap);
    __m128 acc = _mm_setzero_ps();
    for (size_t i = 0; i + 4 <= n; i += 4) {
        __m128 x = _mm_loadu_ps(a + i);
        __m128 y = _mm_loadu_ps(b + i);
        for (int s = 0; s < steps; ++s) {
            x = _mm_min_ps(_mm_max_ps(_mm_add_ps(_mm_mul_ps(x, k1), y), lo), hi);
            y = _mm_min_ps(_mm_max_ps(_mm_sub_ps(_mm_mul_ps(y, k2), x), lo), hi);
        }
        _mm_storeu_ps(out + i, x);
        acc = _mm_add_ps(acc, x);
    }
    alignas(16) float lanes[4];
    _mm_store_ps(lanes, acc);
    return lanes[0] + lanes[1] + lanes[2] + lanes[3];
}

__attribute__((target("avx")))
float kernel_avx(const float* a, const float* b, float* out, size_t n, int steps) {
    const __m256 k1 = _mm256_set1_ps(kK1), k2 = _mm256_set1_ps(kK2);
    const __m256 hi = _mm256_set1_ps(kCap), lo = _mm256_set1_ps(-kCap);
    __m256 acc = _mm256_setzero_ps();
    for (size_t i = 0; i + 8 <= n; i += 8) {
        __m256 x = _mm256_loadu_ps(a + i);
        __m256 y = _mm256_loadu_ps(b + i);
        for (int s = 0; s < steps; ++s) {
            x = _mm256_min_ps(_mm256_max_ps(_mm256_add_ps(_mm256_mul_ps(x, k1), y), lo), hi);
            y = _mm256_min_ps(_mm256_max_ps(_mm256_sub_ps(_mm256_mul_ps(y, k2), x), lo), hi);
        }
        _mm256_storeu_ps(out + i, x);
        acc = _mm256_add_ps(acc, x);
    }
    alignas(32) float lanes[8];
    _mm256_store_ps(lanes, acc);
    float s = 0.0f;
    for (float v : lanes) s += v;
    return s;
}

__attribute__((target("avx2,fma")))
float kernel_avx2(const float* a, const float* b, float* out, size_t n, int steps) {
    const __m256 k1 = _mm256_set1_ps(kK1), k2 = _mm256_set1_ps(kK2);
    const __m256 hi = _mm256_set1_ps(kCap), lo = _mm256_set1_ps(-kCap);
    const __m256i salt = _mm256_set1_epi32(0x45D9F3B);
    __m256  acc  = _mm256_setzero_ps();
    __m256i bits = _mm256_setzero_si256();
    for (size_t i = 0; i + 8 <= n; i += 8) {
        __m256 x = _mm256_loadu_ps(a + i);
        __m256 y = _mm256_loadu_ps(b + i);
        for (int s = 0; s < steps; ++s) {
            x = _mm256_min_ps(_mm256_max_ps(_mm256_fmadd_ps(x, k1, y), lo), hi);
            y = _mm256_min_ps(_mm256_max_ps(_mm256_fmsub_ps(y, k2, x), lo), hi);
        }
        // integer side: keeps the AVX2 integer ports in the mix
        bits = _mm256_xor_si256(_mm256_add_epi32(bits, _mm256_castps_si256(x)), salt);
        _mm256_storeu_ps(out + i, x);
        acc = _mm256_add_ps(acc, x);
    }
    alignas(32) float lanes[8];
    alignas(32) int32_t ibits[8];
    _mm256_store_ps(lanes, acc);
    _mm256_store_si256(reinterpret_cast<__m256i*>(ibits), bits);
    float s = 0.0f;
    for (float v : lanes) s += v;
    int32_t fold = 0;
    for (int32_t v : ibits) fold ^= v;
    return s + static_cast<float>(fold & 0xFF) * 1e-6f;
}

#endif

}

bool SimdCacheWorkload::supported(SimdIsa isa) {
#ifdef BURST_X86
    switch (isa) {
        case SimdIsa::SSE:  return __builtin_cpu_supports("sse2");
        case SimdIsa::AVX:  return __builtin_cpu_supports("avx");
        case SimdIsa::AVX2: return __builtin_cpu_supports("avx2") && __builtin_cpu_supports("fma");
    }
#else
    (void)isa;
#endif
    return false;
}

SimdCacheWorkload::SimdCacheWorkload(SimdIsa isa)
    : isa_(isa), hw_(supported(isa)), a_(kLength), b_(kLength), out_(kLength) {
    for (size_t i = 0; i < kLength; ++i) {
        a_[i] = static_cast<float>((i * 2654435761u) % 1000u) * 1e-3f;
        b_[i] = static_cast<float>((i * 40503u) % 997u) * 1e-3f - 0.5f;
    }
}

const char* SimdCacheWorkload::name() const {
    switch (isa_) {
        case SimdIsa::SSE:  return "SseCacheStress";
        case SimdIsa::AVX:  return "AvxCacheStress";
        case SimdIsa::AVX2: return "Avx2CacheStress";
    }
    return "SimdCacheStress";
}

void SimdCacheWorkload::run() {
    float sum = 0.0f;
#ifdef BURST_X86
    if (hw_) {
        switch (isa_) {
            case SimdIsa::SSE:  sum = kernel_sse(a_.data(), b_.data(), out_.data(), kLength, kMicroSteps); break;
            case SimdIsa::AVX:  sum = kernel_avx(a_.data(), b_.data(), out_.data(), kLength, kMicroSteps); break;
            case SimdIsa::AVX2: sum = kernel_avx2(a_.data(), b_.data(), out_.data(), kLength, kMicroSteps); break;
        }
    } else {
        sum = kernel_scalar(a_.data(), b_.data(), out_.data(), kLength, kMicroSteps);
    }
#else
    sum = kernel_scalar(a_.data(), b_.data(), out_.data(), kLength, kMicroSteps);
#endif
    probe_ = sum * 1e-3f + out_[kLength / 2];
}

std::optional<std::string> SimdCacheWorkload::validate() {
    if (!std::isfinite(probe_))
        return std::string(name()) + " error: NaN/Inf in vector result";
    if (!has_reference_) {
        reference_     = probe_;
        has_reference_ = true;
        return std::nullopt;
    }
    if (probe_ != reference_)
        return std::string(name()) + " error: vector result differs from reference run";
    return std::nullopt;
}
