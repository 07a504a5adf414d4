#include "workload/IntegerWorkload.hpp"

using namespace burst;

namespace {

inline uint64_t rotl(uint64_t x, int r) { return (x << r) | (x >> (64 - r)); }

inline void step(uint64_t& a, uint64_t& b, uint64_t& c, uint64_t& d,
                 uint64_t mA, uint64_t mB, int r1, int r2, int r3, uint64_t& acc) {
    a ^= a >> 29; a *= mA; a = rotl(a, r1);
    b ^= b >> 31; b *= mB; b = rotl(b, r2);
    c ^= c >> 33; c *= mA; c = rotl(c, r3);
    d ^= d >> 25; d *= mB; d = rotl(d, r1);

    a += b; c ^= d; b += c; d ^= a;
    a *= 3; b *= 5; c *= 9; d *= 7;

    acc ^= (a + (b << 1)) ^ (c << 2) ^ (d << 3);
}

}

void IntegerWorkload::run() {
    uint64_t a = 0x9E3779B97F4A7C15ULL;
    uint64_t b = 0xC2B2AE3D27D4EB4FULL;
    uint64_t c = 0x165667B19E3779F9ULL;
    uint64_t d = 0xD6E8FEB86659FD93ULL;
    constexpr uint64_t m1 = 0xBF58476D1CE4E5B9ULL;
    constexpr uint64_t m2 = 0x94D049BB133111EBULL;
    constexpr int R1 = 13, R2 = 17, R3 = 43;

    uint64_t acc = 0;
    int i = 0;
    for (; i <= kInnerIterations - 8; i += 8) {
        step(a, b, c, d, m1, m2, R1, R2, R3, acc);
        step(a, b, c, d, m2, m1, R2, R3, R1, acc);
        step(a, b, c, d, m1, m2, R3, R1, R2, acc);
        step(a, b, c, d, m2, m1, R1, R3, R2, acc);
        step(a, b, c, d, m1, m2, R1, R2, R3, acc);
        step(a, b, c, d, m2, m1, R2, R3, R1, acc);
        step(a, b, c, d, m1, m2, R3, R1, R2, acc);
        step(a, b, c, d, m2, m1, R1, R3, R2, acc);
    }
    for (; i < kInnerIterations; ++i)
        step(a, b, c, d, m1, m2, R1, R2, R3, acc);

    checksum_ = acc ^ rotl(a + b, 17) ^ rotl(c + d, 29);

    // volatile bound keeps the compiler from folding the sum away
    volatile int n = 1000;
    int64_t sum = 0;
    for (int k = 1; k <= n; ++k) sum += k;
    gauss_ = sum;
}

std::optional<std::string> IntegerWorkload::validate() {
    if (gauss_ != 500500)
        return std::string("integer ALU error: sum 1..1000 = ") + std::to_string(gauss_);

    if (!has_reference_) {
        reference_     = checksum_;
        has_reference_ = true;
        return std::nullopt;
    }
    if (checksum_ != reference_)
        return "integer ALU error: checksum drifted from reference run";
    return std::nullopt;
}
