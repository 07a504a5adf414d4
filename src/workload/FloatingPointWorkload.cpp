#include "workload/FloatingPointWorkload.hpp"
#include <cmath>

using namespace burst;

namespace {

inline void step(double& a, double& b, double& c, double& d,
                 double k1, double k2, double& acc) {
    constexpr double eps   = 1e-12;
    constexpr double scale = 0.999999997;

    a = std::fma(a, k1, b);
    b = std::fma(b, k2, c);
    c = std::fma(c, k1, d);
    d = std::fma(d, k2, a);

    double ab = a * b + c;
    double cd = c * d + a;
    double bc = b * c - d;

    a = (std::sqrt(std::fabs(ab)) + eps) * scale;
    b = (std::sqrt(std::fabs(cd)) + eps) * scale;
    c = (std::fabs(bc) + eps) / (1.0 + ab * k1 + eps);
    d = (std::fabs(ab - cd) + eps) / (1.0 + bc * k2 + eps);

    acc = std::fma(acc, 0.9999999, a + b * 1e-6 + c * 1e-9 + d * 1e-12);
}

}

void FloatingPointWorkload::run() {
    double a = 1.6180339887498948482;
    double b = 2.7182818284590452354;
    double c = 3.1415926535897932385;
    double d = 0.5772156649015328606;
    constexpr double k1 = 0.4142135623730950488;
    constexpr double k2 = 1.7320508075688772935;

    double acc = 0.0;
    for (int i = 0; i < kInnerIterations; i += 2) {
        step(a, b, c, d, k1, k2, acc);
        step(a, b, c, d, k2, k1, acc);
    }

    double mix = (a + b) * (c + d);
    mix = std::sqrt(std::fabs(mix) + 1e-12) / (1.0 + std::fabs(a * d - b * c) + 1e-12);
    probe_ = mix + acc * 1e-9;

    volatile int n = 1000;
    double s = 0.0;
    for (int i = 1; i <= n; ++i) s += i;
    gauss_ = s;
}

std::optional<std::string> FloatingPointWorkload::validate() {
    if (!std::isfinite(probe_))
        return "floating point error: NaN/Inf in result";
    // exact: 500500 is representable
    if (gauss_ != 500500.0)
        return "floating point error: sum 1..1000 is not exact";

    if (!has_reference_) {
        reference_     = probe_;
        has_reference_ = true;
        return std::nullopt;
    }
    if (probe_ != reference_)
        return "floating point error: result differs from reference run";
    return std::nullopt;
}
