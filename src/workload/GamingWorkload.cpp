#include "workload/GamingWorkload.hpp"
#include <algorithm>
#include <cmath>
#include <random>

using namespace burst;

GamingWorkload::GamingWorkload()
    : x_(kObjects), y_(kObjects), z_(kObjects),
      vx_(kObjects), vy_(kObjects), vz_(kObjects) {
    std::mt19937 rng(kSeed);
    std::uniform_real_distribution<float> pos(kBoundsMin, kBoundsMax);
    std::uniform_real_distribution<float> vel(-5.0f, 5.0f);
    for (int i = 0; i < kObjects; ++i) {
        x_[i] = pos(rng); y_[i] = pos(rng); z_[i] = pos(rng);
        vx_[i] = vel(rng); vy_[i] = vel(rng); vz_[i] = vel(rng);
    }
}

namespace {

inline void integrate(float& p, float& v, float& sum) {
    p += v * GamingWorkload::kDt;
    if (p < GamingWorkload::kBoundsMin || p > GamingWorkload::kBoundsMax) {
        v = -v;
        p = std::min(std::max(p, GamingWorkload::kBoundsMin), GamingWorkload::kBoundsMax);
    }
    sum += p;
}

}

float GamingWorkload::step_frame(float& angle) {
    angle += 0.001f;
    const float c = std::cos(angle);
    const float s = std::sin(angle);

    float sum = 0.0f;
    for (int i = 0; i < kObjects; ++i) {
        integrate(x_[i], vx_[i], sum);
        integrate(y_[i], vy_[i], sum);
        integrate(z_[i], vz_[i], sum);
    }

    // rotate (1,1,1) about Y, the vertex-shader part of the frame
    const float tx = c + s;
    const float tz = -s + c;
    float v = sum + tx + 1.0f + tz;
    return std::sqrt(v * v + std::sin(v));
}

void GamingWorkload::run() {
    float angle = 0.0f;
    for (int f = 0; f < kFrames; ++f) {
        checksum_ += step_frame(angle);
        ++frames_;
    }
}

std::optional<std::string> GamingWorkload::validate() {
    if (!std::isfinite(checksum_))
        return "gaming error: frame checksum is NaN/Inf";

    constexpr float lo = kBoundsMin - 1e-3f;
    constexpr float hi = kBoundsMax + 1e-3f;
    for (int i = 0; i < kObjects; ++i) {
        if (!std::isfinite(x_[i]) || !std::isfinite(y_[i]) || !std::isfinite(z_[i]))
            return "gaming error: object " + std::to_string(i) + " position is NaN/Inf";
        if (x_[i] < lo || x_[i] > hi || y_[i] < lo || y_[i] > hi || z_[i] < lo || z_[i] > hi)
            return "gaming error: object " + std::to_string(i) + " escaped the bounds";
    }
    return std::nullopt;
}
