#pragma once
#include <cstdint>
#include <vector>
#include "workload/Workload.hpp"

namespace burst {

// ---------------------------------------------------------------------------
// Game-frame simulation: kObjects bodies in a [0, 100]^3 box, SoA layout,
// integrated at ~120 FPS with bounce-and-clamp at the walls, plus a per-frame
// rotation/sqrt/sin tail feeding a checksum. One run() = kFrames frames.
//
// Validation: checksum finite, every coordinate finite and inside the box.
// ---------------------------------------------------------------------------
class GamingWorkload final : public Workload {
public:
    static constexpr int      kObjects   = 1000;
    static constexpr int      kFrames    = 2000;
    static constexpr float    kDt        = 0.007f;
    static constexpr float    kBoundsMin = 0.0f;
    static constexpr float    kBoundsMax = 100.0f;
    static constexpr uint32_t kSeed      = 12345;

    GamingWorkload();

    const char* name() const override { return "GamingStress"; }
    void run() override;
    std::optional<std::string> validate() override;

    uint64_t frames() const { return frames_; }

private:
    float step_frame(float& angle);

    std::vector<float> x_, y_, z_;
    std::vector<float> vx_, vy_, vz_;
    double   checksum_{0.0};
    uint64_t frames_{0};
};

}
