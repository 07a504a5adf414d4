#pragma once
#include <vector>
#include "workload/Workload.hpp"

namespace burst {

enum class SimdIsa { SSE, AVX, AVX2 };

// ---------------------------------------------------------------------------
// Cache-resident vector kernel (two 256 KiB float arrays). Each loaded vector
// goes through kMicroSteps dependent mul/add/min/max rounds before it is
// stored back, so the load keeps the SIMD units busy rather than the bus.
//
// The ISA is checked at construction. When the CPU (or the target) lacks it
// the scalar kernel runs instead, with the same validation: result finite and
// bit-identical to the first run of this instance.
// ---------------------------------------------------------------------------
class SimdCacheWorkload final : public Workload {
public:
    static constexpr size_t kLength     = 1u << 16;
    static constexpr int    kMicroSteps = 16;

    explicit SimdCacheWorkload(SimdIsa isa);

    const char* name() const override;
    void run() override;
    std::optional<std::string> validate() override;

    bool hardware_path() const { return hw_; }

    static bool supported(SimdIsa isa);

private:
    SimdIsa isa_;
    bool    hw_;
    std::vector<float> a_;
    std::vector<float> b_;
    std::vector<float> out_;
    float probe_{0.0f};
    float reference_{0.0f};
    bool  has_reference_{false};
};

}
