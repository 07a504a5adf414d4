#pragma once
#include <cstdint>
#include "workload/Workload.hpp"

namespace burst {

// ---------------------------------------------------------------------------
// Integer-only ALU load: four independent lanes of xorshift/mul/rotate mixing,
// unrolled by 8, no memory traffic and no branches in the hot loop.
//
// Every run() starts from the same seeds, so every run must end on the same
// checksum. The first run records the reference; later runs are compared to
// it. A cheap independent check (sum 1..1000) guards the reference run.
// ---------------------------------------------------------------------------
class IntegerWorkload final : public Workload {
public:
    static constexpr int kInnerIterations = 2'000'000;

    const char* name() const override { return "IntegerStress"; }
    void run() override;
    std::optional<std::string> validate() override;

private:
    uint64_t checksum_{0};
    uint64_t reference_{0};
    bool     has_reference_{false};
    int64_t  gauss_{0};
};

}
