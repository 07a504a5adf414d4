#pragma once
#include "workload/Workload.hpp"

namespace burst {

// FMA/sqrt/div chains over four lanes. The probe must stay finite and must
// be bit-identical between runs (same inputs, same instruction sequence).
class FloatingPointWorkload final : public Workload {
public:
    static constexpr int kInnerIterations = 2'000'000;

    const char* name() const override { return "FloatingPointStress"; }
    void run() override;
    std::optional<std::string> validate() override;

private:
    double probe_{0.0};
    double reference_{0.0};
    bool   has_reference_{false};
    double gauss_{0.0};
};

}
