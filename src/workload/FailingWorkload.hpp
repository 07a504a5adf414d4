#pragma once
#include <cstdint>
#include <random>
#include "workload/Workload.hpp"

namespace burst {

// ---------------------------------------------------------------------------
// Harness self-test. run() is a small sqrt loop; validate() passes for the
// first kWarmupValidations calls on this instance, then fails at geometric
// intervals (success probability kFailProbability per validation).
// Not part of the public catalog.
// ---------------------------------------------------------------------------
class FailingWorkload final : public Workload {
public:
    static constexpr int    kWarmupValidations = 2000;
    static constexpr double kFailProbability   = 0.002;

    FailingWorkload();
    FailingWorkload(int warmup, double fail_probability, uint64_t seed);

    const char* name() const override { return "FailingStress"; }
    void run() override;
    std::optional<std::string> validate() override;

    int64_t validations() const { return validations_; }
    int64_t next_failure_at() const { return next_fail_at_; }

private:
    int64_t sample_gap();

    int          warmup_;
    double       p_;
    std::mt19937_64 rng_;
    int64_t      validations_{0};
    int64_t      next_fail_at_{0};
    double       sink_{0.0};
};

}
