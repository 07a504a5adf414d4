#include "workload/FailingWorkload.hpp"
#include <cmath>
#include <limits>

using namespace burst;

FailingWorkload::FailingWorkload()
    : FailingWorkload(kWarmupValidations, kFailProbability, std::random_device{}()) {}

FailingWorkload::FailingWorkload(int warmup, double fail_probability, uint64_t seed)
    : warmup_(warmup < 0 ? 0 : warmup), p_(fail_probability), rng_(seed) {}

void FailingWorkload::run() {
    double s = 0.0;
    for (int i = 0; i < 50'000; ++i) s += std::sqrt(static_cast<double>(i));
    sink_ = s;
}

// number of trials until the first success, >= 1
int64_t FailingWorkload::sample_gap() {
    if (p_ <= 0.0) return std::numeric_limits<int64_t>::max() / 2;
    if (p_ >= 1.0) return 1;
    std::uniform_real_distribution<double> u01(0.0, 1.0);
    double u;
    do { u = u01(rng_); } while (u == 0.0);
    const auto k = static_cast<int64_t>(std::ceil(std::log(u) / std::log(1.0 - p_)));
    return k < 1 ? 1 : k;
}

std::optional<std::string> FailingWorkload::validate() {
    const int64_t n = ++validations_;
    if (n <= warmup_) return std::nullopt;

    if (next_fail_at_ == 0)
        next_fail_at_ = warmup_ + sample_gap();

    if (n >= next_fail_at_) {
        next_fail_at_ = n + sample_gap();
        return "synthetic failure at validation #" + std::to_string(n)
             + ", next expected near #" + std::to_string(next_fail_at_);
    }
    return std::nullopt;
}
