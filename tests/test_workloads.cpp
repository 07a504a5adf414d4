#include <gtest/gtest.h>

#include "workload/FailingWorkload.hpp"
#include "workload/FloatingPointWorkload.hpp"
#include "workload/GamingWorkload.hpp"
#include "workload/HashingWorkload.hpp"
#include "workload/IntegerWorkload.hpp"
#include "workload/MemoryWorkload.hpp"
#include "workload/SimdCacheWorkload.hpp"

using namespace burst;

namespace {
// Two cycles: the first sets the reference, the second is compared to it.
void expect_two_clean_cycles(Workload& w) {
    for (int i = 0; i < 2; ++i) {
        w.run();
        auto failure = w.validate();
        EXPECT_FALSE(failure.has_value()) << w.name() << ": " << failure.value_or("");
    }
}
}

TEST(WorkloadTest, IntegerIsStable) {
    IntegerWorkload w;
    expect_two_clean_cycles(w);
}

TEST(WorkloadTest, FloatingPointIsStable) {
    FloatingPointWorkload w;
    expect_two_clean_cycles(w);
}

TEST(WorkloadTest, MemoryRoundTripsItsBuffer) {
    MemoryWorkload w;
    expect_two_clean_cycles(w);
}

TEST(WorkloadTest, MemoryValidateBeforeRunFails) {
    MemoryWorkload w;
    EXPECT_TRUE(w.validate().has_value());
}

TEST(WorkloadTest, SimdKernelsAreStableOnEveryIsa) {
    for (SimdIsa isa : {SimdIsa::SSE, SimdIsa::AVX, SimdIsa::AVX2}) {
        SimdCacheWorkload w(isa);
        EXPECT_EQ(w.hardware_path(), SimdCacheWorkload::supported(isa));
        expect_two_clean_cycles(w);
    }
}

TEST(WorkloadTest, HashingIsStable) {
    HashingWorkload w;
    expect_two_clean_cycles(w);
}

TEST(WorkloadTest, GamingStaysInBounds) {
    GamingWorkload w;
    expect_two_clean_cycles(w);
    EXPECT_EQ(w.frames(), 2u * GamingWorkload::kFrames);
}

TEST(FailingWorkloadTest, PassesThroughWarmup) {
    FailingWorkload w(5, 1.0, 42);
    for (int i = 0; i < 5; ++i) EXPECT_FALSE(w.validate().has_value());
    EXPECT_TRUE(w.validate().has_value());
    EXPECT_EQ(w.validations(), 6);
}

TEST(FailingWorkloadTest, NeverFailsWithZeroProbability) {
    FailingWorkload w(0, 0.0, 1);
    for (int i = 0; i < 1000; ++i) ASSERT_FALSE(w.validate().has_value());
}

TEST(FailingWorkloadTest, DefaultFailsOnlyAfterTwoThousandValidations) {
    FailingWorkload w;
    for (int i = 0; i < FailingWorkload::kWarmupValidations; ++i)
        ASSERT_FALSE(w.validate().has_value()) << "validation " << i + 1;

    // p = 0.002: a failure inside the next 20000 calls is all but certain
    bool failed = false;
    for (int i = 0; i < 20000 && !failed; ++i) failed = w.validate().has_value();
    EXPECT_TRUE(failed);
    EXPECT_GT(w.next_failure_at(), w.validations());
}
