#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <functional>
#include <memory>
#include <thread>

#include "runtime/StressSession.hpp"
#include "FakeTelemetry.hpp"
#include "TestWorkloads.hpp"

using namespace burst;
using namespace std::chrono_literals;

class StressSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_path_ = ::testing::TempDir() + "burst_session_" +
                    ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".jsonl";

        registry_.add(1, "Alpha", "scripted", [this] {
            created_.fetch_add(1);
            return std::make_unique<test::ScriptedWorkload>("Alpha");
        });
        registry_.add(2, "Beta", "scripted, first instance fails", [this] {
            auto w = std::make_unique<test::ScriptedWorkload>("Beta");
            if (beta_created_.fetch_add(1) == 0) w->fail_on_validate(1);
            return w;
        });

        cfg_.cores            = {0, 1};
        cfg_.tests            = {1};
        cfg_.cycles           = {3};
        cfg_.policy           = SchedulePolicy::RoundRobin;
        cfg_.policy_given     = true;
        cfg_.log_path         = log_path_;
        cfg_.interval_ms      = 20;
        cfg_.warmup_ms        = 0;
        cfg_.ready_timeout_ms = 2000;
    }

    void TearDown() override { std::remove(log_path_.c_str()); }

    bool wait_done(StressSession& s) {
        auto deadline = std::chrono::steady_clock::now() + 5s;
        while (!s.all_workers_done()) {
            if (std::chrono::steady_clock::now() > deadline) return false;
            std::this_thread::sleep_for(5ms);
        }
        return true;
    }

    Context             ctx_;
    WorkloadRegistry    registry_;
    test::FakeTelemetry telemetry_;
    RunConfig           cfg_;
    std::string         log_path_;
    std::atomic<int>    created_{0};
    std::atomic<int>    beta_created_{0};
};

TEST_F(StressSessionTest, RunsEveryCoreToCompletion) {
    StressSession session(ctx_, registry_, telemetry_, cfg_, &test::bind_ok);
    EXPECT_FALSE(session.all_workers_done());

    session.start();
    EXPECT_TRUE(session.monitor_was_ready());
    EXPECT_EQ(session.worker_count(), 2u);
    ASSERT_TRUE(wait_done(session));

    session.request_stop();
    session.join();
    session.join();

    // one fresh instance per core
    EXPECT_EQ(created_.load(), 2);

    auto progress = ctx_.run.progress.snapshot();
    ASSERT_EQ(progress.size(), 2u);
    for (const auto& kv : progress) {
        ASSERT_EQ(kv.second.size(), 1u);
        EXPECT_EQ(kv.second[0].completed, 3);
        EXPECT_FALSE(kv.second[0].active);
    }
    EXPECT_FALSE(ctx_.errors.any_error_seen());

    auto records = read_snapshot_log(log_path_);
    ASSERT_FALSE(records.empty());
    for (const auto& kv : records.back().progress)
        EXPECT_TRUE(kv.second[0].finished);
}

TEST_F(StressSessionTest, FailureHaltsOnlyItsOwnCore) {
    cfg_.tests  = {2};
    cfg_.cycles = {4};

    StressSession session(ctx_, registry_, telemetry_, cfg_, &test::bind_ok);
    session.start();
    ASSERT_TRUE(wait_done(session));
    session.request_stop();
    session.join();

    EXPECT_EQ(ctx_.errors.total_errors(), 1u);
    int halted = 0, finished = 0;
    for (const auto& kv : ctx_.run.progress.snapshot()) {
        const auto& p = kv.second[0];
        if (p.completed == 0 && ctx_.errors.has_failures(p.core, "Beta")) ++halted;
        if (p.completed == 4) ++finished;
    }
    EXPECT_EQ(halted, 1);
    EXPECT_EQ(finished, 1);
}

TEST_F(StressSessionTest, SlowMonitorDoesNotBlockWorkers) {
    cfg_.warmup_ms        = 500;
    cfg_.ready_timeout_ms = 20;

    StressSession session(ctx_, registry_, telemetry_, cfg_, &test::bind_ok);
    session.start();
    EXPECT_FALSE(session.monitor_was_ready());
    ASSERT_TRUE(wait_done(session));
    session.request_stop();
    session.join();

    EXPECT_TRUE(ctx_.run.monitor_ready.is_set());
    EXPECT_EQ(created_.load(), 2);
}

TEST_F(StressSessionTest, UnknownWorkloadIdIsQueuedPerCore) {
    cfg_.tests  = {99};
    cfg_.cycles = {1};

    StressSession session(ctx_, registry_, telemetry_, cfg_, &test::bind_ok);
    session.start();
    ASSERT_TRUE(wait_done(session));
    session.request_stop();
    session.join();

    // the monitor may have surfaced them already; either way nothing ran
    EXPECT_TRUE(ctx_.run.progress.snapshot().empty());
    auto records = read_snapshot_log(log_path_);
    size_t surfaced = ctx_.run.errors.drain().size();
    for (const auto& r : records) surfaced += r.surfaced.size();
    EXPECT_EQ(surfaced, 2u);
}

TEST_F(StressSessionTest, UnstartedSessionLeavesContextUntouched) {
    {
        StressSession session(ctx_, registry_, telemetry_, cfg_, &test::bind_ok);
    }
    EXPECT_FALSE(ctx_.run.cancelled());
    EXPECT_FALSE(ctx_.run.monitor_ready.is_set());
}

TEST_F(StressSessionTest, DestructorStopsAndJoins) {
    cfg_.cycles = {100000000};
    {
        StressSession session(ctx_, registry_, telemetry_, cfg_, &test::bind_ok);
        session.start();
        std::this_thread::sleep_for(30ms);
    }
    EXPECT_TRUE(ctx_.run.cancelled());
    for (const auto& kv : ctx_.run.progress.snapshot())
        EXPECT_LT(kv.second[0].completed, 100000000);
}
