#include <gtest/gtest.h>
#include <chrono>
#include <stdexcept>
#include <thread>

#include "runtime/RunState.hpp"

using namespace burst;
using namespace std::chrono_literals;

TEST(ReadyLatchTest, TimesOutWhenNeverSet) {
    ReadyLatch latch;
    auto t0 = std::chrono::steady_clock::now();
    EXPECT_FALSE(latch.wait_for(50ms));
    EXPECT_GE(std::chrono::steady_clock::now() - t0, 45ms);
    EXPECT_FALSE(latch.is_set());
}

TEST(ReadyLatchTest, OnlyFirstSetFlips) {
    ReadyLatch latch;
    EXPECT_TRUE(latch.set());
    EXPECT_FALSE(latch.set());
    EXPECT_TRUE(latch.is_set());
    EXPECT_TRUE(latch.wait_for(0ms));
}

TEST(ReadyLatchTest, WakesWaiterFromAnotherThread) {
    ReadyLatch latch;
    std::thread setter([&latch]() {
        std::this_thread::sleep_for(20ms);
        latch.set();
    });
    EXPECT_TRUE(latch.wait_for(5s));
    setter.join();
}

TEST(ErrorQueueTest, FifoAndDrainOnce) {
    ErrorQueue q;
    q.push(ErrorRecord{"core 0", "one"});
    q.push(ErrorRecord{"monitor", "two"});

    ErrorRecord first;
    ASSERT_TRUE(q.try_pop(first));
    EXPECT_EQ(first.message, "one");

    auto rest = q.drain();
    ASSERT_EQ(rest.size(), 1u);
    EXPECT_EQ(rest[0].source, "monitor");
    EXPECT_TRUE(q.empty());
    EXPECT_TRUE(q.drain().empty());
}

TEST(ErrorQueueTest, ManyProducersLoseNothing) {
    ErrorQueue q;
    std::vector<std::thread> producers;
    for (int t = 0; t < 4; ++t) {
        producers.emplace_back([&q, t]() {
            for (int i = 0; i < 250; ++i) q.push(ErrorRecord{"core " + std::to_string(t), "e"});
        });
    }
    for (auto& p : producers) p.join();
    EXPECT_EQ(q.drain().size(), 1000u);
}

TEST(ProgressTableTest, CreateOncePerCore) {
    ProgressTable table;
    table.create(0, {"A", "B"}, {3, 4});
    EXPECT_TRUE(table.contains(0));
    EXPECT_THROW(table.create(0, {"A"}, {1}), std::logic_error);
}

TEST(ProgressTableTest, SnapshotIsADeepCopy) {
    ProgressTable table;
    CoreProgress& p = table.create(2, {"A", "B"}, {3, 4});
    p.set_active(0);
    p.complete_cycle(0);

    auto snap = table.snapshot();
    p.complete_cycle(0);
    p.set_active(1);

    ASSERT_EQ(snap.at(2).size(), 2u);
    EXPECT_EQ(snap.at(2)[0].completed, 1);
    EXPECT_TRUE(snap.at(2)[0].active);
    EXPECT_FALSE(snap.at(2)[1].active);
    EXPECT_EQ(snap.at(2)[1].total, 4);
    EXPECT_EQ(snap.at(2)[0].core, 2);

    auto later = table.snapshot();
    EXPECT_EQ(later.at(2)[0].completed, 2);
    EXPECT_FALSE(later.at(2)[0].active);
    EXPECT_TRUE(later.at(2)[1].active);
}

TEST(CoreProgressTest, RejectsMismatchedTotals) {
    EXPECT_THROW(CoreProgress(0, {"A", "B"}, {1}), std::invalid_argument);
}

TEST(RunStateTest, CancellationIsSticky) {
    RunState rs;
    EXPECT_FALSE(rs.cancelled());
    rs.request_cancel();
    rs.request_cancel();
    EXPECT_TRUE(rs.cancelled());
}
