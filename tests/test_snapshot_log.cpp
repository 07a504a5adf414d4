#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "logging/SnapshotLog.hpp"

using namespace burst;
using json = nlohmann::json;

namespace {

TimePoint at_ms(int64_t ms) {
    return TimePoint(std::chrono::milliseconds(ms));
}

MonitorSnapshot sample(uint64_t tick) {
    MonitorSnapshot s;
    s.ts   = at_ms(1'700'000'000'123 + static_cast<int64_t>(tick) * 1000);
    s.tick = tick;
    s.cpu  = "Test CPU @ 3.0GHz";
    s.core_usage = {{0, 99.5}, {3, 12.0}};
    s.sensors    = {{"coretemp/Package id 0", 71.0}};

    OffenderEntry worst;
    worst.key = FailureKey{3, "AvxCacheStress"};
    worst.counters.consecutive  = 2;
    worst.counters.total        = 4;
    worst.counters.last_at      = at_ms(1'700'000'000'500);
    worst.counters.last_message = "vector result differs";
    s.errors.started = true;
    s.errors.total   = 4;
    s.errors.top     = {worst};

    ProgressEntry p;
    p.workload  = "AvxCacheStress";
    p.core      = 3;
    p.completed = 10;
    p.total     = 50;
    p.error     = true;
    s.progress[3] = {p};

    s.surfaced = {ErrorRecord{"core 3 AvxCacheStress", "boom", at_ms(1'700'000'000'400)}};
    return s;
}

std::string temp_path(const std::string& name) {
    return ::testing::TempDir() + name;
}

}

TEST(SnapshotJsonTest, RecordCarriesTheDocumentedKeys) {
    json j = sample(1);
    for (const char* key : {"ts", "tick", "cpu", "core_usage", "sensors", "errors", "progress", "surfaced"})
        EXPECT_TRUE(j.contains(key)) << key;

    EXPECT_EQ(j["errors"]["top"][0]["key"].get<std::string>(), "3:AvxCacheStress");
    EXPECT_EQ(j["progress"]["3"][0]["test"].get<std::string>(), "AvxCacheStress");
    EXPECT_FALSE(j["progress"]["3"][0]["finished"].get<bool>());
    EXPECT_DOUBLE_EQ(j["core_usage"]["0"].get<double>(), 99.5);
}

TEST(SnapshotJsonTest, RoundTripKeepsReportingFields) {
    MonitorSnapshot in = sample(7);
    MonitorSnapshot out = json(in).get<MonitorSnapshot>();

    EXPECT_EQ(out.ts, in.ts);
    EXPECT_EQ(out.tick, 7u);
    EXPECT_EQ(out.cpu, in.cpu);
    EXPECT_EQ(out.core_usage, in.core_usage);
    EXPECT_EQ(out.sensors, in.sensors);
    EXPECT_TRUE(out.errors.started);
    EXPECT_EQ(out.errors.total, 4u);
    ASSERT_EQ(out.errors.top.size(), 1u);
    EXPECT_EQ(out.errors.top[0].key, (FailureKey{3, "AvxCacheStress"}));
    EXPECT_EQ(out.errors.top[0].counters.consecutive, 2);
    EXPECT_EQ(out.errors.top[0].counters.last_at, in.errors.top[0].counters.last_at);
    ASSERT_EQ(out.progress.at(3).size(), 1u);
    EXPECT_EQ(out.progress.at(3)[0].completed, 10);
    EXPECT_TRUE(out.progress.at(3)[0].error);
    ASSERT_EQ(out.surfaced.size(), 1u);
    EXPECT_EQ(out.surfaced[0].message, "boom");
}

TEST(SnapshotLogTest, WritesOneLinePerRecord) {
    const std::string path = temp_path("burst_snapshots.jsonl");
    {
        SnapshotLog log(path);
        log.open();
        log.write(sample(0));
        log.write(sample(1));
        EXPECT_EQ(log.records(), 2u);
        log.close();
        log.close();
        EXPECT_FALSE(log.is_open());
    }

    auto records = read_snapshot_log(path);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].tick, 0u);
    EXPECT_EQ(records[1].tick, 1u);

    std::ifstream f(path);
    std::string line;
    int lines = 0;
    while (std::getline(f, line)) ++lines;
    EXPECT_EQ(lines, 2);
    std::remove(path.c_str());
}

TEST(SnapshotLogTest, OpenFailureThrows) {
    SnapshotLog log("/nonexistent-dir/burst/log.json");
    EXPECT_THROW(log.open(), std::runtime_error);
    EXPECT_THROW(log.write(sample(0)), std::runtime_error);
    EXPECT_NO_THROW(log.close());
}

TEST(SnapshotLogTest, ReadMissingFileThrows) {
    EXPECT_THROW(read_snapshot_log(temp_path("burst_missing.jsonl")), std::runtime_error);
}
