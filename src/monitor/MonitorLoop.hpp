#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "logging/SnapshotLog.hpp"
#include "runtime/Context.hpp"
#include "runtime/CpuPinning.hpp"
#include "telemetry/TelemetrySource.hpp"

namespace burst {

struct MonitorOptions {
    std::chrono::milliseconds interval{1000};
    std::chrono::milliseconds warmup{800};
    int         monitor_core{-1};     // -1 = leave unpinned
    std::string log_path{"log.json"};
    size_t      top_n{5};
    bool        console{true};        // one status line per tick
};

// ---------------------------------------------------------------------------
// MonitorLoop: the observer thread.
//
// STARTUP: optional affinity, telemetry warm-up, snapshot log open. The
// ready latch is set after startup whether or not any of it worked, so the
// session never waits on a dead monitor for longer than its timeout.
//
// TICK: error summary + top offenders, deep copy of every core's progress,
// telemetry, drain of the error queue. One record per tick to the log.
//
// STOP: on cancellation, one last tick is written so the log ends on the
// final state. Any exception is queued on RunState::errors and ends the
// thread; the log is closed on every path.
// ---------------------------------------------------------------------------
class MonitorLoop {
public:
    MonitorLoop(Context& ctx, TelemetrySource& telemetry, MonitorOptions opts,
                BindFn bind = CpuPinning::binder());

    // Thread body. Returns after cancellation or a failure. Never throws.
    void run();

    MonitorSnapshot take_snapshot();
    std::vector<ErrorRecord> drain_errors();

    uint64_t ticks() const { return ticks_.load(std::memory_order_acquire); }
    const std::string& device_name() const { return device_; }

private:
    void startup(SnapshotLog& log);
    void tick(SnapshotLog& log);
    void print(const MonitorSnapshot& snap) const;

    // Sleeps up to d in short slices; false if cancellation arrived.
    bool sleep_for(std::chrono::milliseconds d) const;

    Context&         ctx_;
    TelemetrySource& telemetry_;
    MonitorOptions   opts_;
    BindFn           bind_;
    std::string      device_;
    std::atomic<uint64_t> ticks_{0};
};

}
