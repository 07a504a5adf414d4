#pragma once
#include <memory>
#include <vector>

#include "config/RunConfig.hpp"
#include "monitor/MonitorLoop.hpp"
#include "runtime/Context.hpp"
#include "runtime/CpuPinning.hpp"
#include "runtime/ThreadModel.hpp"
#include "telemetry/TelemetrySource.hpp"
#include "workload/WorkloadRegistry.hpp"

namespace burst {

// ---------------------------------------------------------------------------
// StressSession: owns the threads of one run.
//
//   start()  monitor thread first, bounded wait on the ready latch (a timeout
//            is logged and ignored), then one engine thread per core. Each
//            core gets fresh workload instances from the registry.
//   request_stop()  sets the cancellation flag; engines stop at their next
//            cycle boundary, the monitor writes its final record.
//   join()   workers first, then the monitor. Idempotent.
//
// The destructor stops and joins, so no thread outlives the session.
// ---------------------------------------------------------------------------
class StressSession {
public:
    StressSession(Context& ctx, const WorkloadRegistry& registry, TelemetrySource& telemetry,
                  RunConfig cfg, BindFn bind = CpuPinning::binder());
    ~StressSession();

    StressSession(const StressSession&) = delete;
    StressSession& operator=(const StressSession&) = delete;

    void start();
    bool all_workers_done() const;
    void request_stop();
    void join();

    bool started() const { return started_; }
    // false if the monitor missed the ready timeout
    bool monitor_was_ready() const { return monitor_ready_in_time_; }
    size_t worker_count() const { return workers_.size(); }
    const MonitorLoop& monitor() const { return monitor_; }

private:
    void run_core(int core);

    Context&                ctx_;
    const WorkloadRegistry& registry_;
    RunConfig               cfg_;
    BindFn                  bind_;
    MonitorLoop             monitor_;

    std::unique_ptr<ThreadModel>              monitor_thread_;
    std::vector<std::unique_ptr<ThreadModel>> workers_;
    bool started_{false};
    bool joined_{false};
    bool monitor_ready_in_time_{false};
};

}
