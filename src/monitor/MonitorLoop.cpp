#include "monitor/MonitorLoop.hpp"
#include <algorithm>
#include <iostream>
#include <thread>

using namespace burst;

namespace {
constexpr std::chrono::milliseconds kSleepSlice{50};
}

MonitorLoop::MonitorLoop(Context& ctx, TelemetrySource& telemetry, MonitorOptions opts,
                         BindFn bind)
    : ctx_(ctx), telemetry_(telemetry), opts_(std::move(opts)), bind_(std::move(bind)) {
    if (opts_.interval.count() <= 0) opts_.interval = std::chrono::milliseconds(1000);
    if (opts_.warmup.count() < 0) opts_.warmup = std::chrono::milliseconds(0);
}

bool MonitorLoop::sleep_for(std::chrono::milliseconds d) const {
    auto deadline = std::chrono::steady_clock::now() + d;
    while (!ctx_.run.cancelled()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return true;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(left, kSleepSlice));
    }
    return false;
}

void MonitorLoop::startup(SnapshotLog& log) {
    if (opts_.monitor_core >= 0 && bind_ && !bind_(opts_.monitor_core)) {
        std::cerr << "[MONITOR] WARNING: affinity to core " << opts_.monitor_core
                  << " not applied\n";
    }

    device_ = telemetry_.device_name();
    telemetry_.warm_up();
    sleep_for(opts_.warmup);

    log.open();
}

void MonitorLoop::run() {
    SnapshotLog log(opts_.log_path);

    try {
        startup(log);
    } catch (const std::exception& e) {
        ctx_.run.errors.push(ErrorRecord{"monitor", std::string("startup failed: ") + e.what()});
        std::cerr << "[MONITOR] Startup failed: " << e.what() << "\n";
    } catch (...) {
        ctx_.run.errors.push(ErrorRecord{"monitor", "startup failed: non-standard exception"});
        std::cerr << "[MONITOR] Startup failed: non-standard exception\n";
    }

    // Unconditional: workers must not wait on a monitor that failed startup.
    if (ctx_.run.monitor_ready.set())
        std::cout << "[MONITOR] Ready\n";

    if (!log.is_open()) return;

    try {
        while (!ctx_.run.cancelled()) {
            tick(log);
            sleep_for(opts_.interval);
        }
        tick(log);
    } catch (const std::exception& e) {
        ctx_.run.errors.push(ErrorRecord{"monitor", e.what()});
        std::cerr << "[MONITOR] Stopped on error: " << e.what() << "\n";
    } catch (...) {
        ctx_.run.errors.push(ErrorRecord{"monitor", "non-standard exception"});
        std::cerr << "[MONITOR] Stopped on error: non-standard exception\n";
    }

    log.close();
    std::cout << "[MONITOR] Stopped after " << ticks() << " ticks, "
              << log.records() << " records in " << log.path() << "\n";
}

MonitorSnapshot MonitorLoop::take_snapshot() {
    MonitorSnapshot snap;
    snap.ts   = Clock::now();
    snap.tick = ticks();
    snap.cpu  = device_;

    snap.errors = ctx_.errors.summary(opts_.top_n);

    for (const auto& kv : ctx_.run.progress.snapshot()) {
        auto& out = snap.progress[kv.first];
        out.reserve(kv.second.size());
        for (const auto& p : kv.second) {
            ProgressEntry e;
            e.workload  = p.workload;
            e.core      = p.core;
            e.completed = p.completed;
            e.total     = p.total;
            e.active    = p.active;
            e.error     = ctx_.errors.has_failures(p.core, p.workload);
            e.finished  = p.completed == p.total && !e.error;
            out.push_back(std::move(e));
        }
    }

    snap.core_usage = telemetry_.core_loads();
    snap.sensors    = telemetry_.sensors();
    return snap;
}

std::vector<ErrorRecord> MonitorLoop::drain_errors() {
    return ctx_.run.errors.drain();
}

void MonitorLoop::tick(SnapshotLog& log) {
    MonitorSnapshot snap = take_snapshot();
    snap.surfaced = drain_errors();

    for (const auto& e : snap.surfaced)
        std::cerr << "[MONITOR] ERROR " << e.source << ": " << e.message << "\n";
    if (opts_.console) print(snap);

    log.write(snap);
    ticks_.fetch_add(1, std::memory_order_acq_rel);
}

void MonitorLoop::print(const MonitorSnapshot& snap) const {
    int done = 0, total = 0, finished = 0, entries = 0;
    for (const auto& kv : snap.progress) {
        for (const auto& p : kv.second) {
            done += p.completed;
            total += p.total;
            finished += p.finished ? 1 : 0;
            ++entries;
        }
    }

    std::cout << "[MONITOR] tick=" << snap.tick
              << " cycles=" << done << "/" << total
              << " finished=" << finished << "/" << entries
              << " errors=" << snap.errors.total;
    if (!snap.errors.top.empty()) {
        const auto& worst = snap.errors.top.front();
        std::cout << " worst=" << worst.key.to_string()
                  << " (" << worst.counters.consecutive << " consecutive)";
    }
    std::cout << "\n";
}
