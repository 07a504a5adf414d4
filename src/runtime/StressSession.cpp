#include "runtime/StressSession.hpp"
#include <iostream>

#include "engine/SchedulingEngine.hpp"

using namespace burst;

StressSession::StressSession(Context& ctx, const WorkloadRegistry& registry,
                             TelemetrySource& telemetry, RunConfig cfg, BindFn bind)
    : ctx_(ctx),
      registry_(registry),
      cfg_(std::move(cfg)),
      bind_(std::move(bind)),
      monitor_(ctx, telemetry, cfg_.monitor_options(), bind_) {}

StressSession::~StressSession() {
    if (!started_) return;
    request_stop();
    join();
}

void StressSession::start() {
    if (started_) return;
    started_ = true;

    // ---- MONITOR ----
    monitor_thread_ = std::make_unique<ThreadModel>("monitor", [this]() { monitor_.run(); });
    monitor_thread_->start();

    const auto timeout = std::chrono::milliseconds(cfg_.ready_timeout_ms);
    monitor_ready_in_time_ = ctx_.run.monitor_ready.wait_for(timeout);
    if (!monitor_ready_in_time_) {
        std::cerr << "[SESSION] WARNING: monitor not ready after " << cfg_.ready_timeout_ms
                  << " ms, starting workers anyway\n";
    }

    // ---- WORKERS: one thread per core ----
    workers_.reserve(cfg_.cores.size());
    for (int core : cfg_.cores) {
        auto t = std::make_unique<ThreadModel>("core " + std::to_string(core),
                                               [this, core]() { run_core(core); });
        t->start();
        workers_.push_back(std::move(t));
    }

    std::cout << "[SESSION] Started " << workers_.size() << " worker thread(s), policy="
              << to_string(cfg_.policy) << "\n";
}

// Thread body: nothing may escape into std::thread.
void StressSession::run_core(int core) {
    try {
        WorkloadList workloads = registry_.create_all(cfg_.tests);
        SchedulingEngine engine(ctx_, bind_);
        engine.run_on_core(core, workloads, cfg_.cycles, cfg_.policy);
    } catch (const std::exception& e) {
        ctx_.run.errors.push(ErrorRecord{"core " + std::to_string(core), e.what()});
        std::cerr << "[SESSION] core " << core << " could not start: " << e.what() << "\n";
    } catch (...) {
        ctx_.run.errors.push(ErrorRecord{"core " + std::to_string(core), "non-standard exception"});
        std::cerr << "[SESSION] core " << core << " could not start: non-standard exception\n";
    }
}

bool StressSession::all_workers_done() const {
    if (!started_) return false;
    for (const auto& w : workers_)
        if (!w->finished()) return false;
    return true;
}

void StressSession::request_stop() {
    ctx_.run.request_cancel();
}

void StressSession::join() {
    if (joined_ || !started_) return;
    for (auto& w : workers_) w->join();
    if (monitor_thread_) monitor_thread_->join();
    joined_ = true;
}
