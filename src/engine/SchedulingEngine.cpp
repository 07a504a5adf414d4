#include "engine/SchedulingEngine.hpp"
#include <chrono>
#include <iostream>
#include <random>
#include <stdexcept>
#include <thread>

using namespace burst;

std::atomic<uint64_t> SchedulingEngine::seed_counter_{0};

const char* burst::to_string(SchedulePolicy p) {
    switch (p) {
        case SchedulePolicy::Sequential: return "sequential";
        case SchedulePolicy::RoundRobin: return "round-robin";
        case SchedulePolicy::Random:     return "random";
    }
    return "unknown";
}

SchedulingEngine::SchedulingEngine(Context& ctx, BindFn bind)
    : ctx_(ctx), bind_(std::move(bind)) {}

// splitmix64 finalizer over (steady clock, process counter, core id)
uint64_t SchedulingEngine::make_seed(int core) {
    uint64_t z = static_cast<uint64_t>(
        std::chrono::steady_clock::now().time_since_epoch().count());
    z ^= seed_counter_.fetch_add(1, std::memory_order_relaxed) * 0x9E3779B97F4A7C15ULL;
    z ^= static_cast<uint64_t>(core) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}

CycleOutcome SchedulingEngine::run_cycle(Workload& w) {
    try {
        w.run();
        auto failure = w.validate();
        if (failure) return CycleOutcome::validation_failure(*failure);
        return CycleOutcome::ok();
    } catch (const std::exception& e) {
        return CycleOutcome::unexpected_error(e.what());
    } catch (...) {
        return CycleOutcome::unexpected_error("non-standard exception");
    }
}

void SchedulingEngine::run_on_core(int core, WorkloadList& workloads, std::vector<int> cycles,
                                   SchedulePolicy policy) {
    const std::string source = "core " + std::to_string(core);
    CoreProgress* prog = nullptr;

    try {
        if (bind_ && !bind_(core)) {
            std::cerr << "[ENGINE] WARNING: " << source
                      << " affinity not applied, running unpinned\n";
        }

        if (cycles.size() != workloads.size())
            throw std::invalid_argument("cycle counts (" + std::to_string(cycles.size()) +
                                        ") do not match workloads (" +
                                        std::to_string(workloads.size()) + ")");

        std::vector<std::string> names;
        names.reserve(workloads.size());
        for (size_t i = 0; i < workloads.size(); ++i) {
            if (!workloads[i]) throw std::invalid_argument("null workload at index " + std::to_string(i));
            if (cycles[i] < 0) cycles[i] = 0;
            names.emplace_back(workloads[i]->name());
        }

        prog = &ctx_.run.progress.create(core, names, cycles);

        std::cout << "[ENGINE] " << source << " start policy=" << to_string(policy)
                  << " workloads=" << workloads.size() << "\n";

        switch (policy) {
            case SchedulePolicy::Sequential:
                run_sequential(core, *prog, workloads, cycles);
                break;
            case SchedulePolicy::RoundRobin:
                run_round_robin(core, *prog, workloads, cycles);
                break;
            case SchedulePolicy::Random:
                run_random(core, *prog, workloads, cycles);
                break;
        }
    } catch (const std::exception& e) {
        ctx_.run.errors.push(ErrorRecord{source, e.what()});
        std::cerr << "[ENGINE] " << source << " aborted: " << e.what() << "\n";
    } catch (...) {
        ctx_.run.errors.push(ErrorRecord{source, "non-standard exception"});
        std::cerr << "[ENGINE] " << source << " aborted: non-standard exception\n";
    }

    // Leave final completed counts as they are; only the highlight goes.
    if (prog) prog->clear_active();
}

bool SchedulingEngine::execute(int core, CoreProgress& prog, size_t idx, Workload& w) {
    prog.set_active(idx);

    CycleOutcome out = run_cycle(w);
    if (!out.is_ok()) {
        ctx_.errors.report(core, w.name(), out.message);
        if (out.kind == CycleOutcome::Kind::UnexpectedError) {
            ctx_.run.errors.push(ErrorRecord{
                "core " + std::to_string(core) + " " + w.name(), out.message});
        }
        std::cerr << "[ENGINE] core " << core << " " << w.name()
                  << " FAILED after " << prog.completed(idx) << " cycles: "
                  << out.message << " (core halted)\n";
        return false;
    }

    prog.complete_cycle(idx);
    ctx_.errors.reset_ok(core, w.name());
    prog.clear_active();
    std::this_thread::yield();
    return true;
}

void SchedulingEngine::run_sequential(int core, CoreProgress& prog, WorkloadList& workloads,
                                      const std::vector<int>& cycles) {
    for (size_t i = 0; i < workloads.size() && !cancelled(); ++i) {
        for (int c = 0; c < cycles[i] && !cancelled(); ++c) {
            if (!execute(core, prog, i, *workloads[i])) return;
        }
    }
}

void SchedulingEngine::run_round_robin(int core, CoreProgress& prog, WorkloadList& workloads,
                                       const std::vector<int>& cycles) {
    std::vector<int> remaining(cycles);
    size_t alive = 0;
    for (int r : remaining) if (r > 0) ++alive;

    while (alive > 0 && !cancelled()) {
        for (size_t i = 0; i < workloads.size() && !cancelled(); ++i) {
            if (remaining[i] <= 0) continue;
            if (!execute(core, prog, i, *workloads[i])) return;
            if (--remaining[i] == 0) --alive;
        }
    }
}

void SchedulingEngine::run_random(int core, CoreProgress& prog, WorkloadList& workloads,
                                  const std::vector<int>& cycles) {
    std::vector<int> remaining(cycles);
    int64_t left = 0;
    for (int r : remaining) left += r;
    if (left == 0) return;

    std::mt19937_64 rng(make_seed(core));
    std::vector<size_t> candidates;
    candidates.reserve(remaining.size());

    while (left > 0 && !cancelled()) {
        candidates.clear();
        for (size_t i = 0; i < remaining.size(); ++i)
            if (remaining[i] > 0) candidates.push_back(i);
        if (candidates.empty()) break;

        std::uniform_int_distribution<size_t> pick(0, candidates.size() - 1);
        size_t idx = candidates[pick(rng)];

        if (!execute(core, prog, idx, *workloads[idx])) return;
        --remaining[idx];
        --left;
    }
}
