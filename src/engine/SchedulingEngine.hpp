#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "runtime/Context.hpp"
#include "runtime/CpuPinning.hpp"
#include "workload/Workload.hpp"

namespace burst {

enum class SchedulePolicy : uint8_t {
    Sequential,   // every cycle of workload i before workload i+1
    RoundRobin,   // one cycle of each live workload per round
    Random        // uniform pick among workloads with cycles left
};

const char* to_string(SchedulePolicy p);

// Result of one run()+validate() pair. The engine decides what to do with it.
struct CycleOutcome {
    enum class Kind : uint8_t { Ok, ValidationFailure, UnexpectedError };

    Kind        kind{Kind::Ok};
    std::string message;

    bool is_ok() const { return kind == Kind::Ok; }

    static CycleOutcome ok() { return {}; }
    static CycleOutcome validation_failure(std::string msg) {
        return CycleOutcome{Kind::ValidationFailure, std::move(msg)};
    }
    static CycleOutcome unexpected_error(std::string msg) {
        return CycleOutcome{Kind::UnexpectedError, std::move(msg)};
    }
};

using WorkloadList = std::vector<std::unique_ptr<Workload>>;

// ---------------------------------------------------------------------------
// SchedulingEngine: drives one core's workload list through its cycle counts.
//
// One engine call per core, executed on that core's own thread. The thread
// binds itself to the core first; a failed bind is only a warning.
//
// HALT POLICY: the first failed cycle stops this core. The failure is
// recorded in ErrorAggregator, the progress entry keeps the count of cycles
// that did pass, and no further workload on this core runs. Other cores are
// never touched.
//
// CANCELLATION: checked between cycles only. A cycle that has started always
// finishes; cancellation is a clean exit, not a failure.
//
// Nothing is thrown out of run_on_core(). Unexpected failures outside the
// run/validate contract are queued on RunState::errors and end this core.
// ---------------------------------------------------------------------------
class SchedulingEngine {
public:
    explicit SchedulingEngine(Context& ctx, BindFn bind = CpuPinning::binder());

    // cycles.size() must equal workloads.size(); negative counts become 0.
    void run_on_core(int core, WorkloadList& workloads, std::vector<int> cycles,
                     SchedulePolicy policy);

    // One run()+validate(); never throws.
    static CycleOutcome run_cycle(Workload& w);

private:
    void run_sequential(int core, CoreProgress& prog, WorkloadList& workloads,
                        const std::vector<int>& cycles);
    void run_round_robin(int core, CoreProgress& prog, WorkloadList& workloads,
                         const std::vector<int>& cycles);
    void run_random(int core, CoreProgress& prog, WorkloadList& workloads,
                    const std::vector<int>& cycles);

    // false = cycle failed, the core must stop
    bool execute(int core, CoreProgress& prog, size_t idx, Workload& w);

    bool cancelled() const { return ctx_.run.cancelled(); }

    static uint64_t make_seed(int core);

    Context& ctx_;
    BindFn   bind_;

    // Mixed into every Random-policy seed so cores started in the same
    // clock tick still get distinct sequences.
    static std::atomic<uint64_t> seed_counter_;
};

}
