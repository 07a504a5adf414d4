#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <vector>

namespace burst {

// ---------------------------------------------------------------------------
// Value copy of one workload's progress on one core. This is what readers
// get; the live counters stay inside CoreProgress.
// ---------------------------------------------------------------------------
struct WorkloadProgress {
    std::string workload;
    int  core{0};
    int  completed{0};
    int  total{0};
    bool active{false};
};

// Error payload handed from any thread to the monitor. Consumed once.
struct ErrorRecord {
    std::string source;
    std::string message;
    std::chrono::system_clock::time_point at{std::chrono::system_clock::now()};
};

// ---------------------------------------------------------------------------
// Unbounded MPSC FIFO. Workers and the monitor push, the monitor drains.
// ---------------------------------------------------------------------------
class ErrorQueue {
public:
    void push(ErrorRecord rec);
    bool try_pop(ErrorRecord& out);
    std::vector<ErrorRecord> drain();
    bool empty() const;

private:
    std::queue<ErrorRecord> q_;
    mutable std::mutex m_;
};

// ---------------------------------------------------------------------------
// One-shot latch. set() is idempotent; waiters are bounded by a timeout so a
// monitor that never comes up cannot hold the workers forever.
// ---------------------------------------------------------------------------
class ReadyLatch {
public:
    // Returns true only for the call that flipped the latch.
    bool set();
    bool is_set() const { return set_.load(std::memory_order_acquire); }
    bool wait_for(std::chrono::milliseconds timeout);

private:
    std::atomic<bool> set_{false};
    std::mutex m_;
    std::condition_variable cv_;
};

// ---------------------------------------------------------------------------
// Progress list of a single core.
//
// Names, core and totals are fixed at construction. completed/active are
// atomics written only by the owning engine thread; snapshot() is the only
// read path for everybody else.
// ---------------------------------------------------------------------------
class CoreProgress {
public:
    CoreProgress(int core, const std::vector<std::string>& workloads,
                 const std::vector<int>& totals);

    int core() const { return core_; }
    size_t size() const { return slots_.size(); }

    // Marks idx active and clears every sibling.
    void set_active(size_t idx);
    void clear_active();
    void complete_cycle(size_t idx);

    int completed(size_t idx) const;
    std::vector<WorkloadProgress> snapshot() const;

private:
    struct Slot {
        std::string workload;
        int total{0};
        std::atomic<int>  completed{0};
        std::atomic<bool> active{false};
    };

    int core_;
    std::vector<std::unique_ptr<Slot>> slots_;   // atomics are not movable
};

// ---------------------------------------------------------------------------
// core id → CoreProgress. Each core's list is created exactly once, before
// that core runs a cycle, and is never removed during the run.
// ---------------------------------------------------------------------------
class ProgressTable {
public:
    // Throws std::logic_error if the core already has a list.
    CoreProgress& create(int core, const std::vector<std::string>& workloads,
                         const std::vector<int>& totals);

    bool contains(int core) const;

    // Deep copy, ordered by core id.
    std::map<int, std::vector<WorkloadProgress>> snapshot() const;

private:
    mutable std::mutex mtx_;
    std::map<int, std::unique_ptr<CoreProgress>> cores_;
};

// Process-wide run control. Every field synchronizes itself.
struct RunState {
    std::atomic<bool> cancel_requested{false};
    ErrorQueue        errors;
    ReadyLatch        monitor_ready;
    ProgressTable     progress;

    bool cancelled() const { return cancel_requested.load(std::memory_order_acquire); }
    void request_cancel() { cancel_requested.store(true, std::memory_order_release); }
};

}
