#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace burst {

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

struct FailureKey {
    int core{0};
    std::string workload;

    std::string to_string() const { return std::to_string(core) + ":" + workload; }

    bool operator<(const FailureKey& o) const {
        return core != o.core ? core < o.core : workload < o.workload;
    }
    bool operator==(const FailureKey& o) const {
        return core == o.core && workload == o.workload;
    }
};

// Counters for one (core, workload) pair. consecutive <= total always.
struct FailureCounters {
    int consecutive{0};
    int total{0};
    std::optional<TimePoint> first_at;   // set on creation, cleared by reset_ok
    TimePoint   last_at{};
    std::string last_message;
};

struct OffenderEntry {
    FailureKey      key;
    FailureCounters counters;
};

struct ErrorSummary {
    bool     started{false};
    uint64_t total{0};
    std::vector<OffenderEntry> top;
};

// ---------------------------------------------------------------------------
// Failure statistics per (core, workload kind) plus the global totals.
//
// Entries appear on the first report() for a key and are never removed.
// Every mutation happens under mtx_, so reads through summary() see totals
// that match the per-key counters. The atomics allow cheap lock-free peeks.
// ---------------------------------------------------------------------------
class ErrorAggregator {
public:
    void report(int core, const std::string& workload, const std::string& message);
    void report(int core, const std::string& workload, const std::string& message,
                TimePoint at);

    // Success after failures: ends the streak. No-op for unknown keys.
    void reset_ok(int core, const std::string& workload);

    // Ordered by consecutive desc, then last_at desc.
    std::vector<OffenderEntry> top_offenders(size_t n) const;

    ErrorSummary summary(size_t top_n) const;

    std::optional<FailureCounters> counters(int core, const std::string& workload) const;
    bool has_failures(int core, const std::string& workload) const;

    bool any_error_seen() const { return any_error_.load(std::memory_order_acquire); }
    uint64_t total_errors() const { return total_errors_.load(std::memory_order_acquire); }
    size_t size() const;

private:
    std::vector<OffenderEntry> top_locked(size_t n) const;

    mutable std::mutex mtx_;
    std::map<FailureKey, FailureCounters> map_;

    std::atomic<bool>     any_error_{false};
    std::atomic<uint64_t> total_errors_{0};
};

}
