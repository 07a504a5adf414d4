#include "errors/ErrorAggregator.hpp"
#include <algorithm>

using namespace burst;

void ErrorAggregator::report(int core, const std::string& workload, const std::string& message) {
    report(core, workload, message, Clock::now());
}

void ErrorAggregator::report(int core, const std::string& workload, const std::string& message,
                             TimePoint at) {
    std::lock_guard<std::mutex> lock(mtx_);

    auto ins = map_.try_emplace(FailureKey{core, workload});
    FailureCounters& c = ins.first->second;
    c.consecutive++;
    c.total++;
    if (ins.second) c.first_at = at;
    c.last_at      = at;
    c.last_message = message;

    total_errors_.fetch_add(1, std::memory_order_acq_rel);
    any_error_.store(true, std::memory_order_release);
}

void ErrorAggregator::reset_ok(int core, const std::string& workload) {
    std::lock_guard<std::mutex> lock(mtx_);
    // find(), not operator[]: a success must never create an entry.
    auto it = map_.find(FailureKey{core, workload});
    if (it == map_.end()) return;
    it->second.consecutive = 0;
    it->second.first_at.reset();
}

std::vector<OffenderEntry> ErrorAggregator::top_locked(size_t n) const {
    std::vector<OffenderEntry> all;
    all.reserve(map_.size());
    for (const auto& kv : map_) all.push_back(OffenderEntry{kv.first, kv.second});

    // stable: equal (consecutive, last_at) keep key order
    std::stable_sort(all.begin(), all.end(), [](const OffenderEntry& a, const OffenderEntry& b) {
        if (a.counters.consecutive != b.counters.consecutive)
            return a.counters.consecutive > b.counters.consecutive;
        return a.counters.last_at > b.counters.last_at;
    });
    if (all.size() > n) all.resize(n);
    return all;
}

std::vector<OffenderEntry> ErrorAggregator::top_offenders(size_t n) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return top_locked(n);
}

ErrorSummary ErrorAggregator::summary(size_t top_n) const {
    std::lock_guard<std::mutex> lock(mtx_);
    ErrorSummary s;
    s.started = any_error_.load(std::memory_order_acquire);
    s.total   = total_errors_.load(std::memory_order_acquire);
    s.top     = top_locked(top_n);
    return s;
}

std::optional<FailureCounters> ErrorAggregator::counters(int core, const std::string& workload) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = map_.find(FailureKey{core, workload});
    if (it == map_.end()) return std::nullopt;
    return it->second;
}

bool ErrorAggregator::has_failures(int core, const std::string& workload) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = map_.find(FailureKey{core, workload});
    return it != map_.end() && it->second.total > 0;
}

size_t ErrorAggregator::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return map_.size();
}
