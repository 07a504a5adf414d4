#include "runtime/RunState.hpp"
#include <stdexcept>

using namespace burst;

// --- ErrorQueue ---

void ErrorQueue::push(ErrorRecord rec) {
    std::lock_guard<std::mutex> lock(m_);
    q_.push(std::move(rec));
}

bool ErrorQueue::try_pop(ErrorRecord& out) {
    std::lock_guard<std::mutex> lock(m_);
    if (q_.empty()) return false;
    out = std::move(q_.front());
    q_.pop();
    return true;
}

std::vector<ErrorRecord> ErrorQueue::drain() {
    std::vector<ErrorRecord> out;
    std::lock_guard<std::mutex> lock(m_);
    out.reserve(q_.size());
    while (!q_.empty()) {
        out.push_back(std::move(q_.front()));
        q_.pop();
    }
    return out;
}

bool ErrorQueue::empty() const {
    std::lock_guard<std::mutex> lock(m_);
    return q_.empty();
}

// --- ReadyLatch ---

bool ReadyLatch::set() {
    bool flipped = false;
    {
        std::lock_guard<std::mutex> lock(m_);
        flipped = !set_.exchange(true, std::memory_order_acq_rel);
    }
    cv_.notify_all();
    return flipped;
}

bool ReadyLatch::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_);
    return cv_.wait_for(lock, timeout, [this] { return set_.load(std::memory_order_acquire); });
}

// --- CoreProgress ---

CoreProgress::CoreProgress(int core, const std::vector<std::string>& workloads,
                           const std::vector<int>& totals)
    : core_(core) {
    if (workloads.size() != totals.size())
        throw std::invalid_argument("progress: workloads/totals size mismatch");

    slots_.reserve(workloads.size());
    for (size_t i = 0; i < workloads.size(); ++i) {
        auto slot = std::make_unique<Slot>();
        slot->workload = workloads[i];
        slot->total    = totals[i] < 0 ? 0 : totals[i];
        slots_.push_back(std::move(slot));
    }
}

void CoreProgress::set_active(size_t idx) {
    for (size_t i = 0; i < slots_.size(); ++i)
        slots_[i]->active.store(i == idx, std::memory_order_relaxed);
}

void CoreProgress::clear_active() {
    for (auto& s : slots_) s->active.store(false, std::memory_order_relaxed);
}

void CoreProgress::complete_cycle(size_t idx) {
    slots_.at(idx)->completed.fetch_add(1, std::memory_order_relaxed);
}

int CoreProgress::completed(size_t idx) const {
    return slots_.at(idx)->completed.load(std::memory_order_relaxed);
}

std::vector<WorkloadProgress> CoreProgress::snapshot() const {
    std::vector<WorkloadProgress> out;
    out.reserve(slots_.size());
    for (const auto& s : slots_) {
        WorkloadProgress p;
        p.workload  = s->workload;
        p.core      = core_;
        p.completed = s->completed.load(std::memory_order_relaxed);
        p.total     = s->total;
        p.active    = s->active.load(std::memory_order_relaxed);
        out.push_back(std::move(p));
    }
    return out;
}

// --- ProgressTable ---

CoreProgress& ProgressTable::create(int core, const std::vector<std::string>& workloads,
                                    const std::vector<int>& totals) {
    auto entry = std::make_unique<CoreProgress>(core, workloads, totals);
    std::lock_guard<std::mutex> lock(mtx_);
    auto res = cores_.emplace(core, std::move(entry));
    if (!res.second)
        throw std::logic_error("progress list for core " + std::to_string(core) +
                               " already exists");
    return *res.first->second;
}

bool ProgressTable::contains(int core) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return cores_.count(core) != 0;
}

std::map<int, std::vector<WorkloadProgress>> ProgressTable::snapshot() const {
    std::map<int, std::vector<WorkloadProgress>> out;
    std::lock_guard<std::mutex> lock(mtx_);
    for (const auto& kv : cores_)
        out.emplace(kv.first, kv.second->snapshot());
    return out;
}
