#include "workload/WorkloadRegistry.hpp"
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

#include "workload/IntegerWorkload.hpp"
#include "workload/FloatingPointWorkload.hpp"
#include "workload/MemoryWorkload.hpp"
#include "workload/SimdCacheWorkload.hpp"
#include "workload/HashingWorkload.hpp"
#include "workload/GamingWorkload.hpp"
#include "workload/FailingWorkload.hpp"

using namespace burst;

void WorkloadRegistry::add(int id, std::string name, std::string description, Factory factory,
                           bool reserved) {
    if (!factory) throw std::invalid_argument("workload " + std::to_string(id) + ": empty factory");
    Entry e{WorkloadInfo{id, std::move(name), std::move(description), reserved}, std::move(factory)};
    if (!entries_.emplace(id, std::move(e)).second)
        throw std::invalid_argument("workload id " + std::to_string(id) + " already registered");
}

bool WorkloadRegistry::contains(int id) const {
    return entries_.count(id) != 0;
}

std::unique_ptr<Workload> WorkloadRegistry::create(int id) const {
    auto it = entries_.find(id);
    if (it == entries_.end())
        throw std::out_of_range("unknown workload id " + std::to_string(id));
    return it->second.factory();
}

std::vector<std::unique_ptr<Workload>> WorkloadRegistry::create_all(const std::vector<int>& ids) const {
    std::vector<std::unique_ptr<Workload>> out;
    out.reserve(ids.size());
    for (int id : ids) out.push_back(create(id));
    return out;
}

std::vector<int> WorkloadRegistry::parse_selection(const std::string& input) const {
    std::vector<int> ids;
    std::string token;

    auto flush = [&]() {
        if (token.empty()) return;
        errno = 0;
        char* end = nullptr;
        long v = std::strtol(token.c_str(), &end, 10);
        if (end == token.c_str() || *end != '\0' || errno == ERANGE) {
            std::cerr << "[CONFIG] Cannot parse workload id '" << token << "', skipping\n";
        } else if (!contains(static_cast<int>(v))) {
            std::cerr << "[CONFIG] Workload " << v << " does not exist, skipping\n";
        } else {
            ids.push_back(static_cast<int>(v));
        }
        token.clear();
    };

    for (char ch : input) {
        if (ch == ',' || ch == ' ' || ch == '\t') flush();
        else token.push_back(ch);
    }
    flush();
    return ids;
}

std::vector<WorkloadInfo> WorkloadRegistry::catalog(bool include_reserved) const {
    std::vector<WorkloadInfo> out;
    for (const auto& kv : entries_) {
        if (kv.second.info.reserved && !include_reserved) continue;
        out.push_back(kv.second.info);
    }
    return out;
}

WorkloadRegistry WorkloadRegistry::with_builtins() {
    WorkloadRegistry reg;
    register_builtin_workloads(reg);
    return reg;
}

void burst::register_builtin_workloads(WorkloadRegistry& reg) {
    reg.add(1, "IntegerStress", "Integer ALU (add/xor/shift/rotate/mul)",
            [] { return std::make_unique<IntegerWorkload>(); });
    reg.add(2, "FloatingPointStress", "Floating point (fma/sqrt/div)",
            [] { return std::make_unique<FloatingPointWorkload>(); });
    reg.add(3, "MemoryStress", "Memory (32 MiB copy/stride/random RMW)",
            [] { return std::make_unique<MemoryWorkload>(); });
    reg.add(4, "SseCacheStress", "SSE cache-resident vector kernel",
            [] { return std::make_unique<SimdCacheWorkload>(SimdIsa::SSE); });
    reg.add(5, "AvxCacheStress", "AVX cache-resident vector kernel",
            [] { return std::make_unique<SimdCacheWorkload>(SimdIsa::AVX); });
    reg.add(6, "Avx2CacheStress", "AVX2/FMA cache-resident vector kernel",
            [] { return std::make_unique<SimdCacheWorkload>(SimdIsa::AVX2); });
    reg.add(7, "HashingStress", "SHA-256/512 hashing",
            [] { return std::make_unique<HashingWorkload>(); });
    reg.add(8, "GamingStress", "Game-like physics frame simulation",
            [] { return std::make_unique<GamingWorkload>(); });
    reg.add(WorkloadRegistry::kFailingSelfTestId, "FailingStress",
            "Harness self-test: fails after warm-up",
            [] { return std::make_unique<FailingWorkload>(); }, true);
}
