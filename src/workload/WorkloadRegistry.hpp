#pragma once
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "workload/Workload.hpp"

namespace burst {

struct WorkloadInfo {
    int id{0};
    std::string name;
    std::string description;
    bool reserved{false};   // self-test entries, hidden from the catalog
};

// ---------------------------------------------------------------------------
// id → factory. New workloads are added with add(); nothing else changes.
// create() always returns a fresh instance, so every core gets its own.
// ---------------------------------------------------------------------------
class WorkloadRegistry {
public:
    using Factory = std::function<std::unique_ptr<Workload>()>;

    static constexpr int kFailingSelfTestId = 102030;

    // Throws std::invalid_argument on a duplicate id or empty factory.
    void add(int id, std::string name, std::string description, Factory factory,
             bool reserved = false);

    bool contains(int id) const;

    // Throws std::out_of_range for unknown ids.
    std::unique_ptr<Workload> create(int id) const;
    std::vector<std::unique_ptr<Workload>> create_all(const std::vector<int>& ids) const;

    // "1,2 7" → {1,2,7}. Unknown ids and junk tokens are skipped with a warning.
    std::vector<int> parse_selection(const std::string& input) const;

    std::vector<WorkloadInfo> catalog(bool include_reserved = false) const;

    // Registry preloaded with the built-in catalog (ids 1-8 + self-test).
    static WorkloadRegistry with_builtins();

private:
    struct Entry {
        WorkloadInfo info;
        Factory      factory;
    };
    std::map<int, Entry> entries_;
};

void register_builtin_workloads(WorkloadRegistry& reg);

}
