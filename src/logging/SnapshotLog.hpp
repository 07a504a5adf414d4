#pragma once
#include <cstdint>
#include <fstream>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "errors/ErrorAggregator.hpp"
#include "runtime/RunState.hpp"
#include "telemetry/TelemetrySource.hpp"

namespace burst {

// Progress copy as the monitor reports it: the live fields plus the two
// flags derived at snapshot time.
struct ProgressEntry {
    std::string workload;
    int  core{0};
    int  completed{0};
    int  total{0};
    bool active{false};
    bool error{false};      // a failure entry exists for (core, workload)
    bool finished{false};   // completed == total && !error
};

// ---------------------------------------------------------------------------
// One monitor tick. Times are serialized as milliseconds since the epoch.
// ---------------------------------------------------------------------------
struct MonitorSnapshot {
    TimePoint      ts{};
    uint64_t       tick{0};
    std::string    cpu;
    CoreLoads      core_usage;
    SensorReadings sensors;
    ErrorSummary   errors;
    std::map<int, std::vector<ProgressEntry>> progress;
    std::vector<ErrorRecord> surfaced;
};

void to_json(nlohmann::json& j, const ProgressEntry& p);
void from_json(const nlohmann::json& j, ProgressEntry& p);
void to_json(nlohmann::json& j, const OffenderEntry& e);
void from_json(const nlohmann::json& j, OffenderEntry& e);
void to_json(nlohmann::json& j, const ErrorRecord& r);
void from_json(const nlohmann::json& j, ErrorRecord& r);
void to_json(nlohmann::json& j, const MonitorSnapshot& s);
void from_json(const nlohmann::json& j, MonitorSnapshot& s);

// ---------------------------------------------------------------------------
// JSON Lines sink: one MonitorSnapshot per line, flushed per record so a
// killed run still leaves every completed tick on disk.
//
// open() and write() throw std::runtime_error. close() never throws and is
// safe to call twice.
// ---------------------------------------------------------------------------
class SnapshotLog {
public:
    explicit SnapshotLog(std::string path);
    ~SnapshotLog();

    SnapshotLog(const SnapshotLog&) = delete;
    SnapshotLog& operator=(const SnapshotLog&) = delete;

    void open();
    void write(const MonitorSnapshot& snap);
    void close() noexcept;

    bool is_open() const { return out_.is_open(); }
    const std::string& path() const { return path_; }
    uint64_t records() const { return records_; }

private:
    std::string   path_;
    std::ofstream out_;
    uint64_t      records_{0};
};

// Parses every non-blank line of a snapshot log. Throws std::runtime_error if
// the file cannot be opened, nlohmann::json::exception on a malformed record.
std::vector<MonitorSnapshot> read_snapshot_log(const std::string& path);

}
