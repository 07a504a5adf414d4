#include "logging/SnapshotLog.hpp"
#include <iostream>
#include <stdexcept>

using namespace burst;
using json = nlohmann::json;

namespace {

int64_t to_ms(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint from_ms(int64_t ms) {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

// "<core>:<workload>", split at the first colon
FailureKey parse_key(const std::string& s) {
    FailureKey k;
    size_t colon = s.find(':');
    if (colon == std::string::npos) {
        k.workload = s;
        return k;
    }
    k.core = std::stoi(s.substr(0, colon));
    k.workload = s.substr(colon + 1);
    return k;
}

}

// ---- record schema ----

void burst::to_json(json& j, const ProgressEntry& p) {
    j = json{{"test", p.workload}, {"core", p.core}, {"completed", p.completed},
             {"total", p.total}, {"active", p.active}, {"error", p.error},
             {"finished", p.finished}};
}

void burst::from_json(const json& j, ProgressEntry& p) {
    j.at("test").get_to(p.workload);
    j.at("core").get_to(p.core);
    j.at("completed").get_to(p.completed);
    j.at("total").get_to(p.total);
    p.active   = j.value("active", false);
    p.error    = j.value("error", false);
    p.finished = j.value("finished", false);
}

void burst::to_json(json& j, const OffenderEntry& e) {
    j = json{{"key", e.key.to_string()},
             {"consecutive", e.counters.consecutive},
             {"total", e.counters.total},
             {"last_at", to_ms(e.counters.last_at)},
             {"last_message", e.counters.last_message}};
}

void burst::from_json(const json& j, OffenderEntry& e) {
    e.key = parse_key(j.at("key").get<std::string>());
    j.at("consecutive").get_to(e.counters.consecutive);
    j.at("total").get_to(e.counters.total);
    e.counters.last_at = from_ms(j.at("last_at").get<int64_t>());
    e.counters.last_message = j.value("last_message", std::string());
}

void burst::to_json(json& j, const ErrorRecord& r) {
    j = json{{"source", r.source}, {"message", r.message}, {"at", to_ms(r.at)}};
}

void burst::from_json(const json& j, ErrorRecord& r) {
    j.at("source").get_to(r.source);
    j.at("message").get_to(r.message);
    r.at = from_ms(j.at("at").get<int64_t>());
}

void burst::to_json(json& j, const MonitorSnapshot& s) {
    json usage = json::object();
    for (const auto& kv : s.core_usage) usage[std::to_string(kv.first)] = kv.second;

    json progress = json::object();
    for (const auto& kv : s.progress) progress[std::to_string(kv.first)] = kv.second;

    j = json{{"ts", to_ms(s.ts)},
             {"tick", s.tick},
             {"cpu", s.cpu},
             {"core_usage", usage},
             {"sensors", s.sensors},
             {"errors", {{"started", s.errors.started},
                         {"total", s.errors.total},
                         {"top", s.errors.top}}},
             {"progress", progress},
             {"surfaced", s.surfaced}};
}

void burst::from_json(const json& j, MonitorSnapshot& s) {
    s.ts   = from_ms(j.at("ts").get<int64_t>());
    s.tick = j.value("tick", uint64_t{0});
    s.cpu  = j.value("cpu", std::string());

    s.core_usage.clear();
    if (j.contains("core_usage"))
        for (const auto& kv : j["core_usage"].items())
            s.core_usage[std::stoi(kv.key())] = kv.value().get<double>();

    s.sensors.clear();
    if (j.contains("sensors"))
        j["sensors"].get_to(s.sensors);

    const json& e = j.at("errors");
    s.errors.started = e.value("started", false);
    s.errors.total   = e.value("total", uint64_t{0});
    s.errors.top     = e.value("top", std::vector<OffenderEntry>{});

    s.progress.clear();
    if (j.contains("progress"))
        for (const auto& kv : j["progress"].items())
            s.progress[std::stoi(kv.key())] = kv.value().get<std::vector<ProgressEntry>>();

    s.surfaced = j.value("surfaced", std::vector<ErrorRecord>{});
}

// ---- SnapshotLog ----

SnapshotLog::SnapshotLog(std::string path) : path_(std::move(path)) {}

SnapshotLog::~SnapshotLog() {
    close();
}

void SnapshotLog::open() {
    if (out_.is_open()) return;
    out_.open(path_, std::ios::out | std::ios::trunc);
    if (!out_.is_open())
        throw std::runtime_error("cannot open snapshot log '" + path_ + "'");
    records_ = 0;
    std::cout << "[SNAPLOG] Writing " << path_ << "\n";
}

void SnapshotLog::write(const MonitorSnapshot& snap) {
    if (!out_.is_open())
        throw std::runtime_error("snapshot log '" + path_ + "' is not open");
    out_ << json(snap).dump() << '\n';
    out_.flush();
    if (!out_)
        throw std::runtime_error("write to snapshot log '" + path_ + "' failed");
    ++records_;
}

void SnapshotLog::close() noexcept {
    if (!out_.is_open()) return;
    out_.flush();
    out_.close();
    if (out_.fail())
        std::cerr << "[SNAPLOG] WARNING: close of " << path_ << " reported an error\n";
    out_.clear();
}

std::vector<MonitorSnapshot> burst::read_snapshot_log(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open())
        throw std::runtime_error("cannot open snapshot log '" + path + "'");

    std::vector<MonitorSnapshot> out;
    std::string line;
    while (std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        out.push_back(json::parse(line).get<MonitorSnapshot>());
    }
    return out;
}
