#include "telemetry/TelemetrySource.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace burst;
namespace fs = std::filesystem;

namespace {

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string read_line(const fs::path& p) {
    std::ifstream f(p);
    std::string line;
    if (f.is_open()) std::getline(f, line);
    return trim(line);
}

}

LinuxTelemetry::LinuxTelemetry(std::string root) : root_(std::move(root)) {
    if (root_.empty()) root_ = "/";
}

std::string LinuxTelemetry::device_name() {
    std::ifstream f(fs::path(root_) / "proc/cpuinfo");
    std::string line;
    while (std::getline(f, line)) {
        if (line.rfind("model name", 0) != 0) continue;
        size_t colon = line.find(':');
        if (colon != std::string::npos) return trim(line.substr(colon + 1));
    }
    return "Unknown CPU";
}

// "cpuN user nice system idle iowait irq softirq steal ..."
std::map<int, LinuxTelemetry::CpuTimes> LinuxTelemetry::read_stat() const {
    std::map<int, CpuTimes> out;
    std::ifstream f(fs::path(root_) / "proc/stat");
    std::string line;
    while (std::getline(f, line)) {
        if (line.size() < 4 || line.compare(0, 3, "cpu") != 0) continue;
        if (line[3] < '0' || line[3] > '9') continue;   // aggregate "cpu " line

        std::istringstream in(line.substr(3));
        int core = -1;
        in >> core;
        if (!in || core < 0) continue;

        CpuTimes t;
        uint64_t v = 0;
        int field = 0;
        while (in >> v) {
            t.total += v;
            // idle (3) and iowait (4) are not busy time
            if (field != 3 && field != 4) t.busy += v;
            ++field;
        }
        if (field >= 4) out[core] = t;
    }
    return out;
}

void LinuxTelemetry::warm_up() {
    prev_ = read_stat();
    has_prev_ = true;
}

CoreLoads LinuxTelemetry::core_loads() {
    auto now = read_stat();
    CoreLoads loads;
    for (const auto& kv : now) {
        double pct = 0.0;
        if (has_prev_) {
            auto it = prev_.find(kv.first);
            if (it != prev_.end() && kv.second.total > it->second.total) {
                const double dt = static_cast<double>(kv.second.total - it->second.total);
                const double db = static_cast<double>(kv.second.busy >= it->second.busy
                                                      ? kv.second.busy - it->second.busy : 0);
                pct = 100.0 * db / dt;
            }
        }
        loads[kv.first] = pct;
    }
    prev_ = std::move(now);
    has_prev_ = true;
    return loads;
}

// hwmon temperatures: tempN_input in millidegrees, tempN_label optional.
SensorReadings LinuxTelemetry::sensors() {
    SensorReadings out;
    const fs::path base = fs::path(root_) / "sys/class/hwmon";
    std::error_code ec;
    if (!fs::is_directory(base, ec)) return out;

    for (fs::directory_iterator it(base, ec), last; !ec && it != last; it.increment(ec)) {
        const fs::directory_entry& dev = *it;
        std::string chip = read_line(dev.path() / "name");
        if (chip.empty()) chip = dev.path().filename().string();

        std::error_code ec2;
        for (fs::directory_iterator fit(dev.path(), ec2), fend; !ec2 && fit != fend;
             fit.increment(ec2)) {
            const fs::directory_entry& file = *fit;
            const std::string fname = file.path().filename().string();
            const std::string suffix = "_input";
            if (fname.rfind("temp", 0) != 0 || fname.size() <= suffix.size() ||
                fname.compare(fname.size() - suffix.size(), suffix.size(), suffix) != 0)
                continue;

            const std::string stem = fname.substr(0, fname.size() - suffix.size());
            const std::string raw = read_line(file.path());
            if (raw.empty()) continue;

            char* end = nullptr;
            const double milli = std::strtod(raw.c_str(), &end);
            if (end == raw.c_str()) continue;

            std::string label = read_line(dev.path() / (stem + "_label"));
            if (label.empty()) label = stem;
            out[chip + "/" + label] = milli / 1000.0;
        }
    }
    return out;
}
