#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace burst {

using CoreLoads = std::map<int, double>;            // core -> percent busy
using SensorReadings = std::map<std::string, double>; // label -> value

// ---------------------------------------------------------------------------
// Host telemetry as seen by the monitor. Read-only and best-effort: a missing
// or unreadable source yields an empty result, never an error.
// ---------------------------------------------------------------------------
class TelemetrySource {
public:
    virtual ~TelemetrySource() = default;

    virtual std::string device_name() = 0;
    // First load sample, so the next core_loads() has a baseline.
    virtual void warm_up() = 0;
    // Percent busy per logical core since the previous call.
    virtual CoreLoads core_loads() = 0;
    virtual SensorReadings sensors() = 0;
};

// ---------------------------------------------------------------------------
// Linux: /proc/cpuinfo, /proc/stat deltas, /sys/class/hwmon temperatures.
// root is prepended to every path ("/" on a live system).
// ---------------------------------------------------------------------------
class LinuxTelemetry final : public TelemetrySource {
public:
    explicit LinuxTelemetry(std::string root = "/");

    std::string device_name() override;
    void warm_up() override;
    CoreLoads core_loads() override;
    SensorReadings sensors() override;

private:
    struct CpuTimes {
        uint64_t busy{0};
        uint64_t total{0};
    };

    std::map<int, CpuTimes> read_stat() const;

    std::string root_;
    std::map<int, CpuTimes> prev_;
    bool has_prev_{false};
};

}
