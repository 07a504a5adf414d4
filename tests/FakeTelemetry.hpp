#pragma once
#include <atomic>
#include <stdexcept>

#include "telemetry/TelemetrySource.hpp"

namespace burst {
namespace test {

class FakeTelemetry final : public TelemetrySource {
public:
    std::string device_name() override { return "Fake CPU"; }
    void warm_up() override { warmed_ = true; }
    CoreLoads core_loads() override { return {{0, 50.0}, {1, 100.0}}; }
    SensorReadings sensors() override { return {{"fake/temp1", 42.0}}; }

    bool warmed() const { return warmed_; }

private:
    std::atomic<bool> warmed_{false};
};

// Loads fail from the given call onward (1-based).
class FailingTelemetry final : public TelemetrySource {
public:
    explicit FailingTelemetry(int fail_from = 1) : fail_from_(fail_from) {}

    std::string device_name() override { return "Failing CPU"; }
    void warm_up() override {}
    CoreLoads core_loads() override {
        if (calls_.fetch_add(1) + 1 >= fail_from_)
            throw std::runtime_error("sensor bus gone");
        return {{0, 10.0}};
    }
    SensorReadings sensors() override { return {}; }

    int calls() const { return calls_; }

private:
    int fail_from_;
    std::atomic<int> calls_{0};
};

}
}
