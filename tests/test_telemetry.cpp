#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

#include "telemetry/TelemetrySource.hpp"

using namespace burst;
namespace fs = std::filesystem;

// Fake /proc and /sys tree under a temp root.
class LinuxTelemetryTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::path(::testing::TempDir()) /
                ("burst_telemetry_" + std::string(
                    ::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(root_);
        fs::create_directories(root_ / "proc");
        fs::create_directories(root_ / "sys/class/hwmon/hwmon0");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    void write(const fs::path& rel, const std::string& text) {
        std::ofstream f(root_ / rel);
        f << text;
    }

    fs::path root_;
};

TEST_F(LinuxTelemetryTest, DeviceNameFromCpuinfo) {
    write("proc/cpuinfo", "processor\t: 0\nvendor_id\t: GenuineIntel\n"
                          "model name\t: Test CPU @ 3.00GHz\n\nprocessor\t: 1\n");
    LinuxTelemetry t(root_.string());
    EXPECT_EQ(t.device_name(), "Test CPU @ 3.00GHz");
}

TEST_F(LinuxTelemetryTest, UnknownDeviceWithoutCpuinfo) {
    LinuxTelemetry t(root_.string());
    EXPECT_EQ(t.device_name(), "Unknown CPU");
}

TEST_F(LinuxTelemetryTest, CoreLoadFromStatDeltas) {
    // user nice system idle iowait irq softirq
    write("proc/stat", "cpu  200 0 0 200 0 0 0\n"
                       "cpu0 100 0 0 100 0 0 0\n"
                       "cpu1 100 0 0 100 0 0 0\n"
                       "intr 12345\n");
    LinuxTelemetry t(root_.string());
    t.warm_up();

    write("proc/stat", "cpu  400 0 0 400 0 0 0\n"
                       "cpu0 175 0 0 125 0 0 0\n"
                       "cpu1 100 0 0 200 0 0 0\n");
    auto loads = t.core_loads();
    ASSERT_EQ(loads.size(), 2u);
    EXPECT_DOUBLE_EQ(loads.at(0), 75.0);
    EXPECT_DOUBLE_EQ(loads.at(1), 0.0);
}

TEST_F(LinuxTelemetryTest, FirstSampleWithoutWarmupIsZero) {
    write("proc/stat", "cpu0 100 0 0 100 0 0 0\n");
    LinuxTelemetry t(root_.string());
    auto loads = t.core_loads();
    ASSERT_EQ(loads.size(), 1u);
    EXPECT_DOUBLE_EQ(loads.at(0), 0.0);
}

TEST_F(LinuxTelemetryTest, HwmonTemperaturesWithLabels) {
    write("sys/class/hwmon/hwmon0/name", "coretemp\n");
    write("sys/class/hwmon/hwmon0/temp1_input", "71000\n");
    write("sys/class/hwmon/hwmon0/temp1_label", "Package id 0\n");
    write("sys/class/hwmon/hwmon0/temp2_input", "45500\n");
    write("sys/class/hwmon/hwmon0/fan1_input", "1200\n");

    LinuxTelemetry t(root_.string());
    auto s = t.sensors();
    ASSERT_EQ(s.size(), 2u);
    EXPECT_DOUBLE_EQ(s.at("coretemp/Package id 0"), 71.0);
    EXPECT_DOUBLE_EQ(s.at("coretemp/temp2"), 45.5);
}

TEST_F(LinuxTelemetryTest, BrokenHwmonEntriesAreSkipped) {
    write("sys/class/hwmon/hwmon0/name", "coretemp\n");
    write("sys/class/hwmon/hwmon0/temp1_input", "50000\n");
    write("sys/class/hwmon/stray", "not a device\n");
    fs::create_symlink(root_ / "sys/devices/gone", root_ / "sys/class/hwmon/hwmon1");

    LinuxTelemetry t(root_.string());
    SensorReadings s;
    EXPECT_NO_THROW(s = t.sensors());
    ASSERT_EQ(s.size(), 1u);
    EXPECT_DOUBLE_EQ(s.at("coretemp/temp1"), 50.0);
}

TEST_F(LinuxTelemetryTest, MissingSourcesGiveEmptyResults) {
    LinuxTelemetry t((root_ / "nothing-here").string());
    t.warm_up();
    EXPECT_TRUE(t.core_loads().empty());
    EXPECT_TRUE(t.sensors().empty());
}
