#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "device_profiler.hpp"

namespace fs = std::filesystem;

class LinuxSignalSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = fs::temp_directory_path() / "hazardscope_device_tests";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir / "proc");
        fs::create_directories(test_dir / "sys");
        cfg.proc_root = (test_dir / "proc").string();
        cfg.sysfs_root = (test_dir / "sys").string();
    }

    void TearDown() override {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }

    void write(const fs::path& relative, const std::string& content) {
        const fs::path p = test_dir / relative;
        fs::create_directories(p.parent_path());
        std::ofstream out(p);
        out << content;
    }

    fs::path test_dir;
    DeviceConfig cfg;
};

TEST_F(LinuxSignalSourceTest, ReadsMemoryFromMeminfo) {
    write("proc/meminfo",
          "MemTotal:        8048576 kB\n"
          "MemFree:          123456 kB\n"
          "MemAvailable:    2097152 kB\n");

    auto s = LinuxSignalSource(cfg).sample();
    ASSERT_TRUE(s.total_memory_mb.has_value());
    EXPECT_EQ(*s.total_memory_mb, 7860);
    ASSERT_TRUE(s.available_memory_mb.has_value());
    EXPECT_EQ(*s.available_memory_mb, 2048);
}

TEST_F(LinuxSignalSourceTest, HottestThermalZoneWins) {
    write("sys/class/thermal/thermal_zone0/temp", "45000\n");
    write("sys/class/thermal/thermal_zone1/temp", "81500\n");
    write("sys/class/thermal/cooling_device0/temp", "99000\n");

    auto t = LinuxSignalSource(cfg).read_max_temperature();
    ASSERT_TRUE(t.has_value());
    EXPECT_DOUBLE_EQ(*t, 81.5);
}

TEST_F(LinuxSignalSourceTest, ReadsBattery) {
    write("sys/class/power_supply/AC/type", "Mains\n");
    write("sys/class/power_supply/BAT0/type", "Battery\n");
    write("sys/class/power_supply/BAT0/capacity", "12\n");
    write("sys/class/power_supply/BAT0/status", "Discharging\n");

    auto s = LinuxSignalSource(cfg).sample();
    ASSERT_TRUE(s.battery_percent.has_value());
    EXPECT_EQ(*s.battery_percent, 12);
    EXPECT_FALSE(s.charging);
}

TEST_F(LinuxSignalSourceTest, NetworkReachability) {
    LinuxSignalSource source(cfg);
    EXPECT_EQ(source.read_network(), NetworkReachability::None);

    write("sys/class/net/lo/operstate", "unknown\n");
    write("sys/class/net/wwan0/operstate", "up\n");
    EXPECT_EQ(source.read_network(), NetworkReachability::Metered);

    write("sys/class/net/eth0/operstate", "down\n");
    EXPECT_EQ(source.read_network(), NetworkReachability::Metered);

    write("sys/class/net/wlan0/operstate", "up\n");
    EXPECT_EQ(source.read_network(), NetworkReachability::Unmetered);
}

TEST_F(LinuxSignalSourceTest, MissingFilesGiveEmptyReadings) {
    auto s = LinuxSignalSource(cfg).sample();
    EXPECT_FALSE(s.total_memory_mb.has_value());
    EXPECT_FALSE(s.max_temperature_c.has_value());
    EXPECT_FALSE(s.battery_percent.has_value());
    EXPECT_EQ(s.network, NetworkReachability::None);
}

class DeviceProfilerTest : public ::testing::Test {
protected:
    void SetUp() override {
        source = std::make_shared<StaticSignalSource>();
        profiler = std::make_unique<DeviceCapabilityProfiler>(DeviceConfig{}, source);
    }

    std::shared_ptr<StaticSignalSource> source;
    std::unique_ptr<DeviceCapabilityProfiler> profiler;
};

TEST_F(DeviceProfilerTest, ThermalBands) {
    EXPECT_EQ(profiler->classify_thermal(40.0), ThermalLevel::Nominal);
    EXPECT_EQ(profiler->classify_thermal(60.0), ThermalLevel::Fair);
    EXPECT_EQ(profiler->classify_thermal(75.0), ThermalLevel::Serious);
    EXPECT_EQ(profiler->classify_thermal(95.0), ThermalLevel::Critical);
}

TEST_F(DeviceProfilerTest, DeviceClasses) {
    EXPECT_EQ(profiler->classify_device(1536), DeviceClass::LowEnd);
    EXPECT_EQ(profiler->classify_device(2048), DeviceClass::LowEnd);
    EXPECT_EQ(profiler->classify_device(4096), DeviceClass::MidRange);
    EXPECT_EQ(profiler->classify_device(16384), DeviceClass::HighEnd);
}

TEST_F(DeviceProfilerTest, AbsentSignalsArePermissive) {
    auto d = profiler->current_state();
    EXPECT_EQ(d.thermal, ThermalLevel::Nominal);
    EXPECT_EQ(d.battery_percent, 100);
    EXPECT_TRUE(d.charging);
    EXPECT_EQ(d.total_memory_mb, 0);
    EXPECT_EQ(d.device_class, DeviceClass::MidRange);
    EXPECT_EQ(d.network, NetworkReachability::Unmetered);
}

TEST_F(DeviceProfilerTest, EveryCallSamplesAfresh) {
    DeviceSignals hot;
    hot.total_memory_mb = 12000;
    hot.available_memory_mb = 900;
    hot.max_temperature_c = 82.0;
    hot.battery_percent = 9;
    hot.charging = false;
    hot.network = NetworkReachability::Metered;
    source->set(hot);

    auto d = profiler->current_state();
    EXPECT_EQ(d.thermal, ThermalLevel::Serious);
    EXPECT_EQ(d.available_memory_mb, 900);
    EXPECT_EQ(d.battery_percent, 9);
    EXPECT_FALSE(d.charging);
    EXPECT_EQ(d.device_class, DeviceClass::HighEnd);
    EXPECT_EQ(d.network, NetworkReachability::Metered);

    hot.max_temperature_c = 50.0;
    source->set(hot);
    EXPECT_EQ(profiler->current_state().thermal, ThermalLevel::Nominal);
}
