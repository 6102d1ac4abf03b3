#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "types.hpp"

struct DeviceConfig {
  std::string proc_root = "/proc";
  std::string sysfs_root = "/sys";
  double fair_celsius = 60.0;
  double serious_celsius = 75.0;
  double critical_celsius = 90.0;
  int low_end_max_memory_mb = 2048;
  int mid_range_max_memory_mb = 6144;
};

// Raw platform readings; absent values fall back to permissive defaults.
struct DeviceSignals {
  std::optional<int> total_memory_mb;
  std::optional<int> available_memory_mb;
  std::optional<double> max_temperature_c;
  std::optional<int> battery_percent;
  bool charging{true};
  NetworkReachability network{NetworkReachability::Unmetered};
  bool accelerator_available{false};
};

class SignalSource {
public:
  virtual ~SignalSource() = default;
  virtual DeviceSignals sample() const = 0;
};

// procfs/sysfs readings plus OpenCV's CUDA device probe.
class LinuxSignalSource : public SignalSource {
public:
  explicit LinuxSignalSource(DeviceConfig cfg) : cfg_(std::move(cfg)) {}
  DeviceSignals sample() const override;

  std::optional<double> read_max_temperature() const;
  NetworkReachability read_network() const;

private:
  DeviceConfig cfg_;
};

// Fixed readings, replaceable at runtime (simulation and tests).
class StaticSignalSource : public SignalSource {
public:
  explicit StaticSignalSource(DeviceSignals s = {}) : signals_(std::move(s)) {}
  DeviceSignals sample() const override {
    std::lock_guard<std::mutex> g(mu_);
    return signals_;
  }
  void set(DeviceSignals s) {
    std::lock_guard<std::mutex> g(mu_);
    signals_ = std::move(s);
  }

private:
  mutable std::mutex mu_;
  DeviceSignals signals_;
};

class DeviceCapabilityProfiler {
public:
  DeviceCapabilityProfiler(DeviceConfig cfg, std::shared_ptr<SignalSource> source);

  // Fresh sample on every call; nothing is cached between calls.
  DeviceState current_state() const;

  ThermalLevel classify_thermal(double celsius) const;
  DeviceClass classify_device(int total_memory_mb) const;

private:
  DeviceConfig cfg_;
  std::shared_ptr<SignalSource> source_;
};
