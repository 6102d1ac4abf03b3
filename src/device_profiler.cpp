#include "device_profiler.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include <opencv2/core/cuda.hpp>

namespace fs = std::filesystem;

namespace {

std::optional<std::string> read_first_line(const fs::path& p) {
  std::ifstream in(p);
  if (!in) return std::nullopt;
  std::string line;
  std::getline(in, line);
  return line;
}

std::optional<long long> read_number(const fs::path& p) {
  auto line = read_first_line(p);
  if (!line || line->empty()) return std::nullopt;
  try {
    return std::stoll(*line);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

bool is_metered_interface(const std::string& name) {
  return name.rfind("wwan", 0) == 0 || name.rfind("ppp", 0) == 0 ||
         name.rfind("rmnet", 0) == 0 || name.rfind("usb", 0) == 0;
}

}  // namespace

DeviceSignals LinuxSignalSource::sample() const {
  DeviceSignals s;

  std::ifstream meminfo(fs::path(cfg_.proc_root) / "meminfo");
  std::string key;
  long long value_kb = 0;
  std::string unit;
  while (meminfo >> key >> value_kb) {
    std::getline(meminfo, unit);
    if (key == "MemTotal:") s.total_memory_mb = static_cast<int>(value_kb / 1024);
    if (key == "MemAvailable:") s.available_memory_mb = static_cast<int>(value_kb / 1024);
  }

  s.max_temperature_c = read_max_temperature();

  std::error_code ec;
  const fs::path supplies = fs::path(cfg_.sysfs_root) / "class" / "power_supply";
  if (fs::is_directory(supplies, ec)) {
    for (const auto& entry : fs::directory_iterator(supplies, ec)) {
      auto type = read_first_line(entry.path() / "type");
      if (!type || *type != "Battery") continue;
      if (auto cap = read_number(entry.path() / "capacity")) {
        s.battery_percent = static_cast<int>(*cap);
      }
      auto status = read_first_line(entry.path() / "status");
      s.charging = status && (*status == "Charging" || *status == "Full");
      break;
    }
  }

  s.network = read_network();

  try {
    s.accelerator_available = cv::cuda::getCudaEnabledDeviceCount() > 0;
  } catch (const cv::Exception& e) {
    spdlog::debug("CUDA probe failed: {}", e.what());
    s.accelerator_available = false;
  }
  return s;
}

std::optional<double> LinuxSignalSource::read_max_temperature() const {
  std::optional<double> max_c;
  std::error_code ec;
  const fs::path thermal = fs::path(cfg_.sysfs_root) / "class" / "thermal";
  if (!fs::is_directory(thermal, ec)) return max_c;
  for (const auto& entry : fs::directory_iterator(thermal, ec)) {
    if (entry.path().filename().string().rfind("thermal_zone", 0) != 0) continue;
    if (auto milli = read_number(entry.path() / "temp")) {
      const double c = static_cast<double>(*milli) / 1000.0;
      if (!max_c || c > *max_c) max_c = c;
    }
  }
  return max_c;
}

NetworkReachability LinuxSignalSource::read_network() const {
  bool metered = false;
  bool unmetered = false;
  std::error_code ec;
  const fs::path net = fs::path(cfg_.sysfs_root) / "class" / "net";
  if (!fs::is_directory(net, ec)) return NetworkReachability::None;
  for (const auto& entry : fs::directory_iterator(net, ec)) {
    const std::string name = entry.path().filename().string();
    if (name == "lo") continue;
    auto state = read_first_line(entry.path() / "operstate");
    if (!state || *state != "up") continue;
    if (is_metered_interface(name)) {
      metered = true;
    } else {
      unmetered = true;
    }
  }
  if (unmetered) return NetworkReachability::Unmetered;
  if (metered) return NetworkReachability::Metered;
  return NetworkReachability::None;
}

DeviceCapabilityProfiler::DeviceCapabilityProfiler(DeviceConfig cfg,
                                                   std::shared_ptr<SignalSource> source)
    : cfg_(std::move(cfg)), source_(std::move(source)) {
  if (!source_) source_ = std::make_shared<LinuxSignalSource>(cfg_);
}

ThermalLevel DeviceCapabilityProfiler::classify_thermal(double celsius) const {
  if (celsius >= cfg_.critical_celsius) return ThermalLevel::Critical;
  if (celsius >= cfg_.serious_celsius) return ThermalLevel::Serious;
  if (celsius >= cfg_.fair_celsius) return ThermalLevel::Fair;
  return ThermalLevel::Nominal;
}

DeviceClass DeviceCapabilityProfiler::classify_device(int total_memory_mb) const {
  if (total_memory_mb <= cfg_.low_end_max_memory_mb) return DeviceClass::LowEnd;
  if (total_memory_mb <= cfg_.mid_range_max_memory_mb) return DeviceClass::MidRange;
  return DeviceClass::HighEnd;
}

DeviceState DeviceCapabilityProfiler::current_state() const {
  const DeviceSignals s = source_->sample();

  DeviceState d;
  d.total_memory_mb = s.total_memory_mb.value_or(0);
  d.available_memory_mb = s.available_memory_mb.value_or(d.total_memory_mb);
  d.thermal = s.max_temperature_c ? classify_thermal(*s.max_temperature_c) : ThermalLevel::Nominal;
  d.battery_percent = s.battery_percent.value_or(100);
  d.charging = s.battery_percent ? s.charging : true;
  d.network = s.network;
  d.accelerator_available = s.accelerator_available;
  d.device_class = s.total_memory_mb ? classify_device(*s.total_memory_mb) : DeviceClass::MidRange;
  return d;
}
