#pragma once
#include <string>
#include <vector>

#include "backend.hpp"
#include "budget_manager.hpp"
#include "device_profiler.hpp"
#include "orchestrator.hpp"
#include "types.hpp"

struct TelemetryConfig {
  std::string log_level{"info"};
  std::string event_log_path;  // JSON lines; empty = off
  int metrics_port{9090};
};

struct EngineConfig {
  OrchestratorConfig orchestrator;
  BudgetConfig budget;
  DeviceConfig device;
  FingerprintPolicy fingerprint;
  CloudConfig cloud;
  std::vector<LocalBackendConfig> local_backends;
  EmergencyConfig emergency;
  TelemetryConfig telemetry;
};

// Every key is optional. Throws std::runtime_error on unreadable files or
// invalid values.
EngineConfig load_config(const std::string& path);

// Applies telemetry.log_level via spdlog::set_level.
void apply_log_level(const std::string& level);

// Cloud (when enabled), configured local backends, and the emergency backend.
std::vector<Backend> make_backends(const EngineConfig& cfg, CloudTransport transport = nullptr,
                                   CredentialProvider credentials = nullptr);
