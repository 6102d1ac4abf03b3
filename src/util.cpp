#include "util.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <stdexcept>

namespace {

std::chrono::milliseconds ms(const YAML::Node& n) {
  return std::chrono::milliseconds(n.as<int64_t>());
}

void load_security(const YAML::Node& n, SecurityConfig& c) {
  if (n["max_image_bytes"]) c.max_image_bytes = n["max_image_bytes"].as<size_t>();
  if (n["max_pixels"]) c.max_pixels = n["max_pixels"].as<int64_t>();
  if (n["max_note_length"]) c.max_note_length = n["max_note_length"].as<size_t>();
  if (n["trusted_models"]) {
    for (const auto& kv : n["trusted_models"]) {
      c.trusted_models[kv.first.as<std::string>()] = kv.second.as<std::string>();
    }
  }
  if (n["injection_phrases"]) {
    c.injection_phrases.clear();
    for (const auto& p : n["injection_phrases"]) c.injection_phrases.push_back(p.as<std::string>());
  }
}

LocalBackendConfig load_local_backend(const YAML::Node& n) {
  LocalBackendConfig c;
  if (n["name"]) c.name = n["name"].as<std::string>();
  if (n["tier"]) {
    c.tier = tier_from_string(n["tier"].as<std::string>());
    if (!is_local(c.tier)) {
      throw std::runtime_error("local backend " + c.name + " must be local_large or local_small");
    }
  }
  if (n["model_path"]) c.model_path = n["model_path"].as<std::string>();
  if (n["labels_path"]) c.labels_path = n["labels_path"].as<std::string>();
  if (n["input_size"]) c.input_size = n["input_size"].as<int>();
  if (n["min_memory_mb"]) c.min_memory_mb = n["min_memory_mb"].as<int>();
  if (n["needs_gpu"]) c.needs_gpu = n["needs_gpu"].as<bool>();
  if (n["accuracy"]) c.accuracy = n["accuracy"].as<int>();
  if (n["max_latency_ms"]) c.max_latency_ms = n["max_latency_ms"].as<int>();
  if (n["detection_threshold"]) c.detection_threshold = n["detection_threshold"].as<float>();
  if (n["nms_threshold"]) c.nms_threshold = n["nms_threshold"].as<float>();
  if (n["max_detections"]) c.max_detections = n["max_detections"].as<int>();
  if (n["empty_scene_confidence"])
    c.empty_scene_confidence = n["empty_scene_confidence"].as<float>();
  return c;
}

void validate(const EngineConfig& c) {
  const auto& o = c.orchestrator;
  if (o.cache.capacity == 0) throw std::runtime_error("cache.capacity must be positive");
  if (o.cache.ttl.count() <= 0) throw std::runtime_error("cache.ttl_seconds must be positive");
  if (c.budget.daily_cap < 0.0 || c.budget.monthly_cap < 0.0)
    throw std::runtime_error("budget caps must not be negative");
  if (c.cloud.cost_per_call < 0.0 || c.cloud.cost_per_1k_tokens < 0.0)
    throw std::runtime_error("cloud costs must not be negative");
  if (c.cloud.max_output_tokens <= 0 || c.cloud.prompt_token_allowance < 0)
    throw std::runtime_error("cloud.max_output_tokens must be positive");
  auto in_unit = [](float v) { return v >= 0.0f && v <= 1.0f; };
  if (!in_unit(o.coordinator.default_threshold))
    throw std::runtime_error("thresholds.default must be within [0, 1]");
  for (const auto& kv : o.coordinator.thresholds) {
    if (!in_unit(kv.second))
      throw std::runtime_error("threshold for " + to_string(kv.first) + " must be within [0, 1]");
  }
  for (const auto& kv : o.coordinator.timeouts) {
    if (kv.second.count() <= 0)
      throw std::runtime_error("timeout for " + to_string(kv.first) + " must be positive");
  }
  if (c.fingerprint.resize_width <= 0 || c.fingerprint.resize_height <= 0)
    throw std::runtime_error("fingerprint resize dimensions must be positive");
}

}  // namespace

EngineConfig load_config(const std::string& path) {
  YAML::Node y;
  try {
    y = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("cannot load config " + path + ": " + e.what());
  }

  EngineConfig c{};
  auto& o = c.orchestrator;

  try {
    if (y["security"]) load_security(y["security"], o.security);

    if (y["cache"]) {
      auto n = y["cache"];
      if (n["capacity"]) o.cache.capacity = n["capacity"].as<size_t>();
      if (n["ttl_seconds"]) o.cache.ttl = std::chrono::seconds(n["ttl_seconds"].as<int64_t>());
    }

    if (y["budget"]) {
      if (y["budget"]["daily_cap"]) c.budget.daily_cap = y["budget"]["daily_cap"].as<double>();
      if (y["budget"]["monthly_cap"])
        c.budget.monthly_cap = y["budget"]["monthly_cap"].as<double>();
    }

    if (y["strategy"]) {
      auto n = y["strategy"];
      if (n["critical_work_types"]) {
        o.strategy.critical_work_types.clear();
        for (const auto& w : n["critical_work_types"])
          o.strategy.critical_work_types.insert(work_type_from_string(w.as<std::string>()));
      }
      if (n["low_battery_percent"])
        o.strategy.low_battery_percent = n["low_battery_percent"].as<int>();
      if (n["allow_metered_cloud"])
        o.strategy.allow_metered_cloud = n["allow_metered_cloud"].as<bool>();
    }

    if (y["thresholds"]) {
      for (const auto& kv : y["thresholds"]) {
        const std::string key = kv.first.as<std::string>();
        if (key == "default") {
          o.coordinator.default_threshold = kv.second.as<float>();
        } else {
          o.coordinator.thresholds[work_type_from_string(key)] = kv.second.as<float>();
        }
      }
    }

    if (y["timeouts_ms"]) {
      for (const auto& kv : y["timeouts_ms"]) {
        o.coordinator.timeouts[tier_from_string(kv.first.as<std::string>())] = ms(kv.second);
      }
    }

    if (y["fingerprint"]) {
      auto n = y["fingerprint"];
      if (n["resize_width"]) c.fingerprint.resize_width = n["resize_width"].as<int>();
      if (n["resize_height"]) c.fingerprint.resize_height = n["resize_height"].as<int>();
      if (n["letterbox"]) c.fingerprint.letterbox = n["letterbox"].as<bool>();
    }

    if (y["cloud"]) {
      auto n = y["cloud"];
      if (n["enabled"]) c.cloud.enabled = n["enabled"].as<bool>();
      if (n["name"]) c.cloud.name = n["name"].as<std::string>();
      if (n["endpoint"]) c.cloud.endpoint = n["endpoint"].as<std::string>();
      if (n["path"]) c.cloud.path = n["path"].as<std::string>();
      if (n["model"]) c.cloud.model = n["model"].as<std::string>();
      if (n["cost_per_call"]) c.cloud.cost_per_call = n["cost_per_call"].as<double>();
      if (n["cost_per_1k_tokens"])
        c.cloud.cost_per_1k_tokens = n["cost_per_1k_tokens"].as<double>();
      if (n["max_output_tokens"]) c.cloud.max_output_tokens = n["max_output_tokens"].as<int>();
      if (n["prompt_token_allowance"])
        c.cloud.prompt_token_allowance = n["prompt_token_allowance"].as<int>();
      if (n["api_key_env"]) c.cloud.api_key_env = n["api_key_env"].as<std::string>();
      if (n["max_concurrent_requests"])
        c.cloud.max_concurrent_requests = n["max_concurrent_requests"].as<int>();
      if (n["connect_timeout_ms"]) c.cloud.connect_timeout_ms = n["connect_timeout_ms"].as<int>();
      if (n["read_timeout_ms"]) c.cloud.read_timeout_ms = n["read_timeout_ms"].as<int>();
      if (n["max_latency_ms"]) c.cloud.max_latency_ms = n["max_latency_ms"].as<int>();
      if (n["accuracy"]) c.cloud.accuracy = n["accuracy"].as<int>();
      if (n["jpeg_quality"]) c.cloud.jpeg_quality = n["jpeg_quality"].as<int>();
      if (n["empty_scene_confidence"])
        c.cloud.empty_scene_confidence = n["empty_scene_confidence"].as<float>();
    }
    o.cloud_max_concurrency = c.cloud.max_concurrent_requests;

    if (y["local_backends"]) {
      for (const auto& n : y["local_backends"]) c.local_backends.push_back(load_local_backend(n));
    }

    if (y["emergency"]) {
      auto n = y["emergency"];
      if (n["name"]) c.emergency.name = n["name"].as<std::string>();
      if (n["confidence"]) c.emergency.confidence = n["confidence"].as<float>();
      if (n["max_latency_ms"]) c.emergency.max_latency_ms = n["max_latency_ms"].as<int>();
      if (n["clutter_edge_density"])
        c.emergency.clutter_edge_density = n["clutter_edge_density"].as<double>();
      if (n["hivis_min_coverage"])
        c.emergency.hivis_min_coverage = n["hivis_min_coverage"].as<double>();
    }

    if (y["device"]) {
      auto n = y["device"];
      if (n["proc_root"]) c.device.proc_root = n["proc_root"].as<std::string>();
      if (n["sysfs_root"]) c.device.sysfs_root = n["sysfs_root"].as<std::string>();
      if (n["fair_celsius"]) c.device.fair_celsius = n["fair_celsius"].as<double>();
      if (n["serious_celsius"]) c.device.serious_celsius = n["serious_celsius"].as<double>();
      if (n["critical_celsius"]) c.device.critical_celsius = n["critical_celsius"].as<double>();
      if (n["low_end_max_memory_mb"])
        c.device.low_end_max_memory_mb = n["low_end_max_memory_mb"].as<int>();
      if (n["mid_range_max_memory_mb"])
        c.device.mid_range_max_memory_mb = n["mid_range_max_memory_mb"].as<int>();
    }

    if (y["telemetry"]) {
      auto n = y["telemetry"];
      if (n["log_level"]) c.telemetry.log_level = n["log_level"].as<std::string>();
      if (n["event_log_path"]) c.telemetry.event_log_path = n["event_log_path"].as<std::string>();
      if (n["metrics_port"]) c.telemetry.metrics_port = n["metrics_port"].as<int>();
    }
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("invalid config " + path + ": " + e.what());
  } catch (const std::invalid_argument& e) {
    throw std::runtime_error("invalid config " + path + ": " + e.what());
  }

  validate(c);
  return c;
}

void apply_log_level(const std::string& level) {
  if (level == "debug") {
    spdlog::set_level(spdlog::level::debug);
  } else if (level == "info") {
    spdlog::set_level(spdlog::level::info);
  } else if (level == "warn") {
    spdlog::set_level(spdlog::level::warn);
  } else if (level == "error") {
    spdlog::set_level(spdlog::level::err);
  } else {
    spdlog::warn("Unknown log level '{}', keeping info", level);
    spdlog::set_level(spdlog::level::info);
  }
}

std::vector<Backend> make_backends(const EngineConfig& cfg, CloudTransport transport,
                                   CredentialProvider credentials) {
  std::vector<Backend> backends;
  if (cfg.cloud.enabled) {
    backends.emplace_back(CloudBackend(cfg.cloud, std::move(transport), std::move(credentials)));
  }
  for (const auto& local : cfg.local_backends) {
    backends.emplace_back(LocalBackend(local, nullptr));
  }
  backends.emplace_back(EmergencyBackend(cfg.emergency));
  return backends;
}
