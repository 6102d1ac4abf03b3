#include <httplib.h>
#include <spdlog/spdlog.h>

#include <CLI/CLI.hpp>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "events.hpp"
#include "image.hpp"
#include "orchestrator.hpp"
#include "util.hpp"

namespace {

std::vector<uint8_t> read_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw std::runtime_error("cannot open " + path);
  return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Dimensions normally come from the capture collaborator; without them they are
// read from the container header. Pixels are only decoded by the validator.
AnalysisRequest request_from_bytes(std::vector<uint8_t> bytes, WorkType work_type,
                                   const std::string& note, const EngineConfig& cfg,
                                   int width = 0, int height = 0) {
  if (width <= 0 || height <= 0) {
    if (auto size = read_image_dimensions(bytes)) {
      width = size->width;
      height = size->height;
    }
  }
  return make_request(std::move(bytes), width, height, work_type, note, cfg.fingerprint);
}

int http_status_for(const AnalysisOutcome& o) {
  if (o.ok()) return 200;
  switch (o.error->code()) {
    case ErrorCode::OversizedInput: return 413;
    case ErrorCode::MalformedInput: return 400;
    case ErrorCode::Cancelled: return 499;
    default: return 503;
  }
}

}  // namespace

int main(int argc, char** argv) {
  CLI::App cli_app{"HazardScope: hybrid construction-hazard analysis engine"};

  std::string cfg_path = "configs/hazardscope.yaml";
  cli_app.add_option("-c,--config", cfg_path, "Configuration file path")->check(CLI::ExistingFile);

  std::string work_type_name = "general_construction";
  cli_app.add_option("-w,--work-type", work_type_name, "Work type of the captured images");

  std::string note;
  cli_app.add_option("-n,--note", note, "Inspector note passed to the cloud prompt");

  std::vector<std::string> images;
  cli_app.add_option("images", images, "Images to analyse")->check(CLI::ExistingFile);

  bool serve = false;
  cli_app.add_flag("--serve", serve, "Run the HTTP analysis server");

  bool show_version = false;
  cli_app.add_flag("-v,--version", show_version, "Show version information");

  try {
    cli_app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return cli_app.exit(e);
  }

  if (show_version) {
    std::cout << "HazardScope v1.0.0" << std::endl;
    std::cout << "Backends: cloud vision, OpenCV DNN (YOLO), emergency heuristic" << std::endl;
    return 0;
  }

  spdlog::set_pattern("[%H:%M:%S.%e] %^[%l]%$ %v");

  EngineConfig cfg;
  WorkType work_type = WorkType::GeneralConstruction;
  try {
    cfg = load_config(cfg_path);
    work_type = work_type_from_string(work_type_name);
  } catch (const std::exception& e) {
    spdlog::error("{}", e.what());
    return 2;
  }
  apply_log_level(cfg.telemetry.log_level);
  spdlog::info("HazardScope starting (config: {})", cfg_path);

  auto events = std::make_shared<FanoutEventSink>();
  events->add(std::make_shared<LogEventSink>());
  if (!cfg.telemetry.event_log_path.empty()) {
    auto jsonl = std::make_shared<JsonlEventSink>(cfg.telemetry.event_log_path);
    if (jsonl->is_open()) {
      events->add(jsonl);
    } else {
      spdlog::warn("Event log {} could not be opened", cfg.telemetry.event_log_path);
    }
  }

  auto budget = std::make_shared<BudgetManager>(cfg.budget, events);
  auto profiler = std::make_shared<DeviceCapabilityProfiler>(cfg.device, nullptr);
  Orchestrator orchestrator(cfg.orchestrator, make_backends(cfg), budget, profiler, events);

  if (!serve) {
    if (images.empty()) {
      spdlog::error("No images given; pass image paths or --serve");
      return 2;
    }
    std::vector<AnalysisRequest> requests;
    try {
      for (const auto& path : images) {
        requests.push_back(request_from_bytes(read_file(path), work_type, note, cfg));
      }
    } catch (const std::runtime_error& e) {
      spdlog::error("{}", e.what());
      return 2;
    }
    auto outcomes = orchestrator.analyze_batch(requests);
    nlohmann::json out = nlohmann::json::array();
    bool all_ok = true;
    for (size_t i = 0; i < outcomes.size(); ++i) {
      nlohmann::json j = to_json(outcomes[i]);
      j["image"] = images[i];
      out.push_back(std::move(j));
      all_ok = all_ok && outcomes[i].ok();
    }
    std::cout << out.dump(2) << std::endl;
    return all_ok ? 0 : 1;
  }

  httplib::Server svr;

  svr.Get("/healthz", [&](const httplib::Request&, httplib::Response& res) {
    res.set_content("{\"status\":\"ok\"}", "application/json");
  });

  svr.Get("/readyz", [&](const httplib::Request&, httplib::Response& res) {
    HealthReport h = orchestrator.health_check();
    res.status = h.healthy ? 200 : 503;
    res.set_content(to_json(h).dump(2), "application/json");
  });

  svr.Get("/stats", [&](const httplib::Request&, httplib::Response& res) {
    res.set_content(orchestrator.stats_json().dump(2), "application/json");
  });

  svr.Get("/metrics", [&](const httplib::Request&, httplib::Response& res) {
    res.set_content(orchestrator.metrics_text(), "text/plain; version=0.0.4");
  });

  svr.Post("/analyze", [&](const httplib::Request& req, httplib::Response& res) {
    WorkType wt = work_type;
    try {
      if (req.has_param("work_type")) wt = work_type_from_string(req.get_param_value("work_type"));
    } catch (const std::invalid_argument& e) {
      res.status = 400;
      res.set_content(nlohmann::json{{"error", e.what()}}.dump(), "application/json");
      return;
    }
    const std::string req_note = req.has_param("note") ? req.get_param_value("note") : "";
    int width = 0;
    int height = 0;
    try {
      if (req.has_param("width")) width = std::stoi(req.get_param_value("width"));
      if (req.has_param("height")) height = std::stoi(req.get_param_value("height"));
    } catch (const std::exception&) {
      res.status = 400;
      res.set_content(nlohmann::json{{"error", "width and height must be integers"}}.dump(),
                      "application/json");
      return;
    }
    std::vector<uint8_t> bytes(req.body.begin(), req.body.end());
    AnalysisOutcome outcome = orchestrator.analyze(
        request_from_bytes(std::move(bytes), wt, req_note, cfg, width, height));
    res.status = http_status_for(outcome);
    res.set_content(to_json(outcome).dump(2), "application/json");
  });

  spdlog::info("HTTP server listening on 0.0.0.0:{}", cfg.telemetry.metrics_port);
  svr.listen("0.0.0.0", cfg.telemetry.metrics_port);

  spdlog::info("Shutdown complete.");
  return 0;
}
