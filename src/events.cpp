#include "events.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>

std::string to_string(EventKind k) {
  switch (k) {
    case EventKind::AttemptStarted: return "attempt_started";
    case EventKind::AttemptFinished: return "attempt_finished";
    case EventKind::CacheHit: return "cache_hit";
    case EventKind::CacheMiss: return "cache_miss";
    case EventKind::CacheJoined: return "cache_joined";
    case EventKind::CacheEviction: return "cache_eviction";
    case EventKind::BudgetChanged: return "budget_changed";
    case EventKind::SecurityVerdict: return "security_verdict";
  }
  return "unknown";
}

Event make_event(EventKind kind, uint64_t request_id, nlohmann::json data) {
  Event e;
  e.kind = kind;
  e.request_id = request_id;
  e.timestamp = WallClock::now();
  e.data = std::move(data);
  return e;
}

nlohmann::json to_json(const Event& e) {
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      e.timestamp.time_since_epoch())
                      .count();
  return nlohmann::json{{"event", to_string(e.kind)},
                        {"request_id", e.request_id},
                        {"timestamp_ms", ms},
                        {"data", e.data}};
}

void LogEventSink::emit(const Event& e) {
  spdlog::debug("[event] {} req={} {}", to_string(e.kind), e.request_id, e.data.dump());
}

JsonlEventSink::JsonlEventSink(const std::string& path) : path_(path) {
  std::filesystem::path p(path);
  if (p.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(p.parent_path(), ec);
  }
  out_.open(path, std::ios::out | std::ios::app);
  if (!out_.is_open()) {
    spdlog::error("Failed to open event log: {}", path);
  } else {
    spdlog::info("Event log: {}", path);
  }
}

JsonlEventSink::~JsonlEventSink() {
  std::lock_guard<std::mutex> g(mu_);
  if (out_.is_open()) {
    out_.flush();
    out_.close();
  }
}

void JsonlEventSink::emit(const Event& e) {
  std::lock_guard<std::mutex> g(mu_);
  if (!out_.is_open()) return;
  out_ << to_json(e).dump() << '\n';
  out_.flush();
}

void FanoutEventSink::emit(const Event& e) {
  for (auto& s : sinks_) s->emit(e);
}

nlohmann::json to_json(const Hazard& h) {
  return nlohmann::json{{"type", to_string(h.type)},
                        {"region",
                         {{"x", h.region.x},
                          {"y", h.region.y},
                          {"width", h.region.width},
                          {"height", h.region.height}}},
                        {"confidence", h.confidence},
                        {"severity", to_string(h.severity)},
                        {"description", h.description},
                        {"osha_code", h.osha_code}};
}

nlohmann::json to_json(const AttemptRecord& a) {
  nlohmann::json j{{"backend", a.backend},
                   {"tier", to_string(a.tier)},
                   {"outcome", to_string(a.outcome)},
                   {"latency_ms", a.latency_ms},
                   {"confidence", a.confidence}};
  if (!a.error.empty()) j["error"] = a.error;
  return j;
}

nlohmann::json to_json(const AnalysisResult& r) {
  nlohmann::json hazards = nlohmann::json::array();
  for (const auto& h : r.hazards) hazards.push_back(to_json(h));
  nlohmann::json provenance = nlohmann::json::array();
  for (const auto& a : r.provenance) provenance.push_back(to_json(a));
  return nlohmann::json{{"request_id", r.request_id},
                        {"hazards", hazards},
                        {"overall_confidence", r.overall_confidence},
                        {"source_tier", to_string(r.source_tier)},
                        {"source_backend", r.source_backend},
                        {"total_cost", r.total_cost},
                        {"total_latency_ms", r.total_latency_ms},
                        {"provenance", provenance}};
}
