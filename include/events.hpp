#pragma once

#include <fstream>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "types.hpp"

enum class EventKind {
  AttemptStarted,
  AttemptFinished,
  CacheHit,
  CacheMiss,
  CacheJoined,
  CacheEviction,
  BudgetChanged,
  SecurityVerdict
};

std::string to_string(EventKind k);

// Observability record for an external telemetry collector.
struct Event {
  EventKind kind{EventKind::AttemptStarted};
  uint64_t request_id{0};
  WallClock::time_point timestamp{WallClock::now()};
  nlohmann::json data = nlohmann::json::object();
};

Event make_event(EventKind kind, uint64_t request_id, nlohmann::json data = nlohmann::json::object());

nlohmann::json to_json(const Event& e);

class EventSink {
public:
  virtual ~EventSink() = default;
  virtual void emit(const Event& e) = 0;
};

class NullEventSink : public EventSink {
public:
  void emit(const Event&) override {}
};

// Forwards events to spdlog at debug level.
class LogEventSink : public EventSink {
public:
  void emit(const Event& e) override;
};

// Appends one JSON object per line; safe for concurrent emitters.
class JsonlEventSink : public EventSink {
public:
  explicit JsonlEventSink(const std::string& path);
  ~JsonlEventSink() override;

  void emit(const Event& e) override;
  bool is_open() const { return out_.is_open(); }

private:
  std::mutex mu_;
  std::ofstream out_;
  std::string path_;
};

class FanoutEventSink : public EventSink {
public:
  void add(std::shared_ptr<EventSink> sink) { sinks_.push_back(std::move(sink)); }
  void emit(const Event& e) override;

private:
  std::vector<std::shared_ptr<EventSink>> sinks_;
};

nlohmann::json to_json(const Hazard& h);
nlohmann::json to_json(const AttemptRecord& a);
nlohmann::json to_json(const AnalysisResult& r);
