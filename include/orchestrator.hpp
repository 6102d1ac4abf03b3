#pragma once
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "backend.hpp"
#include "budget_manager.hpp"
#include "concurrency.hpp"
#include "device_profiler.hpp"
#include "errors.hpp"
#include "events.hpp"
#include "fallback_coordinator.hpp"
#include "metrics.hpp"
#include "result_cache.hpp"
#include "security_validator.hpp"
#include "strategy_selector.hpp"
#include "types.hpp"

struct OrchestratorConfig {
  SecurityConfig security;
  CacheConfig cache;
  StrategyConfig strategy;
  CoordinatorConfig coordinator;
  int cloud_max_concurrency{4};
};

// Exactly one of result / error is set.
struct AnalysisOutcome {
  std::optional<AnalysisResult> result;
  std::optional<AnalysisError> error;
  bool from_cache{false};

  bool ok() const { return result.has_value(); }
};

nlohmann::json to_json(const AnalysisOutcome& o);

struct BackendHealth {
  std::string name;
  Tier tier{Tier::Emergency};
  bool available{false};
  std::string reason;
};

struct HealthReport {
  bool healthy{false};
  DeviceState device;
  std::vector<BackendHealth> backends;
  std::set<Tier> disabled_tiers;
};

nlohmann::json to_json(const HealthReport& h);

// Single entry point for the capture UI. Budget and device state are
// process-scoped collaborators owned by the caller; everything else lives and
// dies with the orchestrator.
class Orchestrator {
public:
  Orchestrator(OrchestratorConfig cfg, std::vector<Backend> backends,
               std::shared_ptr<BudgetManager> budget,
               std::shared_ptr<DeviceCapabilityProfiler> profiler,
               std::shared_ptr<EventSink> events = nullptr,
               ResultCache::TimeSource cache_clock = nullptr);
  ~Orchestrator();

  Orchestrator(const Orchestrator&) = delete;
  Orchestrator& operator=(const Orchestrator&) = delete;

  // Never throws for analysis failures; they are reported in the outcome.
  AnalysisOutcome analyze(const AnalysisRequest& request, const CancelToken& token = CancelToken());

  // Outcomes are in input order.
  std::vector<AnalysisOutcome> analyze_batch(const std::vector<AnalysisRequest>& requests,
                                             size_t max_concurrency = 3,
                                             const CancelToken& token = CancelToken());

  HealthReport health_check() const;
  StatSnapshot stats() const { return metrics_.snapshot(); }
  nlohmann::json stats_json() const;
  std::string metrics_text() const;

  ResultCache& cache() { return cache_; }
  BudgetManager& budget() { return *budget_; }
  SecurityValidator& security() { return security_; }
  const std::vector<Backend>& backends() const { return backends_; }

private:
  AnalysisResult compute(const AnalysisRequest& request, const ValidationVerdict& verdict,
                         const CancelToken& token);

  OrchestratorConfig cfg_;
  std::vector<Backend> backends_;
  std::shared_ptr<BudgetManager> budget_;
  std::shared_ptr<DeviceCapabilityProfiler> profiler_;
  std::shared_ptr<EventSink> events_;

  MetricsRegistry metrics_;
  TaskRunner runner_;
  ConcurrencyGate accelerator_{1};
  ConcurrencyGate cloud_gate_;
  SecurityValidator security_;
  ResultCache cache_;
  StrategySelector selector_;
  FallbackCoordinator coordinator_;
};
