#pragma once
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <vector>

#include "backend.hpp"
#include "budget_manager.hpp"
#include "concurrency.hpp"
#include "errors.hpp"
#include "events.hpp"
#include "metrics.hpp"
#include "types.hpp"

struct CoordinatorConfig {
  float default_threshold{0.6f};
  std::map<WorkType, float> thresholds;  // per-work-type override of default_threshold
  std::map<Tier, std::chrono::milliseconds> timeouts = {
      {Tier::Cloud, std::chrono::milliseconds(15000)},
      {Tier::LocalLarge, std::chrono::milliseconds(10000)},
      {Tier::LocalSmall, std::chrono::milliseconds(8000)},
      {Tier::Emergency, std::chrono::milliseconds(2000)}};
  double low_end_timeout_scale{1.5};
  double high_end_timeout_scale{0.8};

  float threshold_for(WorkType w) const;
  std::chrono::milliseconds timeout_for(Tier t, DeviceClass c) const;
};

// Drives an ordered backend sequence one attempt at a time:
// Pending -> Running -> {Accepted, LowConfidence, Failed, TimedOut}.
class FallbackCoordinator {
public:
  FallbackCoordinator(CoordinatorConfig cfg, TaskRunner& runner, BudgetManager& budget,
                      ConcurrencyGate& accelerator, ConcurrencyGate& cloud_gate,
                      MetricsRegistry* metrics = nullptr,
                      std::shared_ptr<EventSink> events = nullptr);

  // Returns the first accepted result, else the best low-confidence candidate.
  // Throws AnalysisError(AllBackendsFailed) with the provenance chain when no
  // attempt produced anything, AnalysisError(Cancelled) when `token` fires.
  AnalysisResult run(const std::vector<Backend>& ordered, const BackendInput& input,
                     DeviceClass device_class, const CancelToken& token);

  const CoordinatorConfig& config() const { return cfg_; }

private:
  struct Candidate {
    BackendReply reply;
    const Backend* backend{nullptr};
  };

  ConcurrencyGate* gate_for(const Backend& b);
  void finish(uint64_t request_id, const AttemptRecord& rec);
  AnalysisResult make_result(const AnalysisRequest& req, const Candidate& c,
                             std::vector<AttemptRecord> provenance, double total_cost,
                             TimePoint started) const;

  CoordinatorConfig cfg_;
  TaskRunner& runner_;
  BudgetManager& budget_;
  ConcurrencyGate& accelerator_;
  ConcurrencyGate& cloud_gate_;
  MetricsRegistry* metrics_;
  std::shared_ptr<EventSink> events_;
};
