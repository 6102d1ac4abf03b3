#pragma once
#include <set>
#include <string>
#include <vector>

#include "budget_manager.hpp"
#include "result_cache.hpp"
#include "types.hpp"

struct StrategyConfig {
  // Work types whose classification warrants cloud accuracy first.
  std::set<WorkType> critical_work_types = {WorkType::FallProtection, WorkType::Electrical,
                                            WorkType::CraneOperations, WorkType::Scaffolding,
                                            WorkType::Excavation};
  int low_battery_percent{15};
  bool allow_metered_cloud{true};
};

struct Exclusion {
  std::string backend;
  std::string reason;
};

struct StrategyPlan {
  std::vector<BackendDescriptor> order;  // emergency, if offered, is last
  std::vector<Exclusion> excluded;
  std::string reason;
};

class StrategySelector {
public:
  explicit StrategySelector(StrategyConfig cfg) : cfg_(std::move(cfg)) {}

  // Pure function of its inputs. `candidates` are the backends usable for this
  // request; tiers in `disabled` are dropped outright.
  StrategyPlan select_order(const AnalysisRequest& request, const DeviceState& device,
                            const BudgetState& budget, CacheOutcome cache_outcome,
                            const std::vector<BackendDescriptor>& candidates,
                            const std::set<Tier>& disabled = {}) const;

  bool is_critical(WorkType w) const { return cfg_.critical_work_types.count(w) > 0; }

  const StrategyConfig& config() const { return cfg_; }

private:
  // Empty when usable, otherwise the reason for exclusion.
  std::string exclusion_reason(const BackendDescriptor& d, const DeviceState& device,
                               const BudgetState& budget) const;

  StrategyConfig cfg_;
};
