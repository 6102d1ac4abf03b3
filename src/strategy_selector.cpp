#include "strategy_selector.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>

std::string StrategySelector::exclusion_reason(const BackendDescriptor& d,
                                               const DeviceState& device,
                                               const BudgetState& budget) const {
  if (d.tier == Tier::Emergency) return {};

  if (d.tier == Tier::Cloud) {
    if (budget.exhausted()) return "budget exhausted";
    if (!budget.can_afford(d.cost_per_call)) {
      return fmt::format("cost ${:.4f} exceeds remaining ${:.4f}", d.cost_per_call,
                         budget.remaining());
    }
    if (device.network == NetworkReachability::None) return "network unreachable";
    if (device.network == NetworkReachability::Metered && !cfg_.allow_metered_cloud) {
      return "metered network";
    }
  }

  if (d.tier == Tier::LocalLarge) {
    if (device.thermal >= ThermalLevel::Serious) {
      return "thermal " + to_string(device.thermal);
    }
    if (device.battery_percent < cfg_.low_battery_percent && !device.charging) {
      return fmt::format("battery {}% not charging", device.battery_percent);
    }
  }

  // Unknown memory (no total reported) is not treated as pressure.
  if (device.total_memory_mb > 0 && device.available_memory_mb < d.resources.min_memory_mb) {
    return fmt::format("needs {}MB, {}MB available", d.resources.min_memory_mb,
                       device.available_memory_mb);
  }
  if (d.resources.needs_gpu && !device.accelerator_available) return "no accelerator";
  if (d.resources.needs_network && device.network == NetworkReachability::None) {
    return "network unreachable";
  }
  return {};
}

StrategyPlan StrategySelector::select_order(const AnalysisRequest& request,
                                            const DeviceState& device, const BudgetState& budget,
                                            CacheOutcome cache_outcome,
                                            const std::vector<BackendDescriptor>& candidates,
                                            const std::set<Tier>& disabled) const {
  StrategyPlan plan;
  std::vector<BackendDescriptor> usable;
  std::vector<BackendDescriptor> emergency;

  for (const auto& d : candidates) {
    if (disabled.count(d.tier) && d.tier != Tier::Emergency) {
      plan.excluded.push_back({d.name, "tier disabled after integrity failure"});
      continue;
    }
    std::string why = exclusion_reason(d, device, budget);
    if (!why.empty()) {
      plan.excluded.push_back({d.name, std::move(why)});
      continue;
    }
    (d.tier == Tier::Emergency ? emergency : usable).push_back(d);
  }

  // Higher accuracy first; tier order breaks remaining ties.
  std::stable_sort(usable.begin(), usable.end(),
                   [](const BackendDescriptor& a, const BackendDescriptor& b) {
                     if (a.accuracy_class != b.accuracy_class) {
                       return a.accuracy_class > b.accuracy_class;
                     }
                     return static_cast<int>(a.tier) < static_cast<int>(b.tier);
                   });

  auto cloud = std::find_if(usable.begin(), usable.end(),
                            [](const BackendDescriptor& d) { return d.tier == Tier::Cloud; });
  auto local = std::find_if(usable.begin(), usable.end(),
                            [](const BackendDescriptor& d) { return is_local(d.tier); });

  auto primary = usable.end();
  if (is_critical(request.work_type) && cloud != usable.end()) {
    primary = cloud;
    plan.reason = "critical work type, cloud first";
  } else if (local != usable.end()) {
    primary = local;
    plan.reason = "local first";
  } else if (cloud != usable.end()) {
    primary = cloud;
    plan.reason = "no local backend, cloud first";
  } else {
    plan.reason = "emergency only";
  }
  if (primary != usable.end()) std::rotate(usable.begin(), primary, primary + 1);

  plan.order = std::move(usable);
  plan.order.insert(plan.order.end(), emergency.begin(), emergency.end());

  if (spdlog::should_log(spdlog::level::debug)) {
    std::string names;
    for (const auto& d : plan.order) names += (names.empty() ? "" : " > ") + d.name;
    spdlog::debug("Strategy for request {} (cache {}): {} [{}], {} excluded", request.id,
                  to_string(cache_outcome), names, plan.reason, plan.excluded.size());
    for (const auto& e : plan.excluded) spdlog::debug("  excluded {}: {}", e.backend, e.reason);
  }
  return plan;
}
