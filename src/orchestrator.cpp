#include "orchestrator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <future>
#include <unordered_map>

using namespace std::chrono;

namespace {

template <typename T>
T& require(const std::shared_ptr<T>& p, const char* what) {
  if (!p) throw std::invalid_argument(std::string("Orchestrator requires a ") + what);
  return *p;
}

}  // namespace

nlohmann::json to_json(const AnalysisOutcome& o) {
  nlohmann::json j;
  j["ok"] = o.ok();
  j["from_cache"] = o.from_cache;
  if (o.result) j["result"] = to_json(*o.result);
  if (o.error) {
    nlohmann::json provenance = nlohmann::json::array();
    for (const auto& a : o.error->provenance()) provenance.push_back(to_json(a));
    j["error"] = {{"code", to_string(o.error->code())},
                  {"message", o.error->what()},
                  {"provenance", provenance}};
  }
  return j;
}

nlohmann::json to_json(const HealthReport& h) {
  nlohmann::json backends = nlohmann::json::array();
  for (const auto& b : h.backends) {
    backends.push_back({{"name", b.name},
                        {"tier", to_string(b.tier)},
                        {"available", b.available},
                        {"reason", b.reason}});
  }
  nlohmann::json disabled = nlohmann::json::array();
  for (Tier t : h.disabled_tiers) disabled.push_back(to_string(t));
  return {{"healthy", h.healthy},
          {"network", to_string(h.device.network)},
          {"thermal", to_string(h.device.thermal)},
          {"battery_percent", h.device.battery_percent},
          {"available_memory_mb", h.device.available_memory_mb},
          {"device_class", to_string(h.device.device_class)},
          {"accelerator", h.device.accelerator_available},
          {"disabled_tiers", disabled},
          {"backends", backends}};
}

Orchestrator::Orchestrator(OrchestratorConfig cfg, std::vector<Backend> backends,
                           std::shared_ptr<BudgetManager> budget,
                           std::shared_ptr<DeviceCapabilityProfiler> profiler,
                           std::shared_ptr<EventSink> events, ResultCache::TimeSource cache_clock)
    : cfg_(std::move(cfg)),
      backends_(std::move(backends)),
      budget_(std::move(budget)),
      profiler_(std::move(profiler)),
      events_(std::move(events)),
      cloud_gate_(cfg_.cloud_max_concurrency),
      security_(cfg_.security, events_),
      cache_(cfg_.cache, runner_, events_, std::move(cache_clock)),
      selector_(cfg_.strategy),
      coordinator_(cfg_.coordinator, runner_, require(budget_, "BudgetManager"), accelerator_,
                   cloud_gate_, &metrics_, events_) {
  require(profiler_, "DeviceCapabilityProfiler");

  std::set<std::string> names;
  for (const auto& b : backends_) {
    if (!names.insert(b.name()).second) {
      throw std::invalid_argument("duplicate backend name: " + b.name());
    }
  }
  spdlog::info("Orchestrator ready: {} backends, cache {} entries / {}s TTL", backends_.size(),
               cfg_.cache.capacity, cfg_.cache.ttl.count());
}

Orchestrator::~Orchestrator() {
  cache_.cancel_all();
  runner_.join_all();
}

AnalysisResult Orchestrator::compute(const AnalysisRequest& request,
                                     const ValidationVerdict& verdict, const CancelToken& token) {
  const DeviceState device = profiler_->current_state();
  const BudgetState budget = budget_->state();
  const std::set<Tier> disabled = security_.disabled_tiers();

  std::vector<BackendDescriptor> candidates;
  std::unordered_map<std::string, const Backend*> by_name;
  for (const auto& b : backends_) {
    if (is_local(b.tier()) && !disabled.count(b.tier())) {
      // Throws ModelIntegrityViolation, which aborts this request.
      if (security_.ensure_model_trusted(b.descriptor(), b.model_path()) == ModelTrust::Missing) {
        continue;
      }
    }
    candidates.push_back(b.descriptor());
    by_name[b.name()] = &b;
  }

  StrategyPlan plan = selector_.select_order(request, device, budget, CacheOutcome::Miss,
                                             candidates, disabled);
  std::vector<Backend> ordered;
  ordered.reserve(plan.order.size());
  for (const auto& d : plan.order) ordered.push_back(*by_name.at(d.name));

  BackendInput input{request, verdict.image, verdict.sanitized_note};
  return coordinator_.run(ordered, input, device.device_class, token);
}

AnalysisOutcome Orchestrator::analyze(const AnalysisRequest& request, const CancelToken& token) {
  metrics_.inc_request();
  const TimePoint started = Clock::now();
  AnalysisOutcome out;

  ValidationVerdict verdict = security_.validate(request);
  if (!verdict.ok) {
    metrics_.inc_security_rejection();
    out.error = AnalysisError(verdict.rejection.value_or(ErrorCode::MalformedInput),
                              verdict.detail);
    return out;
  }

  try {
    CacheLookup lookup = cache_.get_or_compute(
        cache_key_of(request),
        [this, request, verdict](const CancelToken& t) { return compute(request, verdict, t); },
        token, request.id);
    if (lookup.outcome == CacheOutcome::Miss) {
      metrics_.inc_cache_miss();
    } else {
      metrics_.inc_cache_hit();
    }
    out.result = *lookup.result;
    out.from_cache = lookup.outcome != CacheOutcome::Miss;
  } catch (const AnalysisError& e) {
    switch (e.code()) {
      case ErrorCode::Cancelled:
        metrics_.inc_cancellation();
        spdlog::info("Request {} cancelled", request.id);
        break;
      case ErrorCode::OversizedInput:
      case ErrorCode::MalformedInput:
      case ErrorCode::ModelIntegrityViolation:
        metrics_.inc_security_rejection();
        break;
      default:
        metrics_.inc_total_failure();
        break;
    }
    out.error = e;
  } catch (const std::exception& e) {
    spdlog::error("Request {} failed unexpectedly: {}", request.id, e.what());
    metrics_.inc_total_failure();
    out.error = AnalysisError(ErrorCode::BackendFailure, e.what());
  }

  metrics_.add_e2e(duration<double, std::milli>(Clock::now() - started).count());
  return out;
}

std::vector<AnalysisOutcome> Orchestrator::analyze_batch(
    const std::vector<AnalysisRequest>& requests, size_t max_concurrency,
    const CancelToken& token) {
  std::vector<AnalysisOutcome> out(requests.size());
  if (requests.empty()) return out;

  const size_t workers = std::max<size_t>(1, std::min(max_concurrency, requests.size()));
  std::atomic<size_t> next{0};
  std::vector<std::future<void>> futures;
  futures.reserve(workers);
  for (size_t w = 0; w < workers; ++w) {
    futures.push_back(runner_.submit([this, &requests, &out, &next, &token] {
      for (size_t i = next.fetch_add(1); i < requests.size(); i = next.fetch_add(1)) {
        out[i] = analyze(requests[i], token);
      }
    }));
  }
  for (auto& f : futures) f.get();
  return out;
}

HealthReport Orchestrator::health_check() const {
  HealthReport report;
  report.device = profiler_->current_state();
  report.disabled_tiers = security_.disabled_tiers();

  std::vector<BackendDescriptor> candidates;
  for (const auto& b : backends_) candidates.push_back(b.descriptor());

  AnalysisRequest probe;
  StrategyPlan plan = selector_.select_order(probe, report.device, budget_->state(),
                                             CacheOutcome::Miss, candidates,
                                             report.disabled_tiers);

  bool any_primary = false;
  for (const auto& b : backends_) {
    BackendHealth h;
    h.name = b.name();
    h.tier = b.tier();
    h.available = true;
    for (const auto& e : plan.excluded) {
      if (e.backend == h.name) {
        h.available = false;
        h.reason = e.reason;
      }
    }
    const std::string path = b.model_path();
    std::error_code ec;
    if (h.available && !path.empty() && !std::filesystem::exists(path, ec)) {
      h.available = false;
      h.reason = "model artifact missing";
    }
    if (h.available && b.tier() != Tier::Emergency) any_primary = true;
    report.backends.push_back(std::move(h));
  }
  report.healthy = any_primary && report.disabled_tiers.empty();
  return report;
}

nlohmann::json Orchestrator::stats_json() const {
  nlohmann::json j = metrics_.to_json(metrics_.snapshot());
  const BudgetState b = budget_->state();
  j["budget"] = {{"daily_spend", b.daily_spend},
                 {"monthly_spend", b.monthly_spend},
                 {"reserved", b.reserved},
                 {"daily_cap", b.daily_cap},
                 {"monthly_cap", b.monthly_cap},
                 {"remaining", b.remaining()}};
  j["cache"] = {{"size", cache_.size()},
                {"capacity", cfg_.cache.capacity},
                {"in_flight", cache_.in_flight()},
                {"evictions", cache_.evictions()}};
  return j;
}

std::string Orchestrator::metrics_text() const {
  std::string text = metrics_.prometheus_text(metrics_.snapshot());
  const BudgetState b = budget_->state();
  text += "budget_daily_spend_dollars " + std::to_string(b.daily_spend) + "\n";
  text += "budget_monthly_spend_dollars " + std::to_string(b.monthly_spend) + "\n";
  text += "cache_entries " + std::to_string(cache_.size()) + "\n";
  text += "cache_evictions_total " + std::to_string(cache_.evictions()) + "\n";
  return text;
}
