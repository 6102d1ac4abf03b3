#include "metrics.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace {

// Linear interpolation between closest ranks; p in [0,100].
double percentile(const std::vector<double>& sorted, double p) {
  const double rank = (p / 100.0) * static_cast<double>(sorted.size() - 1);
  const size_t lo = static_cast<size_t>(rank);
  const size_t hi = std::min(sorted.size() - 1, lo + 1);
  const double frac = rank - static_cast<double>(lo);
  return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
}

}  // namespace

void LatencyWindow::record(double ms) {
  if (!std::isfinite(ms) || ms < 0.0) return;
  std::lock_guard<std::mutex> g(mu_);
  if (vals_.size() == cap_) vals_.pop_front();
  vals_.push_back(ms);
}

LatencySummary LatencyWindow::summary() const {
  std::vector<double> v;
  {
    std::lock_guard<std::mutex> g(mu_);
    v.assign(vals_.begin(), vals_.end());
  }
  LatencySummary out;
  out.samples = v.size();
  if (v.empty()) return out;
  std::sort(v.begin(), v.end());
  out.p50 = percentile(v, 50);
  out.p95 = percentile(v, 95);
  out.p99 = percentile(v, 99);
  return out;
}

Tier StatSnapshot::preferred_tier() const {
  Tier best = Tier::Emergency;
  uint64_t best_count = 0;
  for (size_t i = 0; i < kTierCount; ++i) {
    if (tiers[i].successes > best_count) {
      best_count = tiers[i].successes;
      best = static_cast<Tier>(i);
    }
  }
  return best;
}

void MetricsRegistry::record_attempt(const AttemptRecord& a) {
  auto& t = tiers_[tier_index(a.tier)];
  t.latency.record(a.latency_ms);
  switch (a.outcome) {
    case AttemptOutcome::Accepted: t.successes.fetch_add(1, std::memory_order_relaxed); break;
    case AttemptOutcome::LowConfidence:
      t.low_confidence.fetch_add(1, std::memory_order_relaxed);
      break;
    case AttemptOutcome::Failed: t.failures.fetch_add(1, std::memory_order_relaxed); break;
    case AttemptOutcome::TimedOut: t.timeouts.fetch_add(1, std::memory_order_relaxed); break;
  }
}

StatSnapshot MetricsRegistry::snapshot() const {
  StatSnapshot s{};
  s.requests = requests_.load();
  s.cache_hits = cache_hits_.load();
  s.cache_misses = cache_misses_.load();
  s.security_rejections = security_rejections_.load();
  s.total_failures = total_failures_.load();
  s.cancellations = cancellations_.load();
  const LatencySummary e2e = e2e_.summary();
  s.e2e_p50 = e2e.p50;
  s.e2e_p95 = e2e.p95;
  s.e2e_p99 = e2e.p99;
  for (size_t i = 0; i < kTierCount; ++i) {
    const auto& c = tiers_[i];
    auto& t = s.tiers[i];
    t.successes = c.successes.load();
    t.low_confidence = c.low_confidence.load();
    t.failures = c.failures.load();
    t.timeouts = c.timeouts.load();
    const LatencySummary lat = c.latency.summary();
    t.latency_samples = lat.samples;
    t.latency_p50 = lat.p50;
    t.latency_p95 = lat.p95;
    t.latency_p99 = lat.p99;
  }
  return s;
}

std::string MetricsRegistry::prometheus_text(const StatSnapshot& s) const {
  std::ostringstream os;
  os << "analysis_requests_total " << s.requests << "\n";
  os << "analysis_cache_hits_total " << s.cache_hits << "\n";
  os << "analysis_cache_misses_total " << s.cache_misses << "\n";
  os << "analysis_security_rejections_total " << s.security_rejections << "\n";
  os << "analysis_failures_total " << s.total_failures << "\n";
  os << "analysis_cancellations_total " << s.cancellations << "\n";

  os << "analysis_e2e_ms{quantile=\"0.5\"} "  << s.e2e_p50 << "\n";
  os << "analysis_e2e_ms{quantile=\"0.95\"} " << s.e2e_p95 << "\n";
  os << "analysis_e2e_ms{quantile=\"0.99\"} " << s.e2e_p99 << "\n";

  for (size_t i = 0; i < kTierCount; ++i) {
    const std::string tier = to_string(static_cast<Tier>(i));
    const auto& t = s.tiers[i];
    os << "backend_attempts_total{tier=\"" << tier << "\",outcome=\"accepted\"} " << t.successes
       << "\n";
    os << "backend_attempts_total{tier=\"" << tier << "\",outcome=\"low_confidence\"} "
       << t.low_confidence << "\n";
    os << "backend_attempts_total{tier=\"" << tier << "\",outcome=\"failed\"} " << t.failures
       << "\n";
    os << "backend_attempts_total{tier=\"" << tier << "\",outcome=\"timed_out\"} " << t.timeouts
       << "\n";
    os << "backend_latency_ms{tier=\"" << tier << "\",quantile=\"0.95\"} " << t.latency_p95
       << "\n";
  }
  return os.str();
}

nlohmann::json MetricsRegistry::to_json(const StatSnapshot& s) const {
  nlohmann::json tiers = nlohmann::json::object();
  for (size_t i = 0; i < kTierCount; ++i) {
    const auto& t = s.tiers[i];
    tiers[to_string(static_cast<Tier>(i))] = {{"accepted", t.successes},
                                              {"low_confidence", t.low_confidence},
                                              {"failed", t.failures},
                                              {"timed_out", t.timeouts},
                                              {"latency_samples", t.latency_samples},
                                              {"latency_p50", t.latency_p50},
                                              {"latency_p95", t.latency_p95},
                                              {"latency_p99", t.latency_p99}};
  }
  return nlohmann::json{{"requests", s.requests},
                        {"cache_hits", s.cache_hits},
                        {"cache_misses", s.cache_misses},
                        {"cache_hit_rate", s.cache_hit_rate()},
                        {"security_rejections", s.security_rejections},
                        {"total_failures", s.total_failures},
                        {"cancellations", s.cancellations},
                        {"e2e_p50", s.e2e_p50},
                        {"e2e_p95", s.e2e_p95},
                        {"e2e_p99", s.e2e_p99},
                        {"preferred_tier", to_string(s.preferred_tier())},
                        {"tiers", tiers}};
}
