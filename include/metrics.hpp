#pragma once
#include <array>
#include <atomic>
#include <deque>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "types.hpp"

struct LatencySummary {
  size_t samples{0};
  double p50{0}, p95{0}, p99{0};
};

// Most recent latency samples for one tier, or for whole requests. Samples
// that are negative or not finite are dropped.
class LatencyWindow {
public:
  static constexpr size_t kDefaultSamples = 512;

  explicit LatencyWindow(size_t samples = kDefaultSamples) : cap_(samples ? samples : 1) {}

  void record(double ms);
  LatencySummary summary() const;
  size_t samples() const {
    std::lock_guard<std::mutex> g(mu_);
    return vals_.size();
  }

private:
  size_t cap_;
  mutable std::mutex mu_;
  std::deque<double> vals_;
};

constexpr size_t kTierCount = 4;

inline size_t tier_index(Tier t) { return static_cast<size_t>(t); }

struct TierStats {
  uint64_t successes{0};
  uint64_t low_confidence{0};
  uint64_t failures{0};
  uint64_t timeouts{0};
  size_t latency_samples{0};
  double latency_p50{0}, latency_p95{0}, latency_p99{0};
};

struct StatSnapshot {
  uint64_t requests{0};
  uint64_t cache_hits{0};
  uint64_t cache_misses{0};
  uint64_t security_rejections{0};
  uint64_t total_failures{0};
  uint64_t cancellations{0};
  double e2e_p50{0}, e2e_p95{0}, e2e_p99{0};
  std::array<TierStats, kTierCount> tiers{};

  double cache_hit_rate() const {
    const auto lookups = cache_hits + cache_misses;
    return lookups ? static_cast<double>(cache_hits) / static_cast<double>(lookups) : 0.0;
  }
  // Tier with the most accepted results; Emergency when nothing succeeded yet.
  Tier preferred_tier() const;
};

class MetricsRegistry {
public:
  void inc_request() { requests_.fetch_add(1, std::memory_order_relaxed); }
  void inc_cache_hit() { cache_hits_.fetch_add(1, std::memory_order_relaxed); }
  void inc_cache_miss() { cache_misses_.fetch_add(1, std::memory_order_relaxed); }
  void inc_security_rejection() { security_rejections_.fetch_add(1, std::memory_order_relaxed); }
  void inc_total_failure() { total_failures_.fetch_add(1, std::memory_order_relaxed); }
  void inc_cancellation() { cancellations_.fetch_add(1, std::memory_order_relaxed); }

  void add_e2e(double ms) { e2e_.record(ms); }
  void record_attempt(const AttemptRecord& a);

  uint64_t requests() const { return requests_.load(std::memory_order_relaxed); }

  StatSnapshot snapshot() const;
  std::string prometheus_text(const StatSnapshot& s) const;
  nlohmann::json to_json(const StatSnapshot& s) const;

private:
  std::atomic<uint64_t> requests_{0};
  std::atomic<uint64_t> cache_hits_{0};
  std::atomic<uint64_t> cache_misses_{0};
  std::atomic<uint64_t> security_rejections_{0};
  std::atomic<uint64_t> total_failures_{0};
  std::atomic<uint64_t> cancellations_{0};
  LatencyWindow e2e_;

  struct TierCounters {
    std::atomic<uint64_t> successes{0};
    std::atomic<uint64_t> low_confidence{0};
    std::atomic<uint64_t> failures{0};
    std::atomic<uint64_t> timeouts{0};
    LatencyWindow latency;
  };
  std::array<TierCounters, kTierCount> tiers_;
};
