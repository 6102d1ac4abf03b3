#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <unordered_map>

#include "concurrency.hpp"
#include "events.hpp"
#include "types.hpp"

struct CacheConfig {
  size_t capacity = 128;
  std::chrono::seconds ttl{4 * 3600};  // measured from creation, independent of access
};

enum class CacheOutcome { Hit, Miss, Joined };

std::string to_string(CacheOutcome o);

struct CacheLookup {
  std::shared_ptr<const AnalysisResult> result;
  CacheOutcome outcome{CacheOutcome::Miss};
};

// Fixed-capacity LRU keyed by (fingerprint, work type) with request coalescing:
// at most one computation per key is in flight and every waiter receives the same
// value or the same exception. A cancelled waiter stops waiting; the computation
// is only cancelled once no waiter is left.
class ResultCache {
public:
  using ComputeFn = std::function<AnalysisResult(const CancelToken&)>;
  using TimeSource = std::function<TimePoint()>;

  ResultCache(CacheConfig cfg, TaskRunner& runner, std::shared_ptr<EventSink> events = nullptr,
              TimeSource now = nullptr);

  // Throws whatever compute throws, or AnalysisError(Cancelled) if caller is cancelled.
  CacheLookup get_or_compute(const CacheKey& key, ComputeFn compute, const CancelToken& caller,
                             uint64_t request_id = 0);

  // Read-only probe that honours TTL but does not touch recency.
  std::shared_ptr<const AnalysisResult> peek(const CacheKey& key) const;

  size_t size() const;
  size_t in_flight() const;
  // Callers currently waiting on the in-flight computation for key.
  int waiters(const CacheKey& key) const;
  uint64_t evictions() const;
  void clear();

  // Cancels every in-flight computation; used on shutdown.
  void cancel_all();

  const CacheConfig& config() const { return cfg_; }

private:
  using Value = std::shared_ptr<const AnalysisResult>;

  struct Entry {
    CacheKey key;
    Value value;
    TimePoint created;
    TimePoint last_access;
  };

  struct InFlight {
    std::shared_future<Value> future;
    CancelToken token;
    std::shared_ptr<CompletionSignal> done{std::make_shared<CompletionSignal>()};
    int waiters{0};
  };

  bool expired(const Entry& e, TimePoint now) const { return now - e.created >= cfg_.ttl; }
  void insert_locked(const CacheKey& key, Value value);
  Value await(const CacheKey& key, const std::shared_ptr<InFlight>& flight,
              const CancelToken& caller);
  void emit(EventKind kind, uint64_t request_id, const CacheKey& key) const;

  CacheConfig cfg_;
  TaskRunner& runner_;
  std::shared_ptr<EventSink> events_;
  TimeSource now_;

  mutable std::mutex mu_;
  std::list<Entry> lru_;  // front = most recently used
  std::unordered_map<CacheKey, std::list<Entry>::iterator, CacheKeyHash> index_;
  std::unordered_map<CacheKey, std::shared_ptr<InFlight>, CacheKeyHash> in_flight_;
  uint64_t evictions_{0};
};
