#include "result_cache.hpp"

#include <spdlog/spdlog.h>

#include "errors.hpp"

std::string to_string(CacheOutcome o) {
  switch (o) {
    case CacheOutcome::Hit: return "hit";
    case CacheOutcome::Miss: return "miss";
    case CacheOutcome::Joined: return "joined";
  }
  return "miss";
}

ResultCache::ResultCache(CacheConfig cfg, TaskRunner& runner, std::shared_ptr<EventSink> events,
                         TimeSource now)
    : cfg_(cfg), runner_(runner), events_(std::move(events)), now_(std::move(now)) {
  if (!now_) now_ = [] { return Clock::now(); };
  if (cfg_.capacity == 0) cfg_.capacity = 1;
}

void ResultCache::emit(EventKind kind, uint64_t request_id, const CacheKey& key) const {
  if (!events_) return;
  events_->emit(make_event(kind, request_id,
                           {{"fingerprint", key.fingerprint},
                            {"work_type", to_string(key.work_type)}}));
}

CacheLookup ResultCache::get_or_compute(const CacheKey& key, ComputeFn compute,
                                        const CancelToken& caller, uint64_t request_id) {
  std::shared_ptr<InFlight> flight;
  CacheOutcome outcome = CacheOutcome::Miss;
  {
    std::lock_guard<std::mutex> g(mu_);
    const TimePoint now = now_();

    auto it = index_.find(key);
    if (it != index_.end()) {
      if (!expired(*it->second, now)) {
        it->second->last_access = now;
        lru_.splice(lru_.begin(), lru_, it->second);
        Value v = it->second->value;
        emit(EventKind::CacheHit, request_id, key);
        return {std::move(v), CacheOutcome::Hit};
      }
      spdlog::debug("Cache entry expired for {}", key.fingerprint.substr(0, 12));
      lru_.erase(it->second);
      index_.erase(it);
    }

    auto fit = in_flight_.find(key);
    if (fit != in_flight_.end()) {
      flight = fit->second;
      flight->waiters++;
      outcome = CacheOutcome::Joined;
    } else {
      flight = std::make_shared<InFlight>();
      flight->waiters = 1;
      CancelToken token = flight->token;
      std::weak_ptr<InFlight> weak = flight;
      auto done = flight->done;
      auto fut = runner_.submit([this, key, token, weak, done, compute = std::move(compute)]() -> Value {
        SignalOnExit finished(done);
        Value v;
        try {
          v = std::make_shared<const AnalysisResult>(compute(token));
        } catch (...) {
          std::lock_guard<std::mutex> g2(mu_);
          auto f = in_flight_.find(key);
          if (f != in_flight_.end() && f->second == weak.lock()) in_flight_.erase(f);
          throw;
        }
        std::lock_guard<std::mutex> g2(mu_);
        auto f = in_flight_.find(key);
        auto self = weak.lock();
        if (f != in_flight_.end() && f->second == self) {
          in_flight_.erase(f);
          if (!token.cancelled()) insert_locked(key, v);
        }
        return v;
      });
      flight->future = fut.share();
      in_flight_[key] = flight;
    }
  }

  emit(outcome == CacheOutcome::Joined ? EventKind::CacheJoined : EventKind::CacheMiss,
       request_id, key);
  Value v = await(key, flight, caller);
  return {std::move(v), outcome};
}

ResultCache::Value ResultCache::await(const CacheKey& key, const std::shared_ptr<InFlight>& flight,
                                      const CancelToken& caller) {
  if (!flight->done->wait(caller)) {
    bool abandon = false;
    {
      std::lock_guard<std::mutex> g(mu_);
      if (--flight->waiters == 0) {
        abandon = true;
        auto f = in_flight_.find(key);
        if (f != in_flight_.end() && f->second == flight) in_flight_.erase(f);
      }
    }
    if (abandon) {
      spdlog::debug("Last waiter left, cancelling computation for {}",
                    key.fingerprint.substr(0, 12));
      flight->token.cancel();
    }
    throw AnalysisError(ErrorCode::Cancelled, "analysis cancelled by caller");
  }
  // Rethrows the computation's exception identically for every waiter.
  return flight->future.get();
}

void ResultCache::insert_locked(const CacheKey& key, Value value) {
  const TimePoint now = now_();
  auto it = index_.find(key);
  if (it != index_.end()) {
    lru_.erase(it->second);
    index_.erase(it);
  }
  lru_.push_front(Entry{key, std::move(value), now, now});
  index_[key] = lru_.begin();

  while (lru_.size() > cfg_.capacity) {
    const Entry& victim = lru_.back();
    emit(EventKind::CacheEviction, victim.value ? victim.value->request_id : 0, victim.key);
    index_.erase(victim.key);
    lru_.pop_back();
    ++evictions_;
  }
}

std::shared_ptr<const AnalysisResult> ResultCache::peek(const CacheKey& key) const {
  std::lock_guard<std::mutex> g(mu_);
  auto it = index_.find(key);
  if (it == index_.end() || expired(*it->second, now_())) return nullptr;
  return it->second->value;
}

size_t ResultCache::size() const {
  std::lock_guard<std::mutex> g(mu_);
  return lru_.size();
}

size_t ResultCache::in_flight() const {
  std::lock_guard<std::mutex> g(mu_);
  return in_flight_.size();
}

int ResultCache::waiters(const CacheKey& key) const {
  std::lock_guard<std::mutex> g(mu_);
  auto it = in_flight_.find(key);
  return it == in_flight_.end() ? 0 : it->second->waiters;
}

uint64_t ResultCache::evictions() const {
  std::lock_guard<std::mutex> g(mu_);
  return evictions_;
}

void ResultCache::clear() {
  std::lock_guard<std::mutex> g(mu_);
  lru_.clear();
  index_.clear();
}

void ResultCache::cancel_all() {
  std::vector<std::shared_ptr<InFlight>> flights;
  {
    std::lock_guard<std::mutex> g(mu_);
    for (auto& kv : in_flight_) flights.push_back(kv.second);
  }
  for (auto& f : flights) f->token.cancel();
}
