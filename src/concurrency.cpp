#include "concurrency.hpp"

#include <algorithm>

CancelToken::CancelToken() : state_(std::make_shared<State>()) {}

void CancelToken::cancel() {
  std::vector<std::function<void()>> callbacks;
  {
    std::lock_guard<std::mutex> g(state_->mu);
    if (state_->cancelled.exchange(true, std::memory_order_acq_rel)) return;
    callbacks.swap(state_->callbacks);
  }
  state_->cv.notify_all();
  for (auto& fn : callbacks) fn();
}

void CancelToken::on_cancel(std::function<void()> fn) const {
  {
    std::lock_guard<std::mutex> g(state_->mu);
    if (!state_->cancelled.load(std::memory_order_acquire)) {
      state_->callbacks.push_back(std::move(fn));
      return;
    }
  }
  fn();
}

bool CancelToken::wait_for(std::chrono::milliseconds d) const {
  std::unique_lock<std::mutex> lk(state_->mu);
  return state_->cv.wait_for(lk, d, [this] { return cancelled(); });
}

CancelToken CancelToken::child() const {
  CancelToken c;
  std::weak_ptr<State> weak = c.state_;
  on_cancel([weak] {
    if (auto s = weak.lock()) {
      CancelToken t;
      t.state_ = s;
      t.cancel();
    }
  });
  return c;
}

void CompletionSignal::set() {
  {
    std::lock_guard<std::mutex> g(mu_);
    done_ = true;
  }
  cv_.notify_all();
}

bool CompletionSignal::is_set() const {
  std::lock_guard<std::mutex> g(mu_);
  return done_;
}

void CompletionSignal::wake_on_cancel(const CancelToken& token) {
  std::weak_ptr<CompletionSignal> weak = shared_from_this();
  token.on_cancel([weak] {
    if (auto s = weak.lock()) {
      std::lock_guard<std::mutex> g(s->mu_);
      s->cv_.notify_all();
    }
  });
}

bool CompletionSignal::wait(const CancelToken& token) {
  wake_on_cancel(token);
  std::unique_lock<std::mutex> lk(mu_);
  cv_.wait(lk, [&] { return done_ || token.cancelled(); });
  return done_;
}

bool CompletionSignal::wait_until(const CancelToken& token, TimePoint deadline) {
  wake_on_cancel(token);
  std::unique_lock<std::mutex> lk(mu_);
  cv_.wait_until(lk, deadline, [&] { return done_ || token.cancelled(); });
  return done_;
}

AcquireStatus ConcurrencyGate::acquire(const CancelToken& token, TimePoint deadline) {
  std::weak_ptr<State> weak = state_;
  token.on_cancel([weak] {
    if (auto s = weak.lock()) {
      std::lock_guard<std::mutex> g(s->mu);
      s->cv.notify_all();
    }
  });

  std::unique_lock<std::mutex> lk(state_->mu);
  const bool free = state_->cv.wait_until(lk, deadline, [&] {
    return token.cancelled() || state_->in_use < capacity_;
  });
  if (token.cancelled()) return AcquireStatus::Cancelled;
  if (!free) return AcquireStatus::TimedOut;
  ++state_->in_use;
  return AcquireStatus::Acquired;
}

void ConcurrencyGate::release() {
  {
    std::lock_guard<std::mutex> g(state_->mu);
    if (state_->in_use > 0) --state_->in_use;
  }
  state_->cv.notify_all();
}

TaskRunner::~TaskRunner() { join_all(); }

void TaskRunner::join_all() {
  // Running tasks may submit more work, so drain until nothing is left.
  for (;;) {
    std::list<Worker> workers;
    {
      std::lock_guard<std::mutex> g(mu_);
      workers.swap(workers_);
    }
    if (workers.empty()) return;
    for (auto& w : workers) {
      if (w.thread.joinable()) w.thread.join();
    }
  }
}

size_t TaskRunner::active() const {
  std::lock_guard<std::mutex> g(mu_);
  return static_cast<size_t>(std::count_if(workers_.begin(), workers_.end(), [](const Worker& w) {
    return !w.done->load(std::memory_order_acquire);
  }));
}

void TaskRunner::reap_locked() {
  for (auto it = workers_.begin(); it != workers_.end();) {
    if (it->done->load(std::memory_order_acquire)) {
      if (it->thread.joinable()) it->thread.join();
      it = workers_.erase(it);
    } else {
      ++it;
    }
  }
}
