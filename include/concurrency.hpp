#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "types.hpp"

// Shared cancellation flag. Copies observe the same state; child() tokens are
// cancelled with their parent but can also be cancelled on their own.
class CancelToken {
public:
  CancelToken();

  void cancel();
  bool cancelled() const { return state_->cancelled.load(std::memory_order_acquire); }

  // Runs fn once on cancellation (immediately if already cancelled).
  void on_cancel(std::function<void()> fn) const;

  // Sleeps up to d; returns true if cancelled meanwhile.
  bool wait_for(std::chrono::milliseconds d) const;

  CancelToken child() const;

private:
  struct State {
    std::atomic<bool> cancelled{false};
    std::mutex mu;
    std::condition_variable cv;
    std::vector<std::function<void()>> callbacks;
  };
  std::shared_ptr<State> state_;
};

// Raised once by a task when it finishes. Waiters also wake when their cancel
// token fires, so nothing polls.
class CompletionSignal : public std::enable_shared_from_this<CompletionSignal> {
public:
  void set();
  bool is_set() const;

  // True once set; false when the token was cancelled first.
  bool wait(const CancelToken& token);
  // As wait(), also returning false at the deadline.
  bool wait_until(const CancelToken& token, TimePoint deadline);

private:
  void wake_on_cancel(const CancelToken& token);

  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool done_{false};
};

// Sets the signal when the owning scope exits, on return or throw.
class SignalOnExit {
public:
  explicit SignalOnExit(std::shared_ptr<CompletionSignal> s) : signal_(std::move(s)) {}
  ~SignalOnExit() {
    if (signal_) signal_->set();
  }
  SignalOnExit(const SignalOnExit&) = delete;
  SignalOnExit& operator=(const SignalOnExit&) = delete;

private:
  std::shared_ptr<CompletionSignal> signal_;
};

enum class AcquireStatus { Acquired, TimedOut, Cancelled };

// Counting semaphore with cancellable, deadline-bounded acquisition.
class ConcurrencyGate {
public:
  explicit ConcurrencyGate(int capacity)
      : capacity_(capacity > 0 ? capacity : 1), state_(std::make_shared<State>()) {}

  AcquireStatus acquire(const CancelToken& token, TimePoint deadline);
  void release();

  int capacity() const { return capacity_; }
  int in_use() const {
    std::lock_guard<std::mutex> g(state_->mu);
    return state_->in_use;
  }

private:
  // Shared with cancel callbacks, which may fire after the gate is gone.
  struct State {
    std::mutex mu;
    std::condition_variable cv;
    int in_use{0};
  };

  const int capacity_;
  std::shared_ptr<State> state_;
};

// RAII permit; releases the gate slot when it goes out of scope.
class GatePermit {
public:
  GatePermit() = default;
  explicit GatePermit(ConcurrencyGate* gate) : gate_(gate) {}
  GatePermit(GatePermit&& o) noexcept : gate_(o.gate_) { o.gate_ = nullptr; }
  GatePermit& operator=(GatePermit&& o) noexcept {
    if (this != &o) {
      reset();
      gate_ = o.gate_;
      o.gate_ = nullptr;
    }
    return *this;
  }
  GatePermit(const GatePermit&) = delete;
  GatePermit& operator=(const GatePermit&) = delete;
  ~GatePermit() { reset(); }

  void reset() {
    if (gate_) gate_->release();
    gate_ = nullptr;
  }

private:
  ConcurrencyGate* gate_{nullptr};
};

// Owns the threads backing backend and cache computations. Abandoned tasks
// (timed out, cancelled) keep running until they observe their token; the
// destructor joins whatever is still alive.
class TaskRunner {
public:
  TaskRunner() = default;
  ~TaskRunner();
  TaskRunner(const TaskRunner&) = delete;
  TaskRunner& operator=(const TaskRunner&) = delete;

  template <typename F>
  auto submit(F&& fn) -> std::future<decltype(fn())> {
    using R = decltype(fn());
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
    std::future<R> fut = task->get_future();
    auto done = std::make_shared<std::atomic<bool>>(false);

    std::lock_guard<std::mutex> g(mu_);
    reap_locked();
    workers_.push_back(Worker{std::thread([task, done] {
                                (*task)();
                                done->store(true, std::memory_order_release);
                              }),
                              done});
    return fut;
  }

  size_t active() const;

  // Blocks until every submitted task has returned.
  void join_all();

private:
  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void reap_locked();

  mutable std::mutex mu_;
  std::list<Worker> workers_;
};
