#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include "concurrency.hpp"

using namespace std::chrono_literals;

class CancelTokenTest : public ::testing::Test {};

TEST_F(CancelTokenTest, CopiesShareState) {
    CancelToken token;
    CancelToken copy = token;
    EXPECT_FALSE(copy.cancelled());
    token.cancel();
    EXPECT_TRUE(copy.cancelled());
}

TEST_F(CancelTokenTest, ChildFollowsParent) {
    CancelToken parent;
    CancelToken child = parent.child();
    CancelToken grandchild = child.child();

    parent.cancel();
    EXPECT_TRUE(child.cancelled());
    EXPECT_TRUE(grandchild.cancelled());
}

TEST_F(CancelTokenTest, ChildCancelDoesNotReachParent) {
    CancelToken parent;
    CancelToken child = parent.child();

    child.cancel();
    EXPECT_TRUE(child.cancelled());
    EXPECT_FALSE(parent.cancelled());
}

TEST_F(CancelTokenTest, CallbacksRunOnceAndLateCallbacksImmediately) {
    CancelToken token;
    int calls = 0;
    token.on_cancel([&calls] { ++calls; });
    token.cancel();
    token.cancel();
    EXPECT_EQ(calls, 1);

    bool late = false;
    token.on_cancel([&late] { late = true; });
    EXPECT_TRUE(late);
}

TEST_F(CancelTokenTest, WaitForWakesOnCancel) {
    CancelToken token;
    std::thread canceller([token]() mutable {
        std::this_thread::sleep_for(20ms);
        token.cancel();
    });

    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(token.wait_for(5s));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
    canceller.join();

    CancelToken idle;
    EXPECT_FALSE(idle.wait_for(5ms));
}

class CompletionSignalTest : public ::testing::Test {
protected:
    std::shared_ptr<CompletionSignal> signal = std::make_shared<CompletionSignal>();
    CancelToken token;
};

TEST_F(CompletionSignalTest, SetWakesWaiter) {
    std::thread worker([s = signal] { s->set(); });
    EXPECT_TRUE(signal->wait(token));
    EXPECT_TRUE(signal->is_set());
    worker.join();
}

TEST_F(CompletionSignalTest, CancelWakesWaiterWithoutSet) {
    std::thread canceller([t = token]() mutable { t.cancel(); });
    EXPECT_FALSE(signal->wait_until(token, Clock::now() + 30s));
    EXPECT_FALSE(signal->is_set());
    canceller.join();
}

TEST_F(CompletionSignalTest, DeadlineEndsWait) {
    EXPECT_FALSE(signal->wait_until(token, Clock::now() + 5ms));
    EXPECT_FALSE(token.cancelled());
}

TEST_F(CompletionSignalTest, SetBeforeWaitReturnsAtOnce) {
    signal->set();
    token.cancel();
    EXPECT_TRUE(signal->wait(token));
}

TEST_F(CompletionSignalTest, ScopeExitSetsOnThrow) {
    try {
        SignalOnExit guard(signal);
        throw std::runtime_error("task failed");
    } catch (const std::runtime_error&) {
    }
    EXPECT_TRUE(signal->is_set());
}

class ConcurrencyGateTest : public ::testing::Test {
protected:
    ConcurrencyGate gate{2};
    CancelToken token;
};

TEST_F(ConcurrencyGateTest, AcquiresUpToCapacity) {
    auto deadline = Clock::now() + 50ms;
    EXPECT_EQ(gate.acquire(token, deadline), AcquireStatus::Acquired);
    EXPECT_EQ(gate.acquire(token, deadline), AcquireStatus::Acquired);
    EXPECT_EQ(gate.in_use(), 2);
    EXPECT_EQ(gate.acquire(token, Clock::now() + 20ms), AcquireStatus::TimedOut);

    gate.release();
    EXPECT_EQ(gate.acquire(token, Clock::now() + 20ms), AcquireStatus::Acquired);
}

TEST_F(ConcurrencyGateTest, CancelledWaiterGivesUp) {
    GatePermit a(gate.acquire(token, Clock::now() + 1s) == AcquireStatus::Acquired ? &gate : nullptr);
    GatePermit b(gate.acquire(token, Clock::now() + 1s) == AcquireStatus::Acquired ? &gate : nullptr);

    CancelToken waiter;
    std::thread canceller([waiter]() mutable {
        std::this_thread::sleep_for(20ms);
        waiter.cancel();
    });
    EXPECT_EQ(gate.acquire(waiter, Clock::now() + 5s), AcquireStatus::Cancelled);
    canceller.join();
}

TEST_F(ConcurrencyGateTest, ReleaseWakesWaiter) {
    ASSERT_EQ(gate.acquire(token, Clock::now() + 1s), AcquireStatus::Acquired);
    ASSERT_EQ(gate.acquire(token, Clock::now() + 1s), AcquireStatus::Acquired);

    auto waiter = std::async(std::launch::async,
                             [this] { return gate.acquire(token, Clock::now() + 30s); });
    gate.release();
    ASSERT_EQ(waiter.wait_for(10s), std::future_status::ready);
    EXPECT_EQ(waiter.get(), AcquireStatus::Acquired);
    EXPECT_EQ(gate.in_use(), 2);
}

TEST_F(ConcurrencyGateTest, PermitReleasesOnScopeExit) {
    {
        ASSERT_EQ(gate.acquire(token, Clock::now() + 1s), AcquireStatus::Acquired);
        GatePermit permit(&gate);
        EXPECT_EQ(gate.in_use(), 1);

        GatePermit moved(std::move(permit));
        EXPECT_EQ(gate.in_use(), 1);
    }
    EXPECT_EQ(gate.in_use(), 0);
}

TEST_F(ConcurrencyGateTest, ZeroCapacityBecomesOne) {
    ConcurrencyGate single(0);
    EXPECT_EQ(single.capacity(), 1);
}

TEST(TaskRunnerTest, RunsTasksAndReturnsValues) {
    TaskRunner runner;
    auto a = runner.submit([] { return 21 * 2; });
    auto b = runner.submit([] { return std::string("done"); });
    EXPECT_EQ(a.get(), 42);
    EXPECT_EQ(b.get(), "done");
}

TEST(TaskRunnerTest, ExceptionsReachTheFuture) {
    TaskRunner runner;
    auto f = runner.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(f.get(), std::runtime_error);
}

TEST(TaskRunnerTest, JoinAllWaitsForAbandonedTasks) {
    std::atomic<int> finished{0};
    TaskRunner runner;
    for (int i = 0; i < 4; ++i) {
        runner.submit([&finished] {
            std::this_thread::sleep_for(10ms);
            finished.fetch_add(1);
        });
    }
    runner.join_all();
    EXPECT_EQ(finished.load(), 4);
    EXPECT_EQ(runner.active(), 0u);
}
