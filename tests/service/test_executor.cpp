/**
 * @file test_executor.cpp
 * @brief Tests for the coordinator/worker executor and its deadline primitive
 */

#include <prism/service/Executor.hpp>

#include <gtest/gtest.h>

#include <thread>

using namespace prism;
using namespace std::chrono_literals;

TEST(Executor, WorkerCountAndCoordinatorIdentity) {
    Executor executor(3);
    EXPECT_EQ(executor.worker_count(), 3u);
    EXPECT_FALSE(executor.OnCoordinatorThread());
    EXPECT_NO_THROW(executor.RequireOffCoordinator("test"));

    std::promise<bool> on_coordinator;
    executor.PostToCoordinator([&] { on_coordinator.set_value(executor.OnCoordinatorThread()); });
    EXPECT_TRUE(on_coordinator.get_future().get());
}

TEST(Executor, SubmitToWorkersReturnsValue) {
    Executor executor(2);
    auto f = executor.SubmitToWorkers<int>([] { return 6 * 7; });
    EXPECT_EQ(f.get(), 42);
}

TEST(Executor, SubmitToWorkersPropagatesException) {
    Executor executor(2);
    auto f = executor.SubmitToWorkers<int>([]() -> int { throw IOError("disk full"); });
    EXPECT_THROW(f.get(), IOError);
}

TEST(Executor, RunBoundedSettlesWithValue) {
    Executor executor(2);
    auto op = std::make_shared<PendingOperation<int>>();
    auto future = op->promise.get_future();
    std::atomic<int> successes{0};

    BoundedHooks<int> hooks;
    hooks.on_success = [&](const int &) { ++successes; };
    executor.PostToCoordinator([&, op] {
        executor.RunBounded<int>(op, "quick", 1s, [] { return 7; }, hooks);
    });
    EXPECT_EQ(future.get(), 7);
    EXPECT_EQ(successes.load(), 1);
}

TEST(Executor, RunBoundedTimesOut) {
    Executor executor(2);
    auto op = std::make_shared<PendingOperation<int>>();
    auto future = op->promise.get_future();
    std::atomic<int> failures{0};
    std::atomic<int> successes{0};

    BoundedHooks<int> hooks;
    hooks.on_success = [&](const int &) { ++successes; };
    hooks.on_failure = [&](const std::exception_ptr &) { ++failures; };
    executor.PostToCoordinator([&, op] {
        executor.RunBounded<int>(op, "slow", 50ms,
                                 [] {
                                     std::this_thread::sleep_for(300ms);
                                     return 1;
                                 },
                                 hooks);
    });
    EXPECT_THROW(future.get(), TimeoutError);
    executor.Shutdown(); // waits for the late worker

    EXPECT_EQ(failures.load(), 1);
    EXPECT_EQ(successes.load(), 0);
}

TEST(Executor, RunBoundedPropagatesWorkerError) {
    Executor executor(2);
    auto op = std::make_shared<PendingOperation<int>>();
    auto future = op->promise.get_future();
    executor.PostToCoordinator([&, op] {
        executor.RunBounded<int>(op, "broken", 1s,
                                 []() -> int { throw SimulationFailedError("x", 1, "boom"); });
    });
    EXPECT_THROW(future.get(), SimulationFailedError);
}

TEST(Executor, PendingOperationSettlesOnce) {
    PendingOperation<int> op;
    auto future = op.promise.get_future();
    EXPECT_TRUE(op.TrySettle(1));
    EXPECT_FALSE(op.TrySettle(2));
    EXPECT_FALSE(op.TryFail(std::make_exception_ptr(IOError("late"))));
    EXPECT_EQ(future.get(), 1);
}

TEST(Executor, ShutdownIsIdempotent) {
    Executor executor(2);
    executor.Shutdown();
    EXPECT_NO_THROW(executor.Shutdown());
}
