#pragma once

/**
 * @file Executor.hpp
 * @brief Coordinator context plus worker pool
 *
 * Two execution domains:
 * - one coordinator thread running a boost::asio::io_context; it owns cache
 *   access, deadline timers and result hand-off
 * - a boost::asio::thread_pool hosting blocking work (subprocess waits and
 *   the model-based optimizer loop)
 *
 * RunBounded() is the single deadline primitive: the work runs on a worker,
 * a steady_timer on the coordinator races it, and whichever finishes first
 * settles the shared PendingOperation. The loser is discarded. Work whose
 * operation already expired while queued is never started. Hooks run on the
 * coordinator before the operation settles.
 */

#include <prism/core/Error.hpp>
#include <prism/io/LogService.hpp>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <thread>

namespace prism {

/**
 * @brief Shared state of one deadline-bounded operation
 *
 * Settled exactly once, by the worker result or by the deadline.
 */
template <typename T> struct PendingOperation {
    std::promise<T> promise;
    std::atomic<bool> settled{false};

    bool TrySettle(T value) {
        if (settled.exchange(true)) {
            return false;
        }
        promise.set_value(std::move(value));
        return true;
    }

    bool TryFail(std::exception_ptr error) {
        if (settled.exchange(true)) {
            return false;
        }
        promise.set_exception(std::move(error));
        return true;
    }
};

/**
 * @brief Callbacks run on the coordinator around a bounded operation
 */
template <typename T> struct BoundedHooks {
    /// Called before the value settles the operation (skipped for late results)
    std::function<void(const T &)> on_success;
    /// Called for worker failures and deadline expiry that settle the operation
    std::function<void(const std::exception_ptr &)> on_failure;
};

class Executor {
  public:
    /// @param worker_threads Pool size (callers resolve defaults via ExecutorConfig)
    explicit Executor(std::size_t worker_threads);
    ~Executor();

    Executor(const Executor &) = delete;
    Executor &operator=(const Executor &) = delete;

    [[nodiscard]] boost::asio::io_context &coordinator() { return io_; }

    [[nodiscard]] std::size_t worker_count() const { return worker_count_; }

    /// Workers currently running a task
    [[nodiscard]] std::size_t ActiveWorkers() const { return active_workers_.load(); }

    [[nodiscard]] bool OnCoordinatorThread() const {
        return std::this_thread::get_id() == coordinator_id_.load();
    }

    /// Throws LifecycleError when called on the coordinator thread
    void RequireOffCoordinator(const std::string &operation) const {
        if (OnCoordinatorThread()) {
            throw LifecycleError(operation + " would block the coordinator thread");
        }
    }

    template <typename F> void PostToCoordinator(F &&fn) {
        boost::asio::post(io_, std::forward<F>(fn));
    }

    template <typename F> void PostToWorkers(F &&fn) {
        boost::asio::post(pool_, [this, fn = std::forward<F>(fn)]() mutable {
            ActiveScope scope(active_workers_);
            fn();
        });
    }

    /**
     * @brief Run blocking work on a worker; its future carries the result
     */
    template <typename T> std::future<T> SubmitToWorkers(std::function<T()> work) {
        auto task = std::make_shared<std::packaged_task<T()>>(std::move(work));
        auto future = task->get_future();
        PostToWorkers([task] { (*task)(); });
        return future;
    }

    /**
     * @brief Race blocking work against a deadline
     *
     * Must be called on the coordinator thread. The operation is settled with
     * the work's value, its exception, or TimeoutError(stage, timeout).
     */
    template <typename T>
    void RunBounded(std::shared_ptr<PendingOperation<T>> op, const std::string &stage,
                    std::chrono::milliseconds timeout, std::function<T()> work,
                    BoundedHooks<T> hooks = {}) {
        auto timer = std::make_shared<boost::asio::steady_timer>(io_, timeout);
        auto shared_hooks = std::make_shared<BoundedHooks<T>>(std::move(hooks));

        timer->async_wait([op, stage, timeout, shared_hooks](const boost::system::error_code &ec) {
            if (ec || op->settled.load()) {
                return; // cancelled: the work finished first
            }
            auto error = std::make_exception_ptr(TimeoutError(stage, timeout));
            if (shared_hooks->on_failure) {
                shared_hooks->on_failure(error);
            }
            op->TryFail(error);
        });

        PostToWorkers([this, op, stage, timer, shared_hooks, work = std::move(work)] {
            if (op->settled.load()) {
                GetLogService().Debug("Skipping " + stage + ": settled before it started");
                return;
            }
            try {
                T value = work();
                PostToCoordinator([op, stage, timer, shared_hooks, value = std::move(value)] {
                    timer->cancel();
                    if (op->settled.load()) {
                        GetLogService().Warning("Discarding late result for " + stage);
                        return;
                    }
                    if (shared_hooks->on_success) {
                        shared_hooks->on_success(value);
                    }
                    op->TrySettle(value);
                });
            } catch (const std::exception &) {
                auto error = std::current_exception();
                PostToCoordinator([op, stage, timer, shared_hooks, error] {
                    timer->cancel();
                    if (op->settled.load()) {
                        GetLogService().Debug("Discarding late failure for " + stage);
                        return;
                    }
                    if (shared_hooks->on_failure) {
                        shared_hooks->on_failure(error);
                    }
                    op->TryFail(error);
                });
            }
        });
    }

    /**
     * @brief Stop accepting work and join all threads
     *
     * Waits for running worker tasks. Idempotent.
     */
    void Shutdown();

  private:
    /// Counts a worker as busy for the lifetime of the scope
    class ActiveScope {
      public:
        explicit ActiveScope(std::atomic<std::size_t> &counter) : counter_(counter) { ++counter_; }
        ~ActiveScope() { --counter_; }
        ActiveScope(const ActiveScope &) = delete;
        ActiveScope &operator=(const ActiveScope &) = delete;

      private:
        std::atomic<std::size_t> &counter_;
    };

    std::size_t worker_count_;
    boost::asio::io_context io_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> guard_;
    boost::asio::thread_pool pool_;
    std::thread coordinator_;
    std::atomic<std::thread::id> coordinator_id_;
    std::atomic<std::size_t> active_workers_{0};
    std::atomic<bool> stopped_{false};
};

} // namespace prism
