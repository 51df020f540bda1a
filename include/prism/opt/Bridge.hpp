#pragma once

/**
 * @file Bridge.hpp
 * @brief Blocking objective backed by the asynchronous evaluation service
 *
 * The search loop runs on a worker thread and calls Evaluate(). Each call
 * names the coordinates, schedules the evaluation on the coordinator and
 * waits on the future with the objective deadline. Failures and timeouts
 * return +inf and are recorded; nothing is thrown back into the search.
 */

#include <prism/opt/ObjectiveEvaluator.hpp>
#include <prism/opt/OptimizationRun.hpp>
#include <prism/service/EvaluationService.hpp>

#include <chrono>
#include <functional>
#include <future>
#include <mutex>

namespace prism {

/// Builds the full parameter set for a named point
using ParamsFactory = std::function<EvaluationParams(const NamedPoint &)>;

/**
 * @brief Wait for one scheduled evaluation and fill in its record
 *
 * Never throws: a failure or a missed deadline yields an +inf objective
 * with the classified error attached.
 */
inline void AwaitEvaluation(EvaluationService &service, std::future<EvaluationResult> &future,
                            EvaluationRecord &record, double margin_weight,
                            std::chrono::milliseconds timeout) {
    try {
        if (future.wait_for(timeout) != std::future_status::ready) {
            throw TimeoutError("objective", timeout);
        }
        auto result = future.get();
        record.metrics = result.metrics;
        record.objective = ComputeObjective(result.metrics, margin_weight);
        record.result = std::move(result);
        service.metrics().Observe(metric_names::kObjective, record.objective);
    } catch (const std::exception &) {
        record.error = DescribeFailure(std::current_exception());
        record.objective = kFailedObjective;
        GetLogService().Error("Objective evaluation failed: " + record.error->message);
    }
    service.metrics().Set(metric_names::kThreads,
                          static_cast<double>(service.executor().ActiveWorkers()));
}

class BridgedObjective : public ObjectiveEvaluator {
  public:
    BridgedObjective(EvaluationService &service, OptimizationRun &run, ParamsFactory factory,
                     double margin_weight, std::chrono::milliseconds timeout)
        : service_(service), run_(run), factory_(std::move(factory)),
          margin_weight_(margin_weight), timeout_(timeout) {}

    double Evaluate(const std::vector<double> &point) override {
        EvaluationRecord record;
        std::future<EvaluationResult> future;
        try {
            record.params = run_.space.Name(point);
            future = service_.EvaluateAsync(factory_(record.params), timeout_);
        } catch (const std::exception &) {
            record.error = DescribeFailure(std::current_exception());
            record.objective = kFailedObjective;
            GetLogService().Error("Objective evaluation failed: " + record.error->message);
        }
        if (future.valid()) {
            AwaitEvaluation(service_, future, record, margin_weight_, timeout_);
        }

        const double objective = record.objective;
        std::lock_guard<std::mutex> lock(mutex_);
        run_.Record(std::move(record));
        return objective;
    }

  private:
    EvaluationService &service_;
    OptimizationRun &run_;
    ParamsFactory factory_;
    double margin_weight_;
    std::chrono::milliseconds timeout_;
    std::mutex mutex_;
};

} // namespace prism
