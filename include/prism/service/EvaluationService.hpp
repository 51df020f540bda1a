#pragma once

/**
 * @file EvaluationService.hpp
 * @brief Cached, timeout-bounded simulator evaluations
 *
 * EvaluateAsync() schedules onto the coordinator:
 *   cache lookup -> (miss) process run on a worker under a deadline
 *   -> metric extraction -> cache populate -> settle
 *
 * The blocking variants are for callers on ordinary threads; calling them on
 * the coordinator throws LifecycleError.
 */

#include <prism/cache/ResultCache.hpp>
#include <prism/core/Results.hpp>
#include <prism/exec/ProcessRunner.hpp>
#include <prism/io/Config.hpp>
#include <prism/io/ResultStore.hpp>
#include <prism/service/Executor.hpp>
#include <prism/service/ExperimentTracker.hpp>
#include <prism/service/Metrics.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace prism {

class EvaluationService {
  public:
    /// Cache identity operation name for cascade evaluations
    static constexpr const char *kCascadeOp = "cascade";

    EvaluationService(Executor &executor, std::shared_ptr<ProcessRunner> runner,
                      std::shared_ptr<ResultCache> cache, std::shared_ptr<Metrics> metrics,
                      std::shared_ptr<ExperimentTracker> tracker, TimeoutConfig timeouts);

    /**
     * @brief Evaluate a parameter set without blocking the caller
     *
     * The future fails with TimeoutError past the deadline (default: the
     * cascade timeout) and SimulationFailedError on non-zero exit.
     */
    [[nodiscard]] std::future<EvaluationResult>
    EvaluateAsync(const EvaluationParams &params,
                  std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// Blocking EvaluateAsync()
    EvaluationResult Evaluate(const EvaluationParams &params,
                              std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /**
     * @brief Run the simulator's characterize command
     *
     * Object outputs get run_id/timestamp filled in when absent.
     */
    nlohmann::json Characterize();

    /**
     * @brief Truth table for the given control powers
     *
     * When out_csv is empty a fresh file under the results directory is used.
     */
    TruthTableResult TruthTable(const std::vector<double> &ctrl,
                                const std::optional<std::string> &out_csv,
                                const ResultStore &store);

    /// `--help` under the health timeout; any failure is "unhealthy"
    HealthStatus Health();

    [[nodiscard]] const TimeoutConfig &timeouts() const { return timeouts_; }
    [[nodiscard]] ResultCache &cache() { return *cache_; }
    [[nodiscard]] Metrics &metrics() { return *metrics_; }
    [[nodiscard]] Executor &executor() { return executor_; }

    /// Build an EvaluationResult from captured output (exit code already checked)
    [[nodiscard]] static EvaluationResult BuildResult(const EvaluationParams &params,
                                                      const ProcessOutput &output,
                                                      double duration_s);

  private:
    /// Run arbitrary simulator arguments under a deadline and wait
    ProcessOutput RunBlocking(const std::vector<std::string> &args, const std::string &stage,
                              std::chrono::milliseconds timeout);

    void Track(const EvaluationResult &result);
    void ObserveThreads();

    Executor &executor_;
    std::shared_ptr<ProcessRunner> runner_;
    std::shared_ptr<ResultCache> cache_;
    std::shared_ptr<Metrics> metrics_;
    std::shared_ptr<ExperimentTracker> tracker_;
    TimeoutConfig timeouts_;
};

/**
 * @brief Read a CSV file with a header row into string maps
 *
 * Supports double-quoted fields with "" escapes. Short rows leave missing
 * columns out; extra cells are ignored.
 * @throws IOError if the file cannot be opened
 */
[[nodiscard]] std::vector<std::map<std::string, std::string>>
ReadCsvRows(const std::string &path);

} // namespace prism
