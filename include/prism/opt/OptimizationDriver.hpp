#pragma once

/**
 * @file OptimizationDriver.hpp
 * @brief Bounded search minimizing ber_estimate - weight * logic_margin
 *
 * Strategies:
 * - "gp": GaussianProcessStrategy runs on a worker thread and evaluates
 *   through BridgedObjective (one point at a time)
 * - "random": batches of independent draws evaluated concurrently through
 *   EvaluateAsync; records are applied in draw order on the calling thread
 *
 * A driver runs one search at a time; concurrent runs need separate drivers.
 */

#include <prism/io/Config.hpp>
#include <prism/io/ResultStore.hpp>
#include <prism/opt/OptimizationRun.hpp>
#include <prism/opt/ParameterSpace.hpp>
#include <prism/service/EvaluationService.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>

namespace prism {

/**
 * @brief Arguments of one optimization run
 */
struct OptimizationRequest {
    std::size_t n_calls = 40;
    Threshold threshold = Threshold::Soft;
    XpmMode mode = XpmMode::Physics;
    nlohmann::json space_bounds;                              ///< name -> [low, high]
    nlohmann::json fixed_params = nlohmann::json::object(); ///< Applied to every point
    double objective_margin_weight = 0.1;
    std::size_t random_starts = 8;

    /**
     * @brief Parse the bo_run argument object
     * @throws InvalidArgumentError on unknown keys or bad types
     */
    [[nodiscard]] static OptimizationRequest FromJSON(const nlohmann::json &j);
};

class OptimizationDriver {
  public:
    OptimizationDriver(EvaluationService &service, OptimizerConfig config,
                       std::chrono::milliseconds objective_timeout, const ResultStore *store);

    /**
     * @brief Run a search to completion
     *
     * Per-point failures become +inf records. Throws only for programmer
     * errors: zero n_calls, malformed space, invalid fixed parameters,
     * concurrent use of the same driver, or calling from the coordinator.
     */
    OptimizationRun Run(const OptimizationRequest &request);

    /// Parameters of one point: fixed values overlaid with the named coordinates
    [[nodiscard]] static EvaluationParams BuildParams(const nlohmann::json &fixed,
                                                      const NamedPoint &point);

  private:
    void RunModelBased(OptimizationRun &run, const OptimizationRequest &request,
                       const nlohmann::json &fixed, double margin_weight);
    void RunRandom(OptimizationRun &run, const OptimizationRequest &request,
                   const nlohmann::json &fixed, double margin_weight);

    EvaluationService &service_;
    OptimizerConfig config_;
    std::chrono::milliseconds objective_timeout_;
    const ResultStore *store_;
    std::atomic<bool> running_{false};
};

} // namespace prism
