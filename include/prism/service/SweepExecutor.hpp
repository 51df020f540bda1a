#pragma once

/**
 * @file SweepExecutor.hpp
 * @brief Concurrent batch of independent evaluations
 *
 * Every request is issued before any result is awaited; nothing is cancelled
 * when an item fails. Each input index lands in exactly one of ok/errors, in
 * input order within each list.
 */

#include <prism/core/Results.hpp>
#include <prism/io/ResultStore.hpp>
#include <prism/service/EvaluationService.hpp>

#include <nlohmann/json.hpp>

#include <vector>

namespace prism {

class SweepExecutor {
  public:
    /// @param store Where `sweep_<run_id>.json` is written (nullptr: not persisted)
    SweepExecutor(EvaluationService &service, const ResultStore *store)
        : service_(service), store_(store) {}

    /// Sweep over already-validated parameter sets
    SweepResult Run(const std::vector<EvaluationParams> &requests);

    /**
     * @brief Sweep over raw JSON configs
     *
     * Configs that fail validation become InvalidArgument error records at
     * their index; the rest are evaluated.
     */
    SweepResult Run(const nlohmann::json &configs);

  private:
    SweepResult Execute(const std::vector<std::optional<EvaluationParams>> &params,
                        std::vector<SweepError> rejected, const nlohmann::json &causes);

    EvaluationService &service_;
    const ResultStore *store_;
};

} // namespace prism
