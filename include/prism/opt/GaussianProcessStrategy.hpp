#pragma once

/**
 * @file GaussianProcessStrategy.hpp
 * @brief Model-based sequential search (GP surrogate + expected improvement)
 *
 * Works in the unit cube (log-warped on LogScaled() dimensions):
 * 1. random_starts Latin-hypercube points
 * 2. then, per call: fit a zero-mean GP with an RBF kernel on standardized
 *    objectives (length scale picked by marginal likelihood) and evaluate
 *    the candidate with the highest expected improvement
 *
 * Non-finite objectives (failed evaluations) are replaced by the worst
 * finite value plus one before fitting.
 */

#include <prism/opt/SearchStrategy.hpp>

#include <Eigen/Dense>

#include <cstdint>
#include <optional>
#include <random>
#include <vector>

namespace prism {

struct GaussianProcessOptions {
    std::optional<uint64_t> seed;
    std::size_t acquisition_samples = 2000;
    double xi = 0.01;   ///< Exploration margin in standardized units
    double noise = 1e-6; ///< Diagonal jitter
};

class GaussianProcessStrategy : public SearchStrategy {
  public:
    explicit GaussianProcessStrategy(GaussianProcessOptions options = {});

    void Minimize(ObjectiveEvaluator &objective, const ParameterSpace &space,
                  std::size_t n_calls, std::size_t random_starts) override;

    [[nodiscard]] std::string Name() const override { return "gp"; }

    // Exposed for tests

    /// n stratified points in [0, 1]^d
    [[nodiscard]] Eigen::MatrixXd LatinHypercube(std::size_t n, std::size_t d);

    /// Objectives with non-finite entries replaced (see file comment)
    [[nodiscard]] static Eigen::VectorXd Sanitize(const std::vector<double> &y);

    /// EI for minimization given posterior mean/stddev and incumbent
    [[nodiscard]] static double ExpectedImprovement(double mu, double sigma, double best,
                                                    double xi);

  private:
    struct Posterior;

    /// Next unit-cube point to evaluate
    [[nodiscard]] Eigen::VectorXd Propose(const Eigen::MatrixXd &X, const Eigen::VectorXd &y);

    GaussianProcessOptions options_;
    std::mt19937_64 rng_;
};

} // namespace prism
