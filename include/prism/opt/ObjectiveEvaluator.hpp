#pragma once

/**
 * @file ObjectiveEvaluator.hpp
 * @brief Synchronous objective seen by search strategies
 */

#include <prism/core/Results.hpp>

#include <limits>
#include <vector>

namespace prism {

/**
 * @brief Plain blocking objective f(point) -> value, lower is better
 *
 * Implementations must not throw: failures are reported as +inf.
 */
class ObjectiveEvaluator {
  public:
    virtual ~ObjectiveEvaluator() = default;

    /// @param point Coordinates in ParameterSpace declaration order
    virtual double Evaluate(const std::vector<double> &point) = 0;
};

/**
 * @brief objective = ber_estimate - weight * logic_margin
 *
 * Missing metrics make the point unattractive: ber defaults to 1.0 (worst
 * case), margin to 0.0.
 */
[[nodiscard]] inline double ComputeObjective(const MetricMap &metrics, double margin_weight) {
    auto ber_it = metrics.find("ber_estimate");
    auto margin_it = metrics.find("logic_margin");
    const double ber = ber_it != metrics.end() ? ber_it->second : 1.0;
    const double margin = margin_it != metrics.end() ? margin_it->second : 0.0;
    return ber - margin_weight * margin;
}

inline constexpr double kFailedObjective = std::numeric_limits<double>::infinity();

} // namespace prism
