#pragma once

/**
 * @file SearchStrategy.hpp
 * @brief Pluggable sequential minimizers and point samplers
 */

#include <prism/opt/ObjectiveEvaluator.hpp>
#include <prism/opt/ParameterSpace.hpp>

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace prism {

/**
 * @brief Sequential minimizer driving a blocking objective
 *
 * Minimize() calls the objective exactly n_calls times.
 */
class SearchStrategy {
  public:
    virtual ~SearchStrategy() = default;

    virtual void Minimize(ObjectiveEvaluator &objective, const ParameterSpace &space,
                          std::size_t n_calls, std::size_t random_starts) = 0;

    [[nodiscard]] virtual std::string Name() const = 0;
};

/**
 * @brief Independent draws: log-uniform on LogScaled() dimensions, else uniform
 */
class RandomSampler {
  public:
    explicit RandomSampler(std::optional<uint64_t> seed = std::nullopt)
        : rng_(seed ? *seed : std::random_device{}()) {}

    [[nodiscard]] std::vector<double> Sample(const ParameterSpace &space) {
        std::uniform_real_distribution<double> unit(0.0, 1.0);
        std::vector<double> point;
        point.reserve(space.size());
        for (const auto &d : space.dims()) {
            point.push_back(d.FromUnit(unit(rng_)));
        }
        return point;
    }

  private:
    std::mt19937_64 rng_;
};

} // namespace prism
