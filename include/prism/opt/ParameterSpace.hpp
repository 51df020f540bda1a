#pragma once

/**
 * @file ParameterSpace.hpp
 * @brief Ordered box bounds for the optimizer
 */

#include <prism/core/Error.hpp>
#include <prism/io/LogService.hpp>

#include <nlohmann/json.hpp>

#include <cmath>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace prism {

/// Dimensions spanning more than this ratio are searched on a log scale
inline constexpr double kLogScaleRatio = 50.0;

struct Dimension {
    std::string name;
    double low = 0.0;
    double high = 1.0;

    [[nodiscard]] bool LogScaled() const { return low > 0.0 && high / low > kLogScaleRatio; }

    /// Map u in [0, 1] onto [low, high] (log-uniform when LogScaled())
    [[nodiscard]] double FromUnit(double u) const {
        if (LogScaled()) {
            return std::exp(std::log(low) + u * (std::log(high) - std::log(low)));
        }
        return low + u * (high - low);
    }

    [[nodiscard]] double ToUnit(double x) const {
        if (LogScaled()) {
            return (std::log(x) - std::log(low)) / (std::log(high) - std::log(low));
        }
        return (x - low) / (high - low);
    }
};

class ParameterSpace {
  public:
    ParameterSpace() = default;
    explicit ParameterSpace(std::vector<Dimension> dims) : dims_(std::move(dims)) {}

    /// n2, a_eff, n_eff, g_geom, beta
    [[nodiscard]] static ParameterSpace Default() {
        return ParameterSpace({{"n2", 1e-18, 1e-16},
                               {"a_eff", 0.1e-12, 2e-12},
                               {"n_eff", 1.4, 3.5},
                               {"g_geom", 0.5, 1.0},
                               {"beta", 10.0, 100.0}});
    }

    /**
     * @brief Copy with bounds overridden by name
     *
     * @param bounds Object of name -> [low, high]; unknown names are ignored
     * @throws InvalidArgumentError if an entry is not a two-number array
     */
    [[nodiscard]] ParameterSpace WithBounds(const nlohmann::json &bounds) const {
        if (bounds.is_null()) {
            return *this;
        }
        if (!bounds.is_object()) {
            throw InvalidArgumentError("space_bounds", "expected an object of name -> [low, high]");
        }
        ParameterSpace out = *this;
        std::set<std::string> known;
        for (auto &d : out.dims_) {
            known.insert(d.name);
            auto it = bounds.find(d.name);
            if (it == bounds.end()) {
                continue;
            }
            if (!it->is_array() || it->size() != 2 || !(*it)[0].is_number() ||
                !(*it)[1].is_number()) {
                throw InvalidArgumentError("space_bounds." + d.name,
                                           "expected [low, high] numbers");
            }
            d.low = (*it)[0].get<double>();
            d.high = (*it)[1].get<double>();
        }
        for (const auto &item : bounds.items()) {
            if (known.count(item.key()) == 0) {
                GetLogService().Warning("Ignoring bounds for unknown dimension: " + item.key());
            }
        }
        return out;
    }

    /**
     * @throws InvalidArgumentError on an empty space, duplicate names,
     *         non-finite bounds or low >= high
     */
    void Validate() const {
        if (dims_.empty()) {
            throw InvalidArgumentError("space", "at least one dimension is required");
        }
        std::set<std::string> seen;
        for (const auto &d : dims_) {
            if (!seen.insert(d.name).second) {
                throw InvalidArgumentError("space", "duplicate dimension '" + d.name + "'");
            }
            if (!std::isfinite(d.low) || !std::isfinite(d.high) || !(d.low < d.high)) {
                throw InvalidArgumentError("space." + d.name, "bounds must satisfy low < high");
            }
        }
    }

    [[nodiscard]] std::size_t size() const { return dims_.size(); }
    [[nodiscard]] const std::vector<Dimension> &dims() const { return dims_; }
    [[nodiscard]] const Dimension &operator[](std::size_t i) const { return dims_[i]; }

    /// Named coordinates in declaration order
    [[nodiscard]] std::map<std::string, double> Name(const std::vector<double> &point) const {
        if (point.size() != dims_.size()) {
            throw InvalidArgumentError("point", "expected " + std::to_string(dims_.size()) +
                                                    " coordinates, got " +
                                                    std::to_string(point.size()));
        }
        std::map<std::string, double> named;
        for (std::size_t i = 0; i < dims_.size(); ++i) {
            named[dims_[i].name] = point[i];
        }
        return named;
    }

    [[nodiscard]] nlohmann::json ToJSON() const {
        nlohmann::json j = nlohmann::json::array();
        for (const auto &d : dims_) {
            j.push_back({{"name", d.name}, {"low", d.low}, {"high", d.high}});
        }
        return j;
    }

  private:
    std::vector<Dimension> dims_;
};

} // namespace prism
