#pragma once

/**
 * @file ExperimentTracker.hpp
 * @brief Optional experiment-tracking side channel
 *
 * Each successful evaluation (fresh or cached) is mirrored as a run with
 * scalar parameters and finite metrics. Tracking failures are logged by the
 * caller and never reach the evaluation's caller.
 */

#include <prism/core/CoreTypes.hpp>
#include <prism/core/Error.hpp>
#include <prism/core/Results.hpp>

#include <nlohmann/json.hpp>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

namespace prism {

class ExperimentTracker {
  public:
    virtual ~ExperimentTracker() = default;

    /**
     * @brief Record one run
     * @throws Error on backend failure (callers contain it)
     */
    virtual void LogRun(const std::string &run_id, const nlohmann::json &params,
                        const MetricMap &metrics) = 0;

    [[nodiscard]] virtual std::string Name() const = 0;

    /// Only scalar parameter values are loggable
    [[nodiscard]] static nlohmann::json LoggableParams(const nlohmann::json &params) {
        nlohmann::json out = nlohmann::json::object();
        if (!params.is_object()) {
            return out;
        }
        for (const auto &item : params.items()) {
            const auto &v = item.value();
            if (v.is_number() || v.is_string() || v.is_boolean()) {
                out[item.key()] = v;
            }
        }
        return out;
    }

    [[nodiscard]] static MetricMap FiniteMetrics(const MetricMap &metrics) {
        MetricMap out;
        for (const auto &[name, value] : metrics) {
            if (std::isfinite(value)) {
                out[name] = value;
            }
        }
        return out;
    }
};

class NullTracker : public ExperimentTracker {
  public:
    void LogRun(const std::string &, const nlohmann::json &, const MetricMap &) override {}
    [[nodiscard]] std::string Name() const override { return "none"; }
};

/**
 * @brief Appends one JSON object per run to `<directory>/runs.jsonl`
 */
class JsonlTracker : public ExperimentTracker {
  public:
    explicit JsonlTracker(std::string directory) : directory_(std::move(directory)) {}

    void LogRun(const std::string &run_id, const nlohmann::json &params,
                const MetricMap &metrics) override {
        nlohmann::json line;
        line["run_id"] = run_id;
        line["timestamp"] = UtcTimestamp();
        line["params"] = LoggableParams(params);
        line["metrics"] = FiniteMetrics(metrics);

        std::lock_guard<std::mutex> lock(mutex_);
        std::error_code ec;
        std::filesystem::create_directories(directory_, ec);
        if (ec) {
            throw IOError("mkdir", directory_, ec.message());
        }
        std::ofstream out(path(), std::ios::app);
        if (!out) {
            throw IOError("open", path(), "cannot append");
        }
        out << line.dump() << "\n";
    }

    [[nodiscard]] std::string Name() const override { return "jsonl"; }

    [[nodiscard]] std::string path() const {
        return (std::filesystem::path(directory_) / "runs.jsonl").string();
    }

  private:
    std::string directory_;
    std::mutex mutex_;
};

} // namespace prism
