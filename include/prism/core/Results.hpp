#pragma once

/**
 * @file Results.hpp
 * @brief Result types returned by the orchestrator operations
 *
 * Every type serializes to the JSON document the gateway returns and that is
 * persisted under the results directory.
 */

#include <prism/core/Error.hpp>
#include <prism/core/Params.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace prism {

/// Named float measurements (ber_estimate, logic_margin, power_mw, contrast_db, ...)
using MetricMap = std::map<std::string, double>;

// =============================================================================
// EvaluationResult
// =============================================================================

/**
 * @brief Outcome of one simulator evaluation (fresh or served from cache)
 */
struct EvaluationResult {
    std::string run_id;
    std::string timestamp;
    EvaluationParams params;
    nlohmann::json raw_output; ///< Parsed stdout, or {"raw": text}
    MetricMap metrics;
    double duration_s = 0.0;

    [[nodiscard]] nlohmann::json ToJSON() const {
        nlohmann::json j;
        j["run_id"] = run_id;
        j["timestamp"] = timestamp;
        j["params"] = params.ToJSON();
        j["raw_output"] = raw_output;
        j["metrics"] = metrics;
        j["duration_s"] = duration_s;
        return j;
    }

    /// Inverse of ToJSON(); used when reading cache entries
    [[nodiscard]] static EvaluationResult FromJSON(const nlohmann::json &j) {
        EvaluationResult r;
        r.run_id = j.at("run_id").get<std::string>();
        r.timestamp = j.at("timestamp").get<std::string>();
        r.params = EvaluationParams::FromJSON(j.at("params"));
        r.raw_output = j.at("raw_output");
        r.metrics = j.at("metrics").get<MetricMap>();
        r.duration_s = j.at("duration_s").get<double>();
        return r;
    }
};

// =============================================================================
// Sweep
// =============================================================================

/**
 * @brief One failed sweep entry
 */
struct SweepError {
    std::string message;
    ErrorKind kind = ErrorKind::Internal;
    std::size_t index = 0; ///< Position in the originating request
    nlohmann::json cause;  ///< The params (or raw config) that failed

    [[nodiscard]] nlohmann::json ToJSON() const {
        return {{"message", message},
                {"kind", ErrorKindName(kind)},
                {"index", index},
                {"cause", cause}};
    }
};

struct SweepResult {
    std::string run_id;
    std::string timestamp;
    std::vector<EvaluationResult> ok;
    std::vector<SweepError> errors;

    [[nodiscard]] std::size_t count_ok() const { return ok.size(); }
    [[nodiscard]] std::size_t count_error() const { return errors.size(); }

    [[nodiscard]] nlohmann::json ToJSON() const {
        nlohmann::json j;
        j["run_id"] = run_id;
        j["timestamp"] = timestamp;
        j["count_ok"] = count_ok();
        j["count_error"] = count_error();
        j["results"] = nlohmann::json::array();
        for (const auto &r : ok) {
            j["results"].push_back(r.ToJSON());
        }
        j["errors"] = nlohmann::json::array();
        for (const auto &e : errors) {
            j["errors"].push_back(e.ToJSON());
        }
        return j;
    }
};

// =============================================================================
// Truth table
// =============================================================================

struct TruthTableResult {
    std::string run_id;
    std::string timestamp;
    std::string path;
    std::vector<std::map<std::string, std::string>> rows;

    [[nodiscard]] nlohmann::json ToJSON() const {
        return {{"run_id", run_id}, {"timestamp", timestamp}, {"path", path}, {"rows", rows}};
    }
};

// =============================================================================
// Health / Schema
// =============================================================================

struct HealthStatus {
    bool healthy = false;
    std::string detail;

    [[nodiscard]] nlohmann::json ToJSON() const {
        return {{"status", healthy ? "healthy" : "unhealthy"}, {"detail", detail}};
    }
};

struct CapabilityDescriptor {
    std::vector<std::string> available_operations;
    std::string optimizer_strategy;
    std::string cache_backend;
    std::size_t worker_pool_size = 0;
    std::string metrics_backend;
    std::string tracking_backend;

    [[nodiscard]] nlohmann::json ToJSON() const {
        return {{"available_operations", available_operations},
                {"optimizer_strategy", optimizer_strategy},
                {"cache_backend", cache_backend},
                {"worker_pool_size", worker_pool_size},
                {"metrics_backend", metrics_backend},
                {"tracking_backend", tracking_backend}};
    }
};

} // namespace prism
