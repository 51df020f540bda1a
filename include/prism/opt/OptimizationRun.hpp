#pragma once

/**
 * @file OptimizationRun.hpp
 * @brief Per-run optimizer state: capped trace and best point
 *
 * One run owns its state exclusively. Record() is the single mutation
 * point; callers serialize access to it.
 */

#include <prism/core/Error.hpp>
#include <prism/core/Results.hpp>
#include <prism/opt/ParameterSpace.hpp>

#include <nlohmann/json.hpp>

#include <deque>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace prism {

using NamedPoint = std::map<std::string, double>;

/**
 * @brief One evaluated point (successful or failed)
 */
struct EvaluationRecord {
    NamedPoint params;
    double objective = std::numeric_limits<double>::infinity();
    MetricMap metrics;
    std::optional<EvaluationResult> result;
    std::optional<FailureInfo> error;
    double best_objective = std::numeric_limits<double>::infinity(); ///< Running best after this record

    [[nodiscard]] nlohmann::json ToJSON() const {
        nlohmann::json j;
        j["params"] = params;
        j["objective"] = objective; // +inf serializes as null
        j["metrics"] = metrics;
        j["best_objective"] = best_objective;
        if (result) {
            j["result"] = result->ToJSON();
        } else {
            j["result"] = nullptr;
        }
        if (error) {
            j["error"] = {{"kind", ErrorKindName(error->kind)}, {"message", error->message}};
        }
        return j;
    }
};

/**
 * @brief Bounded trace: past kCapacity records, keep the newest kRetain
 */
class TraceBuffer {
  public:
    static constexpr std::size_t kCapacity = 500;
    static constexpr std::size_t kRetain = 400;

    void Append(EvaluationRecord record) {
        records_.push_back(std::move(record));
        ++total_;
        if (records_.size() > kCapacity) {
            records_.erase(records_.begin(),
                           records_.begin() + static_cast<std::ptrdiff_t>(records_.size() - kRetain));
        }
    }

    [[nodiscard]] std::size_t size() const { return records_.size(); }

    /// Every record ever appended, including trimmed ones
    [[nodiscard]] std::size_t total() const { return total_; }

    [[nodiscard]] const std::deque<EvaluationRecord> &records() const { return records_; }

    /// Newest `n` records, oldest first
    [[nodiscard]] nlohmann::json TailJSON(std::size_t n) const {
        nlohmann::json j = nlohmann::json::array();
        std::size_t start = records_.size() > n ? records_.size() - n : 0;
        for (std::size_t i = start; i < records_.size(); ++i) {
            j.push_back(records_[i].ToJSON());
        }
        return j;
    }

  private:
    std::deque<EvaluationRecord> records_;
    std::size_t total_ = 0;
};

struct BestPoint {
    double objective = std::numeric_limits<double>::infinity();
    std::optional<NamedPoint> params;
    std::optional<EvaluationResult> result;

    [[nodiscard]] nlohmann::json ToJSON() const {
        nlohmann::json j;
        j["objective"] = objective;
        j["params"] = params ? nlohmann::json(*params) : nlohmann::json(nullptr);
        j["result"] = result ? result->ToJSON() : nlohmann::json(nullptr);
        return j;
    }
};

struct OptimizationRun {
    /// Records returned to the caller; the full trace goes to the run file
    static constexpr std::size_t kPayloadTrace = 200;

    std::string run_id;
    std::string timestamp;
    std::string strategy;
    ParameterSpace space;
    nlohmann::json fixed_params = nlohmann::json::object();
    BestPoint best;
    TraceBuffer trace;

    /**
     * @brief Append a record and update best (strict less-than: ties keep the earlier)
     */
    void Record(EvaluationRecord record) {
        if (record.objective < best.objective) {
            best.objective = record.objective;
            best.params = record.params;
            best.result = record.result;
        }
        record.best_objective = best.objective;
        trace.Append(std::move(record));
    }

    /// Caller-facing payload (trace truncated to kPayloadTrace)
    [[nodiscard]] nlohmann::json ToJSON() const {
        nlohmann::json j;
        j["run_id"] = run_id;
        j["timestamp"] = timestamp;
        j["strategy"] = strategy;
        j["space"] = space.ToJSON();
        j["fixed_params"] = fixed_params;
        j["best"] = best.ToJSON();
        j["trace_count"] = trace.total();
        j["trace"] = trace.TailJSON(kPayloadTrace);
        return j;
    }

    /// Persisted document: payload plus every retained record
    [[nodiscard]] nlohmann::json ToArchiveJSON() const {
        return {{"payload", ToJSON()}, {"trace_full", trace.TailJSON(trace.size())}};
    }
};

} // namespace prism
