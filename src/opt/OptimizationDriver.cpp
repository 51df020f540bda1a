#include <prism/core/CoreTypes.hpp>
#include <prism/opt/Bridge.hpp>
#include <prism/opt/GaussianProcessStrategy.hpp>
#include <prism/opt/OptimizationDriver.hpp>
#include <prism/opt/SearchStrategy.hpp>

#include <algorithm>
#include <set>

namespace prism {

namespace {

constexpr const char *kWeightKey = "objective_margin_weight";

std::size_t RequireCount(const nlohmann::json &j, const char *key) {
    const auto &v = j.at(key);
    if (!v.is_number_integer() || v.get<int64_t>() < 0) {
        throw InvalidArgumentError(key, "expected a non-negative integer");
    }
    return v.get<std::size_t>();
}

/// Clears running_ when the run ends
class RunGuard {
  public:
    explicit RunGuard(std::atomic<bool> &flag) : flag_(flag) {
        if (flag_.exchange(true)) {
            throw LifecycleError("optimization driver is already running a search");
        }
    }
    ~RunGuard() { flag_.store(false); }
    RunGuard(const RunGuard &) = delete;
    RunGuard &operator=(const RunGuard &) = delete;

  private:
    std::atomic<bool> &flag_;
};

} // namespace

// =============================================================================
// OptimizationRequest
// =============================================================================

OptimizationRequest OptimizationRequest::FromJSON(const nlohmann::json &j) {
    OptimizationRequest req;
    if (j.is_null()) {
        return req;
    }
    if (!j.is_object()) {
        throw InvalidArgumentError("bo_run", "expected a JSON object");
    }
    static const std::set<std::string> known = {
        "n_calls",      "threshold", "mode",          "xpm_mode",
        "space_bounds", "fixed_params", kWeightKey, "random_starts"};
    for (const auto &item : j.items()) {
        if (known.count(item.key()) == 0) {
            throw InvalidArgumentError(item.key(), "unknown parameter");
        }
    }

    if (j.contains("n_calls")) {
        req.n_calls = RequireCount(j, "n_calls");
    }
    if (j.contains("random_starts")) {
        req.random_starts = RequireCount(j, "random_starts");
    }
    if (j.contains("threshold")) {
        if (!j["threshold"].is_string()) {
            throw InvalidArgumentError("threshold", "expected a string");
        }
        req.threshold = ParseThreshold(j["threshold"].get<std::string>());
    }
    const char *mode_key = j.contains("mode") ? "mode" : "xpm_mode";
    if (j.contains(mode_key)) {
        if (!j[mode_key].is_string()) {
            throw InvalidArgumentError(mode_key, "expected a string");
        }
        req.mode = ParseXpmMode(j[mode_key].get<std::string>());
    }
    if (j.contains("space_bounds")) {
        req.space_bounds = j["space_bounds"];
    }
    if (j.contains("fixed_params") && !j["fixed_params"].is_null()) {
        if (!j["fixed_params"].is_object()) {
            throw InvalidArgumentError("fixed_params", "expected an object");
        }
        req.fixed_params = j["fixed_params"];
    }
    if (j.contains(kWeightKey)) {
        if (!j[kWeightKey].is_number()) {
            throw InvalidArgumentError(kWeightKey, "expected a number");
        }
        req.objective_margin_weight = j[kWeightKey].get<double>();
    }
    return req;
}

// =============================================================================
// OptimizationDriver
// =============================================================================

OptimizationDriver::OptimizationDriver(EvaluationService &service, OptimizerConfig config,
                                       std::chrono::milliseconds objective_timeout,
                                       const ResultStore *store)
    : service_(service), config_(std::move(config)), objective_timeout_(objective_timeout),
      store_(store) {}

EvaluationParams OptimizationDriver::BuildParams(const nlohmann::json &fixed,
                                                 const NamedPoint &point) {
    nlohmann::json j = fixed.is_object() ? fixed : nlohmann::json::object();
    for (const auto &[name, value] : point) {
        j[name] = value;
    }
    return EvaluationParams::FromJSON(j);
}

OptimizationRun OptimizationDriver::Run(const OptimizationRequest &request) {
    service_.executor().RequireOffCoordinator("Optimization");
    RunGuard guard(running_);

    if (request.n_calls == 0) {
        throw InvalidArgumentError("n_calls", "must be > 0");
    }

    OptimizationRun run;
    run.run_id = NewRunId();
    run.timestamp = UtcTimestamp();
    run.strategy = config_.strategy;
    run.space = ParameterSpace::Default().WithBounds(request.space_bounds);
    run.space.Validate();

    // Reported fixed parameters include the run-level choices
    nlohmann::json fixed = request.fixed_params;
    if (!fixed.contains("threshold")) {
        fixed["threshold"] = ToString(request.threshold);
    }
    if (!fixed.contains("mode") && !fixed.contains("xpm_mode")) {
        fixed["mode"] = ToString(request.mode);
    }
    if (!fixed.contains(kWeightKey)) {
        fixed[kWeightKey] = request.objective_margin_weight;
    }
    if (!fixed[kWeightKey].is_number()) {
        throw InvalidArgumentError(std::string("fixed_params.") + kWeightKey, "expected a number");
    }
    const double weight = fixed[kWeightKey].get<double>();
    run.fixed_params = fixed;

    nlohmann::json eval_fixed = fixed;
    eval_fixed.erase(kWeightKey);

    // Reject bad fixed parameters up front rather than failing every point
    NamedPoint midpoint;
    for (const auto &d : run.space.dims()) {
        midpoint[d.name] = d.FromUnit(0.5);
    }
    (void)BuildParams(eval_fixed, midpoint);

    LogContextManager::ScopedContext ctx("optimizer", run.run_id);
    GetLogService().Info("Optimization " + run.run_id + ": " + std::to_string(request.n_calls) +
                         " calls, strategy " + run.strategy);

    if (config_.strategy == "random") {
        RunRandom(run, request, eval_fixed, weight);
    } else {
        RunModelBased(run, request, eval_fixed, weight);
    }

    GetLogService().Info("Optimization " + run.run_id + " done: best objective " +
                         FormatNumber(run.best.objective) + " after " +
                         std::to_string(run.trace.total()) + " evaluations");

    if (store_ != nullptr) {
        try {
            store_->Write("bo_run", run.run_id, run.ToArchiveJSON());
        } catch (const IOError &e) {
            GetLogService().Error(std::string("Optimization run not persisted: ") + e.what());
        }
    }
    return run;
}

void OptimizationDriver::RunModelBased(OptimizationRun &run, const OptimizationRequest &request,
                                       const nlohmann::json &fixed, double margin_weight) {
    GaussianProcessOptions options;
    options.seed = config_.seed;
    options.acquisition_samples = config_.acquisition_samples;
    options.xi = config_.xi;
    GaussianProcessStrategy strategy(options);

    BridgedObjective objective(
        service_, run, [fixed](const NamedPoint &point) { return BuildParams(fixed, point); },
        margin_weight, objective_timeout_);

    // The search blocks between evaluations, so it lives on a worker
    const auto run_id = run.run_id;
    auto done = service_.executor().SubmitToWorkers<void>([&] {
        LogContextManager::ScopedContext ctx("optimizer", run_id);
        strategy.Minimize(objective, run.space, request.n_calls, request.random_starts);
    });
    done.get();
}

void OptimizationDriver::RunRandom(OptimizationRun &run, const OptimizationRequest &request,
                                   const nlohmann::json &fixed, double margin_weight) {
    RandomSampler sampler(config_.seed);
    const std::size_t batch = config_.ResolvedBatch(service_.executor().worker_count());

    std::size_t remaining = request.n_calls;
    while (remaining > 0) {
        const std::size_t k = std::min(batch, remaining);

        std::vector<EvaluationRecord> records(k);
        std::vector<std::future<EvaluationResult>> futures(k);
        for (std::size_t i = 0; i < k; ++i) {
            records[i].params = run.space.Name(sampler.Sample(run.space));
            try {
                futures[i] = service_.EvaluateAsync(BuildParams(fixed, records[i].params),
                                                    objective_timeout_);
            } catch (const std::exception &) {
                records[i].error = DescribeFailure(std::current_exception());
                records[i].objective = kFailedObjective;
            }
        }
        for (std::size_t i = 0; i < k; ++i) {
            if (futures[i].valid()) {
                AwaitEvaluation(service_, futures[i], records[i], margin_weight,
                                objective_timeout_);
            }
            run.Record(std::move(records[i]));
        }
        remaining -= k;
    }
}

} // namespace prism
