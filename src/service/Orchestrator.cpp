#include <prism/service/Orchestrator.hpp>
#include <prism/service/SweepExecutor.hpp>

namespace prism {

namespace {

// =============================================================================
// Parameter schemas
// =============================================================================

nlohmann::json NullableNumber() { return {{"type", "number"}, {"nullable", true}}; }

nlohmann::json EvaluationProperties() {
    return {{"threshold", {{"type", "string"}, {"enum", {"hard", "soft"}}, {"default", "soft"}}},
            {"beta", {{"type", "number"}, {"default", EvaluationParams::kDefaultBeta}}},
            {"mode",
             {{"type", "string"}, {"enum", {"linear", "physics"}}, {"default", "physics"}}},
            {"n2", NullableNumber()},
            {"a_eff", NullableNumber()},
            {"n_eff", NullableNumber()},
            {"g_geom", NullableNumber()},
            {"extra", {{"type", "array"}, {"items", {{"type", "string"}}}}}};
}

nlohmann::json ObjectSchema(nlohmann::json properties, std::vector<std::string> required = {}) {
    return {{"type", "object"}, {"properties", std::move(properties)}, {"required", required}};
}

OrchestratorConfig Validated(OrchestratorConfig config) {
    auto errors = config.Validate();
    if (errors.empty()) {
        return config;
    }
    std::string msg = "Invalid configuration:";
    for (const auto &e : errors) {
        msg += "\n  - " + e;
    }
    throw ConfigError(msg, config.source_file);
}

std::shared_ptr<ExperimentTracker> MakeTracker(const OrchestratorConfig &config) {
    if (config.tracking.enabled) {
        return std::make_shared<JsonlTracker>(config.TrackingDirectory());
    }
    return std::make_shared<NullTracker>();
}

} // namespace

// =============================================================================
// Construction
// =============================================================================

Orchestrator::Orchestrator(OrchestratorConfig config, std::shared_ptr<ProcessRunner> runner)
    : config_(Validated(std::move(config))), store_(config_.results.directory),
      metrics_(MakeMetrics(config_.metrics.enabled)), tracker_(MakeTracker(config_)),
      cache_(ResultCache::Create(config_.cache)),
      runner_(runner ? std::move(runner)
                     : std::make_shared<SubprocessRunner>(config_.simulator)),
      executor_(std::make_unique<Executor>(config_.executor.ResolvedWorkers())) {
    service_ = std::make_unique<EvaluationService>(*executor_, runner_, cache_, metrics_, tracker_,
                                                   config_.timeouts);
    RegisterOperations();
    GetLogService().Info("Prism orchestrator ready: " + CapabilityLine());
}

Orchestrator::~Orchestrator() {
    // Workers reference the service; stop them first
    executor_->Shutdown();
}

std::string Orchestrator::CapabilityLine() const {
    return "cache=" + cache_->BackendName() + " optimizer=" + config_.optimizer.strategy +
           " tracking=" + tracker_->Name() + " metrics=" + metrics_->Name() +
           " workers=" + std::to_string(executor_->worker_count());
}

// =============================================================================
// Operations
// =============================================================================

TruthTableResult Orchestrator::TruthTable(const std::vector<double> &ctrl,
                                          const std::optional<std::string> &out_csv) {
    return service_->TruthTable(ctrl, out_csv, store_);
}

nlohmann::json Orchestrator::Characterize() { return service_->Characterize(); }

EvaluationResult Orchestrator::Cascade(const EvaluationParams &params) {
    return service_->Evaluate(params);
}

SweepResult Orchestrator::Sweep(const nlohmann::json &configs) {
    SweepExecutor sweep(*service_, &store_);
    return sweep.Run(configs);
}

OptimizationRun Orchestrator::Optimize(const OptimizationRequest &request) {
    // Fresh driver per run: runs never share state
    OptimizationDriver driver(*service_, config_.optimizer, config_.timeouts.objective, &store_);
    return driver.Run(request);
}

HealthStatus Orchestrator::Health() { return service_->Health(); }

CapabilityDescriptor Orchestrator::Schema() const {
    CapabilityDescriptor caps;
    caps.available_operations = registry_.Names();
    caps.optimizer_strategy = config_.optimizer.strategy;
    caps.cache_backend = cache_->BackendName();
    caps.worker_pool_size = executor_->worker_count();
    caps.metrics_backend = metrics_->Name();
    caps.tracking_backend = tracker_->Name();
    return caps;
}

// =============================================================================
// Registry
// =============================================================================

void Orchestrator::RegisterOperations() {
    registry_.Register(
        {"truth_table", "Generate a truth table for the given control powers.",
         ObjectSchema({{"ctrl", {{"type", "array"}, {"items", {{"type", "number"}}}}},
                       {"out_csv", {{"type", "string"}}}},
                      {"ctrl"})},
        [this](const nlohmann::json &args) {
            if (!args.contains("ctrl")) {
                throw InvalidArgumentError::Missing("ctrl");
            }
            const auto &ctrl = args["ctrl"];
            if (!ctrl.is_array()) {
                throw InvalidArgumentError("ctrl", "expected an array of numbers");
            }
            std::vector<double> values;
            for (const auto &c : ctrl) {
                if (!c.is_number()) {
                    throw InvalidArgumentError("ctrl", "expected an array of numbers");
                }
                values.push_back(c.get<double>());
            }
            std::optional<std::string> out_csv;
            if (args.contains("out_csv") && !args["out_csv"].is_null()) {
                if (!args["out_csv"].is_string()) {
                    throw InvalidArgumentError("out_csv", "expected a string");
                }
                out_csv = args["out_csv"].get<std::string>();
            }
            return TruthTable(values, out_csv).ToJSON();
        });

    registry_.Register({"characterize", "Characterize the simulated device.", ObjectSchema({})},
                       [this](const nlohmann::json &) { return Characterize(); });

    registry_.Register({"cascade", "Run a cascade simulation and return its metrics.",
                        ObjectSchema(EvaluationProperties())},
                       [this](const nlohmann::json &args) {
                           return Cascade(EvaluationParams::FromJSON(args)).ToJSON();
                       });

    registry_.Register(
        {"sweep", "Run several cascade configurations concurrently; returns results and errors.",
         ObjectSchema({{"configs",
                        {{"type", "array"},
                         {"items", {{"type", "object"}, {"properties", EvaluationProperties()}}}}}},
                      {"configs"})},
        [this](const nlohmann::json &args) {
            if (!args.contains("configs")) {
                throw InvalidArgumentError::Missing("configs");
            }
            return Sweep(args["configs"]).ToJSON();
        });

    registry_.Register(
        {"bo_run",
         "Minimize ber_estimate - weight * logic_margin over the physics parameters.",
         ObjectSchema(
             {{"n_calls", {{"type", "integer"}, {"default", 40}, {"minimum", 1}}},
              {"threshold", {{"type", "string"}, {"enum", {"hard", "soft"}}, {"default", "soft"}}},
              {"mode",
               {{"type", "string"}, {"enum", {"linear", "physics"}}, {"default", "physics"}}},
              {"space_bounds",
               {{"type", "object"},
                {"additionalProperties",
                 {{"type", "array"},
                  {"items", {{"type", "number"}}},
                  {"minItems", 2},
                  {"maxItems", 2}}}}},
              {"fixed_params", {{"type", "object"}}},
              {"objective_margin_weight", {{"type", "number"}, {"default", 0.1}}},
              {"random_starts", {{"type", "integer"}, {"default", 8}, {"minimum", 0}}}})},
        [this](const nlohmann::json &args) {
            return Optimize(OptimizationRequest::FromJSON(args)).ToJSON();
        });

    registry_.Register({"health", "Check that the simulator can be invoked.", ObjectSchema({})},
                       [this](const nlohmann::json &) { return Health().ToJSON(); });

    registry_.Register({"schema", "List operations and active backends.", ObjectSchema({})},
                       [this](const nlohmann::json &) { return Schema().ToJSON(); });
}

} // namespace prism
