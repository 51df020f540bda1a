#pragma once

/**
 * @file Orchestrator.hpp
 * @brief Top-level facade owning the executor, cache, service and registry
 *
 * Startup picks the optional backends (distributed cache, metrics,
 * experiment tracking) from configuration and availability, logs one
 * capability line, and registers the public operations:
 *
 *   truth_table, characterize, cascade, sweep, bo_run, health, schema
 */

#include <prism/core/Results.hpp>
#include <prism/exec/ProcessRunner.hpp>
#include <prism/io/Config.hpp>
#include <prism/io/ResultStore.hpp>
#include <prism/opt/OptimizationDriver.hpp>
#include <prism/opt/OptimizationRun.hpp>
#include <prism/service/EvaluationService.hpp>
#include <prism/service/Executor.hpp>
#include <prism/service/ExperimentTracker.hpp>
#include <prism/service/Metrics.hpp>
#include <prism/service/OperationRegistry.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace prism {

class Orchestrator {
  public:
    /**
     * @param config Orchestrator configuration
     * @param runner Simulator runner; nullptr builds a SubprocessRunner from config.simulator
     * @throws ConfigError if the configuration does not validate
     */
    explicit Orchestrator(OrchestratorConfig config, std::shared_ptr<ProcessRunner> runner = nullptr);
    ~Orchestrator();

    Orchestrator(const Orchestrator &) = delete;
    Orchestrator &operator=(const Orchestrator &) = delete;

    // === Operations ===

    TruthTableResult TruthTable(const std::vector<double> &ctrl,
                                const std::optional<std::string> &out_csv = std::nullopt);
    nlohmann::json Characterize();
    EvaluationResult Cascade(const EvaluationParams &params);
    SweepResult Sweep(const nlohmann::json &configs);
    OptimizationRun Optimize(const OptimizationRequest &request);
    HealthStatus Health();
    [[nodiscard]] CapabilityDescriptor Schema() const;

    // === Introspection ===

    [[nodiscard]] const OperationRegistry &registry() const { return registry_; }
    [[nodiscard]] const OrchestratorConfig &config() const { return config_; }
    [[nodiscard]] const ResultStore &results() const { return store_; }
    [[nodiscard]] Metrics &metrics() { return *metrics_; }

    /// "cache=<backend> optimizer=<strategy> tracking=<backend> metrics=<backend> workers=<n>"
    [[nodiscard]] std::string CapabilityLine() const;

  private:
    void RegisterOperations();

    OrchestratorConfig config_;
    ResultStore store_;
    std::shared_ptr<Metrics> metrics_;
    std::shared_ptr<ExperimentTracker> tracker_;
    std::shared_ptr<ResultCache> cache_;
    std::shared_ptr<ProcessRunner> runner_;
    std::unique_ptr<Executor> executor_;
    std::unique_ptr<EvaluationService> service_;
    OperationRegistry registry_;
};

} // namespace prism
