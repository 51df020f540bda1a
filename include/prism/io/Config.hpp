#pragma once

/**
 * @file Config.hpp
 * @brief Orchestrator and subsystem configuration structs
 *
 * Plain structs with Default() factories and Validate() methods that return
 * human-readable problems instead of throwing. ConfigLoader fills them from
 * YAML and environment overrides; OrchestratorConfig::Validate() aggregates.
 */

#include <prism/io/Console.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace prism {

using Seconds = std::chrono::duration<double>;

[[nodiscard]] inline std::chrono::milliseconds ToMillis(double seconds) {
    return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0));
}

// =============================================================================
// SimulatorConfig
// =============================================================================

/**
 * @brief How to invoke the external simulator
 *
 * The command line is `executable prefix_args... <operation args...>`.
 */
struct SimulatorConfig {
    std::string executable = "python3";
    std::vector<std::string> prefix_args = {"-m", "plogic.cli"};

    /// Appended to search_path_var when the directory exists
    std::string source_dir = "/app/external/photonic-logic/src";
    std::string search_path_var = "PYTHONPATH";

    [[nodiscard]] static SimulatorConfig Default() { return SimulatorConfig{}; }

    [[nodiscard]] std::vector<std::string> Validate() const {
        std::vector<std::string> errors;
        if (executable.empty()) {
            errors.push_back("simulator.executable must not be empty");
        }
        if (search_path_var.empty()) {
            errors.push_back("simulator.search_path_var must not be empty");
        }
        return errors;
    }
};

// =============================================================================
// TimeoutConfig
// =============================================================================

/**
 * @brief Stage-specific deadlines
 *
 * Cheap introspection calls get short deadlines, full evaluations long ones.
 */
struct TimeoutConfig {
    std::chrono::milliseconds cascade{60000};
    std::chrono::milliseconds characterize{30000};
    std::chrono::milliseconds truth_table{45000};
    std::chrono::milliseconds objective{60000};
    std::chrono::milliseconds health{5000};

    [[nodiscard]] static TimeoutConfig Default() { return TimeoutConfig{}; }

    [[nodiscard]] std::vector<std::string> Validate() const {
        std::vector<std::string> errors;
        auto check = [&errors](const char *name, std::chrono::milliseconds v) {
            if (v.count() <= 0) {
                errors.push_back(std::string("timeouts.") + name + " must be > 0");
            }
        };
        check("cascade", cascade);
        check("characterize", characterize);
        check("truth_table", truth_table);
        check("objective", objective);
        check("health", health);
        return errors;
    }
};

// =============================================================================
// CacheConfig
// =============================================================================

struct CacheConfig {
    std::string backend = "auto"; ///< "auto", "local" or "redis"
    std::string redis_url;        ///< Empty = no distributed cache
    std::size_t max_items = 1024;
    std::chrono::milliseconds ttl{1800 * 1000};
    std::string key_prefix = "prism:";

    [[nodiscard]] static CacheConfig Default() { return CacheConfig{}; }

    [[nodiscard]] std::vector<std::string> Validate() const {
        std::vector<std::string> errors;
        if (backend != "auto" && backend != "local" && backend != "redis") {
            errors.push_back("Unknown cache backend: " + backend);
        }
        if (backend == "redis" && redis_url.empty()) {
            errors.push_back("cache.backend is 'redis' but cache.redis_url is empty");
        }
        if (max_items == 0) {
            errors.push_back("cache.max_items must be > 0");
        }
        if (ttl.count() <= 0) {
            errors.push_back("cache.ttl must be > 0");
        }
        return errors;
    }
};

// =============================================================================
// ExecutorConfig
// =============================================================================

struct ExecutorConfig {
    std::size_t worker_threads = 0; ///< 0 = min(4, cores)

    /// Lower bound: the optimizer loop occupies one worker while its
    /// evaluations need another.
    static constexpr std::size_t kMinWorkers = 2;

    [[nodiscard]] static ExecutorConfig Default() { return ExecutorConfig{}; }

    [[nodiscard]] std::size_t ResolvedWorkers() const {
        std::size_t n = worker_threads;
        if (n == 0) {
            std::size_t cores = std::max(1u, std::thread::hardware_concurrency());
            n = std::min<std::size_t>(4, cores);
        }
        return std::max(n, kMinWorkers);
    }
};

// =============================================================================
// OptimizerConfig
// =============================================================================

struct OptimizerConfig {
    static constexpr std::size_t kDefaultRandomBatch = 8;

    std::string strategy = "gp";      ///< "gp" (model-based) or "random"
    std::optional<uint64_t> seed;     ///< Unset = nondeterministic
    std::size_t random_batch = 0;     ///< 0 = min(8, cores); always capped at the worker count
    std::size_t acquisition_samples = 2000;
    double xi = 0.01;                 ///< Expected-improvement exploration margin

    [[nodiscard]] static OptimizerConfig Default() { return OptimizerConfig{}; }

    /**
     * @brief Points evaluated concurrently per random-search batch
     *
     * Capped at the worker count: a deadline starts at dispatch, so points
     * queued behind a full pool would lose part of their budget.
     */
    [[nodiscard]] std::size_t ResolvedBatch(std::size_t workers) const {
        const std::size_t cores = std::max(1u, std::thread::hardware_concurrency());
        const std::size_t wanted =
            random_batch > 0 ? random_batch : std::min<std::size_t>(kDefaultRandomBatch, cores);
        return std::clamp<std::size_t>(wanted, 1, std::max<std::size_t>(workers, 1));
    }

    [[nodiscard]] std::vector<std::string> Validate() const {
        std::vector<std::string> errors;
        if (strategy != "gp" && strategy != "random") {
            errors.push_back("Unknown optimizer strategy: " + strategy);
        }
        if (acquisition_samples == 0) {
            errors.push_back("optimizer.acquisition_samples must be > 0");
        }
        if (xi < 0.0) {
            errors.push_back("optimizer.xi must be >= 0");
        }
        return errors;
    }
};

// =============================================================================
// Output / side channels
// =============================================================================

struct ResultsConfig {
    std::string directory = "prism_results";

    [[nodiscard]] static ResultsConfig Default() { return ResultsConfig{}; }
};

struct TrackingConfig {
    bool enabled = false;
    std::string directory; ///< Empty = <results>/tracking
};

struct MetricsConfig {
    bool enabled = true;
};

struct LoggingConfig {
    LogLevel console_level = LogLevel::Info;
    bool quiet = false;      ///< Errors only on the console
    std::string file_path;   ///< Plain-text log file, empty = off
    std::string json_path;   ///< JSON Lines log file, empty = off
};

// =============================================================================
// OrchestratorConfig
// =============================================================================

/**
 * @brief Complete orchestrator configuration
 */
struct OrchestratorConfig {
    std::string source_file; ///< Where this config came from ("<default>", path, "<string>")

    SimulatorConfig simulator;
    TimeoutConfig timeouts;
    CacheConfig cache;
    ExecutorConfig executor;
    OptimizerConfig optimizer;
    ResultsConfig results;
    TrackingConfig tracking;
    MetricsConfig metrics;
    LoggingConfig logging;

    [[nodiscard]] static OrchestratorConfig Default() {
        OrchestratorConfig cfg;
        cfg.source_file = "<default>";
        return cfg;
    }

    [[nodiscard]] std::vector<std::string> Validate() const {
        std::vector<std::string> errors;
        auto append = [&errors](const std::vector<std::string> &more) {
            errors.insert(errors.end(), more.begin(), more.end());
        };
        append(simulator.Validate());
        append(timeouts.Validate());
        append(cache.Validate());
        append(optimizer.Validate());
        if (results.directory.empty()) {
            errors.push_back("results.directory must not be empty");
        }
        return errors;
    }

    /// Directory used by the JSON Lines experiment tracker
    [[nodiscard]] std::string TrackingDirectory() const {
        if (!tracking.directory.empty()) {
            return tracking.directory;
        }
        return results.directory + "/tracking";
    }
};

} // namespace prism
