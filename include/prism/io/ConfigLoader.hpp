#pragma once

/**
 * @file ConfigLoader.hpp
 * @brief Loads orchestrator configuration from YAML and the environment
 *
 * Supports:
 * - ${VAR} and ${VAR:default} expansion inside scalar values
 * - The simulator-facing environment variables (PLOGIC_*, REDIS_URL) as
 *   final overrides, so containers can be configured without a file
 *
 * Example usage:
 * @code
 * auto config = ConfigLoader::Load("prism.yaml");
 * Orchestrator orch(config);
 * @endcode
 */

#include <prism/core/Error.hpp>
#include <prism/io/Config.hpp>

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace prism {

class ConfigLoader {
  public:
    /// Environment lookup; injectable for tests
    using EnvLookup = std::function<std::optional<std::string>(const std::string &)>;

    /**
     * @brief Load config from a YAML file, then apply environment overrides
     * @throws ConfigError on parsing or validation errors
     */
    static OrchestratorConfig Load(const std::string &path,
                                   const EnvLookup &env = ProcessEnvironment) {
        YAML::Node root;
        try {
            root = YAML::LoadFile(path);
        } catch (const YAML::BadFile &) {
            throw ConfigError("Cannot open config file", path, -1, "Check the path");
        } catch (const YAML::ParserException &e) {
            throw ConfigError(e.msg, path, e.mark.line + 1);
        }
        auto cfg = ParseRoot(root, path, env);
        ApplyEnvironment(cfg, env);
        Check(cfg);
        return cfg;
    }

    /**
     * @brief Parse config from a YAML string (for testing). No env overrides.
     */
    static OrchestratorConfig Parse(const std::string &yaml_content,
                                    const EnvLookup &env = ProcessEnvironment) {
        YAML::Node root;
        try {
            root = YAML::Load(yaml_content);
        } catch (const YAML::ParserException &e) {
            throw ConfigError(e.msg, "<string>", e.mark.line + 1);
        }
        auto cfg = ParseRoot(root, "<string>", env);
        Check(cfg);
        return cfg;
    }

    /**
     * @brief Defaults plus environment overrides (no file)
     */
    static OrchestratorConfig FromEnvironment(const EnvLookup &env = ProcessEnvironment) {
        auto cfg = OrchestratorConfig::Default();
        ApplyEnvironment(cfg, env);
        Check(cfg);
        return cfg;
    }

    /**
     * @brief Apply PLOGIC_* / REDIS_URL overrides
     *
     * PLOGIC_SRC, REDIS_URL, PLOGIC_RESULTS, PLOGIC_MAX_WORKERS, PLOGIC_TIMEOUT,
     * PLOGIC_CHAR_TIMEOUT, PLOGIC_TRUTH_TIMEOUT, PLOGIC_OBJECTIVE_TIMEOUT
     * (timeouts in seconds).
     */
    static void ApplyEnvironment(OrchestratorConfig &cfg, const EnvLookup &env) {
        if (auto v = env("PLOGIC_SRC")) {
            cfg.simulator.source_dir = *v;
        }
        if (auto v = env("REDIS_URL")) {
            cfg.cache.redis_url = *v;
        }
        if (auto v = env("PLOGIC_RESULTS")) {
            cfg.results.directory = *v;
        }
        if (auto v = env("PLOGIC_MAX_WORKERS")) {
            cfg.executor.worker_threads = static_cast<std::size_t>(ParseCount("PLOGIC_MAX_WORKERS", *v));
        }
        if (auto v = env("PLOGIC_TIMEOUT")) {
            cfg.timeouts.cascade = ToMillis(ParseSeconds("PLOGIC_TIMEOUT", *v));
        }
        if (auto v = env("PLOGIC_CHAR_TIMEOUT")) {
            cfg.timeouts.characterize = ToMillis(ParseSeconds("PLOGIC_CHAR_TIMEOUT", *v));
        }
        if (auto v = env("PLOGIC_TRUTH_TIMEOUT")) {
            cfg.timeouts.truth_table = ToMillis(ParseSeconds("PLOGIC_TRUTH_TIMEOUT", *v));
        }
        if (auto v = env("PLOGIC_OBJECTIVE_TIMEOUT")) {
            cfg.timeouts.objective = ToMillis(ParseSeconds("PLOGIC_OBJECTIVE_TIMEOUT", *v));
        }
    }

    /**
     * @brief Expand ${VAR} and ${VAR:default} in a string
     * @throws ConfigError if VAR is undefined and no default is given
     */
    static std::string ExpandVariables(const std::string &value, const EnvLookup &env) {
        std::string out;
        std::size_t pos = 0;
        while (pos < value.size()) {
            auto start = value.find("${", pos);
            if (start == std::string::npos) {
                out += value.substr(pos);
                break;
            }
            auto end = value.find('}', start);
            if (end == std::string::npos) {
                throw ConfigError("Unterminated variable reference in '" + value + "'");
            }
            out += value.substr(pos, start - pos);

            std::string body = value.substr(start + 2, end - start - 2);
            std::string name = body;
            std::optional<std::string> fallback;
            if (auto colon = body.find(':'); colon != std::string::npos) {
                name = body.substr(0, colon);
                fallback = body.substr(colon + 1);
            }
            if (auto v = env(name)) {
                out += *v;
            } else if (fallback) {
                out += *fallback;
            } else {
                throw ConfigError("Undefined environment variable: " + name, "", -1,
                                  "Set the variable or use ${" + name + ":default}");
            }
            pos = end + 1;
        }
        return out;
    }

    static std::optional<std::string> ProcessEnvironment(const std::string &name) {
        const char *v = std::getenv(name.c_str());
        if (v == nullptr) {
            return std::nullopt;
        }
        return std::string(v);
    }

  private:
    // =========================================================================
    // Root Parsing
    // =========================================================================

    static OrchestratorConfig ParseRoot(const YAML::Node &root, const std::string &source,
                                        const EnvLookup &env) {
        auto cfg = OrchestratorConfig::Default();
        cfg.source_file = source;
        if (!root || root.IsNull()) {
            return cfg;
        }
        if (!root.IsMap()) {
            throw ConfigError("Top level must be a mapping", source);
        }

        try {
            if (auto n = root["simulator"]) {
                ParseSimulator(cfg.simulator, n, env);
            }
            if (auto n = root["timeouts"]) {
                ParseTimeouts(cfg.timeouts, n, env);
            }
            if (auto n = root["cache"]) {
                ParseCache(cfg.cache, n, env);
            }
            if (auto n = root["executor"]) {
                cfg.executor.worker_threads =
                    GetOr<std::size_t>(n, "worker_threads", cfg.executor.worker_threads, env);
            }
            if (auto n = root["optimizer"]) {
                ParseOptimizer(cfg.optimizer, n, env);
            }
            if (auto n = root["results"]) {
                cfg.results.directory = GetOr<std::string>(n, "directory", cfg.results.directory, env);
            }
            if (auto n = root["tracking"]) {
                cfg.tracking.enabled = GetOr<bool>(n, "enabled", cfg.tracking.enabled, env);
                cfg.tracking.directory =
                    GetOr<std::string>(n, "directory", cfg.tracking.directory, env);
            }
            if (auto n = root["metrics"]) {
                cfg.metrics.enabled = GetOr<bool>(n, "enabled", cfg.metrics.enabled, env);
            }
            if (auto n = root["logging"]) {
                ParseLogging(cfg.logging, n, env);
            }
        } catch (const YAML::Exception &e) {
            throw ConfigError(e.msg, source, e.mark.line + 1);
        }
        return cfg;
    }

    // =========================================================================
    // Section Parsers
    // =========================================================================

    static void ParseSimulator(SimulatorConfig &sim, const YAML::Node &n, const EnvLookup &env) {
        sim.executable = GetOr<std::string>(n, "executable", sim.executable, env);
        if (auto args = n["prefix_args"]) {
            sim.prefix_args.clear();
            for (const auto &a : args) {
                sim.prefix_args.push_back(ExpandVariables(a.as<std::string>(), env));
            }
        }
        sim.source_dir = GetOr<std::string>(n, "source_dir", sim.source_dir, env);
        sim.search_path_var = GetOr<std::string>(n, "search_path_var", sim.search_path_var, env);
    }

    static void ParseTimeouts(TimeoutConfig &t, const YAML::Node &n, const EnvLookup &env) {
        auto seconds = [&](const char *key, std::chrono::milliseconds current) {
            if (!n[key]) {
                return current;
            }
            return ToMillis(GetOr<double>(n, key, 0.0, env));
        };
        t.cascade = seconds("cascade", t.cascade);
        t.characterize = seconds("characterize", t.characterize);
        t.truth_table = seconds("truth_table", t.truth_table);
        t.objective = seconds("objective", t.objective);
        t.health = seconds("health", t.health);
    }

    static void ParseCache(CacheConfig &c, const YAML::Node &n, const EnvLookup &env) {
        c.backend = GetOr<std::string>(n, "backend", c.backend, env);
        c.redis_url = GetOr<std::string>(n, "redis_url", c.redis_url, env);
        c.max_items = GetOr<std::size_t>(n, "max_items", c.max_items, env);
        if (n["ttl"]) {
            c.ttl = ToMillis(GetOr<double>(n, "ttl", 0.0, env));
        }
        c.key_prefix = GetOr<std::string>(n, "key_prefix", c.key_prefix, env);
    }

    static void ParseOptimizer(OptimizerConfig &o, const YAML::Node &n, const EnvLookup &env) {
        o.strategy = GetOr<std::string>(n, "strategy", o.strategy, env);
        if (n["seed"]) {
            o.seed = GetOr<uint64_t>(n, "seed", 0, env);
        }
        o.random_batch = GetOr<std::size_t>(n, "random_batch", o.random_batch, env);
        o.acquisition_samples =
            GetOr<std::size_t>(n, "acquisition_samples", o.acquisition_samples, env);
        o.xi = GetOr<double>(n, "xi", o.xi, env);
    }

    static void ParseLogging(LoggingConfig &l, const YAML::Node &n, const EnvLookup &env) {
        if (n["console_level"]) {
            auto name = GetOr<std::string>(n, "console_level", "info", env);
            auto level = ParseLogLevel(name);
            if (!level) {
                throw ConfigError("Unknown log level: " + name);
            }
            l.console_level = *level;
        }
        l.quiet = GetOr<bool>(n, "quiet", l.quiet, env);
        l.file_path = GetOr<std::string>(n, "file_path", l.file_path, env);
        l.json_path = GetOr<std::string>(n, "json_path", l.json_path, env);
    }

    // =========================================================================
    // Helpers
    // =========================================================================

    /// Scalar lookup with ${VAR} expansion applied before conversion
    template <typename T>
    static T GetOr(const YAML::Node &n, const char *key, const T &fallback, const EnvLookup &env) {
        auto v = n[key];
        if (!v || v.IsNull()) {
            return fallback;
        }
        if (!v.IsScalar()) {
            throw ConfigError(std::string("Expected a scalar for '") + key + "'");
        }
        YAML::Node expanded(ExpandVariables(v.Scalar(), env));
        try {
            return expanded.as<T>();
        } catch (const YAML::BadConversion &) {
            throw ConfigError(std::string("Bad value for '") + key + "': " + v.Scalar());
        }
    }

    static double ParseSeconds(const std::string &name, const std::string &v) {
        try {
            std::size_t used = 0;
            double s = std::stod(v, &used);
            if (used == v.size() && s > 0.0) {
                return s;
            }
        } catch (const std::exception &) {
            // fall through to the ConfigError below
        }
        throw ConfigError(name + " must be a positive number of seconds, got '" + v + "'");
    }

    static long ParseCount(const std::string &name, const std::string &v) {
        try {
            std::size_t used = 0;
            long n = std::stol(v, &used);
            if (used == v.size() && n > 0) {
                return n;
            }
        } catch (const std::exception &) {
            // fall through to the ConfigError below
        }
        throw ConfigError(name + " must be a positive integer, got '" + v + "'");
    }

    static void Check(const OrchestratorConfig &cfg) {
        auto errors = cfg.Validate();
        if (errors.empty()) {
            return;
        }
        std::string msg = "Invalid configuration:";
        for (const auto &e : errors) {
            msg += "\n  - " + e;
        }
        throw ConfigError(msg, cfg.source_file);
    }
};

} // namespace prism
