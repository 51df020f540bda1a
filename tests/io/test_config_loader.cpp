/**
 * @file test_config_loader.cpp
 * @brief Unit tests for YAML configuration loading and environment overrides
 */

#include <prism/io/ConfigLoader.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <map>

using namespace prism;
using namespace std::chrono_literals;

namespace {

/// Fake environment for override tests
ConfigLoader::EnvLookup FakeEnv(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](const std::string &name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

} // namespace

// =============================================================================
// Defaults
// =============================================================================

TEST(ConfigLoader, EmptyDocumentGivesDefaults) {
    auto cfg = ConfigLoader::Parse("", FakeEnv({}));
    EXPECT_EQ(cfg.simulator.executable, "python3");
    EXPECT_EQ(cfg.timeouts.cascade, 60s);
    EXPECT_EQ(cfg.timeouts.characterize, 30s);
    EXPECT_EQ(cfg.timeouts.truth_table, 45s);
    EXPECT_EQ(cfg.timeouts.health, 5s);
    EXPECT_EQ(cfg.cache.ttl, 1800s);
    EXPECT_EQ(cfg.optimizer.strategy, "gp");
    EXPECT_TRUE(cfg.metrics.enabled);
    EXPECT_FALSE(cfg.tracking.enabled);
}

TEST(ConfigLoader, WorkerFloor) {
    ExecutorConfig e;
    e.worker_threads = 1;
    EXPECT_EQ(e.ResolvedWorkers(), ExecutorConfig::kMinWorkers);
    e.worker_threads = 6;
    EXPECT_EQ(e.ResolvedWorkers(), 6u);
}

// =============================================================================
// Sections
// =============================================================================

TEST(ConfigLoader, ParsesSections) {
    const char *yaml = R"(
simulator:
  executable: /usr/bin/plogic
  prefix_args: []
  source_dir: /srv/plogic
timeouts:
  cascade: 12.5
  health: 2
cache:
  backend: local
  max_items: 16
  ttl: 60
executor:
  worker_threads: 3
optimizer:
  strategy: random
  seed: 7
  random_batch: 4
results:
  directory: /tmp/prism-out
tracking:
  enabled: true
logging:
  console_level: debug
  quiet: true
)";
    auto cfg = ConfigLoader::Parse(yaml, FakeEnv({}));
    EXPECT_EQ(cfg.simulator.executable, "/usr/bin/plogic");
    EXPECT_TRUE(cfg.simulator.prefix_args.empty());
    EXPECT_EQ(cfg.simulator.source_dir, "/srv/plogic");
    EXPECT_EQ(cfg.timeouts.cascade, 12500ms);
    EXPECT_EQ(cfg.timeouts.health, 2s);
    EXPECT_EQ(cfg.cache.backend, "local");
    EXPECT_EQ(cfg.cache.max_items, 16u);
    EXPECT_EQ(cfg.cache.ttl, 60s);
    EXPECT_EQ(cfg.executor.worker_threads, 3u);
    EXPECT_EQ(cfg.optimizer.strategy, "random");
    ASSERT_TRUE(cfg.optimizer.seed.has_value());
    EXPECT_EQ(*cfg.optimizer.seed, 7u);
    EXPECT_EQ(cfg.optimizer.ResolvedBatch(8), 4u);
    EXPECT_EQ(cfg.optimizer.ResolvedBatch(cfg.executor.ResolvedWorkers()), 3u);
    EXPECT_EQ(cfg.results.directory, "/tmp/prism-out");
    EXPECT_EQ(cfg.TrackingDirectory(), "/tmp/prism-out/tracking");
    EXPECT_EQ(cfg.logging.console_level, LogLevel::Debug);
    EXPECT_TRUE(cfg.logging.quiet);
}

TEST(ConfigLoader, ExpandsVariables) {
    const char *yaml = R"(
simulator:
  source_dir: ${PLOGIC_HOME}/src
results:
  directory: ${OUT_DIR:/var/prism}
)";
    auto cfg = ConfigLoader::Parse(yaml, FakeEnv({{"PLOGIC_HOME", "/opt/plogic"}}));
    EXPECT_EQ(cfg.simulator.source_dir, "/opt/plogic/src");
    EXPECT_EQ(cfg.results.directory, "/var/prism");
}

TEST(ConfigLoader, UndefinedVariableWithoutDefaultFails) {
    EXPECT_THROW((void)ConfigLoader::Parse("results:\n  directory: ${NOPE}\n", FakeEnv({})),
                 ConfigError);
}

// =============================================================================
// Validation
// =============================================================================

TEST(ConfigLoader, RejectsInvalidValues) {
    EXPECT_THROW((void)ConfigLoader::Parse("cache:\n  backend: memcached\n", FakeEnv({})),
                 ConfigError);
    EXPECT_THROW((void)ConfigLoader::Parse("timeouts:\n  cascade: 0\n", FakeEnv({})), ConfigError);
    EXPECT_THROW((void)ConfigLoader::Parse("optimizer:\n  strategy: annealing\n", FakeEnv({})),
                 ConfigError);
    EXPECT_THROW((void)ConfigLoader::Parse("executor:\n  worker_threads: many\n", FakeEnv({})),
                 ConfigError);
    EXPECT_THROW((void)ConfigLoader::Parse("logging:\n  console_level: loud\n", FakeEnv({})),
                 ConfigError);
}

TEST(ConfigLoader, RejectsMalformedYaml) {
    EXPECT_THROW((void)ConfigLoader::Parse("cache: [unterminated", FakeEnv({})), ConfigError);
    EXPECT_THROW((void)ConfigLoader::Parse("- just\n- a list\n", FakeEnv({})), ConfigError);
}

// =============================================================================
// Environment overrides
// =============================================================================

TEST(ConfigLoader, EnvironmentOverrides) {
    auto cfg = ConfigLoader::FromEnvironment(FakeEnv({{"PLOGIC_SRC", "/src/plogic"},
                                                      {"REDIS_URL", "redis://cache:6379"},
                                                      {"PLOGIC_RESULTS", "/data/results"},
                                                      {"PLOGIC_MAX_WORKERS", "6"},
                                                      {"PLOGIC_TIMEOUT", "90"},
                                                      {"PLOGIC_CHAR_TIMEOUT", "10"},
                                                      {"PLOGIC_TRUTH_TIMEOUT", "20"},
                                                      {"PLOGIC_OBJECTIVE_TIMEOUT", "1.5"}}));
    EXPECT_EQ(cfg.simulator.source_dir, "/src/plogic");
    EXPECT_EQ(cfg.cache.redis_url, "redis://cache:6379");
    EXPECT_EQ(cfg.results.directory, "/data/results");
    EXPECT_EQ(cfg.executor.worker_threads, 6u);
    EXPECT_EQ(cfg.timeouts.cascade, 90s);
    EXPECT_EQ(cfg.timeouts.characterize, 10s);
    EXPECT_EQ(cfg.timeouts.truth_table, 20s);
    EXPECT_EQ(cfg.timeouts.objective, 1500ms);
}

TEST(ConfigLoader, BadEnvironmentValuesFail) {
    EXPECT_THROW((void)ConfigLoader::FromEnvironment(FakeEnv({{"PLOGIC_TIMEOUT", "soon"}})),
                 ConfigError);
    EXPECT_THROW((void)ConfigLoader::FromEnvironment(FakeEnv({{"PLOGIC_MAX_WORKERS", "-2"}})),
                 ConfigError);
}

TEST(ConfigLoader, LoadAppliesEnvironmentAfterFile) {
    auto path = std::filesystem::temp_directory_path() / "prism_config_loader_test.yaml";
    {
        std::ofstream out(path);
        out << "results:\n  directory: from-file\ntimeouts:\n  cascade: 5\n";
    }
    auto cfg = ConfigLoader::Load(path.string(), FakeEnv({{"PLOGIC_RESULTS", "from-env"}}));
    EXPECT_EQ(cfg.results.directory, "from-env");
    EXPECT_EQ(cfg.timeouts.cascade, 5s);
    EXPECT_EQ(cfg.source_file, path.string());
    std::filesystem::remove(path);
}

TEST(ConfigLoader, MissingFile) {
    EXPECT_THROW((void)ConfigLoader::Load("/no/such/prism.yaml", FakeEnv({})), ConfigError);
}
