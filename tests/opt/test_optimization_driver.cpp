/**
 * @file test_optimization_driver.cpp
 * @brief Tests for bo_run: request parsing, both strategies, failures and persistence
 */

#include <prism/opt/OptimizationDriver.hpp>

#include <support/StubRunner.hpp>

#include <gtest/gtest.h>

#include <cmath>
#include <filesystem>
#include <future>
#include <limits>
#include <thread>

using namespace prism;
using namespace prism::test_support;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

class OptimizationDriverTest : public ::testing::Test {
  protected:
    void Build(StubRunner::Handler handler) {
        runner_ = std::make_shared<StubRunner>(std::move(handler));
        auto cache = std::make_shared<ResultCache>(nullptr, std::make_unique<LruTtlStore>(256),
                                                   60s, "prism:");
        service_ = std::make_unique<EvaluationService>(executor_, runner_, cache, nullptr, nullptr,
                                                       TimeoutConfig{});
    }

    OptimizerConfig Config(const std::string &strategy) const {
        OptimizerConfig config;
        config.strategy = strategy;
        config.seed = 17;
        config.random_batch = 3;
        config.acquisition_samples = 200;
        return config;
    }

    void SetUp() override {
        dir_ = fs::temp_directory_path() / "prism_bo_test";
        fs::remove_all(dir_);
    }

    void TearDown() override {
        executor_.Shutdown();
        fs::remove_all(dir_);
    }

    Executor executor_{2};
    fs::path dir_;
    std::shared_ptr<StubRunner> runner_;
    std::unique_ptr<EvaluationService> service_;
};

} // namespace

// =============================================================================
// Request parsing
// =============================================================================

TEST(OptimizationRequest, Defaults) {
    auto req = OptimizationRequest::FromJSON(nlohmann::json::object());
    EXPECT_EQ(req.n_calls, 40u);
    EXPECT_EQ(req.random_starts, 8u);
    EXPECT_EQ(req.threshold, Threshold::Soft);
    EXPECT_EQ(req.mode, XpmMode::Physics);
    EXPECT_DOUBLE_EQ(req.objective_margin_weight, 0.1);
    EXPECT_TRUE(req.fixed_params.empty());
}

TEST(OptimizationRequest, ParsesFields) {
    auto req = OptimizationRequest::FromJSON({{"n_calls", 12},
                                              {"threshold", "hard"},
                                              {"xpm_mode", "linear"},
                                              {"space_bounds", {{"beta", {20, 40}}}},
                                              {"fixed_params", {{"n2", 1e-17}}},
                                              {"objective_margin_weight", 0.5},
                                              {"random_starts", 2}});
    EXPECT_EQ(req.n_calls, 12u);
    EXPECT_EQ(req.threshold, Threshold::Hard);
    EXPECT_EQ(req.mode, XpmMode::Linear);
    EXPECT_EQ(req.space_bounds["beta"][1], 40);
    EXPECT_DOUBLE_EQ(req.fixed_params["n2"].get<double>(), 1e-17);
    EXPECT_DOUBLE_EQ(req.objective_margin_weight, 0.5);
    EXPECT_EQ(req.random_starts, 2u);
}

TEST(OptimizationRequest, RejectsBadInput) {
    EXPECT_THROW((void)OptimizationRequest::FromJSON({{"n_calls", -3}}), InvalidArgumentError);
    EXPECT_THROW((void)OptimizationRequest::FromJSON({{"n_calls", 2.5}}), InvalidArgumentError);
    EXPECT_THROW((void)OptimizationRequest::FromJSON({{"threshold", "medium"}}),
                 InvalidArgumentError);
    EXPECT_THROW((void)OptimizationRequest::FromJSON({{"fixed_params", 3}}), InvalidArgumentError);
    EXPECT_THROW((void)OptimizationRequest::FromJSON({{"iterations", 3}}), InvalidArgumentError);
}

TEST(OptimizationDriver, BuildParamsOverlaysPoint) {
    nlohmann::json fixed = {{"threshold", "hard"}, {"beta", 10.0}, {"n2", 1e-17}};
    auto params = OptimizationDriver::BuildParams(fixed, {{"beta", 55.0}, {"g_geom", 0.8}});
    EXPECT_EQ(params.threshold(), Threshold::Hard);
    EXPECT_DOUBLE_EQ(params.beta(), 55.0);
    ASSERT_TRUE(params.n2().has_value());
    EXPECT_DOUBLE_EQ(*params.n2(), 1e-17);
    ASSERT_TRUE(params.g_geom().has_value());
    EXPECT_DOUBLE_EQ(*params.g_geom(), 0.8);
}

// =============================================================================
// Runs
// =============================================================================

TEST_F(OptimizationDriverTest, ModelBasedRunRecordsEveryCall) {
    Build(SyntheticCascade);
    ResultStore store(dir_.string());
    OptimizationDriver driver(*service_, Config("gp"), 2s, &store);

    OptimizationRequest req;
    req.n_calls = 8;
    req.random_starts = 4;
    auto run = driver.Run(req);

    EXPECT_EQ(run.strategy, "gp");
    EXPECT_EQ(run.trace.total(), 8u);
    EXPECT_EQ(runner_->calls(), 8);
    ASSERT_TRUE(run.best.params.has_value());
    EXPECT_EQ(run.best.params->size(), 5u);
    EXPECT_TRUE(std::isfinite(run.best.objective));
    EXPECT_EQ(run.fixed_params["threshold"], "soft");
    EXPECT_EQ(run.fixed_params["mode"], "physics");

    // Running best never increases
    double previous = std::numeric_limits<double>::infinity();
    for (const auto &record : run.trace.records()) {
        EXPECT_LE(record.best_objective, previous);
        previous = record.best_objective;
    }
    EXPECT_DOUBLE_EQ(previous, run.best.objective);

    auto doc = ResultStore::Read(store.PathFor("bo_run", run.run_id));
    EXPECT_EQ(doc["payload"]["run_id"], run.run_id);
    EXPECT_EQ(doc["payload"]["trace_count"], 8);
    EXPECT_EQ(doc["trace_full"].size(), 8u);
}

TEST_F(OptimizationDriverTest, RandomRunAppliesFixedParams) {
    Build(SyntheticCascade);
    OptimizationDriver driver(*service_, Config("random"), 2s, nullptr);

    OptimizationRequest req;
    req.n_calls = 7;
    req.threshold = Threshold::Hard;
    req.space_bounds = {{"beta", {40.0, 80.0}}};
    auto run = driver.Run(req);

    EXPECT_EQ(run.strategy, "random");
    EXPECT_EQ(run.trace.total(), 7u);
    for (const auto &args : runner_->history()) {
        EXPECT_EQ(FlagValue(args, "--threshold"), "hard");
    }
    for (const auto &record : run.trace.records()) {
        const double beta = record.params.at("beta");
        EXPECT_GE(beta, 40.0);
        EXPECT_LE(beta, 80.0);
    }
}

TEST_F(OptimizationDriverTest, ObjectiveCombinesBerAndMargin) {
    Build(SyntheticCascade);
    OptimizationDriver driver(*service_, Config("random"), 2s, nullptr);

    OptimizationRequest req;
    req.n_calls = 3;
    req.objective_margin_weight = 0.5;
    auto run = driver.Run(req);

    for (const auto &record : run.trace.records()) {
        ASSERT_FALSE(record.error.has_value());
        const double expected =
            record.metrics.at("ber_estimate") - 0.5 * record.metrics.at("logic_margin");
        EXPECT_DOUBLE_EQ(record.objective, expected);
    }
    EXPECT_DOUBLE_EQ(run.fixed_params["objective_margin_weight"].get<double>(), 0.5);
}

TEST_F(OptimizationDriverTest, FailedEvaluationsScoreInfinity) {
    Build([](const std::vector<std::string> &) { return Fail(2, "solver diverged"); });
    OptimizationDriver driver(*service_, Config("gp"), 2s, nullptr);

    OptimizationRequest req;
    req.n_calls = 4;
    req.random_starts = 2;
    auto run = driver.Run(req);

    EXPECT_EQ(run.trace.total(), 4u);
    EXPECT_FALSE(run.best.params.has_value());
    for (const auto &record : run.trace.records()) {
        EXPECT_TRUE(std::isinf(record.objective));
        ASSERT_TRUE(record.error.has_value());
        EXPECT_EQ(record.error->kind, ErrorKind::SimulationFailed);
    }
    auto payload = nlohmann::json::parse(run.ToJSON().dump());
    EXPECT_TRUE(payload["best"]["objective"].is_null());
}

TEST_F(OptimizationDriverTest, SlowEvaluationsRecordTimeouts) {
    Build(Sleeping(400ms, SyntheticCascade({"cascade"})));
    OptimizationDriver driver(*service_, Config("random"), 100ms, nullptr);

    OptimizationRequest req;
    req.n_calls = 2;
    auto run = driver.Run(req);

    EXPECT_EQ(run.trace.total(), 2u);
    for (const auto &record : run.trace.records()) {
        ASSERT_TRUE(record.error.has_value());
        EXPECT_EQ(record.error->kind, ErrorKind::Timeout);
    }
}

TEST_F(OptimizationDriverTest, RandomBatchNeverOutrunsThePool) {
    Build(Sleeping(200ms, SyntheticCascade({"cascade"})));
    auto config = Config("random");
    config.random_batch = 6;
    OptimizationDriver driver(*service_, config, 320ms, nullptr);

    // Four points queued on two workers at once would miss the deadline
    OptimizationRequest req;
    req.n_calls = 4;
    auto run = driver.Run(req);

    EXPECT_EQ(run.trace.total(), 4u);
    for (const auto &record : run.trace.records()) {
        EXPECT_FALSE(record.error.has_value());
    }
}

TEST(OptimizerConfig, BatchCappedAtWorkers) {
    OptimizerConfig config;
    config.random_batch = 6;
    EXPECT_EQ(config.ResolvedBatch(2), 2u);
    EXPECT_EQ(config.ResolvedBatch(16), 6u);
    config.random_batch = 0;
    EXPECT_GE(config.ResolvedBatch(4), 1u);
    EXPECT_LE(config.ResolvedBatch(4), 4u);
}

// =============================================================================
// Rejections
// =============================================================================

TEST_F(OptimizationDriverTest, ZeroCallsRejected) {
    Build(SyntheticCascade);
    OptimizationDriver driver(*service_, Config("gp"), 2s, nullptr);
    OptimizationRequest req;
    req.n_calls = 0;
    EXPECT_THROW((void)driver.Run(req), InvalidArgumentError);
    EXPECT_EQ(runner_->calls(), 0);
}

TEST_F(OptimizationDriverTest, BadFixedParamsRejectedUpFront) {
    Build(SyntheticCascade);
    OptimizationDriver driver(*service_, Config("gp"), 2s, nullptr);

    OptimizationRequest req;
    req.n_calls = 3;
    req.fixed_params = {{"threshold", "medium"}};
    EXPECT_THROW((void)driver.Run(req), InvalidArgumentError);

    req.fixed_params = {{"colour", "blue"}};
    EXPECT_THROW((void)driver.Run(req), InvalidArgumentError);
    EXPECT_EQ(runner_->calls(), 0);
}

TEST_F(OptimizationDriverTest, InvertedBoundsRejected) {
    Build(SyntheticCascade);
    OptimizationDriver driver(*service_, Config("random"), 2s, nullptr);
    OptimizationRequest req;
    req.n_calls = 2;
    req.space_bounds = {{"beta", {90.0, 10.0}}};
    EXPECT_THROW((void)driver.Run(req), InvalidArgumentError);
}

TEST_F(OptimizationDriverTest, RunOnCoordinatorIsRejected) {
    Build(SyntheticCascade);
    OptimizationDriver driver(*service_, Config("random"), 2s, nullptr);
    std::promise<bool> rejected;
    executor_.PostToCoordinator([&] {
        try {
            OptimizationRequest req;
            req.n_calls = 1;
            (void)driver.Run(req);
            rejected.set_value(false);
        } catch (const LifecycleError &) {
            rejected.set_value(true);
        }
    });
    EXPECT_TRUE(rejected.get_future().get());
}

TEST_F(OptimizationDriverTest, ConcurrentRunOnSameDriverRejected) {
    Build(Sleeping(300ms, SyntheticCascade({"cascade"})));
    OptimizationDriver driver(*service_, Config("random"), 2s, nullptr);

    OptimizationRequest req;
    req.n_calls = 2;
    auto first = std::async(std::launch::async, [&] { return driver.Run(req); });
    while (runner_->calls() == 0) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_THROW((void)driver.Run(req), LifecycleError);
    EXPECT_EQ(first.get().trace.total(), 2u);
}
