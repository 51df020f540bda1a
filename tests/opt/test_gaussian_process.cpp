/**
 * @file test_gaussian_process.cpp
 * @brief Unit tests for the GP/expected-improvement search strategy
 */

#include <prism/opt/GaussianProcessStrategy.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>
#include <set>

using namespace prism;

namespace {

/// Quadratic bowl with its minimum at (0.3, 0.7)
class BowlObjective : public ObjectiveEvaluator {
  public:
    double Evaluate(const std::vector<double> &point) override {
        ++calls;
        const double v = std::pow(point[0] - 0.3, 2) + std::pow(point[1] - 0.7, 2);
        best = std::min(best, v);
        return v;
    }

    int calls = 0;
    double best = std::numeric_limits<double>::infinity();
};

/// Fails (returns +inf) on the left half of the space
class HalfFailingObjective : public ObjectiveEvaluator {
  public:
    double Evaluate(const std::vector<double> &point) override {
        ++calls;
        if (point[0] < 0.5) {
            return std::numeric_limits<double>::infinity();
        }
        return point[0];
    }

    int calls = 0;
};

ParameterSpace UnitSquare() { return ParameterSpace({{"x", 0.0, 1.0}, {"y", 0.0, 1.0}}); }

GaussianProcessOptions Seeded(uint64_t seed) {
    GaussianProcessOptions options;
    options.seed = seed;
    options.acquisition_samples = 500;
    return options;
}

} // namespace

// =============================================================================
// Search
// =============================================================================

TEST(GaussianProcessStrategy, CallsObjectiveExactlyNCalls) {
    GaussianProcessStrategy gp(Seeded(1));
    BowlObjective f;
    gp.Minimize(f, UnitSquare(), 12, 4);
    EXPECT_EQ(f.calls, 12);
    EXPECT_EQ(gp.Name(), "gp");
}

TEST(GaussianProcessStrategy, MoreStartsThanCalls) {
    GaussianProcessStrategy gp(Seeded(2));
    BowlObjective f;
    gp.Minimize(f, UnitSquare(), 3, 10);
    EXPECT_EQ(f.calls, 3);
}

TEST(GaussianProcessStrategy, ConvergesOnSmoothBowl) {
    GaussianProcessStrategy gp(Seeded(3));
    BowlObjective f;
    gp.Minimize(f, UnitSquare(), 30, 6);
    EXPECT_LT(f.best, 0.02);
}

TEST(GaussianProcessStrategy, SurvivesFailedEvaluations) {
    GaussianProcessStrategy gp(Seeded(4));
    HalfFailingObjective f;
    EXPECT_NO_THROW(gp.Minimize(f, UnitSquare(), 10, 4));
    EXPECT_EQ(f.calls, 10);
}

TEST(GaussianProcessStrategy, ZeroCallsRejected) {
    GaussianProcessStrategy gp(Seeded(5));
    BowlObjective f;
    EXPECT_THROW(gp.Minimize(f, UnitSquare(), 0, 4), InvalidArgumentError);
    EXPECT_EQ(f.calls, 0);
}

TEST(GaussianProcessStrategy, PointsStayInBounds) {
    class BoundsCheck : public ObjectiveEvaluator {
      public:
        explicit BoundsCheck(const ParameterSpace &space) : space_(space) {}
        double Evaluate(const std::vector<double> &p) override {
            for (std::size_t i = 0; i < p.size(); ++i) {
                EXPECT_GE(p[i], space_[i].low);
                EXPECT_LE(p[i], space_[i].high);
            }
            return p[1];
        }

      private:
        const ParameterSpace &space_;
    };
    auto space = ParameterSpace::Default();
    BoundsCheck f(space);
    GaussianProcessStrategy gp(Seeded(6));
    gp.Minimize(f, space, 10, 5);
}

// =============================================================================
// Building blocks
// =============================================================================

TEST(GaussianProcessStrategy, LatinHypercubeStratifies) {
    GaussianProcessStrategy gp(Seeded(7));
    const std::size_t n = 8;
    auto U = gp.LatinHypercube(n, 3);
    ASSERT_EQ(U.rows(), 8);
    ASSERT_EQ(U.cols(), 3);
    for (Eigen::Index j = 0; j < U.cols(); ++j) {
        std::set<int> strata;
        for (Eigen::Index i = 0; i < U.rows(); ++i) {
            EXPECT_GE(U(i, j), 0.0);
            EXPECT_LT(U(i, j), 1.0);
            strata.insert(static_cast<int>(U(i, j) * n));
        }
        EXPECT_EQ(strata.size(), n);
    }
}

TEST(GaussianProcessStrategy, SanitizeReplacesNonFinite) {
    const double inf = std::numeric_limits<double>::infinity();
    auto y = GaussianProcessStrategy::Sanitize({1.0, inf, 3.0});
    EXPECT_DOUBLE_EQ(y(1), 4.0);
    EXPECT_DOUBLE_EQ(y(2), 3.0);

    auto all_failed = GaussianProcessStrategy::Sanitize({inf, inf});
    EXPECT_DOUBLE_EQ(all_failed(0), 1.0);
}

TEST(GaussianProcessStrategy, ExpectedImprovement) {
    EXPECT_DOUBLE_EQ(GaussianProcessStrategy::ExpectedImprovement(0.0, 0.0, 1.0, 0.0), 1.0);
    EXPECT_DOUBLE_EQ(GaussianProcessStrategy::ExpectedImprovement(2.0, 0.0, 1.0, 0.0), 0.0);

    const double narrow = GaussianProcessStrategy::ExpectedImprovement(1.0, 0.1, 1.0, 0.0);
    const double wide = GaussianProcessStrategy::ExpectedImprovement(1.0, 1.0, 1.0, 0.0);
    EXPECT_GT(narrow, 0.0);
    EXPECT_GT(wide, narrow);
    // At mu == best, EI = sigma * phi(0)
    EXPECT_NEAR(wide, 1.0 / std::sqrt(2.0 * std::numbers::pi), 1e-12);
}
