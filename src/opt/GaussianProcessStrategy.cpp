#include <prism/core/Error.hpp>
#include <prism/io/LogService.hpp>
#include <prism/opt/GaussianProcessStrategy.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <numbers>
#include <numeric>

namespace prism {

namespace {

constexpr std::array<double, 7> kLengthScales = {0.05, 0.1, 0.2, 0.3, 0.5, 0.8, 1.2};
constexpr double kLocalFraction = 0.25; ///< Share of candidates drawn near the incumbent
constexpr double kLocalSpread = 0.05;

/// RBF kernel between row-point sets
Eigen::MatrixXd Kernel(const Eigen::MatrixXd &A, const Eigen::MatrixXd &B, double length_scale) {
    Eigen::MatrixXd K(A.rows(), B.rows());
    const double inv = 1.0 / (2.0 * length_scale * length_scale);
    for (Eigen::Index i = 0; i < A.rows(); ++i) {
        for (Eigen::Index j = 0; j < B.rows(); ++j) {
            K(i, j) = std::exp(-(A.row(i) - B.row(j)).squaredNorm() * inv);
        }
    }
    return K;
}

std::vector<double> ToPoint(const ParameterSpace &space, const Eigen::VectorXd &u) {
    std::vector<double> point(space.size());
    for (std::size_t j = 0; j < space.size(); ++j) {
        point[j] = space[j].FromUnit(std::clamp(u(static_cast<Eigen::Index>(j)), 0.0, 1.0));
    }
    return point;
}

} // namespace

struct GaussianProcessStrategy::Posterior {
    double length_scale = kLengthScales[0];
    Eigen::LLT<Eigen::MatrixXd> llt;
    Eigen::VectorXd alpha;
    double log_marginal = -std::numeric_limits<double>::infinity();
    bool ok = false;

    void Fit(const Eigen::MatrixXd &X, const Eigen::VectorXd &y, double ls, double noise) {
        length_scale = ls;
        Eigen::MatrixXd K = Kernel(X, X, ls);
        K.diagonal().array() += noise;
        llt.compute(K);
        ok = llt.info() == Eigen::Success;
        if (!ok) {
            return;
        }
        alpha = llt.solve(y);
        const Eigen::MatrixXd L = llt.matrixL();
        const double log_det = 2.0 * L.diagonal().array().log().sum();
        log_marginal = -0.5 * y.dot(alpha) - 0.5 * log_det -
                       0.5 * static_cast<double>(y.size()) * std::log(2.0 * std::numbers::pi);
    }
};

GaussianProcessStrategy::GaussianProcessStrategy(GaussianProcessOptions options)
    : options_(options), rng_(options.seed ? *options.seed : std::random_device{}()) {}

void GaussianProcessStrategy::Minimize(ObjectiveEvaluator &objective, const ParameterSpace &space,
                                       std::size_t n_calls, std::size_t random_starts) {
    space.Validate();
    if (n_calls == 0) {
        throw InvalidArgumentError("n_calls", "must be > 0");
    }
    const std::size_t d = space.size();
    const std::size_t n_initial = std::clamp<std::size_t>(random_starts, 1, n_calls);

    Eigen::MatrixXd X(static_cast<Eigen::Index>(n_calls), static_cast<Eigen::Index>(d));
    std::vector<double> y;
    y.reserve(n_calls);

    const Eigen::MatrixXd initial = LatinHypercube(n_initial, d);
    for (std::size_t i = 0; i < n_initial; ++i) {
        const Eigen::VectorXd u = initial.row(static_cast<Eigen::Index>(i)).transpose();
        X.row(static_cast<Eigen::Index>(i)) = u.transpose();
        y.push_back(objective.Evaluate(ToPoint(space, u)));
    }

    for (std::size_t i = n_initial; i < n_calls; ++i) {
        const auto n = static_cast<Eigen::Index>(i);
        const Eigen::VectorXd u = Propose(X.topRows(n), Sanitize(y));
        X.row(n) = u.transpose();
        y.push_back(objective.Evaluate(ToPoint(space, u)));
    }
}

Eigen::MatrixXd GaussianProcessStrategy::LatinHypercube(std::size_t n, std::size_t d) {
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    Eigen::MatrixXd U(static_cast<Eigen::Index>(n), static_cast<Eigen::Index>(d));
    std::vector<std::size_t> strata(n);
    for (std::size_t j = 0; j < d; ++j) {
        std::iota(strata.begin(), strata.end(), 0);
        std::shuffle(strata.begin(), strata.end(), rng_);
        for (std::size_t i = 0; i < n; ++i) {
            U(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) =
                (static_cast<double>(strata[i]) + unit(rng_)) / static_cast<double>(n);
        }
    }
    return U;
}

Eigen::VectorXd GaussianProcessStrategy::Sanitize(const std::vector<double> &y) {
    double worst = -std::numeric_limits<double>::infinity();
    for (double v : y) {
        if (std::isfinite(v)) {
            worst = std::max(worst, v);
        }
    }
    const double fill = std::isfinite(worst) ? worst + 1.0 : 1.0;
    Eigen::VectorXd out(static_cast<Eigen::Index>(y.size()));
    for (std::size_t i = 0; i < y.size(); ++i) {
        out(static_cast<Eigen::Index>(i)) = std::isfinite(y[i]) ? y[i] : fill;
    }
    return out;
}

double GaussianProcessStrategy::ExpectedImprovement(double mu, double sigma, double best,
                                                    double xi) {
    const double improvement = best - mu - xi;
    if (sigma <= 0.0) {
        return std::max(improvement, 0.0);
    }
    const double z = improvement / sigma;
    const double cdf = 0.5 * std::erfc(-z / std::sqrt(2.0));
    const double pdf = std::exp(-0.5 * z * z) / std::sqrt(2.0 * std::numbers::pi);
    return improvement * cdf + sigma * pdf;
}

Eigen::VectorXd GaussianProcessStrategy::Propose(const Eigen::MatrixXd &X,
                                                 const Eigen::VectorXd &y) {
    const Eigen::Index d = X.cols();

    // Standardize
    const double mean = y.mean();
    double sd = std::sqrt((y.array() - mean).square().mean());
    if (sd < 1e-12) {
        sd = 1.0;
    }
    const Eigen::VectorXd ys = (y.array() - mean) / sd;

    Posterior post;
    for (double ls : kLengthScales) {
        Posterior trial;
        trial.Fit(X, ys, ls, options_.noise);
        if (trial.ok && trial.log_marginal > post.log_marginal) {
            post.length_scale = ls;
            post.log_marginal = trial.log_marginal;
            post.ok = true;
        }
    }

    std::uniform_real_distribution<double> unit(0.0, 1.0);
    Eigen::Index incumbent = 0;
    const double best = ys.minCoeff(&incumbent);

    if (!post.ok) {
        GetLogService().Debug("GP fit failed for every length scale; sampling uniformly");
        Eigen::VectorXd u(d);
        for (Eigen::Index j = 0; j < d; ++j) {
            u(j) = unit(rng_);
        }
        return u;
    }
    post.Fit(X, ys, post.length_scale, options_.noise);

    // Candidates: mostly uniform, some near the incumbent
    const auto m = static_cast<Eigen::Index>(std::max<std::size_t>(options_.acquisition_samples, 1));
    const auto n_local = static_cast<Eigen::Index>(static_cast<double>(m) * kLocalFraction);
    std::normal_distribution<double> jitter(0.0, kLocalSpread);
    Eigen::MatrixXd C(m, d);
    for (Eigen::Index i = 0; i < m; ++i) {
        for (Eigen::Index j = 0; j < d; ++j) {
            C(i, j) = i < n_local ? std::clamp(X(incumbent, j) + jitter(rng_), 0.0, 1.0)
                                  : unit(rng_);
        }
    }

    const Eigen::MatrixXd Ks = Kernel(C, X, post.length_scale); // m x n
    const Eigen::VectorXd mu = Ks * post.alpha;
    const Eigen::MatrixXd V = post.llt.matrixL().solve(Ks.transpose()); // n x m
    const Eigen::VectorXd explained = V.colwise().squaredNorm().transpose();

    Eigen::Index chosen = 0;
    double best_ei = -1.0;
    for (Eigen::Index i = 0; i < m; ++i) {
        const double var = std::max(1.0 + options_.noise - explained(i), 1e-12);
        const double ei = ExpectedImprovement(mu(i), std::sqrt(var), best, options_.xi);
        if (ei > best_ei) {
            best_ei = ei;
            chosen = i;
        }
    }
    return C.row(chosen).transpose();
}

} // namespace prism
