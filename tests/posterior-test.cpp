#include <elicit/belief/PosteriorManager.hpp>
#include <elicit/random/rng.hpp>
#include <gtest/gtest.h>
#include <Eigen/Eigenvalues>
#include <cmath>
#include <limits>
#include <sstream>

using namespace elicit;
using namespace elicit::belief;
using namespace Eigen;

static const MatrixXd I7 = MatrixXd::Identity(NUM_DIMENSIONS, NUM_DIMENSIONS);

static Observation dummy_observation() {
    return Observation{Vignette("v1", "financial", "", {VignetteOption("A", "", {{"wage", 20000L}}), VignetteOption("B", "", {{"wage", 10000L}})}), "A"};
}

// A likelihood peaked at beta_0 = 0.7 that ignores the observation
static double peaked(const Observation&, const VectorXd &beta) {
    return std::exp(-10 * (beta[0] - 0.7) * (beta[0] - 0.7));
}

TEST(Posterior, Construction) {
    PosteriorDistribution p(VectorXd::Zero(NUM_DIMENSIONS), I7);
    EXPECT_EQ(NUM_DIMENSIONS, p.K());
    EXPECT_EQ(dimension_names(), p.dimensions());
    EXPECT_EQ(0u, p.index("financial"));
    EXPECT_EQ(6u, p.index("values_culture"));
    EXPECT_EQ(1.0, p.variance("job_security"));
    EXPECT_THROW(p.index("hobbies"), std::invalid_argument);

    PosteriorDistribution small({"x", "y"}, VectorXd::Zero(2), MatrixXd::Identity(2, 2));
    EXPECT_EQ(1u, small.index("y"));

    EXPECT_THROW(PosteriorDistribution({}, VectorXd(), MatrixXd()), std::invalid_argument);
    EXPECT_THROW(PosteriorDistribution({"x", "x"}, VectorXd::Zero(2), MatrixXd::Identity(2, 2)), std::invalid_argument);
    EXPECT_THROW(PosteriorDistribution({"x", "y"}, VectorXd::Zero(3), MatrixXd::Identity(2, 2)), std::invalid_argument);
    EXPECT_THROW(PosteriorDistribution({"x", "y"}, VectorXd::Zero(2), MatrixXd::Identity(3, 3)), std::invalid_argument);
    MatrixXd negative = -MatrixXd::Identity(2, 2);
    EXPECT_THROW(PosteriorDistribution({"x", "y"}, VectorXd::Zero(2), negative), std::invalid_argument);
    VectorXd nan_mean = VectorXd::Zero(2);
    nan_mean[1] = std::nan("");
    EXPECT_THROW(PosteriorDistribution({"x", "y"}, nan_mean, MatrixXd::Identity(2, 2)), std::invalid_argument);
}

TEST(Posterior, ConstructFromNamedValues) {
    VectorXd mu(NUM_DIMENSIONS);
    mu << 0.5, -0.25, 0, 1, 0, 0, 2;
    MatrixXd S = 0.5 * I7;
    PosteriorDistribution p(mu, S);
    EXPECT_EQ(dimension_names(), p.dimensions());
    EXPECT_EQ(mu, p.mean());
    EXPECT_EQ(S, p.covariance());

    VectorXd small_mu = VectorXd::Ones(3);
    MatrixXd small_S = MatrixXd::Identity(3, 3);
    PosteriorDistribution small(small_mu, small_S);
    EXPECT_EQ((std::vector<std::string>{"0", "1", "2"}), small.dimensions());

    PosteriorManager pm(mu, S);
    EXPECT_EQ(dimension_names(), pm.posterior().dimensions());
    EXPECT_EQ(mu, pm.posterior().mean());
}

TEST(Posterior, Correlation) {
    MatrixXd cov(2, 2);
    cov << 4, 1,
           1, 1;
    PosteriorDistribution p({"a", "b"}, VectorXd::Zero(2), cov);
    EXPECT_DOUBLE_EQ(0.5, p.correlation("a", "b"));
    EXPECT_DOUBLE_EQ(1.0, p.correlation("a", "a"));

    PosteriorDistribution degenerate({"a", "b"}, VectorXd::Zero(2), MatrixXd::Zero(2, 2));
    EXPECT_EQ(0.0, degenerate.correlation("a", "b"));
}

TEST(Posterior, Sample) {
    elicit::random::seed(20240611);
    VectorXd mean(2);
    mean << 1.0, -2.0;
    MatrixXd cov(2, 2);
    cov << 0.25, 0,
           0, 1;
    PosteriorDistribution p({"a", "b"}, mean, cov);
    MatrixXd draws = p.sample(4000);
    ASSERT_EQ(4000, draws.rows());
    ASSERT_EQ(2, draws.cols());
    VectorXd m = draws.colwise().mean();
    EXPECT_NEAR(1.0, m[0], 0.05);
    EXPECT_NEAR(-2.0, m[1], 0.1);

    // Singular covariance still samples
    PosteriorDistribution flat({"a", "b"}, mean, MatrixXd::Zero(2, 2));
    MatrixXd d = flat.sample(3);
    EXPECT_EQ(1.0, d(2, 0));
    EXPECT_EQ(-2.0, d(2, 1));
    EXPECT_EQ(0, p.sample(0).rows());
}

TEST(Posterior, Summary) {
    PosteriorDistribution p(VectorXd::Zero(NUM_DIMENSIONS), I7);
    std::ostringstream out;
    out << p;
    EXPECT_NE(std::string::npos, out.str().find("work_life_balance"));
}

TEST(MapSolver, Quadratic) {
    // Gaussian likelihood centred at 2 with unit variance times an N(0, 1) prior: mode at 1
    VectorXd m = VectorXd::Zero(1);
    LogPosterior obj([](const VectorXd &b) { return std::exp(-0.5 * (b[0] - 2) * (b[0] - 2)); }, m, MatrixXd::Identity(1, 1));
    NewtonMapSolver solver;
    auto r = solver.solve(obj, m);
    EXPECT_TRUE(r.converged);
    EXPECT_NEAR(1.0, r.beta[0], 1e-4);
    EXPECT_NEAR(-2.0, r.hessian(0, 0), 1e-3);
    EXPECT_THROW(solver.solve(obj, VectorXd::Zero(2)), std::invalid_argument);
}

TEST(MapSolver, Invalid) {
    EXPECT_THROW(NewtonMapSolver(0), std::domain_error);
    EXPECT_THROW(NewtonMapSolver(10, 0.0), std::domain_error);
    EXPECT_THROW(NewtonMapSolver(10, 1e-6, -1.0), std::domain_error);
    auto one = [](const VectorXd&) { return 1.0; };
    EXPECT_THROW(LogPosterior(one, VectorXd(), MatrixXd()), std::invalid_argument);
    EXPECT_THROW(LogPosterior(one, VectorXd::Zero(2), MatrixXd::Identity(3, 3)), std::invalid_argument);
    EXPECT_THROW(LogPosterior(one, VectorXd::Zero(2), MatrixXd::Zero(2, 2)), std::invalid_argument);
}

TEST(PosteriorManager, PeakedLikelihood) {
    PosteriorManager pm(VectorXd::Zero(NUM_DIMENSIONS), I7);
    const auto &post = pm.update(peaked, dummy_observation());
    EXPECT_EQ(1u, pm.updates());

    // log posterior in beta_0 is -10(b - 0.7)^2 - b^2/2: mode 14/21, curvature 21
    EXPECT_NEAR(14.0 / 21.0, post.mean()[0], 1e-3);
    EXPECT_NEAR(1.0 / 21.0, post.covariance()(0, 0), 1e-3);
    for (int k = 1; k < NUM_DIMENSIONS; k++) {
        EXPECT_NEAR(0.0, post.mean()[k], 1e-4);
        EXPECT_NEAR(1.0, post.covariance()(k, k), 1e-3);
    }
    EXPECT_TRUE(post.covariance().isApprox(post.covariance().transpose()));
    SelfAdjointEigenSolver<MatrixXd> eig(post.covariance());
    EXPECT_GE(eig.eigenvalues().minCoeff(), -1e-6);
    EXPECT_EQ(dimension_names(), post.dimensions());
}

TEST(PosteriorManager, RepeatedObservations) {
    PosteriorManager pm(VectorXd::Zero(NUM_DIMENSIONS), I7);
    double previous_mean = 0, previous_var = 1;
    for (int i = 0; i < 4; i++) {
        const auto &post = pm.update(peaked, dummy_observation());
        EXPECT_GT(post.mean()[0], previous_mean);
        EXPECT_LT(post.mean()[0], 0.7 + 1e-6);
        EXPECT_LT(post.covariance()(0, 0), previous_var);
        previous_mean = post.mean()[0];
        previous_var = post.covariance()(0, 0);
    }
    EXPECT_EQ(4u, pm.updates());

    pm.reset();
    EXPECT_EQ(0u, pm.updates());
    EXPECT_EQ(0.0, pm.posterior().mean()[0]);
    EXPECT_EQ(1.0, pm.posterior().covariance()(0, 0));
}

TEST(PosteriorManager, ChoiceLikelihood) {
    PosteriorManager pm(VectorXd::Zero(NUM_DIMENSIONS), I7);
    LikelihoodCalculator lc;
    auto obs = dummy_observation();
    pm.update(lc.createLikelihoodFunction(obs.vignette, obs.chosen_option), obs);
    // Choosing the higher wage pulls the financial weight up and leaves the others alone
    EXPECT_GT(pm.posterior().mean()[0], 0.1);
    EXPECT_LT(pm.posterior().covariance()(0, 0), 1.0);
    EXPECT_NEAR(0.0, pm.posterior().mean()[3], 1e-4);

    Observation other{obs.vignette, "B"};
    PosteriorManager pm2(VectorXd::Zero(NUM_DIMENSIONS), I7);
    pm2.update(lc.createLikelihoodFunction(other.vignette, other.chosen_option), other);
    EXPECT_LT(pm2.posterior().mean()[0], -0.1);
}

TEST(PosteriorManager, LaplaceFallback) {
    MatrixXd fallback = 2 * MatrixXd::Identity(3, 3);
    // Positive definite Hessian (not a maximum)
    MatrixXd bad = MatrixXd::Identity(3, 3);
    EXPECT_TRUE(PosteriorManager::laplaceCovariance(bad, fallback).isApprox(fallback));
    MatrixXd nonfinite = -MatrixXd::Identity(3, 3);
    nonfinite(1, 2) = std::numeric_limits<double>::infinity();
    EXPECT_TRUE(PosteriorManager::laplaceCovariance(nonfinite, fallback).isApprox(fallback));

    MatrixXd good = -4 * MatrixXd::Identity(3, 3);
    EXPECT_TRUE(PosteriorManager::laplaceCovariance(good, fallback).isApprox(0.25 * MatrixXd::Identity(3, 3)));
}

TEST(PosteriorManager, ConstantLikelihood) {
    VectorXd mu(NUM_DIMENSIONS);
    mu << 0.3, -0.2, 0.1, 0.5, -0.4, 0.0, 0.25;
    MatrixXd S = I7;
    S(0, 1) = S(1, 0) = 0.4;
    S(2, 5) = S(5, 2) = -0.3;
    PosteriorManager pm(mu, S);
    auto constant = [](const Observation&, const VectorXd&) { return 0.42; };
    for (int i = 0; i < 3; i++) pm.update(constant, dummy_observation());
    EXPECT_EQ(3u, pm.updates());
    EXPECT_TRUE(pm.posterior().mean().isApprox(mu, 1e-9));
    EXPECT_TRUE(pm.posterior().covariance().isApprox(S, 1e-6));
}

TEST(PosteriorManager, HugeWeights) {
    VectorXd mu = VectorXd::Constant(NUM_DIMENSIONS, 1e8);
    MatrixXd S = 1e-4 * I7;
    PosteriorManager pm(mu, S);
    LikelihoodCalculator lc;
    auto obs = dummy_observation();
    Observation other{obs.vignette, "B"};
    pm.update(lc.createLikelihoodFunction(other.vignette, other.chosen_option), other);
    pm.update(lc.createLikelihoodFunction(obs.vignette, obs.chosen_option), obs);
    EXPECT_TRUE(pm.posterior().mean().allFinite());
    EXPECT_TRUE(pm.posterior().covariance().allFinite());
    EXPECT_GE(pm.posterior().variances().minCoeff(), 0.0);
}

TEST(PosteriorManager, TightPriorRegularization) {
    // Laplace eigenvalues 1e-9, 1e-9, 1e-12: the floor follows the 1e-9 current covariance
    MatrixXd fallback = 1e-9 * MatrixXd::Identity(3, 3);
    MatrixXd H = MatrixXd::Zero(3, 3);
    H.diagonal() << -1e9, -1e9, -1e12;
    MatrixXd cov = PosteriorManager::laplaceCovariance(H, fallback);
    for (int k = 0; k < 3; k++) EXPECT_LE(cov(k, k), 1e-9 * (1 + 1e-6));
    EXPECT_NEAR(1e-9, cov(2, 2), 1e-15);

    // With an ordinary covariance the absolute floor applies
    H(2, 2) = -1e12;
    H(0, 0) = H(1, 1) = -1;
    MatrixXd reg = PosteriorManager::laplaceCovariance(H, MatrixXd::Identity(3, 3));
    EXPECT_NEAR(PosteriorManager::min_eigenvalue, reg(2, 2), 1e-15);
    EXPECT_NEAR(1.0, reg(0, 0), 1e-12);
}

TEST(PosteriorManager, InvalidPrior) {
    EXPECT_THROW(PosteriorManager(VectorXd::Zero(NUM_DIMENSIONS), MatrixXd::Zero(NUM_DIMENSIONS, NUM_DIMENSIONS)), std::invalid_argument);
    EXPECT_THROW(PosteriorManager(VectorXd::Zero(2), I7), std::invalid_argument);
}

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
