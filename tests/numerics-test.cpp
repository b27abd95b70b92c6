// Tests for the numerical helpers, the combinatorics helpers, the random engine and the runtime log.

#include <elicit/numerics.hpp>
#include <elicit/algorithms.hpp>
#include <elicit/log.hpp>
#include <elicit/random/util.hpp>
#include <cstdio>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include <cmath>
#include <stdexcept>
#include <vector>

using namespace elicit;
using Eigen::VectorXd;
using Eigen::MatrixXd;

TEST(Sigmoid, Symmetric) {
    EXPECT_EQ(0.5, sigmoid(0));
    for (double z : {0.25, 1.0, 3.5, 20.0, 100.0}) {
        EXPECT_NEAR(1.0, sigmoid(z) + sigmoid(-z), 1e-15);
        EXPECT_GT(sigmoid(z), 0.5);
    }
}

TEST(Sigmoid, Extremes) {
    EXPECT_EQ(1.0, sigmoid(1000));
    EXPECT_EQ(0.0, sigmoid(-1000));
    EXPECT_TRUE(std::isfinite(sigmoid(-1e300)));
    EXPECT_TRUE(std::isfinite(sigmoid(1e300)));
    EXPECT_NEAR(1.0 / (1.0 + std::exp(-2.0)), sigmoid(2.0), 1e-15);
}

TEST(Differences, Gradient) {
    auto f = [](const VectorXd &x) { return x[0]*x[0] + 3*x[0]*x[1] - std::sin(x[1]); };
    VectorXd x(2);
    x << 0.5, -1.25;
    VectorXd g = numerical_gradient(f, x);
    EXPECT_NEAR(2*0.5 + 3*(-1.25), g[0], 1e-7);
    EXPECT_NEAR(3*0.5 - std::cos(-1.25), g[1], 1e-7);
}

TEST(Differences, HessianSymmetric) {
    auto f = [](const VectorXd &x) { return -2*x[0]*x[0] + x[0]*x[1]*x[2] + std::exp(0.5*x[2]); };
    VectorXd x(3);
    x << 1.0, 2.0, -0.5;
    MatrixXd H = numerical_hessian(f, x);
    EXPECT_EQ(H, H.transpose());
    EXPECT_NEAR(-4, H(0,0), 1e-4);
    EXPECT_NEAR(0, H(1,1), 1e-4);
    EXPECT_NEAR(0.25*std::exp(-0.25), H(2,2), 1e-4);
    EXPECT_NEAR(x[2], H(0,1), 1e-4);
    EXPECT_NEAR(x[1], H(0,2), 1e-4);
    EXPECT_NEAR(x[0], H(1,2), 1e-4);
}

TEST(Algorithms, CartesianIndex) {
    std::vector<size_t> sizes{2, 1, 3}, index(3, 0);
    std::vector<std::vector<size_t>> seen{index};
    while (next_cartesian_index(index, sizes)) seen.push_back(index);

    ASSERT_EQ(6, seen.size());
    EXPECT_EQ((std::vector<size_t>{0, 0, 1}), seen[1]);
    EXPECT_EQ((std::vector<size_t>{0, 0, 2}), seen[2]);
    EXPECT_EQ((std::vector<size_t>{1, 0, 0}), seen[3]);
    EXPECT_EQ((std::vector<size_t>{1, 0, 2}), seen[5]);
    // Exhausting the odometer resets it
    EXPECT_EQ((std::vector<size_t>{0, 0, 0}), index);
}

TEST(Algorithms, IncreasingPermutation) {
    // All 2-element subsets of {0, ..., 4}
    std::vector<size_t> pair{0, 1};
    unsigned int count = 1;
    while (next_increasing_integer_permutation(pair.begin(), pair.end(), size_t(4))) {
        EXPECT_LT(pair[0], pair[1]);
        count++;
    }
    EXPECT_EQ(10, count);
}

TEST(Log, Levels) {
    EXPECT_EQ(log::level::info, log::parse_level("INFO"));
    EXPECT_EQ(log::level::warning, log::parse_level("warn"));
    EXPECT_STREQ("ERROR", log::to_string(log::level::error));
    EXPECT_THROW(log::parse_level("loud"), std::invalid_argument);

    log::threshold(log::level::warning);
    EXPECT_FALSE(log::enabled(log::level::info));
    EXPECT_TRUE(log::enabled(log::level::error));
    log::threshold(log::level::debug);
    EXPECT_TRUE(log::enabled(log::level::debug));
    log::threshold(log::level::warning);
}

TEST(Log, BadFile) {
    EXPECT_THROW(log::open("/nonexistent-directory/elicit.log"), std::runtime_error);
}

TEST(Random, Reseed) {
    random::seed(123);
    double a = random::rnormal(), b = random::runiform();
    random::seed(123);
    EXPECT_EQ(a, random::rnormal());
    EXPECT_EQ(b, random::runiform());
    for (int i = 0; i < 100; i++) {
        auto k = random::runiform_index(2, 4);
        EXPECT_GE(k, 2u);
        EXPECT_LE(k, 4u);
    }
}

TEST(Log, WritesTimestampedLines) {
    const std::string path = testing::TempDir() + "elicit-log-test.log";
    std::remove(path.c_str());
    log::open(path);
    log::threshold(log::level::info);
    ELICIT_LOG(info, "profiles: " << 5120);
    ELICIT_LOG(debug, "hidden");
    log::close();
    log::threshold(log::level::warning);

    std::ifstream in(path);
    std::string line;
    ASSERT_TRUE(std::getline(in, line));
    // [YYYY-mm-dd HH:MM:SS] INFO: ...
    EXPECT_EQ('[', line[0]);
    EXPECT_EQ(']', line[20]);
    EXPECT_NE(std::string::npos, line.find("INFO: profiles: 5120"));
    EXPECT_FALSE(std::getline(in, line));
}

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
