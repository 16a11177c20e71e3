#include <blp/demand.hpp>
#include <blp/error.hpp>
#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

using namespace blp;
using Eigen::MatrixXd;
using Eigen::VectorXd;

namespace {

ProductData products(int markets, int nonlinear) {
    const int n = 3 * markets;
    std::vector<std::string> ids;
    VectorXd s(n);
    MatrixXd X1(n, 2), X2(n, nonlinear);
    for (int t = 0; t < markets; t++) {
        for (int k = 0; k < 3; k++) {
            const int j = 3*t + k;
            ids.push_back("t" + std::to_string(t));
            s[j] = 0.05 + 0.1*k + 0.02*(t % 3);
            X1.row(j) << 1, k + 0.1*t;
            for (int c = 0; c < nonlinear; c++) X2(j, c) = 0.5 + 0.4*k - 0.1*c + 0.03*t;
        }
    }
    return ProductData::Builder(ids, s).x1(X1).x2(X2).build();
}

MatrixXd sigma() {
    MatrixXd sigma(2, 2);
    sigma << 1.0, 0,
             0.3, 0.6;
    return sigma;
}

}

TEST(Contraction, LogitOneIteration) {
    auto data = products(4, 0);
    auto result = solve_delta(data, SimulationDraws::standardNormal(1, 0, 5), MatrixXd());

    EXPECT_EQ(1, result.second.iterations);
    EXPECT_LT(result.second.max_gap, 1e-9);
    for (std::size_t j = 0; j < data.size(); j++)
        EXPECT_NEAR(std::log(data.shares()[j] / data.outsideShare(j)), result.first[j], 1e-12);
}

TEST(Contraction, RoundTrip) {
    auto data = products(5, 2);
    auto draws = SimulationDraws::standardNormal(200, 2, 99);
    auto result = solve_delta(data, draws, sigma());

    EXPECT_GT(result.second.iterations, 1);
    EXPECT_LT(result.second.max_gap, 1e-9);

    VectorXd predicted = predict_shares(result.first, data, sigma(), draws);
    for (std::size_t j = 0; j < data.size(); j++)
        EXPECT_NEAR(data.shares()[j], predicted[j], 1e-8);
}

TEST(Contraction, NoIterations) {
    auto data = products(2, 0);
    ContractionOptions opts;
    opts.max_iterations = 0;
    try {
        solve_delta(data, SimulationDraws::standardNormal(1, 0, 5), MatrixXd(), opts);
        FAIL() << "contraction with no iterations succeeded";
    }
    catch (const contraction_failure &e) {
        EXPECT_EQ(0, e.iterations());
        EXPECT_EQ(std::numeric_limits<double>::infinity(), e.maxGap());
    }
}

TEST(Contraction, IterationBudget) {
    auto data = products(3, 2);
    ContractionOptions opts;
    opts.max_iterations = 1;
    try {
        solve_delta(data, SimulationDraws::standardNormal(100, 2, 5), sigma(), opts);
        FAIL() << "heterogeneous contraction converged in one iteration";
    }
    catch (const contraction_failure &e) {
        EXPECT_EQ(1, e.iterations());
        EXPECT_GT(e.maxGap(), 1e-9);
        EXPECT_TRUE(std::isfinite(e.maxGap()));
    }
}

TEST(Contraction, Damping) {
    auto data = products(3, 2);
    auto draws = SimulationDraws::standardNormal(100, 2, 8);
    auto full = solve_delta(data, draws, sigma());

    ContractionOptions opts;
    opts.damping = 0.5;
    auto damped = solve_delta(data, draws, sigma(), opts);

    EXPECT_GT(damped.second.iterations, full.second.iterations);
    for (std::size_t j = 0; j < data.size(); j++)
        EXPECT_NEAR(full.first[j], damped.first[j], 1e-6);
}

TEST(Contraction, Threaded) {
    auto data = products(7, 2);
    auto draws = SimulationDraws::standardNormal(50, 2, 12);
    auto serial = solve_delta(data, draws, sigma());

    ContractionOptions opts;
    opts.max_threads = 3;
    auto parallel = solve_delta(data, draws, sigma(), opts);

    EXPECT_EQ(serial.second.iterations, parallel.second.iterations);
    EXPECT_TRUE(serial.first == parallel.first);
}

TEST(Contraction, Underflow) {
    auto data = products(2, 2);
    // Each weighted per-draw share is at most 1/50, below this floor
    ContractionOptions opts;
    opts.minimum_share = 0.05;
    EXPECT_THROW(solve_delta(data, SimulationDraws::standardNormal(50, 2, 3), sigma(), opts), numerical_error);
}

TEST(Contraction, ShapesCheckedFirst) {
    auto data = products(2, 1);
    ContractionOptions opts;
    opts.max_iterations = 0;
    try {
        solve_delta(data, SimulationDraws::standardNormal(5, 1, 1), MatrixXd::Identity(4, 4), opts);
        FAIL() << "4x4 sigma accepted for one nonlinear characteristic";
    }
    catch (const dimension_mismatch &e) {
        EXPECT_EQ("sigma dimension", e.context());
        EXPECT_EQ(1, e.expected());
        EXPECT_EQ(4, e.found());
    }

    try {
        solve_delta(data, SimulationDraws::standardNormal(5, 3, 1), MatrixXd::Identity(1, 1), opts);
        FAIL() << "3-dimensional draws accepted";
    }
    catch (const dimension_mismatch &e) {
        EXPECT_EQ("draw dimension", e.context());
        EXPECT_EQ(1, e.expected());
        EXPECT_EQ(3, e.found());
    }
}
