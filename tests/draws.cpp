#include <blp/SimulationDraws.hpp>
#include <blp/error.hpp>
#include <gtest/gtest.h>
#include <cmath>

using blp::SimulationDraws;
using Eigen::MatrixXd;
using Eigen::VectorXd;

TEST(StandardNormal, Shape) {
    auto draws = SimulationDraws::standardNormal(128, 2, 7);
    EXPECT_EQ(128, draws.size());
    EXPECT_EQ(2, draws.dimension());
    EXPECT_EQ(128, draws.nodes().rows());
    EXPECT_EQ(2, draws.nodes().cols());
    ASSERT_EQ(128, draws.weights().size());
    for (int r = 0; r < 128; r++) EXPECT_EQ(1.0 / 128, draws.weights()[r]);
    EXPECT_NEAR(1.0, draws.weights().sum(), 1e-12);
}

TEST(StandardNormal, UniformWeights) {
    for (std::size_t n : {1, 3, 7, 100, 1000}) {
        auto draws = SimulationDraws::standardNormal(n, 3, 99);
        for (std::size_t r = 0; r < n; r++) EXPECT_DOUBLE_EQ(1.0 / n, draws.weights()[r]);
        EXPECT_NEAR(1.0, draws.weights().sum(), 1e-12);
    }
}

TEST(StandardNormal, Reproducible) {
    auto a = SimulationDraws::standardNormal(50, 3, 1234);
    auto b = SimulationDraws::standardNormal(50, 3, 1234);
    auto c = SimulationDraws::standardNormal(50, 3, 4321);

    EXPECT_TRUE(a.nodes() == b.nodes());
    EXPECT_FALSE(a.nodes() == c.nodes());

    // More draws with the same seed extend the smaller set
    auto d = SimulationDraws::standardNormal(80, 3, 1234);
    EXPECT_TRUE(a.nodes() == d.nodes().topRows(50));
}

TEST(StandardNormal, Moments) {
    auto draws = SimulationDraws::standardNormal(20000, 2, 42);
    const auto &nodes = draws.nodes();
    const auto &w = draws.weights();
    for (int k = 0; k < 2; k++) {
        double mean = w.dot(nodes.col(k));
        double second = w.dot(nodes.col(k).cwiseAbs2());
        EXPECT_NEAR(0.0, mean, 0.05);
        EXPECT_NEAR(1.0, second, 0.05);
    }
}

TEST(StandardNormal, ZeroDimension) {
    auto draws = SimulationDraws::standardNormal(1, 0, 123);
    EXPECT_EQ(1, draws.size());
    EXPECT_EQ(0, draws.dimension());
    EXPECT_EQ(1.0, draws.weights()[0]);
}

TEST(StandardNormal, NoDraws) {
    EXPECT_THROW(SimulationDraws::standardNormal(0, 2, 1), blp::dimension_mismatch);
}

TEST(Construction, Valid) {
    MatrixXd nodes(3, 1);
    nodes << -1.224744871391589, 0, 1.224744871391589;
    VectorXd weights(3);
    weights << 1.0/6, 2.0/3, 1.0/6;
    SimulationDraws draws(nodes, weights);
    EXPECT_EQ(3, draws.size());
    EXPECT_EQ(1, draws.dimension());
    EXPECT_TRUE(nodes == draws.nodes());
    EXPECT_TRUE(weights == draws.weights());
}

TEST(Construction, WeightSum) {
    MatrixXd nodes = MatrixXd::Zero(2, 1);
    VectorXd weights(2);
    weights << 0.5, 0.52;
    try {
        SimulationDraws draws(nodes, weights);
        FAIL() << "weights summing to 1.02 accepted";
    }
    catch (const blp::invalid_weights &e) {
        EXPECT_NEAR(0.02, e.slack(), 1e-12);
    }

    weights << 0.5, 0.48;
    EXPECT_THROW(SimulationDraws(nodes, weights), blp::invalid_weights);

    // Within tolerance:
    weights << 0.5, 0.5 + 5e-9;
    EXPECT_NO_THROW(SimulationDraws(nodes, weights));
}

TEST(Construction, NonPositiveWeight) {
    MatrixXd nodes = MatrixXd::Zero(2, 2);
    VectorXd weights(2);
    weights << 1.25, -0.25;
    try {
        SimulationDraws draws(nodes, weights);
        FAIL() << "negative weight accepted";
    }
    catch (const blp::invalid_weights &e) {
        EXPECT_EQ(-0.25, e.slack());
    }

    weights << 1.0, 0.0;
    EXPECT_THROW(SimulationDraws(nodes, weights), blp::invalid_weights);
}

TEST(Construction, Dimensions) {
    try {
        SimulationDraws draws(MatrixXd(0, 2), VectorXd());
        FAIL() << "empty draws accepted";
    }
    catch (const blp::dimension_mismatch &e) {
        EXPECT_EQ("simulation draws", e.context());
        EXPECT_EQ(1, e.expected());
        EXPECT_EQ(0, e.found());
    }

    try {
        SimulationDraws draws(MatrixXd::Zero(3, 2), VectorXd::Constant(2, 0.5));
        FAIL() << "weight length mismatch accepted";
    }
    catch (const blp::dimension_mismatch &e) {
        EXPECT_EQ("draw weight length", e.context());
        EXPECT_EQ(3, e.expected());
        EXPECT_EQ(2, e.found());
    }
}
