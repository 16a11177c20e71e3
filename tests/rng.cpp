#include <blp/random/rng.hpp>
#include <blp/SimulationDraws.hpp>
#include <gtest/gtest.h>
#include <thread>

using namespace blp;

TEST(Rng, ExplicitSeed) {
    random::seed(42);
    EXPECT_EQ(42, random::seed());

    auto a1 = random::rng()(), a2 = random::rng()();
    random::seed(42);
    EXPECT_EQ(a1, random::rng()());
    EXPECT_EQ(a2, random::rng()());
}

TEST(Rng, MatchesSeededGenerator) {
    random::seed(987);
    random::rng_t local(987);
    for (int i = 0; i < 10; i++) EXPECT_EQ(local(), random::rng()());
}

TEST(Rng, ThreadSeeds) {
    random::seed(1000);
    random::rng_t::result_type other = 0;
    std::thread thr([&other] { other = random::seed(); });
    thr.join();
    // The other thread was seeded automatically with something other than our seed
    EXPECT_NE(1000, other);
    EXPECT_EQ(1000, random::seed());
}

TEST(Rng, ThreadDraws) {
    random::seed(31337);
    auto a = SimulationDraws::standardNormal(20, 2);
    random::seed(31337);
    auto b = SimulationDraws::standardNormal(20, 2);
    EXPECT_TRUE(a.nodes() == b.nodes());

    auto c = SimulationDraws::standardNormal(20, 2);
    EXPECT_FALSE(a.nodes() == c.nodes());
}

TEST(Rng, ConsecutiveThreadSeeds) {
    random::rng_t::result_type first = 0, second = 0;
    std::thread a([&first] { first = random::seed(); });
    a.join();
    std::thread b([&second] { second = random::seed(); });
    b.join();
    EXPECT_EQ(first + 1, second);
}
