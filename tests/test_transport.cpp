#include <gtest/gtest.h>

#include "transport.hpp"

#include <stdexcept>

TEST(TransportTest, MatchingMassOnZeroDiagonalCostsNothing) {
    EXPECT_NEAR(earth_movers_distance({0.5, 0.5}, {0.5, 0.5}, {0.0, 1.0, 1.0, 0.0}), 0.0, 1e-12);
}

TEST(TransportTest, MovesAllMassAcross) {
    EXPECT_NEAR(earth_movers_distance({1.0, 0.0}, {0.0, 1.0}, {0.0, 2.0, 2.0, 0.0}), 2.0, 1e-12);
}

TEST(TransportTest, SingleSourceSplitsOverTargets) {
    EXPECT_NEAR(earth_movers_distance({1.0}, {0.25, 0.75}, {4.0, 2.0}), 2.5, 1e-12);
}

TEST(TransportTest, ReroutesWhenCheapestFirstEdgeIsWrong) {
    // Cheapest single edge is row0->col0 or row1->col0, but the optimum is the anti-diagonal.
    EXPECT_NEAR(earth_movers_distance({0.5, 0.5}, {0.5, 0.5}, {1.0, 2.0, 1.0, 10.0}), 1.5, 1e-12);
}

TEST(TransportTest, MatchesOneDimensionalClosedForm) {
    // On a line with unit spacing the cost equals the L1 distance between the CDFs.
    const std::vector<double> cost = {
        0.0, 1.0, 2.0,
        1.0, 0.0, 1.0,
        2.0, 1.0, 0.0,
    };
    EXPECT_NEAR(earth_movers_distance({0.2, 0.3, 0.5}, {0.5, 0.3, 0.2}, cost), 0.6, 1e-9);
}

TEST(TransportTest, EmptyMassIsFree) {
    EXPECT_DOUBLE_EQ(earth_movers_distance({0.0}, {0.0}, {3.0}), 0.0);
}

TEST(TransportTest, RejectsMismatchedCostMatrix) {
    EXPECT_THROW(earth_movers_distance({0.5, 0.5}, {1.0}, {1.0}), std::invalid_argument);
}

TEST(TransportTest, RejectsNegativeWeights) {
    EXPECT_THROW(earth_movers_distance({1.5, -0.5}, {1.0}, {1.0, 1.0}), std::invalid_argument);
}

TEST(TransportTest, RejectsUnequalMass) {
    EXPECT_THROW(earth_movers_distance({1.0}, {0.5}, {1.0}), std::invalid_argument);
}

TEST(TransportTest, RejectsNegativeCost) {
    EXPECT_THROW(earth_movers_distance({1.0}, {1.0}, {-1.0}), std::invalid_argument);
}
