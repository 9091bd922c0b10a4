#include "Cleaner.h"
#include "ProbabilityModel.h"
#include "SimulationConfig.h"
#include "TestSupport.h"
#include <cmath>
#include <gtest/gtest.h>

TEST(QualityAdjustmentTest, NeutralAtAverageScore) {
    auto q = make_quality_adjustment(1.0);
    EXPECT_DOUBLE_EQ(q(0.5), 1.0);
    EXPECT_DOUBLE_EQ(q(0.9), 1.4);
    EXPECT_DOUBLE_EQ(q(0.0), 0.5);
    EXPECT_DOUBLE_EQ(q(1.0), 1.5);
}

TEST(QualityAdjustmentTest, IncreasesWithScore) {
    auto q = make_quality_adjustment(0.8);
    for (double s = 0.0; s < 1.0; s += 0.1)
        EXPECT_LT(q(s), q(s + 0.1));
}

TEST(QualityAdjustmentTest, ZeroWeightIgnoresScore) {
    auto q = make_quality_adjustment(0.0);
    EXPECT_DOUBLE_EQ(q(0.1), 1.0);
    EXPECT_DOUBLE_EQ(q(0.9), 1.0);
}

TEST(CapacityAdjustmentTest, FallsWithLoadDownToTheFloor) {
    auto cap = make_capacity_adjustment(10, 0.1);
    EXPECT_DOUBLE_EQ(cap(Cleaner("c", MIDTOWN, 0.5, 10.0, true, 1, 0)), 1.0);
    EXPECT_DOUBLE_EQ(cap(Cleaner("c", MIDTOWN, 0.5, 10.0, true, 1, 5)), 0.5);
    EXPECT_DOUBLE_EQ(cap(Cleaner("c", MIDTOWN, 0.5, 10.0, true, 1, 10)), 0.1);
    EXPECT_DOUBLE_EQ(cap(Cleaner("c", MIDTOWN, 0.5, 10.0, true, 1, 50)), 0.1);
}

TEST(CapacityAdjustmentTest, LargerTeamsHaveMoreRoom) {
    auto cap = make_capacity_adjustment(10, 0.1);
    EXPECT_DOUBLE_EQ(cap(Cleaner("c", MIDTOWN, 0.5, 10.0, true, 2, 10)), 0.5);
    EXPECT_GT(cap(Cleaner("c", MIDTOWN, 0.5, 10.0, true, 3, 10)),
              cap(Cleaner("c", MIDTOWN, 0.5, 10.0, true, 2, 10)));
}

TEST(CapacityAdjustmentTest, IdleMaximalTeamHasFullCapacity) {
    auto cap = make_capacity_adjustment(10, 0.1);
    EXPECT_DOUBLE_EQ(cap(Cleaner("c", MIDTOWN, 0.5, 10.0, true, 2147483647, 0)), 1.0);
    EXPECT_DOUBLE_EQ(cap(Cleaner("c", MIDTOWN, 0.5, 10.0, true, 2147483647, 10)), 1.0 - 10.0 / 21474836470.0);
}

TEST(ProbabilityModelTest, DefaultsMatchConfig) {
    ProbabilityModel model;
    SimulationConfig config;
    ProbabilityModel from_config(config);
    EXPECT_DOUBLE_EQ(model.base_bid_probability, from_config.base_bid_probability);
    EXPECT_DOUBLE_EQ(model.base_connection_probability, from_config.base_connection_probability);
    EXPECT_DOUBLE_EQ(model.distance_decay_factor, from_config.distance_decay_factor);
}

TEST(ProbabilityModelTest, BidProbabilityFormula) {
    ProbabilityModel model;
    Cleaner c("c", MIDTOWN, 0.9);
    double expected = 0.14 * std::exp(-0.2 * 2.0) * 1.4 * 1.0;
    EXPECT_NEAR(model.raw_bid_probability(c, 2.0), expected, 1e-12);
}

TEST(ProbabilityModelTest, ConnectionProbabilityIgnoresCapacity) {
    ProbabilityModel model;
    Cleaner idle("c", MIDTOWN, 0.9, 10.0, true, 1, 0);
    Cleaner loaded("c", MIDTOWN, 0.9, 10.0, true, 1, 9);
    EXPECT_DOUBLE_EQ(model.raw_connection_probability(idle, 3.0),
                     model.raw_connection_probability(loaded, 3.0));
    EXPECT_GT(model.raw_bid_probability(idle, 3.0), model.raw_bid_probability(loaded, 3.0));
    EXPECT_NEAR(model.raw_connection_probability(idle, 3.0), 0.4 * std::exp(-0.6) * 1.4, 1e-12);
}

TEST(ProbabilityModelTest, DecaysWithDistance) {
    ProbabilityModel model;
    Cleaner c("c", MIDTOWN);
    EXPECT_DOUBLE_EQ(model.distance_factor(0.0), 1.0);
    double prev = model.raw_bid_probability(c, 0.0);
    for (double d = 0.5; d <= 10.0; d += 0.5) {
        double p = model.raw_bid_probability(c, d);
        EXPECT_LT(p, prev);
        prev = p;
    }
}

TEST(ProbabilityModelTest, ZeroDecayIgnoresDistance) {
    ProbabilityModel model;
    model.distance_decay_factor = 0.0;
    Cleaner c("c", MIDTOWN);
    EXPECT_DOUBLE_EQ(model.raw_bid_probability(c, 0.0), model.raw_bid_probability(c, 9.0));
}

TEST(ProbabilityModelTest, AdjustmentsCanBeReplaced) {
    ProbabilityModel model;
    model.quality_adjustment = [](double) { return 2.0; };
    model.capacity_adjustment = [](const Cleaner&) { return 0.5; };
    model.distance_decay_factor = 0.0;
    Cleaner c("c", MIDTOWN);
    EXPECT_DOUBLE_EQ(model.raw_bid_probability(c, 1.0), 0.14 * 2.0 * 0.5);
    EXPECT_DOUBLE_EQ(model.raw_connection_probability(c, 1.0), 0.4 * 2.0);
}
