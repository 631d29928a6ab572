#include <gtest/gtest.h>
#include "modules/Monsoon.h"
#include "modules/RouteDistanceTable.h"

// Labels after each advance(), including the hold steps at cycle % 6 == 1 and 4
TEST(MonsoonTest, CycleTable) {
    MonsoonModel model;
    EXPECT_EQ(model.state(), MonsoonState::Northeast);
    EXPECT_EQ(model.cycle(), 0u);

    const MonsoonState expected[] = {
        MonsoonState::Northeast,  // 1: hold
        MonsoonState::Calm,       // 2
        MonsoonState::Southwest,  // 3
        MonsoonState::Southwest,  // 4: hold
        MonsoonState::Calm,       // 5
        MonsoonState::Northeast   // 6
    };

    // Three full periods
    for (int period = 0; period < 3; ++period) {
        for (int step = 0; step < 6; ++step) {
            model.advance();
            EXPECT_EQ(model.state(), expected[step])
                << "cycle " << model.cycle();
        }
    }
    EXPECT_EQ(model.cycle(), 18u);
}

TEST(MonsoonTest, Reset) {
    MonsoonModel model;
    for (int i = 0; i < 4; ++i) model.advance();
    EXPECT_EQ(model.state(), MonsoonState::Southwest);

    model.reset();
    EXPECT_EQ(model.state(), MonsoonState::Northeast);
    EXPECT_EQ(model.cycle(), 0u);
}

TEST(MonsoonTest, WindFactors) {
    auto winds = FavorableWinds::nusantara();

    // Calm overrides the table
    EXPECT_DOUBLE_EQ(winds.factor(MonsoonState::Calm, "jakarta", "surabaya"), 0.6);

    // With the wind, against it, and unlisted
    EXPECT_DOUBLE_EQ(winds.factor(MonsoonState::Northeast, "jakarta", "surabaya"), 0.9);
    EXPECT_DOUBLE_EQ(winds.factor(MonsoonState::Northeast, "surabaya", "jakarta"), 0.3);
    EXPECT_DOUBLE_EQ(winds.factor(MonsoonState::Northeast, "ternate", "cebu"), 0.5);

    EXPECT_DOUBLE_EQ(winds.factor(MonsoonState::Southwest, "surabaya", "jakarta"), 0.9);
    EXPECT_DOUBLE_EQ(winds.factor(MonsoonState::Southwest, "jakarta", "surabaya"), 0.3);
}

TEST(MonsoonTest, Names) {
    EXPECT_STREQ(monsoonName(MonsoonState::Northeast), "northeast");
    EXPECT_STREQ(monsoonName(MonsoonState::Southwest), "southwest");
    EXPECT_STREQ(monsoonName(MonsoonState::Calm), "calm");
}

TEST(DistanceTableTest, ListedAndDefault) {
    auto table = RouteDistanceTable::nusantara();

    EXPECT_EQ(table.size(), 16u);
    EXPECT_DOUBLE_EQ(table.distance("malacca", "jakarta"), 0.8);
    EXPECT_DOUBLE_EQ(table.distance("jakarta", "malacca"), 0.8);
    EXPECT_DOUBLE_EQ(table.distance("manila", "cebu"), 0.9);
    EXPECT_DOUBLE_EQ(table.distance("ternate", "cebu"), 0.4);
}

TEST(DistanceTableTest, DirectedLookup) {
    // Only one direction listed: the reverse falls back to the default
    std::map<RouteDistanceTable::Key, double> entries;
    entries[RouteDistanceTable::Key("a", "b")] = 0.9;
    RouteDistanceTable table(entries);

    EXPECT_DOUBLE_EQ(table.distance("a", "b"), 0.9);
    EXPECT_DOUBLE_EQ(table.distance("b", "a"), 0.4);
    EXPECT_DOUBLE_EQ(table.fallback(), 0.4);
}
