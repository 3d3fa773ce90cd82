#include <gtest/gtest.h>
#include <sizing/furnace_sizing.hpp>

using namespace furnaceline;

TEST(Sizing, FurnacesPerFullBeltIsPositive) {
    for (FurnaceType furnace : all_furnace_types()) {
        for (BeltType belt : all_belt_types()) {
            EXPECT_GT(furnaces_per_full_belt(furnace, belt), 0.0);
        }
    }
}

TEST(Sizing, CountAlwaysInRange) {
    for (FurnaceType furnace : all_furnace_types()) {
        for (BeltType belt : all_belt_types()) {
            FurnaceLineConfig config;
            config.furnace = furnace;
            config.belt = belt;
            int count = calculate_furnace_count(config);
            EXPECT_GE(count, MIN_FURNACE_COUNT);
            EXPECT_LE(count, MAX_FURNACE_COUNT);
        }
    }
}

TEST(Sizing, StoneFurnacesOnYellowBelt) {
    FurnaceLineConfig config;
    config.furnace = FurnaceType::Stone;
    config.belt = BeltType::Transport;

    EXPECT_NEAR(furnaces_per_full_belt(config.furnace, config.belt), 48.0, 1e-9);
    EXPECT_EQ(calculate_furnace_count(config), 48);
}

TEST(Sizing, SaturatingCounts) {
    FurnaceLineConfig config;

    config.furnace = FurnaceType::Stone;
    config.belt = BeltType::Fast;
    EXPECT_EQ(calculate_furnace_count(config), 96);

    config.belt = BeltType::Express;
    EXPECT_EQ(calculate_furnace_count(config), 144);

    config.furnace = FurnaceType::Steel;
    config.belt = BeltType::Transport;
    EXPECT_EQ(calculate_furnace_count(config), 24);

    config.furnace = FurnaceType::Electric;
    config.belt = BeltType::Express;
    EXPECT_EQ(calculate_furnace_count(config), 72);
}

TEST(Sizing, ExplicitLengthOverridesThroughput) {
    for (FurnaceType furnace : all_furnace_types()) {
        for (BeltType belt : all_belt_types()) {
            FurnaceLineConfig config;
            config.furnace = furnace;
            config.belt = belt;
            config.length = 5;
            EXPECT_EQ(calculate_furnace_count(config), 5);
        }
    }
}

TEST(Sizing, ExplicitLengthIsClamped) {
    FurnaceLineConfig config;

    for (int length : {-10, 0, 1, 2, 199, 200, 201, 100000}) {
        config.length = length;
        EXPECT_EQ(calculate_furnace_count(config), clamp_length(length));
    }

    config.length = 0;
    EXPECT_EQ(calculate_furnace_count(config), 1);
    config.length = 500;
    EXPECT_EQ(calculate_furnace_count(config), 200);
}

TEST(Sizing, ClampLength) {
    EXPECT_EQ(clamp_length(-1), 1);
    EXPECT_EQ(clamp_length(0), 1);
    EXPECT_EQ(clamp_length(42), 42);
    EXPECT_EQ(clamp_length(200), 200);
    EXPECT_EQ(clamp_length(201), 200);
    EXPECT_EQ(clamp_length(4294967297LL), 200);
    EXPECT_EQ(clamp_length(-4294967295LL), 1);
}

TEST(Sizing, ReportDescribesDecision) {
    FurnaceLineConfig config;
    SizingReport report = size_furnace_line(config);
    EXPECT_DOUBLE_EQ(report.furnace_throughput, 0.3125);
    EXPECT_DOUBLE_EQ(report.belt_throughput, 15.0);
    EXPECT_NEAR(report.furnaces_per_belt, 48.0, 1e-9);
    EXPECT_EQ(report.furnace_count, 48);
    EXPECT_FALSE(report.explicit_length);

    config.length = 7;
    report = size_furnace_line(config);
    EXPECT_EQ(report.furnace_count, 7);
    EXPECT_TRUE(report.explicit_length);
}
