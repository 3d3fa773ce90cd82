#include <gtest/gtest.h>
#include <math/vec2.hpp>

using namespace furnaceline;

TEST(Vec2Test, DefaultConstruction) {
    Vec2 v;
    EXPECT_DOUBLE_EQ(v.x, 0.0);
    EXPECT_DOUBLE_EQ(v.y, 0.0);
    EXPECT_EQ(v, Vec2(0.0, 0.0));
}

TEST(Vec2Test, ExactComparison) {
    EXPECT_EQ(Vec2(0.5, 1.0), Vec2(0.5, 1.0));
    EXPECT_NE(Vec2(0.5, 1.0), Vec2(0.5, 1.0000001));
}

TEST(Vec2Test, NegativeZeroEqualsZero) {
    EXPECT_EQ(Vec2(-0.0, 0.0), Vec2(0.0, -0.0));
}
