#include <gtest/gtest.h>
#include <algorithm>
#include <limits>
#include "core/test_base.hpp"
#include "trade_pilot/strategy/position_sizer.hpp"

using namespace trade_pilot;
using namespace trade_pilot::testing;

class PositionSizerTest : public TestBase {};

TEST_F(PositionSizerTest, CapBindsOnLargeBalances) {
    EXPECT_DOUBLE_EQ(safe_size(10000.0, 96450.0, 0.02, 50.0), 50.0);
}

TEST_F(PositionSizerTest, RiskFractionBindsOnSmallBalances) {
    EXPECT_DOUBLE_EQ(safe_size(1000.0, 198.5, 0.02, 50.0), 20.0);
}

TEST_F(PositionSizerTest, IndependentOfPrice) {
    EXPECT_DOUBLE_EQ(safe_size(2450.75, 1.0, 0.02, 100.0),
                     safe_size(2450.75, 100000.0, 0.02, 100.0));
}

TEST_F(PositionSizerTest, NeverExceedsBalance) {
    EXPECT_DOUBLE_EQ(safe_size(30.0, 10.0, 5.0, 1000.0), 30.0);
}

TEST_F(PositionSizerTest, StaysWithinBounds) {
    for (double balance : {0.0, 1.0, 250.0, 10000.0}) {
        for (double r : {0.0, 0.01, 0.5, 1.0}) {
            for (double cap : {0.0, 10.0, 1e6}) {
                double size = safe_size(balance, 100.0, r, cap);
                EXPECT_GE(size, 0.0);
                EXPECT_LE(size, std::min(balance * r, cap) + 1e-9);
            }
        }
    }
}

TEST_F(PositionSizerTest, InvalidInputsYieldZero) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    EXPECT_DOUBLE_EQ(safe_size(nan, 100.0, 0.02, 50.0), 0.0);
    EXPECT_DOUBLE_EQ(safe_size(inf, 100.0, 0.02, 50.0), 0.0);
    EXPECT_DOUBLE_EQ(safe_size(1000.0, 100.0, nan, 50.0), 0.0);
    EXPECT_DOUBLE_EQ(safe_size(-500.0, 100.0, 0.02, 50.0), 0.0);
    EXPECT_DOUBLE_EQ(safe_size(1000.0, 100.0, -0.02, 50.0), 0.0);
}

TEST_F(PositionSizerTest, ConvertsNotionalToUnits) {
    EXPECT_DOUBLE_EQ(to_units(1000.0, 50000.0), 0.02);
    EXPECT_DOUBLE_EQ(to_units(1000.0, 0.0), 0.0);
}
