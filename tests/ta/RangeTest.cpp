#include "sta/ta/Range.hpp"
#include "sta/ta/Errors.hpp"
#include "TestBars.hpp"
#include <gtest/gtest.h>
#include <cmath>

using namespace sta::ta;
using sta::test::bar;

TEST(RangeTest, TrueRangeOnBars) {
    TrueRange tr;
    // No previous close yet: plain high - low.
    EXPECT_DOUBLE_EQ(tr.next(bar(10.0, 7.5, 9.0)), 2.5);
    EXPECT_DOUBLE_EQ(tr.next(bar(11.0, 9.0, 9.5)), 2.0);
    // Gap down below the previous close.
    EXPECT_DOUBLE_EQ(tr.next(bar(9.0, 5.0, 8.0)), 4.5);
}

TEST(RangeTest, TrueRangeOnScalars) {
    TrueRange tr;
    EXPECT_DOUBLE_EQ(tr.next(2.5), 0.0);
    EXPECT_NEAR(tr.next(3.6), 1.1, 1e-12);
    EXPECT_NEAR(tr.next(3.3), 0.3, 1e-12);
}

TEST(RangeTest, TrueRangeReset) {
    TrueRange tr;
    tr.next(bar(10.0, 7.5, 9.0));
    tr.reset();
    EXPECT_TRUE(std::isnan(tr.lastValue()));
    EXPECT_DOUBLE_EQ(tr.next(bar(11.0, 9.0, 9.5)), 2.0);
    EXPECT_EQ(tr.name(), "TRUE_RANGE");
}

TEST(RangeTest, AverageTrueRangeSmoothsWithEma) {
    AverageTrueRange atr(3);
    EXPECT_DOUBLE_EQ(atr.next(bar(10.0, 7.5, 9.0)), 2.5);
    EXPECT_DOUBLE_EQ(atr.next(bar(11.0, 9.0, 9.5)), 2.25);
    EXPECT_DOUBLE_EQ(atr.next(bar(9.0, 5.0, 8.0)), 3.375);
    EXPECT_DOUBLE_EQ(atr.lastValue(), 3.375);
}

TEST(RangeTest, AverageTrueRangeValidation) {
    EXPECT_THROW(AverageTrueRange(0), ConfigError);
    EXPECT_EQ(AverageTrueRange().name(), "ATR(14)");
}
