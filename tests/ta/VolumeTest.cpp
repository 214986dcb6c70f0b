#include "sta/ta/Volume.hpp"
#include "sta/ta/Errors.hpp"
#include "sta/ta/AnyIndicator.hpp"
#include "TestBars.hpp"
#include <gtest/gtest.h>
#include <cmath>

using namespace sta::ta;
using sta::test::bar;
using sta::test::closeBar;

static_assert(!detail::accepts_scalar<OnBalanceVolume>::value, "OBV needs volume");
static_assert(!detail::accepts_scalar<Mfi>::value, "MFI needs volume");

TEST(VolumeTest, OnBalanceVolume) {
    OnBalanceVolume obv;
    EXPECT_TRUE(std::isnan(obv.lastValue()));
    EXPECT_DOUBLE_EQ(obv.next(closeBar(1.5, 1000.0)), 1000.0);
    EXPECT_DOUBLE_EQ(obv.next(closeBar(5.0, 5000.0)), 6000.0);
    EXPECT_DOUBLE_EQ(obv.next(closeBar(4.0, 9000.0)), -3000.0);
    EXPECT_DOUBLE_EQ(obv.next(closeBar(4.0, 4000.0)), -3000.0);
    EXPECT_EQ(obv.name(), "OBV");
}

TEST(VolumeTest, OnBalanceVolumeFollowsDirection) {
    OnBalanceVolume obv;
    double prevClose = 0.0, prevObv = 0.0;
    for (const auto& b : sta::test::randomBars(300)) {
        const double v = obv.next(b);
        if (b.close() > prevClose) EXPECT_GE(v, prevObv);
        else if (b.close() < prevClose) EXPECT_LE(v, prevObv);
        else EXPECT_EQ(v, prevObv);
        prevClose = b.close();
        prevObv = v;
    }
}

TEST(VolumeTest, MoneyFlowIndex) {
    Mfi mfi(3);
    EXPECT_DOUBLE_EQ(mfi.next(bar(10.0, 8.0, 9.0, 100.0)), 50.0);
    EXPECT_DOUBLE_EQ(mfi.next(bar(11.0, 9.0, 10.0, 200.0)), 100.0);
    EXPECT_NEAR(mfi.next(bar(10.0, 9.0, 9.5, 100.0)), 100.0 - 100.0 / (1.0 + 2000.0 / 950.0), 1e-9);
    EXPECT_NEAR(mfi.next(bar(10.5, 9.5, 10.0, 100.0)), 100.0 - 100.0 / (1.0 + 3000.0 / 950.0), 1e-9);
    EXPECT_NEAR(mfi.next(bar(11.0, 10.0, 10.5, 100.0)), 100.0 - 100.0 / (1.0 + 2050.0 / 950.0), 1e-9);
    // The only negative flow has left the window.
    EXPECT_EQ(mfi.next(bar(11.5, 10.5, 11.0, 100.0)), 100.0);
}

TEST(VolumeTest, MoneyFlowIndexFlatIsNeutral) {
    Mfi mfi(4);
    for (int i = 0; i < 8; ++i) EXPECT_DOUBLE_EQ(mfi.next(bar(10.0, 9.0, 9.5, 500.0)), 50.0);
}

TEST(VolumeTest, MoneyFlowIndexRangeAndReset) {
    Mfi mfi(14);
    for (const auto& b : sta::test::randomBars(1000)) {
        const double v = mfi.next(b);
        ASSERT_GE(v, 0.0);
        ASSERT_LE(v, 100.0);
    }
    mfi.reset();
    EXPECT_TRUE(std::isnan(mfi.lastValue()));
    EXPECT_DOUBLE_EQ(mfi.next(bar(10.0, 8.0, 9.0, 100.0)), 50.0);
    EXPECT_THROW(Mfi(0), ConfigError);
    EXPECT_EQ(Mfi().name(), "MFI(14)");
}
