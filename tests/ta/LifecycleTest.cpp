#include "sta/ta/Indicators.hpp"
#include "sta/ta/AnyIndicator.hpp"
#include "TestBars.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <sstream>
#include <vector>

using namespace sta::ta;

namespace {

bool sameLines(const std::vector<double>& a, const std::vector<double>& b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::isnan(a[i]) && std::isnan(b[i])) continue;
        if (a[i] != b[i]) return false;
    }
    return true;
}

} // namespace

template <typename T>
class ScalarLifecycleTest : public ::testing::Test {};

using ScalarIndicators =
        ::testing::Types<Sma, Ema, Wma, Hma, Minimum, Maximum, StandardDeviation,
                                          MeanAbsoluteDeviation, TrueRange, AverageTrueRange, RateOfChange,
                                          EfficiencyRatio, Rsi, FastStochastic, Cci>;
TYPED_TEST_SUITE(ScalarLifecycleTest, ScalarIndicators);

TYPED_TEST(ScalarLifecycleTest, NaNBeforeFirstSample) {
    TypeParam ind;
    EXPECT_TRUE(std::isnan(ind.lastValue()));
}

TYPED_TEST(ScalarLifecycleTest, ResetMatchesFresh) {
    const auto xs = sta::test::randomWalk(60, 11);
    TypeParam used;
    for (double x : xs) used.next(x);
    used.reset();
    EXPECT_TRUE(std::isnan(used.lastValue()));

    TypeParam fresh;
    for (double x : xs) ASSERT_EQ(used.next(x), fresh.next(x));
}

TYPED_TEST(ScalarLifecycleTest, CopyIsIndependentSnapshot) {
    const auto xs = sta::test::randomWalk(80, 3);
    TypeParam a;
    for (std::size_t i = 0; i < 40; ++i) a.next(xs[i]);

    TypeParam b = a;
    EXPECT_EQ(b.lastValue(), a.lastValue());
    for (std::size_t i = 40; i < xs.size(); ++i) ASSERT_EQ(a.next(xs[i]), b.next(xs[i]));

    // Feeding one copy leaves the other alone.
    const double before = b.lastValue();
    a.next(1234.5);
    EXPECT_EQ(b.lastValue(), before);
}

TYPED_TEST(ScalarLifecycleTest, LastValueIsIdempotent) {
    TypeParam ind;
    const double v = ind.next(3.25);
    EXPECT_EQ(ind.lastValue(), v);
    EXPECT_EQ(ind.lastValue(), v);
}

TYPED_TEST(ScalarLifecycleTest, StreamsItsName) {
    TypeParam ind;
    std::ostringstream os;
    os << ind;
    EXPECT_EQ(os.str(), ind.name());
    EXPECT_FALSE(os.str().empty());
}

// Composite outputs go through the runtime adapter so NaN lines compare equal.
template <typename T>
class CompositeLifecycleTest : public ::testing::Test {};

using CompositeIndicators =
        ::testing::Types<Macd, Ppo, SlowStochastic, BollingerBands, KeltnerChannel, ChandelierExit>;
TYPED_TEST_SUITE(CompositeLifecycleTest, CompositeIndicators);

TYPED_TEST(CompositeLifecycleTest, ResetCloneAndSnapshot) {
    const auto bars = sta::test::randomBars(120, 9);
    auto ind = makeIndicator(TypeParam());
    for (double v : ind->lastValues()) EXPECT_TRUE(std::isnan(v));
    EXPECT_EQ(ind->lastValues().size(), ind->lineNames().size());

    for (std::size_t i = 0; i < 60; ++i) ind->next(bars[i]);
    auto snap = ind->clone();
    ASSERT_TRUE(sameLines(snap->lastValues(), ind->lastValues()));
    for (std::size_t i = 60; i < bars.size(); ++i) {
        ASSERT_TRUE(sameLines(ind->next(bars[i]), snap->next(bars[i])));
    }

    ind->reset();
    auto fresh = makeIndicator(TypeParam());
    for (const auto& b : bars) ASSERT_TRUE(sameLines(ind->next(b), fresh->next(b)));
}

TYPED_TEST(CompositeLifecycleTest, StreamsItsName) {
    TypeParam ind;
    std::ostringstream os;
    os << ind;
    EXPECT_EQ(os.str(), ind.name());
}

TEST(PeriodValidationTest, ZeroPeriodIsRejectedEverywhere) {
    EXPECT_THROW(Sma(0), ConfigError);
    EXPECT_THROW(Ema(0), ConfigError);
    EXPECT_THROW(Wma(0), ConfigError);
    EXPECT_THROW(Hma(0), ConfigError);
    EXPECT_THROW(Minimum(0), ConfigError);
    EXPECT_THROW(Maximum(0), ConfigError);
    EXPECT_THROW(StandardDeviation(0), ConfigError);
    EXPECT_THROW(MeanAbsoluteDeviation(0), ConfigError);
    EXPECT_THROW(AverageTrueRange(0), ConfigError);
    EXPECT_THROW(RateOfChange(0), ConfigError);
    EXPECT_THROW(EfficiencyRatio(0), ConfigError);
    EXPECT_THROW(Rsi(0), ConfigError);
    EXPECT_THROW(Macd(0, 26, 9), ConfigError);
    EXPECT_THROW(Macd(12, 26, 0), ConfigError);
    EXPECT_THROW(Ppo(0, 26, 9), ConfigError);
    EXPECT_THROW(Ppo(12, 0, 9), ConfigError);
    EXPECT_THROW(Ppo(12, 26, 0), ConfigError);
    EXPECT_THROW(FastStochastic(0), ConfigError);
    EXPECT_THROW(SlowStochastic(0, 3), ConfigError);
    EXPECT_THROW(SlowStochastic(14, 0), ConfigError);
    EXPECT_THROW(Cci(0), ConfigError);
    EXPECT_THROW(Mfi(0), ConfigError);
    EXPECT_THROW(BollingerBands(0, 2.0), ConfigError);
    EXPECT_THROW(KeltnerChannel(0, 2.0), ConfigError);
    EXPECT_THROW(ChandelierExit(0, 3.0), ConfigError);
}

TEST(PeriodValidationTest, OversizedPeriodIsConfigError) {
    const std::size_t huge = std::numeric_limits<std::size_t>::max();
    EXPECT_THROW((void)Sma(huge), ConfigError);
    EXPECT_THROW((void)Wma(huge), ConfigError);
    EXPECT_THROW((void)Hma(huge), ConfigError);
    EXPECT_THROW((void)StandardDeviation(huge), ConfigError);
    EXPECT_THROW((void)MeanAbsoluteDeviation(huge), ConfigError);
    EXPECT_THROW((void)RateOfChange(huge), ConfigError);
    EXPECT_THROW((void)EfficiencyRatio(huge), ConfigError);
    EXPECT_THROW((void)Mfi(huge), ConfigError);
    EXPECT_THROW((void)Cci(huge), ConfigError);
    EXPECT_THROW(BollingerBands(huge, 2.0), ConfigError);
    EXPECT_THROW(Maximum(detail::kMaxPeriod + 1), ConfigError);

    // The bound itself is accepted.
    EXPECT_EQ(Ema(detail::kMaxPeriod).period(), detail::kMaxPeriod);
}
