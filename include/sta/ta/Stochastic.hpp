#pragma once
#include <cstddef>
#include <string>
#include <type_traits>

#include "sta/ta/Averages.hpp"
#include "sta/ta/Dispersion.hpp"
#include "sta/ta/Extremum.hpp"
#include "sta/ta/Names.hpp"
#include "sta/ta/Outputs.hpp"
#include "sta/ta/Sample.hpp"

namespace sta::ta {

// Fast stochastic %K: where the close sits within the window's low..high
// range, 0..100. A flat window yields 50.
class FastStochastic {
public:
  explicit FastStochastic(std::size_t period = 14);

  double next(double x) { return nextHlc(x, x, x); }
  template <typename Bar, typename = std::enable_if_t<is_priceable_v<Bar>>>
  double next(const Bar& bar) {
    return nextHlc(double(bar.high()), double(bar.low()), double(bar.close()));
  }

  double nextHlc(double high, double low, double close);

  void reset();
  double lastValue() const { return last_; }
  std::size_t period() const { return min_.period(); }
  std::string name() const { return formatName("FAST_STOCH", {double(period())}); }

private:
  Minimum min_;
  Maximum max_;
  double last_ = NaN();
};

// Slow stochastic: %K from a FastStochastic, %D its SMA.
class SlowStochastic {
public:
  explicit SlowStochastic(std::size_t period = 14, std::size_t smooth = 3);

  StochasticOutput next(double x) { return combine(fast_.next(x)); }
  template <typename Bar, typename = std::enable_if_t<is_priceable_v<Bar>>>
  StochasticOutput next(const Bar& bar) { return combine(fast_.next(bar)); }

  void reset();
  StochasticOutput lastValue() const { return last_; }
  std::size_t period() const { return fast_.period(); }
  std::size_t smoothPeriod() const { return smooth_.period(); }
  std::string name() const;

private:
  StochasticOutput combine(double k);

  FastStochastic fast_;
  Sma smooth_;
  StochasticOutput last_{NaN(), NaN()};
};

// Commodity channel index over the typical price (H+L+C)/3:
// (tp - SMA(tp)) / (0.015 * MAD(tp)), 0 when MAD is 0.
class Cci {
public:
  static constexpr double kLambertConstant = 0.015;

  explicit Cci(std::size_t period = 20);

  double next(double x);
  template <typename Bar, typename = std::enable_if_t<is_priceable_v<Bar>>>
  double next(const Bar& bar) { return next(typicalPrice(bar)); }

  void reset();
  double lastValue() const { return last_; }
  std::size_t period() const { return sma_.period(); }
  std::string name() const { return formatName("CCI", {double(period())}); }

private:
  Sma sma_;
  MeanAbsoluteDeviation mad_;
  double last_ = NaN();
};

} // namespace sta::ta
