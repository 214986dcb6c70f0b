#pragma once
#include <cstddef>
#include <string>
#include <type_traits>

#include "sta/ta/Averages.hpp"
#include "sta/ta/Dispersion.hpp"
#include "sta/ta/Extremum.hpp"
#include "sta/ta/Names.hpp"
#include "sta/ta/Outputs.hpp"
#include "sta/ta/Range.hpp"
#include "sta/ta/Sample.hpp"

namespace sta::ta {

// SMA middle band, +/- multiplier population standard deviations.
class BollingerBands {
public:
  explicit BollingerBands(std::size_t period = 9, double multiplier = 2.0);

  BandsOutput next(double x);
  template <typename Bar, typename = std::enable_if_t<is_closeable_v<Bar>>>
  BandsOutput next(const Bar& bar) { return next(double(bar.close())); }

  void reset();
  BandsOutput lastValue() const { return last_; }
  std::size_t period() const { return sma_.period(); }
  double multiplier() const { return multiplier_; }
  std::string name() const { return formatName("BB", {double(period()), multiplier_}); }

private:
  double multiplier_;
  Sma sma_;
  StandardDeviation sd_;
  BandsOutput last_{NaN(), NaN(), NaN()};
};

// EMA of the typical price, +/- multiplier ATRs.
class KeltnerChannel {
public:
  explicit KeltnerChannel(std::size_t period = 10, double multiplier = 2.0);

  BandsOutput next(double x) {
    const double mid = ema_.next(x);
    return combine(mid, atr_.next(x));
  }
  template <typename Bar, typename = std::enable_if_t<is_priceable_v<Bar>>>
  BandsOutput next(const Bar& bar) {
    // Typical price first, then ATR, same order as the scalar path.
    const double mid = ema_.next(typicalPrice(bar));
    return combine(mid, atr_.next(bar));
  }

  void reset();
  BandsOutput lastValue() const { return last_; }
  std::size_t period() const { return ema_.period(); }
  double multiplier() const { return multiplier_; }
  std::string name() const { return formatName("KC", {double(period()), multiplier_}); }

private:
  BandsOutput combine(double mid, double atr);

  double multiplier_;
  Ema ema_;
  AverageTrueRange atr_;
  BandsOutput last_{NaN(), NaN(), NaN()};
};

// Chandelier exit: highest high - k*ATR for longs, lowest low + k*ATR for shorts.
class ChandelierExit {
public:
  explicit ChandelierExit(std::size_t period = 22, double multiplier = 3.0);

  ChandelierOutput next(double x) { return nextHlc(x, x, x); }
  template <typename Bar, typename = std::enable_if_t<is_priceable_v<Bar>>>
  ChandelierOutput next(const Bar& bar) {
    return nextHlc(double(bar.high()), double(bar.low()), double(bar.close()));
  }

  ChandelierOutput nextHlc(double high, double low, double close);

  void reset();
  ChandelierOutput lastValue() const { return last_; }
  std::size_t period() const { return max_.period(); }
  double multiplier() const { return multiplier_; }
  std::string name() const { return formatName("CE", {double(period()), multiplier_}); }

private:
  double multiplier_;
  AverageTrueRange atr_;
  Maximum max_;
  Minimum min_;
  ChandelierOutput last_{NaN(), NaN()};
};

} // namespace sta::ta
