#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <type_traits>

#include "sta/ta/Averages.hpp"
#include "sta/ta/Names.hpp"
#include "sta/ta/Sample.hpp"

namespace sta::ta {

// True range. The first bar has no previous close and yields high - low.
// Scalars are treated as bars with high == low == close.
class TrueRange {
public:
  TrueRange() = default;

  double next(double x);
  template <typename Bar, typename = std::enable_if_t<is_priceable_v<Bar>>>
  double next(const Bar& bar) {
    return nextHlc(double(bar.high()), double(bar.low()), double(bar.close()));
  }

  double nextHlc(double high, double low, double close);

  void reset();
  double lastValue() const { return last_; }
  std::string name() const { return "TRUE_RANGE"; }

private:
  std::optional<double> prevClose_;
  double last_ = NaN();
};

// EMA-smoothed true range.
class AverageTrueRange {
public:
  explicit AverageTrueRange(std::size_t period = 14);

  double next(double x) { return ema_.next(tr_.next(x)); }
  template <typename Bar, typename = std::enable_if_t<is_priceable_v<Bar>>>
  double next(const Bar& bar) { return ema_.next(tr_.next(bar)); }

  double nextHlc(double high, double low, double close) {
    return ema_.next(tr_.nextHlc(high, low, close));
  }

  void reset();
  double lastValue() const { return ema_.lastValue(); }
  std::size_t period() const { return ema_.period(); }
  std::string name() const { return formatName("ATR", {double(period())}); }

private:
  TrueRange tr_;
  Ema ema_;
};

} // namespace sta::ta
