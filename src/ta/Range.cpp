#include "sta/ta/Range.hpp"

#include "sta/ta/Errors.hpp"

#include <algorithm>
#include <cmath>

namespace sta::ta {

double TrueRange::next(double x) {
  last_ = prevClose_ ? std::abs(x - *prevClose_) : 0.0;
  prevClose_ = x;
  return last_;
}

double TrueRange::nextHlc(double high, double low, double close) {
  const double range = high - low;
  if (prevClose_) {
    last_ = std::max({range, std::abs(high - *prevClose_), std::abs(low - *prevClose_)});
  } else {
    last_ = range;
  }
  prevClose_ = close;
  return last_;
}

void TrueRange::reset() {
  prevClose_.reset();
  last_ = NaN();
}

AverageTrueRange::AverageTrueRange(std::size_t period)
  : ema_(detail::requirePeriod("ATR", period)) {}

void AverageTrueRange::reset() {
  tr_.reset();
  ema_.reset();
}

} // namespace sta::ta
