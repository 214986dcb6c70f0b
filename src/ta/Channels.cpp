#include "sta/ta/Channels.hpp"

#include "sta/ta/Errors.hpp"

namespace sta::ta {

// ------- Bollinger -------

BollingerBands::BollingerBands(std::size_t period, double multiplier)
  : multiplier_(detail::requireMultiplier("BB", multiplier)),
    sma_(detail::requirePeriod("BB", period)),
    sd_(period) {}

BandsOutput BollingerBands::next(double x) {
  const double mid = sma_.next(x);
  const double width = multiplier_ * sd_.next(x);
  last_ = BandsOutput{mid, mid + width, mid - width};
  return last_;
}

void BollingerBands::reset() {
  sma_.reset();
  sd_.reset();
  last_ = BandsOutput{NaN(), NaN(), NaN()};
}

// ------- Keltner -------

KeltnerChannel::KeltnerChannel(std::size_t period, double multiplier)
  : multiplier_(detail::requireMultiplier("KC", multiplier)),
    ema_(detail::requirePeriod("KC", period)),
    atr_(period) {}

BandsOutput KeltnerChannel::combine(double mid, double atr) {
  const double width = multiplier_ * atr;
  last_ = BandsOutput{mid, mid + width, mid - width};
  return last_;
}

void KeltnerChannel::reset() {
  ema_.reset();
  atr_.reset();
  last_ = BandsOutput{NaN(), NaN(), NaN()};
}

// ------- Chandelier -------

ChandelierExit::ChandelierExit(std::size_t period, double multiplier)
  : multiplier_(detail::requireMultiplier("CE", multiplier)),
    atr_(detail::requirePeriod("CE", period)),
    max_(period),
    min_(period) {}

ChandelierOutput ChandelierExit::nextHlc(double high, double low, double close) {
  const double atr = atr_.nextHlc(high, low, close);
  const double hi = max_.next(high);
  const double lo = min_.next(low);
  last_ = ChandelierOutput{hi - multiplier_ * atr, lo + multiplier_ * atr};
  return last_;
}

void ChandelierExit::reset() {
  atr_.reset();
  max_.reset();
  min_.reset();
  last_ = ChandelierOutput{NaN(), NaN()};
}

} // namespace sta::ta
