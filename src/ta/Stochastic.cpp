#include "sta/ta/Stochastic.hpp"

#include "sta/ta/Errors.hpp"

namespace sta::ta {

// ------- Fast stochastic -------

FastStochastic::FastStochastic(std::size_t period)
  : min_(detail::requirePeriod("FAST_STOCH", period)), max_(period) {}

double FastStochastic::nextHlc(double high, double low, double close) {
  const double lo = min_.next(low);
  const double hi = max_.next(high);
  last_ = hi == lo ? 50.0 : (close - lo) / (hi - lo) * 100.0;
  return last_;
}

void FastStochastic::reset() {
  min_.reset();
  max_.reset();
  last_ = NaN();
}

// ------- Slow stochastic -------

SlowStochastic::SlowStochastic(std::size_t period, std::size_t smooth)
  : fast_(detail::requirePeriod("SLOW_STOCH", period)),
    smooth_(detail::requirePeriod("SLOW_STOCH", smooth)) {}

StochasticOutput SlowStochastic::combine(double k) {
  last_ = StochasticOutput{k, smooth_.next(k)};
  return last_;
}

void SlowStochastic::reset() {
  fast_.reset();
  smooth_.reset();
  last_ = StochasticOutput{NaN(), NaN()};
}

std::string SlowStochastic::name() const {
  return formatName("SLOW_STOCH", {double(period()), double(smoothPeriod())});
}

// ------- CCI -------

Cci::Cci(std::size_t period)
  : sma_(detail::requirePeriod("CCI", period)), mad_(period) {}

double Cci::next(double x) {
  const double mean = sma_.next(x);
  const double mad = mad_.next(x);
  last_ = mad == 0.0 ? 0.0 : (x - mean) / (kLambertConstant * mad);
  return last_;
}

void Cci::reset() {
  sma_.reset();
  mad_.reset();
  last_ = NaN();
}

} // namespace sta::ta
