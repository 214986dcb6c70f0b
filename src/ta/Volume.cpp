#include "sta/ta/Volume.hpp"

#include "sta/ta/Errors.hpp"

namespace sta::ta {

// ------- OBV -------

double OnBalanceVolume::nextCv(double close, double volume) {
  if (close > prevClose_) obv_ += volume;
  else if (close < prevClose_) obv_ -= volume;
  prevClose_ = close;
  last_ = obv_;
  return last_;
}

void OnBalanceVolume::reset() {
  obv_ = 0.0;
  prevClose_ = 0.0;
  last_ = NaN();
}

// ------- MFI -------

Mfi::Mfi(std::size_t period)
  : pos_(detail::requirePeriod("MFI", period)), neg_(period) {}

double Mfi::nextTv(double typical, double volume) {
  if (!prevTypical_) {
    prevTypical_ = typical;
    last_ = 50.0;
    return last_;
  }

  const double flow = typical * volume;
  posSum_.slide(pos_, typical > *prevTypical_ ? flow : 0.0);
  negSum_.slide(neg_, typical < *prevTypical_ ? flow : 0.0);
  prevTypical_ = typical;

  // Both windows hold non-negative flows; discard drift residue.
  const double pos = posSum_.nonZero() == 0 || posSum_.sum() < 0.0 ? 0.0 : posSum_.sum();
  const double neg = negSum_.nonZero() == 0 || negSum_.sum() < 0.0 ? 0.0 : negSum_.sum();
  if (neg == 0.0) {
    last_ = pos == 0.0 ? 50.0 : 100.0;
  } else {
    last_ = 100.0 - 100.0 / (1.0 + pos / neg);
  }
  return last_;
}

void Mfi::reset() {
  pos_.reset();
  neg_.reset();
  posSum_.reset();
  negSum_.reset();
  prevTypical_.reset();
  last_ = NaN();
}

} // namespace sta::ta
