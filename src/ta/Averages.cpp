#include "sta/ta/Averages.hpp"

#include "sta/ta/Errors.hpp"

#include <cmath>

namespace sta::ta {

namespace {

std::size_t sqrtPeriod(std::size_t period) {
  auto r = static_cast<std::size_t>(std::sqrt(double(period)));
  // Guard against sqrt rounding just below an exact square.
  while ((r + 1) * (r + 1) <= period) ++r;
  while (r * r > period) --r;
  return r == 0 ? 1 : r;
}

} // namespace

// ------- SMA -------

Sma::Sma(std::size_t period) : buf_(detail::requirePeriod("SMA", period)) {}

double Sma::next(double x) {
  acc_.slide(buf_, x);
  last_ = *acc_.mean();
  return last_;
}

void Sma::reset() {
  buf_.reset();
  acc_.reset();
  last_ = NaN();
}

std::string Sma::name() const { return formatName("SMA", {double(period())}); }

// ------- EMA -------

Ema::Ema(std::size_t period)
  : period_(detail::requirePeriod("EMA", period)), alpha_(2.0 / (double(period) + 1.0)) {}

double Ema::next(double x) {
  if (!seeded_) {
    current_ = x;
    seeded_ = true;
  } else {
    current_ = alpha_ * x + (1.0 - alpha_) * current_;
  }
  return current_;
}

void Ema::reset() {
  current_ = 0.0;
  seeded_ = false;
}

std::string Ema::name() const { return formatName("EMA", {double(period_)}); }

// ------- WMA -------

Wma::Wma(std::size_t period) : buf_(detail::requirePeriod("WMA", period)) {}

double Wma::next(double x) {
  buf_.push(x);
  const std::size_t k = buf_.size();
  double num = 0.0;
  std::size_t w = 1;
  for (double v : buf_) num += double(w++) * v;
  last_ = num / (double(k) * double(k + 1) / 2.0);
  return last_;
}

void Wma::reset() {
  buf_.reset();
  last_ = NaN();
}

std::string Wma::name() const { return formatName("WMA", {double(period())}); }

// ------- HMA -------

Hma::Hma(std::size_t period)
  : period_(detail::requirePeriod("HMA", period, 2)),
    half_(period / 2),
    full_(period),
    smooth_(sqrtPeriod(period)) {}

double Hma::next(double x) {
  const double h = half_.next(x);
  const double f = full_.next(x);
  return smooth_.next(2.0 * h - f);
}

void Hma::reset() {
  half_.reset();
  full_.reset();
  smooth_.reset();
}

std::string Hma::name() const { return formatName("HMA", {double(period_)}); }

} // namespace sta::ta
