#include "sta/ta/Dispersion.hpp"

#include "sta/ta/Errors.hpp"

#include <cmath>

namespace sta::ta {

// ------- Standard deviation -------

StandardDeviation::StandardDeviation(std::size_t period, window::VarianceKind kind)
  : buf_(detail::requirePeriod("SD", period)), kind_(kind) {}

double StandardDeviation::next(double x) {
  acc_.slide(buf_, x);
  last_ = std::sqrt(*acc_.variance(kind_));
  return last_;
}

double StandardDeviation::mean() const {
  auto m = acc_.mean();
  return m ? *m : NaN();
}

void StandardDeviation::reset() {
  buf_.reset();
  acc_.reset();
  last_ = NaN();
}

std::string StandardDeviation::name() const {
  return formatName(kind_ == window::VarianceKind::Sample ? "SSD" : "SD", {double(period())});
}

// ------- Mean absolute deviation -------

MeanAbsoluteDeviation::MeanAbsoluteDeviation(std::size_t period)
  : buf_(detail::requirePeriod("MAD", period)) {}

double MeanAbsoluteDeviation::next(double x) {
  buf_.push(x);
  const double ref = buf_.front();
  const double n = double(buf_.size());
  double shifted = 0.0;
  for (double v : buf_) shifted += v - ref;
  const double mean = ref + shifted / n;
  double dev = 0.0;
  for (double v : buf_) dev += std::abs(v - mean);
  last_ = dev / n;
  return last_;
}

void MeanAbsoluteDeviation::reset() {
  buf_.reset();
  last_ = NaN();
}

std::string MeanAbsoluteDeviation::name() const {
  return formatName("MAD", {double(period())});
}

} // namespace sta::ta
