#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>

#include "sta/ta/Names.hpp"
#include "sta/ta/Sample.hpp"
#include "sta/window/MonotonicExtremumTracker.hpp"

namespace sta::ta {

// Running extremum over the last `period` samples, O(1) amortised per step.
class RunningExtremum {
public:
  RunningExtremum(window::ExtremumOrder order, std::size_t period);

  double next(double x);
  void reset();
  double lastValue() const { return last_; }
  std::size_t period() const { return period_; }

private:
  std::size_t period_;
  window::MonotonicExtremumTracker tracker_;
  std::uint64_t position_ = 0;
  double last_ = NaN();
};

// Lowest value in the window; bars contribute their low.
class Minimum {
public:
  explicit Minimum(std::size_t period = 14);

  double next(double x) { return impl_.next(x); }
  template <typename Bar, typename = std::enable_if_t<has_low<Bar>::value>>
  double next(const Bar& bar) { return impl_.next(double(bar.low())); }

  void reset() { impl_.reset(); }
  double lastValue() const { return impl_.lastValue(); }
  std::size_t period() const { return impl_.period(); }
  std::string name() const { return formatName("MIN", {double(period())}); }

private:
  RunningExtremum impl_;
};

// Highest value in the window; bars contribute their high.
class Maximum {
public:
  explicit Maximum(std::size_t period = 14);

  double next(double x) { return impl_.next(x); }
  template <typename Bar, typename = std::enable_if_t<has_high<Bar>::value>>
  double next(const Bar& bar) { return impl_.next(double(bar.high())); }

  void reset() { impl_.reset(); }
  double lastValue() const { return impl_.lastValue(); }
  std::size_t period() const { return impl_.period(); }
  std::string name() const { return formatName("MAX", {double(period())}); }

private:
  RunningExtremum impl_;
};

} // namespace sta::ta
