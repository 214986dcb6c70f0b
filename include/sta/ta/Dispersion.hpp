#pragma once
#include <cstddef>
#include <string>
#include <type_traits>

#include "sta/ta/Names.hpp"
#include "sta/ta/Sample.hpp"
#include "sta/window/RingBuffer.hpp"
#include "sta/window/SumAccumulator.hpp"

namespace sta::ta {

// Standard deviation over the window; population by default.
class StandardDeviation {
public:
  explicit StandardDeviation(std::size_t period = 9,
                             window::VarianceKind kind = window::VarianceKind::Population);

  double next(double x);
  template <typename Bar, typename = std::enable_if_t<is_closeable_v<Bar>>>
  double next(const Bar& bar) { return next(double(bar.close())); }

  void reset();
  double lastValue() const { return last_; }
  double mean() const;
  std::size_t period() const { return buf_.capacity(); }
  window::VarianceKind kind() const { return kind_; }
  std::string name() const;

private:
  window::RingBuffer<double> buf_;
  window::SumAccumulator acc_;
  window::VarianceKind kind_;
  double last_ = NaN();
};

// Mean absolute deviation from the window mean. O(period) per step since the
// mean moves with every sample. The mean is taken relative to the oldest
// sample so that a constant window yields exactly 0.
class MeanAbsoluteDeviation {
public:
  explicit MeanAbsoluteDeviation(std::size_t period = 9);

  double next(double x);
  template <typename Bar, typename = std::enable_if_t<is_closeable_v<Bar>>>
  double next(const Bar& bar) { return next(double(bar.close())); }

  void reset();
  double lastValue() const { return last_; }
  std::size_t period() const { return buf_.capacity(); }
  std::string name() const;

private:
  window::RingBuffer<double> buf_;
  double last_ = NaN();
};

} // namespace sta::ta
