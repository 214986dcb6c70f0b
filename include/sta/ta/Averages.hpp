#pragma once
#include <cstddef>
#include <string>
#include <type_traits>

#include "sta/ta/Names.hpp"
#include "sta/ta/Sample.hpp"
#include "sta/window/RingBuffer.hpp"
#include "sta/window/SumAccumulator.hpp"

namespace sta::ta {

// Simple moving average. Until `period` samples have been seen the output is
// the mean of everything fed so far.
class Sma {
public:
  explicit Sma(std::size_t period = 9);

  double next(double x);
  template <typename Bar, typename = std::enable_if_t<is_closeable_v<Bar>>>
  double next(const Bar& bar) { return next(double(bar.close())); }

  void reset();
  double lastValue() const { return last_; }
  std::size_t period() const { return buf_.capacity(); }
  const window::RingBuffer<double>& samples() const { return buf_; }
  std::string name() const;

private:
  window::RingBuffer<double> buf_;
  window::SumAccumulator acc_;
  double last_ = NaN();
};

// Exponential moving average, alpha = 2 / (period + 1), seeded by the first sample.
class Ema {
public:
  explicit Ema(std::size_t period = 9);

  double next(double x);
  template <typename Bar, typename = std::enable_if_t<is_closeable_v<Bar>>>
  double next(const Bar& bar) { return next(double(bar.close())); }

  void reset();
  double lastValue() const { return seeded_ ? current_ : NaN(); }
  std::size_t period() const { return period_; }
  double alpha() const { return alpha_; }
  std::string name() const;

private:
  std::size_t period_;
  double alpha_;
  double current_ = 0.0;
  bool seeded_ = false;
};

// Linearly weighted moving average; the newest sample carries weight k for k
// samples held. Recomputed from the window on every step.
class Wma {
public:
  explicit Wma(std::size_t period = 9);

  double next(double x);
  template <typename Bar, typename = std::enable_if_t<is_closeable_v<Bar>>>
  double next(const Bar& bar) { return next(double(bar.close())); }

  void reset();
  double lastValue() const { return last_; }
  std::size_t period() const { return buf_.capacity(); }
  const window::RingBuffer<double>& samples() const { return buf_; }
  std::string name() const;

private:
  window::RingBuffer<double> buf_;
  double last_ = NaN();
};

// Hull moving average: WMA(floor(sqrt(n))) over 2*WMA(n/2) - WMA(n). Needs n >= 2.
class Hma {
public:
  explicit Hma(std::size_t period = 9);

  double next(double x);
  template <typename Bar, typename = std::enable_if_t<is_closeable_v<Bar>>>
  double next(const Bar& bar) { return next(double(bar.close())); }

  void reset();
  double lastValue() const { return smooth_.lastValue(); }
  std::size_t period() const { return period_; }
  std::string name() const;

private:
  std::size_t period_;
  Wma half_;
  Wma full_;
  Wma smooth_;
};

} // namespace sta::ta
