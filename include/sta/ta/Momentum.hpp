#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <type_traits>

#include "sta/ta/Averages.hpp"
#include "sta/ta/Names.hpp"
#include "sta/ta/Outputs.hpp"
#include "sta/ta/Sample.hpp"
#include "sta/window/RingBuffer.hpp"

namespace sta::ta {

// Percentage change against the sample `period` steps back (the first sample
// while fewer have been seen). A zero base yields 0.
class RateOfChange {
public:
  explicit RateOfChange(std::size_t period = 9);

  double next(double x);
  template <typename Bar, typename = std::enable_if_t<is_closeable_v<Bar>>>
  double next(const Bar& bar) { return next(double(bar.close())); }

  void reset();
  double lastValue() const { return last_; }
  std::size_t period() const { return prev_.capacity(); }
  std::string name() const { return formatName("ROC", {double(period())}); }

private:
  window::RingBuffer<double> prev_;
  double last_ = NaN();
};

// Kaufman efficiency ratio: |net change| over the sum of absolute step
// changes across the last `period` steps; 0 when nothing moved.
class EfficiencyRatio {
public:
  explicit EfficiencyRatio(std::size_t period = 14);

  double next(double x);
  template <typename Bar, typename = std::enable_if_t<is_closeable_v<Bar>>>
  double next(const Bar& bar) { return next(double(bar.close())); }

  void reset();
  double lastValue() const { return last_; }
  std::size_t period() const { return prev_.capacity(); }
  std::string name() const { return formatName("ER", {double(period())}); }

private:
  window::RingBuffer<double> prev_;
  double last_ = NaN();
};

// Relative strength index over EMA-smoothed gains and losses.
// First sample: 50. Only gains: 100. No movement at all: 50.
class Rsi {
public:
  explicit Rsi(std::size_t period = 14);

  double next(double x);
  template <typename Bar, typename = std::enable_if_t<is_closeable_v<Bar>>>
  double next(const Bar& bar) { return next(double(bar.close())); }

  void reset();
  double lastValue() const { return last_; }
  std::size_t period() const { return gain_.period(); }
  std::string name() const { return formatName("RSI", {double(period())}); }

private:
  Ema gain_;
  Ema loss_;
  std::optional<double> prev_;
  double last_ = NaN();
};

// Moving average convergence/divergence. Requires fast < slow.
class Macd {
public:
  explicit Macd(std::size_t fast = 12, std::size_t slow = 26, std::size_t signal = 9);

  MacdOutput next(double x);
  template <typename Bar, typename = std::enable_if_t<is_closeable_v<Bar>>>
  MacdOutput next(const Bar& bar) { return next(double(bar.close())); }

  void reset();
  MacdOutput lastValue() const { return last_; }
  std::size_t fastPeriod() const { return fast_.period(); }
  std::size_t slowPeriod() const { return slow_.period(); }
  std::size_t signalPeriod() const { return signal_.period(); }
  std::string name() const;

private:
  Ema fast_;
  Ema slow_;
  Ema signal_;
  MacdOutput last_{NaN(), NaN(), NaN()};
};

// Percentage price oscillator: MACD line expressed as a percentage of the slow
// EMA (0 while the slow EMA is 0). Requires fast < slow.
class Ppo {
public:
  explicit Ppo(std::size_t fast = 12, std::size_t slow = 26, std::size_t signal = 9);

  PpoOutput next(double x);
  template <typename Bar, typename = std::enable_if_t<is_closeable_v<Bar>>>
  PpoOutput next(const Bar& bar) { return next(double(bar.close())); }

  void reset();
  PpoOutput lastValue() const { return last_; }
  std::size_t fastPeriod() const { return fast_.period(); }
  std::size_t slowPeriod() const { return slow_.period(); }
  std::size_t signalPeriod() const { return signal_.period(); }
  std::string name() const;

private:
  Ema fast_;
  Ema slow_;
  Ema signal_;
  PpoOutput last_{NaN(), NaN(), NaN()};
};

} // namespace sta::ta
