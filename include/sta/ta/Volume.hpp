#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <type_traits>

#include "sta/ta/Names.hpp"
#include "sta/ta/Sample.hpp"
#include "sta/window/RingBuffer.hpp"
#include "sta/window/SumAccumulator.hpp"

namespace sta::ta {

// On-balance volume. The previous close starts at 0, so a first bar with a
// positive close contributes its volume.
class OnBalanceVolume {
public:
  OnBalanceVolume() = default;

  template <typename Bar, typename = std::enable_if_t<has_close_volume_v<Bar>>>
  double next(const Bar& bar) { return nextCv(double(bar.close()), double(bar.volume())); }

  double nextCv(double close, double volume);

  void reset();
  double lastValue() const { return last_; }
  std::string name() const { return "OBV"; }

private:
  double obv_ = 0.0;
  double prevClose_ = 0.0;
  double last_ = NaN();
};

// Money flow index: RSI-style ratio over the sums of positive and negative
// money flow (typical price * volume) across the last `period` flows.
// First bar: 50. Only positive flow: 100. No flow at all: 50.
class Mfi {
public:
  explicit Mfi(std::size_t period = 14);

  template <typename Bar, typename = std::enable_if_t<has_hlcv_v<Bar>>>
  double next(const Bar& bar) { return nextTv(typicalPrice(bar), double(bar.volume())); }

  double nextTv(double typical, double volume);

  void reset();
  double lastValue() const { return last_; }
  std::size_t period() const { return pos_.capacity(); }
  std::string name() const { return formatName("MFI", {double(period())}); }

private:
  window::RingBuffer<double> pos_;
  window::RingBuffer<double> neg_;
  window::SumAccumulator posSum_;
  window::SumAccumulator negSum_;
  std::optional<double> prevTypical_;
  double last_ = NaN();
};

} // namespace sta::ta
