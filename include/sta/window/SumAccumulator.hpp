#pragma once
#include <cstddef>
#include <optional>

#include "sta/window/RingBuffer.hpp"

namespace sta::window {

enum class VarianceKind {
  Population,
  Sample    // Bessel-corrected, divides by n-1
};

// Running sum and sum of squares over the contents of a window.
class SumAccumulator {
public:
  // After this many full windows of evictions the sums are rebuilt from the buffer.
  static constexpr size_t kResyncFactor = 64;

  void onPush(double v) {
    sum_ += v;
    sumSq_ += v * v;
    ++count_;
    if (v != 0.0) ++nonZero_;
  }

  void onEvict(double v) {
    sum_ -= v;
    sumSq_ -= v * v;
    --count_;
    if (v != 0.0) --nonZero_;
    ++evictions_;
  }

  size_t count() const { return count_; }
  // Number of non-zero values in the window; when 0 the exact sum is 0
  // whatever residue sum() carries.
  size_t nonZero() const { return nonZero_; }
  double sum() const { return sum_; }
  double sumSquares() const { return sumSq_; }

  std::optional<double> mean() const;
  std::optional<double> variance(VarianceKind kind = VarianceKind::Population) const;

  template <typename It>
  void resync(It first, It last) {
    sum_ = 0.0;
    sumSq_ = 0.0;
    count_ = 0;
    nonZero_ = 0;
    for (; first != last; ++first) onPush(*first);
    evictions_ = 0;
  }

  // Push v into the window, keep the sums consistent with its contents and
  // periodically resynchronise to bound floating-point drift.
  void slide(RingBuffer<double>& window, double v) {
    if (auto evicted = window.push(v)) onEvict(*evicted);
    onPush(v);
    if (evictions_ >= kResyncFactor * window.capacity())
      resync(window.begin(), window.end());
  }

  void reset() {
    sum_ = 0.0;
    sumSq_ = 0.0;
    count_ = 0;
    nonZero_ = 0;
    evictions_ = 0;
  }

private:
  double sum_ = 0.0;
  double sumSq_ = 0.0;
  size_t count_ = 0;
  size_t nonZero_ = 0;
  size_t evictions_ = 0;
};

} // namespace sta::window
