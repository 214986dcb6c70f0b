#include "sta/window/SumAccumulator.hpp"

#include <algorithm>

namespace sta::window {

std::optional<double> SumAccumulator::mean() const {
  if (count_ == 0) return std::nullopt;
  return sum_ / double(count_);
}

std::optional<double> SumAccumulator::variance(VarianceKind kind) const {
  if (count_ == 0) return std::nullopt;
  const double n = double(count_);
  const double m = sum_ / n;
  double var;
  if (kind == VarianceKind::Population) {
    var = sumSq_ / n - m * m;
  } else {
    if (count_ < 2) return 0.0;
    var = (sumSq_ - n * m * m) / (n - 1.0);
  }
  // Cancellation can leave a tiny negative residue.
  return std::max(var, 0.0);
}

} // namespace sta::window
