#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <utility>

namespace sta::window {

enum class ExtremumOrder { Min, Max };

// Sliding-window extremum via a monotonic deque of (value, position).
// The front is always the extremum of the candidates still in the window.
class MonotonicExtremumTracker {
public:
  explicit MonotonicExtremumTracker(ExtremumOrder order) : order_(order) {}

  // Drops every back candidate that `value` dominates, then appends it.
  void push(double value, std::uint64_t position);

  // Drops front candidates whose position is < minPosition.
  void evictBefore(std::uint64_t minPosition);

  std::optional<double> current() const {
    if (dq_.empty()) return std::nullopt;
    return dq_.front().first;
  }

  ExtremumOrder order() const { return order_; }
  std::size_t size() const { return dq_.size(); }
  void reset() { dq_.clear(); }

private:
  bool dominates(double incoming, double stored) const {
    return order_ == ExtremumOrder::Max ? stored <= incoming : stored >= incoming;
  }

  ExtremumOrder order_;
  std::deque<std::pair<double, std::uint64_t>> dq_;
};

} // namespace sta::window
