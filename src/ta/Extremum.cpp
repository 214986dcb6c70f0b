#include "sta/ta/Extremum.hpp"

#include "sta/ta/Errors.hpp"

namespace sta::ta {

RunningExtremum::RunningExtremum(window::ExtremumOrder order, std::size_t period)
  : period_(detail::requirePeriod(order == window::ExtremumOrder::Min ? "MIN" : "MAX", period)),
    tracker_(order) {}

double RunningExtremum::next(double x) {
  tracker_.push(x, position_);
  // Window covers positions [position_ + 1 - period_, position_].
  if (position_ + 1 > period_) tracker_.evictBefore(position_ + 1 - period_);
  ++position_;
  last_ = *tracker_.current();
  return last_;
}

void RunningExtremum::reset() {
  tracker_.reset();
  position_ = 0;
  last_ = NaN();
}

Minimum::Minimum(std::size_t period) : impl_(window::ExtremumOrder::Min, period) {}

Maximum::Maximum(std::size_t period) : impl_(window::ExtremumOrder::Max, period) {}

} // namespace sta::ta
