#include "sta/window/MonotonicExtremumTracker.hpp"

namespace sta::window {

void MonotonicExtremumTracker::push(double value, std::uint64_t position) {
  while (!dq_.empty() && dominates(value, dq_.back().first)) dq_.pop_back();
  dq_.emplace_back(value, position);
}

void MonotonicExtremumTracker::evictBefore(std::uint64_t minPosition) {
  while (!dq_.empty() && dq_.front().second < minPosition) dq_.pop_front();
}

} // namespace sta::window
