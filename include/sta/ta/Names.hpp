#pragma once
#include <cmath>
#include <initializer_list>
#include <limits>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>

namespace sta::ta {

inline double NaN() { return std::numeric_limits<double>::quiet_NaN(); }
inline bool isFinite(double x) { return std::isfinite(x); }

// "SMA(9)", "MACD(12, 26, 9)", "BB(20, 2.5)"
inline std::string formatName(const char* tag, std::initializer_list<double> params) {
  std::ostringstream oss;
  oss << tag;
  if (params.size() == 0) return oss.str();
  oss << '(';
  bool first = true;
  for (double p : params) {
    if (!first) oss << ", ";
    oss << p;
    first = false;
  }
  oss << ')';
  return oss.str();
}

// Every indicator renders as its name().
template <typename T, typename = decltype(std::declval<const T&>().name())>
std::ostream& operator<<(std::ostream& os, const T& indicator) {
  return os << indicator.name();
}

} // namespace sta::ta
