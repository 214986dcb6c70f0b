#include "sta/ta/Errors.hpp"

#include "sta/util/Logger.hpp"

#include <cmath>

namespace sta::ta {

const char* describe(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InvalidParameter:   return "invalid parameter";
    case ErrorKind::DataItemIncomplete: return "data item is incomplete";
    case ErrorKind::DataItemInvalid:    return "data item is invalid";
  }
  return "unknown error";
}

namespace detail {

std::size_t requirePeriod(const char* indicator, std::size_t period, std::size_t minimum) {
  if (period >= minimum && period <= kMaxPeriod) return period;
  util::logger().log(util::LogLevel::Debug, "Rejected period",
                     { {"indicator", indicator},
                       {"period", std::to_string(period)},
                       {"minimum", std::to_string(minimum)} });
  if (period < minimum)
    throw ConfigError(std::string(indicator) + ": period must be >= " +
                      std::to_string(minimum) + ", got " + std::to_string(period));
  throw ConfigError(std::string(indicator) + ": period must be <= " +
                    std::to_string(kMaxPeriod) + ", got " + std::to_string(period));
}

double requireMultiplier(const char* indicator, double multiplier) {
  if (std::isfinite(multiplier) && multiplier >= 0.0) return multiplier;
  util::logger().log(util::LogLevel::Debug, "Rejected multiplier",
                     { {"indicator", indicator},
                       {"multiplier", std::to_string(multiplier)} });
  throw ConfigError(std::string(indicator) +
                    ": multiplier must be finite and non-negative");
}

void requireOrdered(const char* indicator, std::size_t fast, std::size_t slow) {
  if (fast < slow) return;
  util::logger().log(util::LogLevel::Debug, "Rejected period ordering",
                     { {"indicator", indicator},
                       {"fast", std::to_string(fast)},
                       {"slow", std::to_string(slow)} });
  throw ConfigError(std::string(indicator) + ": fast period (" + std::to_string(fast) +
                    ") must be less than slow period (" + std::to_string(slow) + ")");
}

} // namespace detail

} // namespace sta::ta
