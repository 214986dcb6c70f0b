#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace sta::ta {

enum class ErrorKind : int {
  InvalidParameter = 0,
  DataItemIncomplete = 1,
  DataItemInvalid = 2
};

const char* describe(ErrorKind kind);

class TaError : public std::invalid_argument {
public:
  TaError(ErrorKind kind, const std::string& what)
    : std::invalid_argument(what), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

// Thrown by indicator constructors and the factory for out-of-domain parameters.
class ConfigError : public TaError {
public:
  explicit ConfigError(const std::string& what)
    : TaError(ErrorKind::InvalidParameter, what) {}
};

// Thrown when an OHLCV record is incomplete or violates low <= open,close <= high.
class DataItemError : public TaError {
public:
  DataItemError(ErrorKind kind, const std::string& what)
    : TaError(kind, what) {}
};

namespace detail {

// Upper bound on any window length. Larger periods are rejected before a
// window is allocated.
constexpr std::size_t kMaxPeriod = std::size_t(1) << 24;

// Validation helpers shared by every indicator constructor. Each returns the
// accepted value, or logs the rejected one at Debug level and throws ConfigError.
// Periods must lie in [minimum, kMaxPeriod].
std::size_t requirePeriod(const char* indicator, std::size_t period, std::size_t minimum = 1);
double requireMultiplier(const char* indicator, double multiplier);
void requireOrdered(const char* indicator, std::size_t fast, std::size_t slow);

} // namespace detail

} // namespace sta::ta
