#pragma once
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "sta/ta/Outputs.hpp"
#include "sta/ta/Sample.hpp"

namespace sta::ta {

// Runtime handle over any indicator. Outputs are flattened into lines, named
// by lineNames() in the same order.
class IIndicator {
public:
  IIndicator() = default;
  virtual ~IIndicator() = default;

  IIndicator(const IIndicator&) = delete;
  IIndicator& operator=(const IIndicator&) = delete;

  virtual std::string name() const = 0;
  virtual std::vector<std::string> lineNames() const = 0;
  // False for indicators that need volume (OBV, MFI).
  virtual bool acceptsScalar() const = 0;

  // Throws std::logic_error when !acceptsScalar().
  virtual std::vector<double> next(double x) = 0;
  virtual std::vector<double> next(const DataItem& bar) = 0;
  virtual std::vector<double> lastValues() const = 0;
  virtual void reset() = 0;
  virtual std::unique_ptr<IIndicator> clone() const = 0;
};

namespace detail {

inline std::vector<double> toLines(double v) { return {v}; }
inline std::vector<double> toLines(const MacdOutput& o) { return {o.macd, o.signal, o.histogram}; }
inline std::vector<double> toLines(const PpoOutput& o) { return {o.ppo, o.signal, o.histogram}; }
inline std::vector<double> toLines(const StochasticOutput& o) { return {o.k, o.d}; }
inline std::vector<double> toLines(const BandsOutput& o) { return {o.average, o.upper, o.lower}; }
inline std::vector<double> toLines(const ChandelierOutput& o) { return {o.longExit, o.shortExit}; }

template <typename Out> struct LineNames;
template <> struct LineNames<double> {
  static std::vector<std::string> get() { return {"value"}; }
};
template <> struct LineNames<MacdOutput> {
  static std::vector<std::string> get() { return {"macd", "signal", "histogram"}; }
};
template <> struct LineNames<PpoOutput> {
  static std::vector<std::string> get() { return {"ppo", "signal", "histogram"}; }
};
template <> struct LineNames<StochasticOutput> {
  static std::vector<std::string> get() { return {"k", "d"}; }
};
template <> struct LineNames<BandsOutput> {
  static std::vector<std::string> get() { return {"average", "upper", "lower"}; }
};
template <> struct LineNames<ChandelierOutput> {
  static std::vector<std::string> get() { return {"long", "short"}; }
};

template <typename T, typename = void>
struct accepts_scalar : std::false_type {};
template <typename T>
struct accepts_scalar<T, std::void_t<decltype(std::declval<T&>().next(0.0))>> : std::true_type {};

} // namespace detail

template <typename T>
class IndicatorAdapter final : public IIndicator {
public:
  using Output = std::decay_t<decltype(std::declval<const T&>().lastValue())>;

  explicit IndicatorAdapter(T indicator) : ind_(std::move(indicator)) {}

  std::string name() const override { return ind_.name(); }
  std::vector<std::string> lineNames() const override { return detail::LineNames<Output>::get(); }
  bool acceptsScalar() const override { return detail::accepts_scalar<T>::value; }

  std::vector<double> next(double x) override {
    if constexpr (detail::accepts_scalar<T>::value) {
      return detail::toLines(ind_.next(x));
    } else {
      (void)x;
      throw std::logic_error(ind_.name() + ": requires OHLCV input");
    }
  }

  std::vector<double> next(const DataItem& bar) override { return detail::toLines(ind_.next(bar)); }
  std::vector<double> lastValues() const override { return detail::toLines(ind_.lastValue()); }
  void reset() override { ind_.reset(); }

  std::unique_ptr<IIndicator> clone() const override {
    return std::make_unique<IndicatorAdapter<T>>(ind_);
  }

  const T& get() const { return ind_; }

private:
  T ind_;
};

template <typename T>
std::unique_ptr<IIndicator> makeIndicator(T indicator) {
  return std::make_unique<IndicatorAdapter<T>>(std::move(indicator));
}

} // namespace sta::ta
