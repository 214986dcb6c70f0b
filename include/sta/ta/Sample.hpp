#pragma once
#include <optional>
#include <ostream>
#include <type_traits>
#include <utility>

namespace sta::ta {

// Validated OHLCV record. Immutable once constructed.
class DataItem {
public:
  // Throws DataItemError(DataItemInvalid) unless all values are finite,
  // low <= min(open, close), max(open, close) <= high and volume >= 0.
  DataItem(double open, double high, double low, double close, double volume);

  class Builder {
  public:
    Builder& open(double v)   { open_ = v;   return *this; }
    Builder& high(double v)   { high_ = v;   return *this; }
    Builder& low(double v)    { low_ = v;    return *this; }
    Builder& close(double v)  { close_ = v;  return *this; }
    Builder& volume(double v) { volume_ = v; return *this; }

    // Throws DataItemError(DataItemIncomplete) if a field was never set.
    DataItem build() const;

  private:
    std::optional<double> open_, high_, low_, close_, volume_;
  };

  static Builder builder() { return Builder(); }

  double open() const   { return open_; }
  double high() const   { return high_; }
  double low() const    { return low_; }
  double close() const  { return close_; }
  double volume() const { return volume_; }

  bool operator==(const DataItem& o) const {
    return open_ == o.open_ && high_ == o.high_ && low_ == o.low_ &&
           close_ == o.close_ && volume_ == o.volume_;
  }
  bool operator!=(const DataItem& o) const { return !(*this == o); }

private:
  double open_, high_, low_, close_, volume_;
};

std::ostream& operator<<(std::ostream& os, const DataItem& d);

// ------- Capability traits -------
// Indicators accept any bar type exposing the accessors they need.

template <typename T, typename = void>
struct has_open : std::false_type {};
template <typename T>
struct has_open<T, std::void_t<decltype(double(std::declval<const T&>().open()))>> : std::true_type {};

template <typename T, typename = void>
struct has_high : std::false_type {};
template <typename T>
struct has_high<T, std::void_t<decltype(double(std::declval<const T&>().high()))>> : std::true_type {};

template <typename T, typename = void>
struct has_low : std::false_type {};
template <typename T>
struct has_low<T, std::void_t<decltype(double(std::declval<const T&>().low()))>> : std::true_type {};

template <typename T, typename = void>
struct has_close : std::false_type {};
template <typename T>
struct has_close<T, std::void_t<decltype(double(std::declval<const T&>().close()))>> : std::true_type {};

template <typename T, typename = void>
struct has_volume : std::false_type {};
template <typename T>
struct has_volume<T, std::void_t<decltype(double(std::declval<const T&>().volume()))>> : std::true_type {};

template <typename T>
inline constexpr bool is_closeable_v = has_close<T>::value;

template <typename T>
inline constexpr bool is_priceable_v =
  has_high<T>::value && has_low<T>::value && has_close<T>::value;

template <typename T>
inline constexpr bool is_ohlcv_complete_v =
  is_priceable_v<T> && has_open<T>::value && has_volume<T>::value;

template <typename T>
inline constexpr bool has_close_volume_v = has_close<T>::value && has_volume<T>::value;

template <typename T>
inline constexpr bool has_hlcv_v = is_priceable_v<T> && has_volume<T>::value;

template <typename Bar>
inline double typicalPrice(const Bar& b) {
  return (b.high() + b.low() + b.close()) / 3.0;
}

} // namespace sta::ta
