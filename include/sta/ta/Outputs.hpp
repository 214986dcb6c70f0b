#pragma once
#include <ostream>

namespace sta::ta {

struct MacdOutput {
  double macd;
  double signal;
  double histogram;
};

struct PpoOutput {
  double ppo;
  double signal;
  double histogram;
};

struct StochasticOutput {
  double k;
  double d;
};

struct BandsOutput {
  double average;
  double upper;
  double lower;
};

struct ChandelierOutput {
  double longExit;
  double shortExit;
};

inline bool operator==(const MacdOutput& a, const MacdOutput& b) {
  return a.macd == b.macd && a.signal == b.signal && a.histogram == b.histogram;
}
inline bool operator==(const PpoOutput& a, const PpoOutput& b) {
  return a.ppo == b.ppo && a.signal == b.signal && a.histogram == b.histogram;
}
inline bool operator==(const StochasticOutput& a, const StochasticOutput& b) {
  return a.k == b.k && a.d == b.d;
}
inline bool operator==(const BandsOutput& a, const BandsOutput& b) {
  return a.average == b.average && a.upper == b.upper && a.lower == b.lower;
}
inline bool operator==(const ChandelierOutput& a, const ChandelierOutput& b) {
  return a.longExit == b.longExit && a.shortExit == b.shortExit;
}

inline std::ostream& operator<<(std::ostream& os, const MacdOutput& o) {
  return os << "{macd=" << o.macd << " signal=" << o.signal << " histogram=" << o.histogram << '}';
}
inline std::ostream& operator<<(std::ostream& os, const PpoOutput& o) {
  return os << "{ppo=" << o.ppo << " signal=" << o.signal << " histogram=" << o.histogram << '}';
}
inline std::ostream& operator<<(std::ostream& os, const StochasticOutput& o) {
  return os << "{k=" << o.k << " d=" << o.d << '}';
}
inline std::ostream& operator<<(std::ostream& os, const BandsOutput& o) {
  return os << "{average=" << o.average << " upper=" << o.upper << " lower=" << o.lower << '}';
}
inline std::ostream& operator<<(std::ostream& os, const ChandelierOutput& o) {
  return os << "{long=" << o.longExit << " short=" << o.shortExit << '}';
}

} // namespace sta::ta
