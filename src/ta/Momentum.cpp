#include "sta/ta/Momentum.hpp"

#include "sta/ta/Errors.hpp"

#include <cmath>

namespace sta::ta {

namespace {

// Validates the whole triple before any sub-instance is built.
std::size_t checkedFast(const char* tag, std::size_t fast, std::size_t slow, std::size_t signal) {
  detail::requirePeriod(tag, fast);
  detail::requirePeriod(tag, slow);
  detail::requirePeriod(tag, signal);
  detail::requireOrdered(tag, fast, slow);
  return fast;
}

} // namespace

// ------- ROC -------

RateOfChange::RateOfChange(std::size_t period)
  : prev_(detail::requirePeriod("ROC", period)) {}

double RateOfChange::next(double x) {
  const double base = prev_.empty() ? x : prev_.front();
  prev_.push(x);
  last_ = base == 0.0 ? 0.0 : (x - base) / base * 100.0;
  return last_;
}

void RateOfChange::reset() {
  prev_.reset();
  last_ = NaN();
}

// ------- Efficiency ratio -------

EfficiencyRatio::EfficiencyRatio(std::size_t period)
  : prev_(detail::requirePeriod("ER", period)) {}

double EfficiencyRatio::next(double x) {
  double path = 0.0;
  double net = 0.0;
  if (!prev_.empty()) {
    for (std::size_t i = 1; i < prev_.size(); ++i) path += std::abs(prev_[i] - prev_[i - 1]);
    path += std::abs(x - prev_.back());
    net = std::abs(x - prev_.front());
  }
  prev_.push(x);
  last_ = path == 0.0 ? 0.0 : net / path;
  return last_;
}

void EfficiencyRatio::reset() {
  prev_.reset();
  last_ = NaN();
}

// ------- RSI -------

Rsi::Rsi(std::size_t period)
  : gain_(detail::requirePeriod("RSI", period)), loss_(period) {}

double Rsi::next(double x) {
  if (!prev_) {
    prev_ = x;
    last_ = 50.0;
    return last_;
  }
  const double delta = x - *prev_;
  prev_ = x;

  const double avgGain = gain_.next(delta > 0.0 ? delta : 0.0);
  const double avgLoss = loss_.next(delta < 0.0 ? -delta : 0.0);

  if (avgLoss == 0.0) {
    last_ = avgGain == 0.0 ? 50.0 : 100.0;
  } else {
    const double rs = avgGain / avgLoss;
    last_ = 100.0 - 100.0 / (1.0 + rs);
  }
  return last_;
}

void Rsi::reset() {
  gain_.reset();
  loss_.reset();
  prev_.reset();
  last_ = NaN();
}

// ------- MACD -------

Macd::Macd(std::size_t fast, std::size_t slow, std::size_t signal)
  : fast_(checkedFast("MACD", fast, slow, signal)), slow_(slow), signal_(signal) {}

MacdOutput Macd::next(double x) {
  const double line = fast_.next(x) - slow_.next(x);
  const double sig = signal_.next(line);
  last_ = MacdOutput{line, sig, line - sig};
  return last_;
}

void Macd::reset() {
  fast_.reset();
  slow_.reset();
  signal_.reset();
  last_ = MacdOutput{NaN(), NaN(), NaN()};
}

std::string Macd::name() const {
  return formatName("MACD", {double(fastPeriod()), double(slowPeriod()), double(signalPeriod())});
}

// ------- PPO -------

Ppo::Ppo(std::size_t fast, std::size_t slow, std::size_t signal)
  : fast_(checkedFast("PPO", fast, slow, signal)), slow_(slow), signal_(signal) {}

PpoOutput Ppo::next(double x) {
  const double f = fast_.next(x);
  const double s = slow_.next(x);
  const double line = s == 0.0 ? 0.0 : (f - s) / s * 100.0;
  const double sig = signal_.next(line);
  last_ = PpoOutput{line, sig, line - sig};
  return last_;
}

void Ppo::reset() {
  fast_.reset();
  slow_.reset();
  signal_.reset();
  last_ = PpoOutput{NaN(), NaN(), NaN()};
}

std::string Ppo::name() const {
  return formatName("PPO", {double(fastPeriod()), double(slowPeriod()), double(signalPeriod())});
}

} // namespace sta::ta
