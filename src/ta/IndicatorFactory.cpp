#include "sta/ta/IndicatorFactory.hpp"

#include "sta/ta/Errors.hpp"
#include "sta/ta/Indicators.hpp"
#include "sta/util/Logger.hpp"

#include <rapidjson/error/en.h>

#include <exception>
#include <optional>
#include <string>
#include <utility>

namespace sta::ta {

// ----------------- Tiny helpers -----------------
namespace {

const char* expectType(const rapidjson::Value& v) {
  if (!v.IsObject()) throw ConfigError("indicator spec must be a JSON object");
  if (!v.HasMember("type") || !v["type"].IsString())
    throw ConfigError("indicator spec missing string 'type'");
  return v["type"].GetString();
}

// Present members must be positive integers; absent ones take the default.
std::size_t periodOr(const rapidjson::Value& v, const char* k, std::size_t def) {
  if (!v.HasMember(k)) return def;
  const auto& m = v[k];
  if (!m.IsUint64())
    throw ConfigError(std::string("'") + k + "' must be a non-negative integer");
  return static_cast<std::size_t>(m.GetUint64());
}

double multiplierOr(const rapidjson::Value& v, const char* k, double def) {
  if (!v.HasMember(k)) return def;
  const auto& m = v[k];
  if (!m.IsNumber()) throw ConfigError(std::string("'") + k + "' must be a number");
  return m.GetDouble();
}

window::VarianceKind kindOr(const rapidjson::Value& v, window::VarianceKind def) {
  if (!v.HasMember("kind")) return def;
  const auto& m = v["kind"];
  if (m.IsString()) {
    const std::string s = m.GetString();
    if (s == "population") return window::VarianceKind::Population;
    if (s == "sample") return window::VarianceKind::Sample;
  }
  throw ConfigError("'kind' must be \"population\" or \"sample\"");
}

// "k" and "multiplier" are accepted interchangeably.
double kOr(const rapidjson::Value& v, double def) {
  return v.HasMember("k") ? multiplierOr(v, "k", def) : multiplierOr(v, "multiplier", def);
}

} // namespace

// ----------------- Factory -----------------

IndicatorFactory::IndicatorFactory(util::Config defaults) : defaults_(std::move(defaults)) {
  registerBuiltins();
}

void IndicatorFactory::registerBuilder(const std::string& type, Builder b) {
  builders_[type] = std::move(b);
}

bool IndicatorFactory::has(const std::string& type) const {
  return builders_.count(type) != 0;
}

std::vector<std::string> IndicatorFactory::types() const {
  std::vector<std::string> out;
  out.reserve(builders_.size());
  for (const auto& kv : builders_) out.push_back(kv.first);
  return out;
}

void IndicatorFactory::registerBuiltins() {
  using V = rapidjson::Value;
  using C = util::Config;

  registerBuilder("sma", [](const V& v, const C& d) {
    return makeIndicator(Sma(periodOr(v, "period", d.defaultPeriod)));
  });
  registerBuilder("ema", [](const V& v, const C& d) {
    return makeIndicator(Ema(periodOr(v, "period", d.defaultPeriod)));
  });
  registerBuilder("wma", [](const V& v, const C& d) {
    return makeIndicator(Wma(periodOr(v, "period", d.defaultPeriod)));
  });
  registerBuilder("hma", [](const V& v, const C& d) {
    return makeIndicator(Hma(periodOr(v, "period", d.defaultPeriod)));
  });
  registerBuilder("min", [](const V& v, const C& d) {
    return makeIndicator(Minimum(periodOr(v, "period", d.extremumPeriod)));
  });
  registerBuilder("max", [](const V& v, const C& d) {
    return makeIndicator(Maximum(periodOr(v, "period", d.extremumPeriod)));
  });
  registerBuilder("sd", [](const V& v, const C& d) {
    return makeIndicator(StandardDeviation(periodOr(v, "period", d.defaultPeriod),
                                           kindOr(v, window::VarianceKind::Population)));
  });
  registerBuilder("mad", [](const V& v, const C& d) {
    return makeIndicator(MeanAbsoluteDeviation(periodOr(v, "period", d.defaultPeriod)));
  });
  registerBuilder("tr", [](const V&, const C&) {
    return makeIndicator(TrueRange());
  });
  registerBuilder("roc", [](const V& v, const C& d) {
    return makeIndicator(RateOfChange(periodOr(v, "period", d.defaultPeriod)));
  });
  registerBuilder("obv", [](const V&, const C&) {
    return makeIndicator(OnBalanceVolume());
  });
  registerBuilder("er", [](const V& v, const C& d) {
    return makeIndicator(EfficiencyRatio(periodOr(v, "period", d.efficiencyPeriod)));
  });
  registerBuilder("rsi", [](const V& v, const C& d) {
    return makeIndicator(Rsi(periodOr(v, "period", d.rsiPeriod)));
  });
  registerBuilder("macd", [](const V& v, const C& d) {
    return makeIndicator(Macd(periodOr(v, "fast", d.macdFast),
                              periodOr(v, "slow", d.macdSlow),
                              periodOr(v, "signal", d.macdSignal)));
  });
  registerBuilder("ppo", [](const V& v, const C& d) {
    return makeIndicator(Ppo(periodOr(v, "fast", d.macdFast),
                             periodOr(v, "slow", d.macdSlow),
                             periodOr(v, "signal", d.macdSignal)));
  });
  registerBuilder("fast_stoch", [](const V& v, const C& d) {
    return makeIndicator(FastStochastic(periodOr(v, "period", d.stochPeriod)));
  });
  registerBuilder("slow_stoch", [](const V& v, const C& d) {
    return makeIndicator(SlowStochastic(periodOr(v, "period", d.stochPeriod),
                                        periodOr(v, "smooth", d.stochSmooth)));
  });
  registerBuilder("cci", [](const V& v, const C& d) {
    return makeIndicator(Cci(periodOr(v, "period", d.cciPeriod)));
  });
  registerBuilder("mfi", [](const V& v, const C& d) {
    return makeIndicator(Mfi(periodOr(v, "period", d.mfiPeriod)));
  });
  registerBuilder("atr", [](const V& v, const C& d) {
    return makeIndicator(AverageTrueRange(periodOr(v, "period", d.atrPeriod)));
  });
  registerBuilder("bb", [](const V& v, const C& d) {
    return makeIndicator(BollingerBands(periodOr(v, "period", d.bbandsPeriod),
                                        kOr(v, d.bbandsK)));
  });
  registerBuilder("kc", [](const V& v, const C& d) {
    return makeIndicator(KeltnerChannel(periodOr(v, "period", d.keltnerPeriod),
                                        kOr(v, d.keltnerK)));
  });
  registerBuilder("ce", [](const V& v, const C& d) {
    return makeIndicator(ChandelierExit(periodOr(v, "period", d.chandelierPeriod),
                                        kOr(v, d.chandelierK)));
  });
}

std::unique_ptr<IIndicator> IndicatorFactory::build(const rapidjson::Value& spec) const {
  const std::string type = expectType(spec);
  auto it = builders_.find(type);
  if (it == builders_.end()) throw ConfigError("unknown indicator type '" + type + "'");

  auto ind = it->second(spec, defaults_);
  util::logger().log(util::LogLevel::Debug, "Indicator built",
                     { {"type", type}, {"name", ind->name()} });
  return ind;
}

IndicatorList IndicatorFactory::buildFromJson(const std::string& json) const {
  auto r = tryBuildFromJson(json);
  if (!r) throw ConfigError(r.error().describe());
  return std::move(r.value());
}

Result<IndicatorList> IndicatorFactory::tryBuildFromJson(const std::string& json) const {
  rapidjson::Document doc;
  doc.Parse(json.c_str(), json.size());
  if (doc.HasParseError()) {
    const std::string msg = std::string("JSON parse error at offset ") +
                            std::to_string(doc.GetErrorOffset()) + ": " +
                            rapidjson::GetParseError_En(doc.GetParseError());
    util::logger().log(util::LogLevel::Warn, "Indicator spec rejected", { {"error", msg} });
    return Error{msg, "$"};
  }

  IndicatorList out;
  auto buildAt = [&](const rapidjson::Value& v, const std::string& path) -> std::optional<Error> {
    try {
      out.push_back(build(v));
    } catch (const TaError& e) {
      util::logger().log(util::LogLevel::Warn, "Indicator spec rejected",
                         { {"path", path}, {"error", e.what()} });
      return Error{e.what(), path};
    } catch (const std::exception& e) {
      // Custom builders may fail with anything; keep it on the Result path.
      util::logger().log(util::LogLevel::Error, "Indicator builder failed",
                         { {"path", path}, {"error", e.what()} });
      return Error{e.what(), path};
    }
    return std::nullopt;
  };

  if (doc.IsArray()) {
    out.reserve(doc.Size());
    for (rapidjson::SizeType i = 0; i < doc.Size(); ++i) {
      if (auto err = buildAt(doc[i], "$[" + std::to_string(i) + "]")) return *err;
    }
  } else {
    if (auto err = buildAt(doc, "$")) return *err;
  }

  util::logger().log(util::LogLevel::Info, "Indicators built",
                     { {"count", std::to_string(out.size())} });
  return Result<IndicatorList>(std::move(out));
}

} // namespace sta::ta
