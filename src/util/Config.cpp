#include "sta/util/Config.hpp"

#include "sta/util/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <istream>
#include <string>

namespace sta {
namespace util {

namespace {

bool parsePeriod(const std::string& val, std::size_t& out) {
  if (val.empty() || !std::all_of(val.begin(), val.end(),
                                  [](unsigned char c){ return std::isdigit(c) != 0; }))
    return false;
  const unsigned long long n = std::strtoull(val.c_str(), nullptr, 10);
  if (n == 0) return false;
  out = static_cast<std::size_t>(n);
  return true;
}

bool parseMultiplier(const std::string& val, double& out) {
  char* end = nullptr;
  const double d = std::strtod(val.c_str(), &end);
  if (val.empty() || end != val.c_str() + val.size()) return false;
  if (!std::isfinite(d) || d < 0.0) return false;
  out = d;
  return true;
}

bool parseBool(const std::string& val, bool& out) {
  if (val == "1" || val == "true" || val == "yes") { out = true; return true; }
  if (val == "0" || val == "false" || val == "no") { out = false; return true; }
  return false;
}

} // namespace

std::string Config::trim(const std::string& s) {
  const auto is_ws = [](unsigned char c){ return std::isspace(c) != 0; };
  auto b = std::find_if_not(s.begin(), s.end(), is_ws);
  auto e = std::find_if_not(s.rbegin(), s.rend(), is_ws).base();
  if (b >= e) return {};
  return std::string(b, e);
}

bool Config::parseLineKV(const std::string& line, std::string& k, std::string& v) {
  auto pos = line.find('=');
  if (pos == std::string::npos) return false;
  k = trim(line.substr(0, pos));
  v = trim(line.substr(pos + 1));
  if (k.empty()) return false;
  return true;
}

bool Config::apply(const std::string& key, const std::string& val) {
  if      (key == "default_period")    return parsePeriod(val, defaultPeriod);
  else if (key == "extremum_period")   return parsePeriod(val, extremumPeriod);
  else if (key == "rsi_period")        return parsePeriod(val, rsiPeriod);
  else if (key == "efficiency_period") return parsePeriod(val, efficiencyPeriod);
  else if (key == "atr_period")        return parsePeriod(val, atrPeriod);
  else if (key == "mfi_period")        return parsePeriod(val, mfiPeriod);
  else if (key == "cci_period")        return parsePeriod(val, cciPeriod);
  else if (key == "macd_fast")         return parsePeriod(val, macdFast);
  else if (key == "macd_slow")         return parsePeriod(val, macdSlow);
  else if (key == "macd_signal")       return parsePeriod(val, macdSignal);
  else if (key == "stoch_period")      return parsePeriod(val, stochPeriod);
  else if (key == "stoch_smooth")      return parsePeriod(val, stochSmooth);
  else if (key == "bbands_period")     return parsePeriod(val, bbandsPeriod);
  else if (key == "bbands_k")          return parseMultiplier(val, bbandsK);
  else if (key == "keltner_period")    return parsePeriod(val, keltnerPeriod);
  else if (key == "keltner_k")         return parseMultiplier(val, keltnerK);
  else if (key == "chandelier_period") return parsePeriod(val, chandelierPeriod);
  else if (key == "chandelier_k")      return parseMultiplier(val, chandelierK);
  else if (key == "log_level")         { logLevel = val; return true; }
  else if (key == "log_file")          { logFile = val; return true; }
  else if (key == "log_json")          return parseBool(val, logJson);

  logger().log(LogLevel::Warn, "Unknown config key ignored", { {"key", key} });
  return true;
}

bool Config::loadFromStream(std::istream& in) {
  // Simple INI-ish parser: key=value per line, '#' or ';' start comments.
  std::string line;
  std::size_t lineNo = 0;
  while (std::getline(in, line)) {
    ++lineNo;
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();

    auto s = trim(line);
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == ';') continue; // comment

    std::string key, val;
    if (!parseLineKV(s, key, val)) {
      logger().log(LogLevel::Warn, "Malformed config line skipped",
                   { {"line", std::to_string(lineNo)} });
      continue;
    }
    if (!apply(key, val)) {
      logger().log(LogLevel::Warn, "Invalid config value, default kept",
                   { {"key", key}, {"value", val} });
    }
  }

  // MACD/PPO need fast < slow; fall back to the stock triple otherwise.
  if (macdFast >= macdSlow) {
    logger().log(LogLevel::Warn, "macd_fast must be below macd_slow, using 12/26",
                 { {"fast", std::to_string(macdFast)}, {"slow", std::to_string(macdSlow)} });
    macdFast = 12;
    macdSlow = 26;
  }
  return true;
}

bool Config::loadFromFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    logger().log(LogLevel::Error, "Cannot open config file", { {"path", path} });
    return false;
  }
  const bool ok = loadFromStream(in);
  logger().log(LogLevel::Info, "Config loaded", { {"path", path} });
  return ok;
}

void Config::applyLogging() const {
  logger().setLevel(parseLevel(logLevel));
  logger().setFormatJson(logJson);
  logger().setFile(logFile);
}

} // namespace util
} // namespace sta
