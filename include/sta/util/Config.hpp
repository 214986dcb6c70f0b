#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>

namespace sta {
namespace util {

// Default indicator parameters, used by the factory when a spec omits them.
class Config {
public:
  // Construct with the conventional defaults.
  Config() = default;

  // Load from a simple "key=value" file. Unknown keys and malformed values are
  // logged and skipped. Returns false only if the file could not be opened.
  bool loadFromFile(const std::string& path);
  bool loadFromStream(std::istream& in);

  std::size_t defaultPeriod = 9;     // SMA, EMA, WMA, HMA, SD, MAD, ROC
  std::size_t extremumPeriod = 14;   // Minimum, Maximum
  std::size_t rsiPeriod = 14;
  std::size_t efficiencyPeriod = 14;
  std::size_t atrPeriod = 14;
  std::size_t mfiPeriod = 14;
  std::size_t cciPeriod = 20;

  std::size_t macdFast = 12;
  std::size_t macdSlow = 26;
  std::size_t macdSignal = 9;

  std::size_t stochPeriod = 14;
  std::size_t stochSmooth = 3;

  std::size_t bbandsPeriod = 9;
  double      bbandsK = 2.0;
  std::size_t keltnerPeriod = 10;
  double      keltnerK = 2.0;
  std::size_t chandelierPeriod = 22;
  double      chandelierK = 3.0;

  std::string logLevel = "info";
  std::string logFile;               // empty -> stdout
  bool        logJson = false;

  // Push the log* fields into the process logger.
  void applyLogging() const;

private:
  bool apply(const std::string& key, const std::string& val);
  static bool parseLineKV(const std::string& line, std::string& k, std::string& v);
  static std::string trim(const std::string& s);
};

} // namespace util
} // namespace sta
