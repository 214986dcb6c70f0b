#pragma once
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <rapidjson/document.h>

#include "sta/Result.hpp"
#include "sta/ta/AnyIndicator.hpp"
#include "sta/util/Config.hpp"

namespace sta::ta {

using IndicatorList = std::vector<std::unique_ptr<IIndicator>>;

// Builds indicators from JSON specs such as
//   {"type":"macd","fast":12,"slow":26,"signal":9}
//   [{"type":"sma","period":20},{"type":"bb","period":20,"k":2.5}]
// Parameters a spec omits come from the Config defaults.
class IndicatorFactory {
public:
  using Builder = std::function<std::unique_ptr<IIndicator>(const rapidjson::Value& spec,
                                                            const util::Config& defaults)>;

  // Registers every built-in indicator type.
  explicit IndicatorFactory(util::Config defaults = util::Config());

  /// Register (or replace) the builder for `type`.
  void registerBuilder(const std::string& type, Builder b);

  bool has(const std::string& type) const;
  std::vector<std::string> types() const;
  const util::Config& defaults() const { return defaults_; }

  /// Build one indicator from a spec object. Throws ConfigError.
  std::unique_ptr<IIndicator> build(const rapidjson::Value& spec) const;

  /// Parse `json` (an object or an array of objects). Throws ConfigError.
  IndicatorList buildFromJson(const std::string& json) const;

  /// As buildFromJson, reporting the first failure with its JSON path.
  Result<IndicatorList> tryBuildFromJson(const std::string& json) const;

private:
  void registerBuiltins();

  util::Config defaults_;
  std::map<std::string, Builder> builders_;
};

} // namespace sta::ta
