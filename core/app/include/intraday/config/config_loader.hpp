#pragma once

#include "intraday/config/strategy_config.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace intraday {
namespace config {

// -----------------------------------------------------------------------------
// ConfigLoadResult
// -----------------------------------------------------------------------------
// The configuration produced by a load together with every warning that was
// logged while producing it. used_defaults is true when the whole file was
// unusable and the built-in defaults were substituted.
// -----------------------------------------------------------------------------
struct ConfigLoadResult {
  StrategyConfig config;
  std::vector<std::string> warnings;
  bool used_defaults{false};
};

// -----------------------------------------------------------------------------
// ConfigLoader: JSON configuration file → StrategyConfig
// -----------------------------------------------------------------------------
//
// @brief  Reads the strategy configuration once at startup and resolves every
//         recognised option to either its configured value or its default.
//
// @details
// Expected layout (all keys optional):
//
//   {
//     "trading":    { "symbol": "BTCUSD", "consolidation_minutes": 5, ... },
//     "indicators": { "ema": { "period": 20 }, "rsi": { ... }, ... },
//     "entry":      { "conditions": { "price_above_ema": true, ... } },
//     "exit":       { "stop_loss_percent": 0.005, ... },
//     "risk":       { "portfolio": { ... }, "position_sizing": { ... },
//                     "stop_loss": { ... } },
//     "behavior":   { "log_trades": true, ... }
//   }
//
// Failure policy:
//   - File missing, unreadable or not valid JSON → warning, full defaults
//     (used_defaults = true). Startup continues.
//   - Unknown top-level section → ConfigurationError. A misspelled section
//     would otherwise silently drop a whole block of settings.
//   - Unknown key inside a known section → warning, ignored.
//   - Value of the wrong JSON type or outside its valid range → warning,
//     default kept.
//
// Every warning is written to std::cerr with a "[ConfigLoader]" prefix and
// also returned in ConfigLoadResult::warnings.
//
// Thread model:
//   Stateless; call from main() before the engine starts.
// -----------------------------------------------------------------------------
class ConfigLoader {
 public:
  // Loads and parses the file at `path`. See failure policy above.
  static ConfigLoadResult loadFile(const std::string& path);

  // Parses JSON text. Malformed text yields defaults with a warning.
  static ConfigLoadResult loadString(const std::string& text);

  // Parses an already-decoded document. A non-object root yields defaults
  // with a warning; an unknown top-level section throws ConfigurationError.
  static ConfigLoadResult fromJson(const nlohmann::json& document);
};

}  // namespace config
}  // namespace intraday
