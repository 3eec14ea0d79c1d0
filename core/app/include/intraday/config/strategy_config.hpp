#pragma once

#include <algorithm>
#include <optional>
#include <string>

namespace intraday {
namespace config {

// -----------------------------------------------------------------------------
// StrategyConfig: typed, immutable run configuration
// -----------------------------------------------------------------------------
//
// @brief  Every option the decision core recognises, grouped by the section
//         of the JSON configuration file it is read from. Each member carries
//         its documented default, so a value-initialised StrategyConfig is the
//         complete fallback configuration.
//
// @details
// Populated once at startup by ConfigLoader and then passed by const
// reference into every component. Nothing mutates it after startup.
//
// Thread model:
//   Plain data with value semantics. Safe to read from any thread once
//   constructed.
// -----------------------------------------------------------------------------

struct TradingConfig {
  std::string symbol{"BTCUSD"};
  std::string market{"Bitfinex"};
  std::string resolution{"Minute"};
  int consolidation_minutes{5};
  double position_size{0.99};
  int trade_duration_minutes{30};
};

struct EmaConfig {
  int period{20};
};

struct RsiConfig {
  int period{14};
  double oversold{30.0};
  double overbought{70.0};
};

struct ObvConfig {
  bool enabled{true};
};

struct BollingerBandsConfig {
  bool enabled{false};
  int period{20};
  double std_dev{2.0};
};

struct MacdConfig {
  bool enabled{false};
  int fast_period{12};
  int slow_period{26};
  int signal_period{9};
};

struct IndicatorsConfig {
  EmaConfig ema;
  RsiConfig rsi;
  ObvConfig obv;
  BollingerBandsConfig bollinger_bands;
  MacdConfig macd;
};

// Entry condition toggles. A disabled condition is vacuously true.
struct EntryConditions {
  bool price_above_ema{true};
  bool rsi_oversold{true};
  bool obv_increasing{true};
};

struct EntryConfig {
  EntryConditions conditions;
};

struct ExitConfig {
  double stop_loss_percent{0.005};
  double take_profit_percent{0.01};
};

enum class SizingMethod {
  Fixed,
  PercentRisk,
};

inline const char* toString(SizingMethod method) {
  switch (method) {
    case SizingMethod::Fixed:       return "fixed";
    case SizingMethod::PercentRisk: return "percent_risk";
  }
  return "fixed";
}

// Any string other than "percent_risk" selects fixed sizing.
inline SizingMethod parseSizingMethod(const std::string& name) {
  return name == "percent_risk" ? SizingMethod::PercentRisk
                                : SizingMethod::Fixed;
}

struct PortfolioRiskConfig {
  double max_drawdown_percent{0.15};
  double daily_loss_limit_percent{0.05};
};

struct PositionSizingConfig {
  SizingMethod method{SizingMethod::Fixed};

  // risk.position_sizing.fixed.size. Empty means "use trading.position_size".
  std::optional<double> fixed_size;

  double risk_per_trade{0.02};
};

struct StopLossConfig {
  double default_percent{0.005};
};

struct RiskConfig {
  PortfolioRiskConfig portfolio;
  PositionSizingConfig position_sizing;
  StopLossConfig stop_loss;
};

struct BehaviorConfig {
  bool debug_mode{false};
  bool log_performance{true};
  bool log_signals{true};
  bool log_trades{true};
  bool log_indicators{false};
  int warmup_buffer{1};
};

struct StrategyConfig {
  TradingConfig trading;
  IndicatorsConfig indicators;
  EntryConfig entry;
  ExitConfig exit;
  RiskConfig risk;
  BehaviorConfig behavior;

  // Number of bars the external indicator feed must deliver before the
  // core starts evaluating: the longest indicator period plus the buffer.
  int warmupPeriod() const {
    return std::max(indicators.ema.period, indicators.rsi.period) +
           behavior.warmup_buffer;
  }

  // Size used by the fixed sizing method.
  double fixedPositionSize() const {
    return risk.position_sizing.fixed_size.value_or(trading.position_size);
  }

  // OBV takes part in entry decisions only if the indicator is enabled and
  // the condition toggle is on.
  bool obvConditionActive() const {
    return indicators.obv.enabled && entry.conditions.obv_increasing;
  }
};

}  // namespace config
}  // namespace intraday
