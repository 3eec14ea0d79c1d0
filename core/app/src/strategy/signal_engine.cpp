#include "intraday/strategy/signal_engine.hpp"

#include <chrono>

namespace intraday {

SignalEngine::SignalEngine(EventBus& bus, const config::StrategyConfig& config)
    : bus_(bus), config_(config) {}

bool SignalEngine::obvIncreasing(const domain::IndicatorSnapshot& snapshot,
                                 const domain::StrategyContext& context) const {
  if (!config_.obvConditionActive()) {
    return true;
  }
  if (!snapshot.obv) {
    return false;
  }
  if (!context.last_obv) {
    return true;
  }
  return *snapshot.obv > *context.last_obv;
}

// -----------------------------------------------------------------------------
// generateEntrySignal
// -----------------------------------------------------------------------------
bool SignalEngine::generateEntrySignal(
    const domain::IndicatorSnapshot& snapshot,
    domain::StrategyContext& context) {
  if (context.position.isOpen()) {
    return false;
  }

  const auto& conditions = config_.entry.conditions;

  const bool price_above_ema =
      !conditions.price_above_ema || snapshot.close > snapshot.ema;
  const bool rsi_oversold =
      !conditions.rsi_oversold ||
      snapshot.rsi < config_.indicators.rsi.oversold;
  const bool obv_increasing = obvIncreasing(snapshot, context);

  if (!(price_above_ema && rsi_oversold && obv_increasing)) {
    return false;
  }

  ++context.performance.signals_generated;

  if (config_.behavior.log_signals) {
    SignalEvent event;
    event.type = SignalType::Entry;
    event.symbol = config_.trading.symbol;
    event.timestamp = snapshot.timestamp;
    event.indicator_values = {
        {"price", snapshot.close},
        {"ema", snapshot.ema},
        {"rsi", snapshot.rsi},
        {"obv_increasing", obv_increasing ? 1.0 : 0.0},
    };
    if (snapshot.obv) {
      event.indicator_values["obv"] = *snapshot.obv;
    }
    bus_.publish(event);
  }

  return true;
}

// -----------------------------------------------------------------------------
// generateExitSignal: STOP_LOSS > TAKE_PROFIT > TIME_EXIT
// -----------------------------------------------------------------------------
domain::ExitReason SignalEngine::generateExitSignal(
    const domain::IndicatorSnapshot& snapshot,
    const domain::Position& position, Timestamp now) const {
  if (!position.isOpen() || !position.entry_price) {
    return domain::ExitReason::None;
  }

  const double entry = *position.entry_price;
  const double close = snapshot.close;

  if (close <= entry * (1 - config_.exit.stop_loss_percent)) {
    return domain::ExitReason::StopLoss;
  }
  if (close >= entry * (1 + config_.exit.take_profit_percent)) {
    return domain::ExitReason::TakeProfit;
  }

  const auto limit =
      std::chrono::minutes(config_.trading.trade_duration_minutes);
  if (position.entry_time && (now - *position.entry_time) >= limit) {
    return domain::ExitReason::TimeExit;
  }

  return domain::ExitReason::None;
}

bool SignalEngine::updateObvBaseline(domain::StrategyContext& context,
                                     double obv, bool is_warming_up) const {
  if (is_warming_up || !config_.indicators.obv.enabled) {
    return false;
  }
  context.last_obv = obv;
  return true;
}

void SignalEngine::logIndicators(
    const domain::IndicatorSnapshot& snapshot) const {
  if (!config_.behavior.log_indicators) {
    return;
  }

  SignalEvent event;
  event.type = SignalType::Indicators;
  event.symbol = config_.trading.symbol;
  event.timestamp = snapshot.timestamp;
  event.indicator_values = {
      {"price", snapshot.close},
      {"ema", snapshot.ema},
      {"rsi", snapshot.rsi},
  };
  if (snapshot.obv) {
    event.indicator_values["obv"] = *snapshot.obv;
  }
  if (snapshot.bollinger_bands) {
    event.indicator_values["bb_upper"] = snapshot.bollinger_bands->upper;
    event.indicator_values["bb_middle"] = snapshot.bollinger_bands->middle;
    event.indicator_values["bb_lower"] = snapshot.bollinger_bands->lower;
  }
  if (snapshot.macd) {
    event.indicator_values["macd"] = snapshot.macd->macd;
    event.indicator_values["macd_signal"] = snapshot.macd->signal;
    event.indicator_values["macd_histogram"] = snapshot.macd->histogram;
  }
  bus_.publish(event);
}

}  // namespace intraday
