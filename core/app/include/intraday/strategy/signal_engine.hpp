#pragma once

#include "intraday/config/strategy_config.hpp"
#include "intraday/domain/exit_reason.hpp"
#include "intraday/domain/indicator_snapshot.hpp"
#include "intraday/domain/position.hpp"
#include "intraday/domain/strategy_context.hpp"
#include "intraday/eventbus/event_bus.hpp"

namespace intraday {

// -----------------------------------------------------------------------------
// SignalEngine
// -----------------------------------------------------------------------------
//
// @brief  Pure rule evaluation: turns one IndicatorSnapshot into an entry
//         yes/no or an exit reason.
//
// @details
// Entry (only while FLAT): the AND of three independently toggled
// conditions, each vacuously true when disabled:
//
//   1. price_above_ema   close > ema
//   2. rsi_oversold      rsi < indicators.rsi.oversold
//   3. obv_increasing    obv > last tracked OBV. Vacuously true when OBV is
//                        disabled or no baseline exists yet. A bar without
//                        an OBV value fails it.
//
// Exit (only while OPEN), first match wins:
//
//   1. close <= entry × (1 - exit.stop_loss_percent)    → STOP_LOSS
//   2. close >= entry × (1 + exit.take_profit_percent)  → TAKE_PROFIT
//   3. now - entry_time >= trading.trade_duration_minutes → TIME_EXIT
//
// Comparisons are exact; no epsilon is applied.
//
// SignalEngine never changes the position. Its only writes are the signal
// counter and the OBV baseline in StrategyContext.
//
// Thread model:
//   Strategy loop thread only.
// -----------------------------------------------------------------------------
class SignalEngine {
 public:
  SignalEngine(EventBus& bus, const config::StrategyConfig& config);

  SignalEngine(const SignalEngine&) = delete;
  SignalEngine& operator=(const SignalEngine&) = delete;

  // -------------------------------------------------------------------------
  // generateEntrySignal(snapshot, context)
  // -------------------------------------------------------------------------
  //
  // @return false when the position is OPEN; otherwise the AND of the
  //         enabled conditions.
  //
  // @details
  // On true, increments context.performance.signals_generated and, when
  // behavior.log_signals is set, publishes an ENTRY SignalEvent carrying
  // price, ema, rsi, obv (if present) and obv_increasing. The counter
  // counts signals, not trades: a signal later blocked by the risk check
  // is still counted.
  // -------------------------------------------------------------------------
  bool generateEntrySignal(const domain::IndicatorSnapshot& snapshot,
                           domain::StrategyContext& context);

  // Returns ExitReason::None when FLAT or when no rule matches.
  domain::ExitReason generateExitSignal(
      const domain::IndicatorSnapshot& snapshot,
      const domain::Position& position, Timestamp now) const;

  // -------------------------------------------------------------------------
  // updateObvBaseline(context, obv, is_warming_up)
  // -------------------------------------------------------------------------
  // Replaces the OBV baseline with `obv`. Ignored while warming up or when
  // the OBV indicator is disabled. Returns whether the baseline changed.
  // -------------------------------------------------------------------------
  bool updateObvBaseline(domain::StrategyContext& context, double obv,
                         bool is_warming_up) const;

  // Publishes an INDICATORS SignalEvent with every value on the bar when
  // behavior.log_indicators is set.
  void logIndicators(const domain::IndicatorSnapshot& snapshot) const;

 private:
  bool obvIncreasing(const domain::IndicatorSnapshot& snapshot,
                     const domain::StrategyContext& context) const;

  EventBus& bus_;
  const config::StrategyConfig config_;
};

}  // namespace intraday
