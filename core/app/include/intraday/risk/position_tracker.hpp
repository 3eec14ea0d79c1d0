#pragma once

#include "intraday/config/strategy_config.hpp"
#include "intraday/domain/exit_reason.hpp"
#include "intraday/domain/indicator_snapshot.hpp"
#include "intraday/domain/strategy_context.hpp"
#include "intraday/domain/trade_record.hpp"
#include "intraday/eventbus/event_bus.hpp"

namespace intraday {

// Result of closing a position: the EXIT record plus the realised currency
// P&L (trade P&L fraction × entry size × portfolio value at entry) that the
// caller feeds into the daily P&L.
struct ClosedTrade {
  domain::TradeRecord record;
  double realized_pnl{0.0};
};

// -----------------------------------------------------------------------------
// PositionTracker: FLAT/OPEN state machine
// -----------------------------------------------------------------------------
//
// @brief  The only writer of StrategyContext::position. Applies the two legal
//         transitions and appends one TradeRecord to the trade log for each.
//
// @details
//
//     FLAT ──openPosition()──▶ OPEN
//      ▲                        │
//      └──closePosition(reason)─┘     reason ∈ {STOP_LOSS, TAKE_PROFIT,
//                                               TIME_EXIT}
//
// openPosition() records entry price/time/size, increments trade_count.
// closePosition() computes trade P&L = (exit - entry) / entry, counts a win
// if it is strictly positive and a loss otherwise (a loss also bumps
// RiskState::consecutive_losses, which is never reset), then clears every
// entry field.
//
// Anything else (opening while OPEN, closing while FLAT, closing with
// ExitReason::None) throws StateTransitionError and leaves the context
// untouched. An EXIT record therefore always has a matching ENTRY before it.
//
// When behavior.log_trades is set each transition is also published as a
// TradeEvent.
//
// Thread model:
//   Strategy loop thread only.
// -----------------------------------------------------------------------------
class PositionTracker {
 public:
  PositionTracker(EventBus& bus, const config::StrategyConfig& config);

  PositionTracker(const PositionTracker&) = delete;
  PositionTracker& operator=(const PositionTracker&) = delete;

  // -------------------------------------------------------------------------
  // openPosition(context, snapshot, now, size, portfolio_value)
  // -------------------------------------------------------------------------
  //
  // @param  snapshot         Bar that triggered the entry; its close is the
  //                          entry price, its EMA/RSI go into the TradeEvent.
  // @param  now              Entry time.
  // @param  size             Target portfolio fraction from RiskManager.
  // @param  portfolio_value  Portfolio value at entry.
  //
  // @return The ENTRY record appended to context.trade_log.
  // @throws StateTransitionError if the position is already OPEN.
  // -------------------------------------------------------------------------
  domain::TradeRecord openPosition(domain::StrategyContext& context,
                                   const domain::IndicatorSnapshot& snapshot,
                                   Timestamp now, double size,
                                   double portfolio_value);

  // -------------------------------------------------------------------------
  // closePosition(context, price, now, reason, portfolio_value)
  // -------------------------------------------------------------------------
  //
  // @return The EXIT record (also appended to context.trade_log) and the
  //         realised currency P&L.
  // @throws StateTransitionError if FLAT or reason == ExitReason::None.
  // -------------------------------------------------------------------------
  ClosedTrade closePosition(domain::StrategyContext& context, double price,
                            Timestamp now, domain::ExitReason reason,
                            double portfolio_value);

 private:
  EventBus& bus_;
  const config::StrategyConfig config_;
};

}  // namespace intraday
