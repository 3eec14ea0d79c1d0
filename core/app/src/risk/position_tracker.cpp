#include "intraday/risk/position_tracker.hpp"
#include "intraday/domain/errors.hpp"
#include "intraday/time/time_utils.hpp"

#include <iostream>

namespace intraday {

PositionTracker::PositionTracker(EventBus& bus,
                                 const config::StrategyConfig& config)
    : bus_(bus), config_(config) {}

// -----------------------------------------------------------------------------
// openPosition: FLAT → OPEN
// -----------------------------------------------------------------------------
domain::TradeRecord PositionTracker::openPosition(
    domain::StrategyContext& context, const domain::IndicatorSnapshot& snapshot,
    Timestamp now, double size, double portfolio_value) {
  domain::Position& position = context.position;
  if (position.isOpen()) {
    throw StateTransitionError(
        "openPosition: position in " + position.symbol +
        " is already OPEN at " + std::to_string(*position.entry_price));
  }

  position.symbol = config_.trading.symbol;
  position.status = domain::PositionStatus::Open;
  position.entry_price = snapshot.close;
  position.entry_time = now;
  position.entry_size = size;
  position.entry_portfolio_value = portfolio_value;
  ++position.trade_count;

  domain::TradeRecord record;
  record.action = domain::TradeAction::Entry;
  record.symbol = position.symbol;
  record.quantity = size;
  record.price = snapshot.close;
  record.timestamp = now;
  context.trade_log.push_back(record);

  std::cout << "[PositionTracker] ENTRY " << record.symbol << " at "
            << record.price << " size=" << size
            << " (trade #" << position.trade_count << ")\n";

  if (config_.behavior.log_trades) {
    TradeEvent event;
    event.record = record;
    event.trade_count = position.trade_count;
    event.portfolio_value = portfolio_value;
    event.ema = snapshot.ema;
    event.rsi = snapshot.rsi;
    bus_.publish(event);
  }

  return record;
}

// -----------------------------------------------------------------------------
// closePosition: OPEN → FLAT
// -----------------------------------------------------------------------------
ClosedTrade PositionTracker::closePosition(domain::StrategyContext& context,
                                           double price, Timestamp now,
                                           domain::ExitReason reason,
                                           double portfolio_value) {
  domain::Position& position = context.position;
  if (!position.isOpen()) {
    throw StateTransitionError("closePosition: no open position in " +
                               config_.trading.symbol);
  }
  if (reason == domain::ExitReason::None) {
    throw StateTransitionError("closePosition: exit reason must not be NONE");
  }

  const double entry_price = *position.entry_price;
  const double trade_pnl = (price - entry_price) / entry_price;

  if (trade_pnl > 0.0) {
    ++position.winning_trades;
  } else {
    ++position.losing_trades;
    ++context.risk.consecutive_losses;
  }

  ClosedTrade closed;
  closed.realized_pnl = trade_pnl * position.entry_size.value_or(0.0) *
                        position.entry_portfolio_value.value_or(0.0);

  domain::TradeRecord& record = closed.record;
  record.action = domain::TradeAction::Exit;
  record.symbol = position.symbol;
  record.quantity = 0.0;
  record.price = price;
  record.timestamp = now;
  record.exit_reason = reason;
  record.entry_price = entry_price;
  record.pnl_percent = trade_pnl * 100.0;
  record.duration_minutes = minutes_between(*position.entry_time, now);

  position.status = domain::PositionStatus::Flat;
  position.entry_price.reset();
  position.entry_time.reset();
  position.entry_size.reset();
  position.entry_portfolio_value.reset();

  context.trade_log.push_back(record);

  std::cout << "[PositionTracker] EXIT " << record.symbol << " at "
            << price << " reason=" << domain::toString(reason)
            << " pnl=" << *record.pnl_percent << "%\n";

  if (config_.behavior.log_trades) {
    TradeEvent event;
    event.record = record;
    event.trade_count = position.trade_count;
    event.portfolio_value = portfolio_value;
    bus_.publish(event);
  }

  return closed;
}

}  // namespace intraday
