#pragma once

#include "intraday/domain/trade_record.hpp"

#include <cstdint>
#include <optional>

namespace intraday {

// -----------------------------------------------------------------------------
// TradeEvent
// -----------------------------------------------------------------------------
//
// @brief  Structured log record for one FLAT/OPEN transition.
//
// @details
// Wraps the immutable TradeRecord appended to the trade log with the context
// an observer needs to read it on its own: the running trade count and the
// portfolio value at the time. ENTRY events also carry the EMA and RSI that
// justified the entry; EXIT events leave them empty and rely on the exit
// fields of the record instead.
//
// Published by PositionTracker only when behavior.log_trades is set.
// -----------------------------------------------------------------------------
struct TradeEvent {
  domain::TradeRecord record;
  std::uint64_t trade_count{0};
  double portfolio_value{0.0};
  std::optional<double> ema;
  std::optional<double> rsi;
};

}  // namespace intraday
