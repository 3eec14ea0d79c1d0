#pragma once

#include "intraday/domain/timestamp.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace intraday {
namespace domain {

enum class PositionStatus {
  Flat,
  Open,
};

inline const char* toString(PositionStatus status) {
  switch (status) {
    case PositionStatus::Flat: return "FLAT";
    case PositionStatus::Open: return "OPEN";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// Position: the single instrument's trading state
// -----------------------------------------------------------------------------
//
// @brief  Two-state record (FLAT / OPEN) plus the trade counters that survive
//         across open intervals.
//
// @details
// Invariant (enforced by PositionTracker, the only writer):
//   entry_price, entry_time, entry_size and entry_portfolio_value hold a value
//   if and only if status == Open.
//
// entry_size is the target portfolio fraction committed on entry and
// entry_portfolio_value the portfolio value at that moment; together they
// give the notional used to turn the exit's fractional P&L into a currency
// amount for the daily P&L accumulator.
//
// trade_count increments on every entry and never decreases. winning_trades
// and losing_trades increment on every exit (a zero P&L exit is a loss).
//
// Thread model:
//   Value type owned by StrategyContext on the strategy loop thread.
// -----------------------------------------------------------------------------
struct Position {
  std::string symbol;
  PositionStatus status{PositionStatus::Flat};
  std::optional<double> entry_price;
  std::optional<Timestamp> entry_time;
  std::optional<double> entry_size;
  std::optional<double> entry_portfolio_value;

  std::uint64_t trade_count{0};
  std::uint64_t winning_trades{0};
  std::uint64_t losing_trades{0};

  bool isOpen() const { return status == PositionStatus::Open; }
};

}  // namespace domain
}  // namespace intraday
