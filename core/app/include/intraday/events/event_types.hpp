#pragma once

#include "intraday/domain/indicator_snapshot.hpp"
#include "intraday/domain/timestamp.hpp"

#include <optional>
#include <string>

namespace intraday {

// -----------------------------------------------------------------------------
// Inbound events
// -----------------------------------------------------------------------------
// Everything the external data/indicator collaborator tells the decision
// core arrives as one of the four structs below. MarketDataGateway decodes
// them from the wire and pushes them onto the strategy loop, so all of them
// are handled on one thread in arrival order.
// -----------------------------------------------------------------------------

// -----------------------------------------------------------------------------
// BarEvent
// -----------------------------------------------------------------------------
//
// @brief  One consolidated bar with its precomputed indicators and the
//         portfolio reading taken at the same moment.
//
// @details
// is_warming_up and indicators_ready let the collaborator say "do not
// evaluate this bar yet". The core skips such bars without touching any
// state. is_invested is the broker's view of the position; the core trusts
// its own PositionTracker and only warns when the two disagree.
// -----------------------------------------------------------------------------
struct BarEvent {
  std::string symbol;
  domain::IndicatorSnapshot snapshot;
  double portfolio_value{0.0};
  bool is_invested{false};
  bool is_warming_up{false};
  bool indicators_ready{true};
};

// -----------------------------------------------------------------------------
// TickEvent
// -----------------------------------------------------------------------------
// Per-minute update between bars. Carries only the running OBV value, which
// refreshes the baseline used by the "OBV increasing" entry condition.
// -----------------------------------------------------------------------------
struct TickEvent {
  Timestamp timestamp{};
  double obv{0.0};
  bool is_warming_up{false};
};

// End of a trading day: emit daily metrics, reset daily P&L.
struct DayEndEvent {
  Timestamp timestamp{};
  double portfolio_value{0.0};
};

// End of the run: emit the final summary.
struct RunEndEvent {
  Timestamp timestamp{};
  double portfolio_value{0.0};
};

}  // namespace intraday
