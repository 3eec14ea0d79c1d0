#pragma once

#include "intraday/domain/performance_stats.hpp"
#include "intraday/domain/position.hpp"
#include "intraday/domain/risk_state.hpp"
#include "intraday/domain/timestamp.hpp"
#include "intraday/domain/trade_record.hpp"

#include <optional>
#include <vector>

namespace intraday {
namespace domain {

// -----------------------------------------------------------------------------
// StrategyContext: all mutable state of the decision core
// -----------------------------------------------------------------------------
//
// @brief  Explicit state object passed by reference into RiskManager,
//         SignalEngine, PositionTracker and PerformanceTracker operations.
//
// @details
// The components themselves hold only configuration and the EventBus they
// publish on. Every mutation of trading state therefore happens through a
// visible `StrategyContext&` parameter, which keeps each component testable
// in isolation: a test builds a context, calls one operation, inspects the
// context.
//
//   position            FLAT/OPEN state machine data (PositionTracker).
//   risk                Peak / drawdown / daily P&L / loss streak.
//   performance         Additive statistics (SignalEngine, PerformanceTracker).
//   last_obv            OBV baseline; empty until the first tick or bar
//                       records one (entry condition 3 is vacuously true
//                       while empty).
//   last_event_time     Timestamp of the last processed inbound event, used
//                       to reject out-of-order delivery.
//   last_portfolio_value  Latest portfolio reading, reported in snapshots.
//   trade_log           Append-only audit trail of TradeRecords.
//
// Thread model:
//   Owned by IntradayStrategy and touched only on the strategy loop thread.
// -----------------------------------------------------------------------------
struct StrategyContext {
  Position position;
  RiskState risk;
  PerformanceStats performance;
  std::optional<double> last_obv;
  std::optional<Timestamp> last_event_time;
  double last_portfolio_value{0.0};
  std::vector<TradeRecord> trade_log;
};

}  // namespace domain
}  // namespace intraday
