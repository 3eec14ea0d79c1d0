#pragma once

#include <cstdint>
#include <optional>

namespace intraday {
namespace domain {

// -----------------------------------------------------------------------------
// PerformanceStats: cumulative, additive run statistics
// -----------------------------------------------------------------------------
// Written by SignalEngine (signals_generated) and PerformanceTracker (the
// closed-trade aggregates). Never reset during a run; day boundaries only
// reset RiskState::daily_pnl.
// -----------------------------------------------------------------------------
struct PerformanceStats {
  std::uint64_t signals_generated{0};
  std::uint64_t closed_trades{0};
  double total_pnl_percent{0.0};
  double total_duration_minutes{0.0};
  std::optional<double> best_trade_pnl_percent;
  std::optional<double> worst_trade_pnl_percent;
  std::uint64_t days_reported{0};
};

}  // namespace domain
}  // namespace intraday
