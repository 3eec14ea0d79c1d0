#pragma once

#include <cstdint>
#include <optional>

namespace intraday {
namespace domain {

// -----------------------------------------------------------------------------
// RiskState: running portfolio risk figures
// -----------------------------------------------------------------------------
//
// @brief  Pure data updated by RiskManager and PositionTracker for the
//         lifetime of the process.
//
// @details
//   peak_portfolio_value  Empty until the first portfolio value is observed,
//                         then monotonically non-decreasing.
//   current_drawdown      (peak - value) / peak of the latest check, in [0,1].
//   max_drawdown_seen     Monotonically non-decreasing.
//   daily_pnl             Realized currency P&L since the last day boundary.
//   consecutive_losses    Incremented on every losing exit; never reset.
//
// Thread model:
//   Owned by StrategyContext on the strategy loop thread.
// -----------------------------------------------------------------------------
struct RiskState {
  std::optional<double> peak_portfolio_value;
  double current_drawdown{0.0};
  double max_drawdown_seen{0.0};
  double daily_pnl{0.0};
  std::uint64_t consecutive_losses{0};
};

}  // namespace domain
}  // namespace intraday
