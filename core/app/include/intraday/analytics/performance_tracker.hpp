#pragma once

#include "intraday/config/strategy_config.hpp"
#include "intraday/domain/performance_stats.hpp"
#include "intraday/domain/strategy_context.hpp"
#include "intraday/domain/trade_record.hpp"
#include "intraday/eventbus/event_bus.hpp"
#include "intraday/risk/risk_manager.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace intraday {

// -----------------------------------------------------------------------------
// MetricsSnapshot
// -----------------------------------------------------------------------------
// Point-in-time copy of the run's metrics. Produced on the strategy loop and
// handed to other threads by value (IPC STATUS command).
// -----------------------------------------------------------------------------
struct MetricsSnapshot {
  double portfolio_value{0.0};
  std::uint64_t total_trades{0};        // Entries taken
  std::uint64_t signals_generated{0};
  std::uint64_t winning_trades{0};
  std::uint64_t losing_trades{0};
  double win_rate_percent{0.0};
  double current_drawdown{0.0};
  double max_drawdown_seen{0.0};
  std::uint64_t consecutive_losses{0};
  double daily_pnl{0.0};
  double average_pnl_percent{0.0};
  double average_duration_minutes{0.0};
  std::optional<double> best_trade_pnl_percent;
  std::optional<double> worst_trade_pnl_percent;
  std::string position_status{"FLAT"};
  std::optional<double> entry_price;
};

// -----------------------------------------------------------------------------
// PerformanceTracker
// -----------------------------------------------------------------------------
//
// @brief  Aggregates closed-trade statistics and emits the daily and final
//         performance reports.
//
// @details
// Counters that already live elsewhere in StrategyContext (signals in
// PerformanceStats, wins/losses in Position, drawdown in RiskState) are
// read, not duplicated. recordTrade() adds the per-trade aggregates that
// nothing else keeps: total and average P&L percent, holding time, best and
// worst trade.
//
// Reports are PerformanceEvents published on the bus when
// behavior.log_performance is set. The final report carries the keys
//
//   total_signals, total_trades, winning_trades, losing_trades,
//   win_rate_percent, final_portfolio_value, max_drawdown_percent
//
// where total_trades counts closed trades (wins + losses) and
// max_drawdown_percent is in percent.
//
// Thread model:
//   Strategy loop thread only.
// -----------------------------------------------------------------------------
class PerformanceTracker {
 public:
  PerformanceTracker(EventBus& bus, const config::StrategyConfig& config,
                     const RiskManager& risk);

  PerformanceTracker(const PerformanceTracker&) = delete;
  PerformanceTracker& operator=(const PerformanceTracker&) = delete;

  // wins / (wins + losses) × 100, or 0 with no closed trades.
  static double winRate(std::uint64_t wins, std::uint64_t losses);

  // Folds an EXIT record into the aggregates. ENTRY records are ignored.
  void recordTrade(domain::PerformanceStats& stats,
                   const domain::TradeRecord& record) const;

  MetricsSnapshot snapshot(const domain::StrategyContext& context) const;

  // -------------------------------------------------------------------------
  // onDayEnd(context, portfolio_value, now)
  // -------------------------------------------------------------------------
  // Takes a snapshot, publishes it as a DAILY report, then zeroes the daily
  // P&L through RiskManager::resetDaily(). Cumulative counters are kept.
  // Returns the published metrics.
  // -------------------------------------------------------------------------
  std::map<std::string, double> onDayEnd(domain::StrategyContext& context,
                                         double portfolio_value,
                                         Timestamp now) const;

  // Publishes the FINAL report and returns its metrics.
  std::map<std::string, double> onRunEnd(domain::StrategyContext& context,
                                         double portfolio_value,
                                         Timestamp now) const;

 private:
  void publish(PerformanceReportKind kind,
               const std::map<std::string, double>& metrics,
               Timestamp now) const;

  EventBus& bus_;
  const config::StrategyConfig config_;
  const RiskManager& risk_;
};

}  // namespace intraday
