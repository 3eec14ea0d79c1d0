#include "intraday/analytics/performance_tracker.hpp"

#include <algorithm>
#include <iostream>

namespace intraday {

PerformanceTracker::PerformanceTracker(EventBus& bus,
                                       const config::StrategyConfig& config,
                                       const RiskManager& risk)
    : bus_(bus), config_(config), risk_(risk) {}

double PerformanceTracker::winRate(std::uint64_t wins, std::uint64_t losses) {
  const std::uint64_t total = wins + losses;
  if (total == 0) {
    return 0.0;
  }
  return static_cast<double>(wins) / static_cast<double>(total) * 100.0;
}

void PerformanceTracker::recordTrade(domain::PerformanceStats& stats,
                                     const domain::TradeRecord& record) const {
  if (record.action != domain::TradeAction::Exit || !record.pnl_percent) {
    return;
  }

  const double pnl = *record.pnl_percent;
  ++stats.closed_trades;
  stats.total_pnl_percent += pnl;
  stats.total_duration_minutes += record.duration_minutes.value_or(0.0);
  stats.best_trade_pnl_percent =
      std::max(stats.best_trade_pnl_percent.value_or(pnl), pnl);
  stats.worst_trade_pnl_percent =
      std::min(stats.worst_trade_pnl_percent.value_or(pnl), pnl);
}

MetricsSnapshot PerformanceTracker::snapshot(
    const domain::StrategyContext& context) const {
  const domain::PerformanceStats& stats = context.performance;
  const domain::Position& position = context.position;

  MetricsSnapshot m;
  m.portfolio_value = context.last_portfolio_value;
  m.total_trades = position.trade_count;
  m.signals_generated = stats.signals_generated;
  m.winning_trades = position.winning_trades;
  m.losing_trades = position.losing_trades;
  m.win_rate_percent = winRate(position.winning_trades, position.losing_trades);
  m.current_drawdown = context.risk.current_drawdown;
  m.max_drawdown_seen = context.risk.max_drawdown_seen;
  m.consecutive_losses = context.risk.consecutive_losses;
  m.daily_pnl = context.risk.daily_pnl;
  if (stats.closed_trades > 0) {
    const auto n = static_cast<double>(stats.closed_trades);
    m.average_pnl_percent = stats.total_pnl_percent / n;
    m.average_duration_minutes = stats.total_duration_minutes / n;
  }
  m.best_trade_pnl_percent = stats.best_trade_pnl_percent;
  m.worst_trade_pnl_percent = stats.worst_trade_pnl_percent;
  m.position_status = domain::toString(position.status);
  m.entry_price = position.entry_price;
  return m;
}

// -----------------------------------------------------------------------------
// onDayEnd: report, then reset daily P&L
// -----------------------------------------------------------------------------
std::map<std::string, double> PerformanceTracker::onDayEnd(
    domain::StrategyContext& context, double portfolio_value,
    Timestamp now) const {
  context.last_portfolio_value = portfolio_value;
  const MetricsSnapshot m = snapshot(context);

  std::map<std::string, double> metrics = {
      {"portfolio_value", m.portfolio_value},
      {"total_trades", static_cast<double>(m.total_trades)},
      {"signals_generated", static_cast<double>(m.signals_generated)},
      {"max_drawdown", m.max_drawdown_seen},
      {"current_drawdown", m.current_drawdown},
      {"consecutive_losses", static_cast<double>(m.consecutive_losses)},
      {"daily_pnl", m.daily_pnl},
  };

  publish(PerformanceReportKind::Daily, metrics, now);

  ++context.performance.days_reported;
  risk_.resetDaily(context.risk);
  return metrics;
}

// -----------------------------------------------------------------------------
// onRunEnd: final summary
// -----------------------------------------------------------------------------
std::map<std::string, double> PerformanceTracker::onRunEnd(
    domain::StrategyContext& context, double portfolio_value,
    Timestamp now) const {
  context.last_portfolio_value = portfolio_value;
  const MetricsSnapshot m = snapshot(context);
  const std::uint64_t closed = m.winning_trades + m.losing_trades;

  std::map<std::string, double> metrics = {
      {"total_signals", static_cast<double>(m.signals_generated)},
      {"total_trades", static_cast<double>(closed)},
      {"winning_trades", static_cast<double>(m.winning_trades)},
      {"losing_trades", static_cast<double>(m.losing_trades)},
      {"win_rate_percent", m.win_rate_percent},
      {"final_portfolio_value", portfolio_value},
      {"max_drawdown_percent", m.max_drawdown_seen * 100.0},
      {"average_pnl_percent", m.average_pnl_percent},
      {"average_duration_minutes", m.average_duration_minutes},
  };
  if (m.best_trade_pnl_percent) {
    metrics["best_trade_pnl_percent"] = *m.best_trade_pnl_percent;
  }
  if (m.worst_trade_pnl_percent) {
    metrics["worst_trade_pnl_percent"] = *m.worst_trade_pnl_percent;
  }

  publish(PerformanceReportKind::Final, metrics, now);

  std::cout << "[PerformanceTracker] run complete: " << closed
            << " closed trades, win rate " << m.win_rate_percent
            << "%, final portfolio value " << portfolio_value << "\n";
  return metrics;
}

void PerformanceTracker::publish(PerformanceReportKind kind,
                                 const std::map<std::string, double>& metrics,
                                 Timestamp now) const {
  if (!config_.behavior.log_performance) {
    return;
  }
  PerformanceEvent event;
  event.kind = kind;
  event.metrics = metrics;
  event.timestamp = now;
  bus_.publish(event);
}

}  // namespace intraday
