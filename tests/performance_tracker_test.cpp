// =============================================================================
// performance_tracker_test.cpp
// =============================================================================
// Unit tests for intraday::PerformanceTracker.
//
// Validates:
//   - winRate() arithmetic, including the no-trades case
//   - recordTrade() folds EXIT records only
//   - snapshot() reflects position, risk and performance state
//   - onDayEnd() publishes a DAILY report then resets daily P&L
//   - onRunEnd() publishes the FINAL summary keys
//   - log_performance = false suppresses publication but not the return
// =============================================================================

#include "intraday/analytics/performance_tracker.hpp"
#include "intraday/eventbus/event_bus.hpp"
#include "intraday/risk/risk_manager.hpp"
#include "intraday/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <vector>

using intraday::domain::ExitReason;
using intraday::domain::TradeAction;

class PerformanceTrackerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    bus.subscribe<intraday::PerformanceEvent>(
        [this](const intraday::PerformanceEvent& e) { reports.push_back(e); });
  }

  static intraday::domain::TradeRecord exitRecord(double pnl_percent,
                                                  double minutes) {
    intraday::domain::TradeRecord r;
    r.action = TradeAction::Exit;
    r.symbol = "BTCUSD";
    r.exit_reason = ExitReason::TimeExit;
    r.entry_price = 100.0;
    r.price = 100.0 * (1.0 + pnl_percent / 100.0);
    r.pnl_percent = pnl_percent;
    r.duration_minutes = minutes;
    return r;
  }

  intraday::EventBus bus;
  intraday::config::StrategyConfig config;
  intraday::domain::StrategyContext context;
  std::vector<intraday::PerformanceEvent> reports;

  const intraday::Timestamp now = intraday::ms_to_timestamp(1'700'086'400'000);
};

// -----------------------------------------------------------------------------
// 1. Win rate in percent; zero closed trades → 0.
// -----------------------------------------------------------------------------
TEST(PerformanceTrackerStaticTest, WinRate) {
  EXPECT_DOUBLE_EQ(intraday::PerformanceTracker::winRate(3, 2), 60.0);
  EXPECT_DOUBLE_EQ(intraday::PerformanceTracker::winRate(0, 0), 0.0);
  EXPECT_DOUBLE_EQ(intraday::PerformanceTracker::winRate(0, 4), 0.0);
  EXPECT_DOUBLE_EQ(intraday::PerformanceTracker::winRate(1, 0), 100.0);
}

// -----------------------------------------------------------------------------
// 2. Aggregates: count, averages, best and worst.
// -----------------------------------------------------------------------------
TEST_F(PerformanceTrackerTest, RecordTradeAggregatesExits) {
  intraday::RiskManager risk(bus, config);
  intraday::PerformanceTracker perf(bus, config, risk);

  intraday::domain::TradeRecord entry;
  entry.action = TradeAction::Entry;
  perf.recordTrade(context.performance, entry);
  EXPECT_EQ(context.performance.closed_trades, 0u);

  perf.recordTrade(context.performance, exitRecord(1.0, 10.0));
  perf.recordTrade(context.performance, exitRecord(-0.5, 30.0));
  perf.recordTrade(context.performance, exitRecord(0.2, 20.0));

  const auto& stats = context.performance;
  EXPECT_EQ(stats.closed_trades, 3u);
  EXPECT_NEAR(stats.total_pnl_percent, 0.7, 1e-12);
  EXPECT_DOUBLE_EQ(stats.total_duration_minutes, 60.0);
  EXPECT_DOUBLE_EQ(*stats.best_trade_pnl_percent, 1.0);
  EXPECT_DOUBLE_EQ(*stats.worst_trade_pnl_percent, -0.5);

  context.position.winning_trades = 2;
  context.position.losing_trades = 1;
  const auto m = perf.snapshot(context);
  EXPECT_NEAR(m.average_pnl_percent, 0.7 / 3.0, 1e-12);
  EXPECT_DOUBLE_EQ(m.average_duration_minutes, 20.0);
  EXPECT_NEAR(m.win_rate_percent, 200.0 / 3.0, 1e-9);
}

// -----------------------------------------------------------------------------
// 3. Snapshot of an untouched context: zeros, FLAT, no extremes.
// -----------------------------------------------------------------------------
TEST_F(PerformanceTrackerTest, SnapshotOfFreshContext) {
  intraday::RiskManager risk(bus, config);
  intraday::PerformanceTracker perf(bus, config, risk);

  const auto m = perf.snapshot(context);
  EXPECT_EQ(m.total_trades, 0u);
  EXPECT_DOUBLE_EQ(m.win_rate_percent, 0.0);
  EXPECT_DOUBLE_EQ(m.average_pnl_percent, 0.0);
  EXPECT_EQ(m.position_status, "FLAT");
  EXPECT_FALSE(m.entry_price.has_value());
  EXPECT_FALSE(m.best_trade_pnl_percent.has_value());
}

// -----------------------------------------------------------------------------
// 4. Day end: publish the day's figures, then zero daily_pnl.
// Why: the daily-loss limit must start from zero on the next day while the
//      report still shows what the day produced.
// -----------------------------------------------------------------------------
TEST_F(PerformanceTrackerTest, DayEndPublishesThenResetsDailyPnl) {
  intraday::RiskManager risk(bus, config);
  intraday::PerformanceTracker perf(bus, config, risk);

  context.risk.daily_pnl = -1200.0;
  context.risk.max_drawdown_seen = 0.03;
  context.risk.consecutive_losses = 2;
  context.position.trade_count = 4;
  context.performance.signals_generated = 6;

  const auto metrics = perf.onDayEnd(context, 98800.0, now);

  ASSERT_EQ(reports.size(), 1u);
  EXPECT_EQ(reports[0].kind, intraday::PerformanceReportKind::Daily);
  EXPECT_EQ(reports[0].timestamp, now);
  EXPECT_DOUBLE_EQ(reports[0].metrics.at("daily_pnl"), -1200.0);
  EXPECT_DOUBLE_EQ(metrics.at("portfolio_value"), 98800.0);
  EXPECT_DOUBLE_EQ(metrics.at("total_trades"), 4.0);
  EXPECT_DOUBLE_EQ(metrics.at("signals_generated"), 6.0);
  EXPECT_DOUBLE_EQ(metrics.at("max_drawdown"), 0.03);
  EXPECT_DOUBLE_EQ(metrics.at("consecutive_losses"), 2.0);

  EXPECT_DOUBLE_EQ(context.risk.daily_pnl, 0.0);
  EXPECT_DOUBLE_EQ(context.risk.max_drawdown_seen, 0.03);
  EXPECT_EQ(context.risk.consecutive_losses, 2u);
  EXPECT_EQ(context.performance.days_reported, 1u);
  EXPECT_DOUBLE_EQ(context.last_portfolio_value, 98800.0);
}

// -----------------------------------------------------------------------------
// 5. Run end: final summary keys and values.
// -----------------------------------------------------------------------------
TEST_F(PerformanceTrackerTest, RunEndPublishesFinalSummary) {
  intraday::RiskManager risk(bus, config);
  intraday::PerformanceTracker perf(bus, config, risk);

  perf.recordTrade(context.performance, exitRecord(1.0, 10.0));
  perf.recordTrade(context.performance, exitRecord(-0.5, 30.0));
  context.position.trade_count = 2;
  context.position.winning_trades = 1;
  context.position.losing_trades = 1;
  context.performance.signals_generated = 5;
  context.risk.max_drawdown_seen = 0.02;

  const auto metrics = perf.onRunEnd(context, 100450.0, now);

  ASSERT_EQ(reports.size(), 1u);
  EXPECT_EQ(reports[0].kind, intraday::PerformanceReportKind::Final);
  EXPECT_DOUBLE_EQ(metrics.at("total_signals"), 5.0);
  EXPECT_DOUBLE_EQ(metrics.at("total_trades"), 2.0);
  EXPECT_DOUBLE_EQ(metrics.at("winning_trades"), 1.0);
  EXPECT_DOUBLE_EQ(metrics.at("losing_trades"), 1.0);
  EXPECT_DOUBLE_EQ(metrics.at("win_rate_percent"), 50.0);
  EXPECT_DOUBLE_EQ(metrics.at("final_portfolio_value"), 100450.0);
  EXPECT_DOUBLE_EQ(metrics.at("max_drawdown_percent"), 2.0);
  EXPECT_DOUBLE_EQ(metrics.at("average_pnl_percent"), 0.25);
  EXPECT_DOUBLE_EQ(metrics.at("average_duration_minutes"), 20.0);
  EXPECT_DOUBLE_EQ(metrics.at("best_trade_pnl_percent"), 1.0);
  EXPECT_DOUBLE_EQ(metrics.at("worst_trade_pnl_percent"), -0.5);
}

TEST_F(PerformanceTrackerTest, RunEndWithoutTradesOmitsExtremes) {
  intraday::RiskManager risk(bus, config);
  intraday::PerformanceTracker perf(bus, config, risk);

  const auto metrics = perf.onRunEnd(context, 100000.0, now);
  EXPECT_DOUBLE_EQ(metrics.at("win_rate_percent"), 0.0);
  EXPECT_EQ(metrics.count("best_trade_pnl_percent"), 0u);
  EXPECT_EQ(metrics.count("worst_trade_pnl_percent"), 0u);
}

// -----------------------------------------------------------------------------
// 6. log_performance = false: nothing published, daily reset still happens.
// -----------------------------------------------------------------------------
TEST_F(PerformanceTrackerTest, ReportsSuppressedWhenLoggingDisabled) {
  config.behavior.log_performance = false;
  intraday::RiskManager risk(bus, config);
  intraday::PerformanceTracker perf(bus, config, risk);

  context.risk.daily_pnl = 300.0;
  const auto daily = perf.onDayEnd(context, 100300.0, now);
  perf.onRunEnd(context, 100300.0, now);

  EXPECT_TRUE(reports.empty());
  EXPECT_DOUBLE_EQ(daily.at("daily_pnl"), 300.0);
  EXPECT_DOUBLE_EQ(context.risk.daily_pnl, 0.0);
}
