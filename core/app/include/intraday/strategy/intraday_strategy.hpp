#pragma once

#include "intraday/analytics/performance_tracker.hpp"
#include "intraday/config/strategy_config.hpp"
#include "intraday/domain/strategy_context.hpp"
#include "intraday/eventbus/event_bus.hpp"
#include "intraday/risk/position_tracker.hpp"
#include "intraday/risk/risk_manager.hpp"
#include "intraday/strategy/signal_engine.hpp"
#include "intraday/time/i_time_provider.hpp"

#include <atomic>
#include <shared_mutex>

namespace intraday {

// -----------------------------------------------------------------------------
// IntradayStrategy
// -----------------------------------------------------------------------------
//
// @brief  Per-event orchestrator of the decision core. Owns the
//         StrategyContext and the four components, and turns inbound bars
//         into entry/exit decisions.
//
// @details
// Subscribes to the strategy loop's EventBus for the four inbound event
// types and handles each one to completion before the next is dispatched.
//
// Bar handling, in order:
//
//   1. Skip with a warning if the bar's symbol is not trading.symbol.
//   2. Skip if the bar is flagged warming-up or indicators-not-ready, or
//      carries no OBV value while the OBV indicator is enabled.
//   3. Reject if older than the last processed event (error log, skip).
//   4. Publish the INDICATORS dump (behavior.log_indicators).
//   5. RiskManager::checkRiskLimits(). A DataError or a failed check ends
//      the bar here: neither exits nor entries are evaluated, and an open
//      position is held until a later bar passes the check.
//   6. OPEN: evaluate exits; on a reason, close the position, book the
//      realised P&L into the daily figure and publish ExitDecisionEvent.
//      FLAT: evaluate the entry; on a signal, size it, open the position
//      and publish EntryDecisionEvent.
//   7. Seed the OBV baseline from the bar if no baseline exists yet. The
//      entry above was evaluated before seeding, so the first bar's OBV
//      condition is vacuously true.
//
// Tick events refresh the OBV baseline. DayEnd emits the daily report and
// resets daily P&L; RunEnd emits the final summary and sets runEnded().
//
// "Now" for exit timing and trade timestamps is the bar's own timestamp.
// The injected ITimeProvider runs ahead of the strategy queue and only
// appears in the debug diagnostics line.
//
// Thread model:
//   All handlers run on the strategy loop thread. metricsSnapshot() and
//   runEnded() may be called from any thread; the snapshot is a copy
//   refreshed after every handled event under a shared_mutex.
//
// Ownership:
//   Borrows the EventBus and time provider; both must outlive this object.
// -----------------------------------------------------------------------------
class IntradayStrategy {
 public:
  // @throws ConfigurationError (from RiskManager) for an unusable sizing
  //         configuration.
  IntradayStrategy(EventBus& bus, const config::StrategyConfig& config,
                   const ITimeProvider& clock);
  ~IntradayStrategy();

  IntradayStrategy(const IntradayStrategy&) = delete;
  IntradayStrategy& operator=(const IntradayStrategy&) = delete;
  IntradayStrategy(IntradayStrategy&&) = delete;
  IntradayStrategy& operator=(IntradayStrategy&&) = delete;

  // Direct access for tests and for code running on the loop thread.
  const domain::StrategyContext& context() const { return context_; }

  // Thread-safe copy of the latest metrics.
  MetricsSnapshot metricsSnapshot() const;

  bool runEnded() const { return run_ended_.load(); }

 private:
  void onBar(const BarEvent& event);
  void onTick(const TickEvent& event);
  void onDayEnd(const DayEndEvent& event);
  void onRunEnd(const RunEndEvent& event);

  // False (and an error log) if `ts` precedes the last processed event.
  bool acceptTimestamp(Timestamp ts, const char* kind);

  void evaluateExit(const BarEvent& event, Timestamp now);
  void evaluateEntry(const BarEvent& event, Timestamp now);
  void logBarDiagnostics(const BarEvent& event, bool risk_ok) const;
  void refreshSnapshot();

  EventBus& bus_;
  const config::StrategyConfig config_;
  const ITimeProvider& clock_;

  RiskManager risk_;
  PositionTracker tracker_;
  SignalEngine signals_;
  PerformanceTracker performance_;

  domain::StrategyContext context_;

  mutable std::shared_mutex snapshot_mutex_;
  MetricsSnapshot snapshot_;
  std::atomic<bool> run_ended_{false};

  EventBus::SubscriptionId bar_sub_id_{0};
  EventBus::SubscriptionId tick_sub_id_{0};
  EventBus::SubscriptionId day_end_sub_id_{0};
  EventBus::SubscriptionId run_end_sub_id_{0};
};

}  // namespace intraday
