#include "intraday/strategy/intraday_strategy.hpp"
#include "intraday/domain/errors.hpp"
#include "intraday/time/time_utils.hpp"

#include <iostream>
#include <mutex>

namespace intraday {

IntradayStrategy::IntradayStrategy(EventBus& bus,
                                   const config::StrategyConfig& config,
                                   const ITimeProvider& clock)
    : bus_(bus),
      config_(config),
      clock_(clock),
      risk_(bus, config),
      tracker_(bus, config),
      signals_(bus, config),
      performance_(bus, config, risk_) {
  context_.position.symbol = config_.trading.symbol;

  bar_sub_id_ = bus_.subscribe<BarEvent>(
      [this](const BarEvent& e) { onBar(e); });
  tick_sub_id_ = bus_.subscribe<TickEvent>(
      [this](const TickEvent& e) { onTick(e); });
  day_end_sub_id_ = bus_.subscribe<DayEndEvent>(
      [this](const DayEndEvent& e) { onDayEnd(e); });
  run_end_sub_id_ = bus_.subscribe<RunEndEvent>(
      [this](const RunEndEvent& e) { onRunEnd(e); });

  refreshSnapshot();

  std::cout << "[IntradayStrategy] " << config_.trading.symbol << " on "
            << config_.trading.market << ", "
            << config_.trading.consolidation_minutes
            << "-minute bars, warm-up " << config_.warmupPeriod()
            << " bars, sizing " << config::toString(
                   config_.risk.position_sizing.method)
            << "\n";
}

IntradayStrategy::~IntradayStrategy() {
  bus_.unsubscribe(run_end_sub_id_);
  bus_.unsubscribe(day_end_sub_id_);
  bus_.unsubscribe(tick_sub_id_);
  bus_.unsubscribe(bar_sub_id_);
}

MetricsSnapshot IntradayStrategy::metricsSnapshot() const {
  std::shared_lock lock(snapshot_mutex_);
  return snapshot_;
}

bool IntradayStrategy::acceptTimestamp(Timestamp ts, const char* kind) {
  if (context_.last_event_time && ts < *context_.last_event_time) {
    std::cerr << "[IntradayStrategy] ERROR: out-of-order " << kind << " at "
              << timestamp_to_ms(ts) << " ms (last processed "
              << timestamp_to_ms(*context_.last_event_time)
              << " ms). Skipped.\n";
    return false;
  }
  context_.last_event_time = ts;
  return true;
}

// -----------------------------------------------------------------------------
// onBar: symbol / readiness → risk check → exit or entry → OBV seeding
// -----------------------------------------------------------------------------
void IntradayStrategy::onBar(const BarEvent& event) {
  const domain::IndicatorSnapshot& snapshot = event.snapshot;

  if (event.symbol != config_.trading.symbol) {
    std::cerr << "[IntradayStrategy] WARNING: bar for '" << event.symbol
              << "' at " << timestamp_to_ms(snapshot.timestamp)
              << " ms ignored (trading " << config_.trading.symbol << ")\n";
    return;
  }

  if (event.is_warming_up || !event.indicators_ready) {
    if (config_.behavior.debug_mode) {
      std::cout << "[IntradayStrategy] bar at "
                << timestamp_to_ms(snapshot.timestamp)
                << " skipped (warming up / indicators not ready)\n";
    }
    return;
  }

  if (config_.indicators.obv.enabled && !snapshot.obv) {
    std::cerr << "[IntradayStrategy] WARNING: bar at "
              << timestamp_to_ms(snapshot.timestamp)
              << " ms has no OBV value while OBV is enabled. Skipped.\n";
    return;
  }

  if (!acceptTimestamp(snapshot.timestamp, "bar")) {
    return;
  }

  context_.last_portfolio_value = event.portfolio_value;
  const Timestamp now = snapshot.timestamp;

  if (event.is_invested != context_.position.isOpen()) {
    std::cerr << "[IntradayStrategy] WARNING: broker reports invested="
              << std::boolalpha << event.is_invested << std::noboolalpha
              << " but position is "
              << domain::toString(context_.position.status)
              << "; keeping tracked state\n";
  }

  signals_.logIndicators(snapshot);

  bool risk_ok = false;
  try {
    risk_ok = risk_.checkRiskLimits(event.portfolio_value, context_.risk, now);
  } catch (const DataError& e) {
    std::cerr << "[IntradayStrategy] ERROR: " << e.what()
              << ". Bar skipped.\n";
    refreshSnapshot();
    return;
  }

  logBarDiagnostics(event, risk_ok);

  if (!risk_ok) {
    std::cerr << "[IntradayStrategy] risk limits breached at "
              << timestamp_to_ms(now) << " ms; no signals evaluated, position "
              << domain::toString(context_.position.status) << " held\n";
    refreshSnapshot();
    return;
  }

  if (context_.position.isOpen()) {
    evaluateExit(event, now);
  } else {
    evaluateEntry(event, now);
  }

  if (!context_.last_obv && snapshot.obv) {
    signals_.updateObvBaseline(context_, *snapshot.obv, false);
  }

  refreshSnapshot();
}

void IntradayStrategy::evaluateExit(const BarEvent& event, Timestamp now) {
  const domain::ExitReason reason =
      signals_.generateExitSignal(event.snapshot, context_.position, now);
  if (reason == domain::ExitReason::None) {
    return;
  }

  ClosedTrade closed = tracker_.closePosition(
      context_, event.snapshot.close, now, reason, event.portfolio_value);
  risk_.recordRealizedPnL(context_.risk, closed.realized_pnl);
  performance_.recordTrade(context_.performance, closed.record);

  ExitDecisionEvent decision;
  decision.symbol = config_.trading.symbol;
  decision.liquidate = true;
  decision.reason = reason;
  decision.price = event.snapshot.close;
  decision.timestamp = now;
  bus_.publish(decision);
}

void IntradayStrategy::evaluateEntry(const BarEvent& event, Timestamp now) {
  if (!signals_.generateEntrySignal(event.snapshot, context_)) {
    return;
  }

  const double size = risk_.calculatePositionSize();
  tracker_.openPosition(context_, event.snapshot, now, size,
                        event.portfolio_value);

  EntryDecisionEvent decision;
  decision.symbol = config_.trading.symbol;
  decision.target_fraction = size;
  decision.price = event.snapshot.close;
  decision.timestamp = now;
  bus_.publish(decision);
}

void IntradayStrategy::logBarDiagnostics(const BarEvent& event,
                                         bool risk_ok) const {
  if (!config_.behavior.debug_mode) {
    return;
  }
  const domain::IndicatorSnapshot& s = event.snapshot;
  std::cout << "[IntradayStrategy] bar " << timestamp_to_ms(s.timestamp)
            << " close=" << s.close << " ema=" << s.ema << " rsi=" << s.rsi;
  if (s.obv) {
    std::cout << " obv=" << *s.obv;
  }
  if (context_.last_obv) {
    std::cout << " last_obv=" << *context_.last_obv;
  }
  std::cout << " drawdown=" << context_.risk.current_drawdown
            << " risk_ok=" << (risk_ok ? "yes" : "no")
            << " position=" << domain::toString(context_.position.status)
            << " clock=" << clock_.now_ms() << "\n";
}

void IntradayStrategy::onTick(const TickEvent& event) {
  if (!acceptTimestamp(event.timestamp, "tick")) {
    return;
  }
  if (signals_.updateObvBaseline(context_, event.obv, event.is_warming_up) &&
      config_.behavior.debug_mode) {
    std::cout << "[IntradayStrategy] OBV baseline " << event.obv << "\n";
  }
}

void IntradayStrategy::onDayEnd(const DayEndEvent& event) {
  performance_.onDayEnd(context_, event.portfolio_value, event.timestamp);
  refreshSnapshot();
}

void IntradayStrategy::onRunEnd(const RunEndEvent& event) {
  performance_.onRunEnd(context_, event.portfolio_value, event.timestamp);
  refreshSnapshot();
  run_ended_.store(true);
}

void IntradayStrategy::refreshSnapshot() {
  MetricsSnapshot fresh = performance_.snapshot(context_);
  std::unique_lock lock(snapshot_mutex_);
  snapshot_ = std::move(fresh);
}

}  // namespace intraday
