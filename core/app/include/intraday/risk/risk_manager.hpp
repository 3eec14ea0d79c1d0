#pragma once

#include "intraday/config/strategy_config.hpp"
#include "intraday/domain/risk_state.hpp"
#include "intraday/domain/timestamp.hpp"
#include "intraday/eventbus/event_bus.hpp"

namespace intraday {

// -----------------------------------------------------------------------------
// RiskManager
// -----------------------------------------------------------------------------
//
// @brief  Position sizing and portfolio-level risk gating for the single
//         traded instrument.
//
// @details
// Two questions are answered here, once per bar:
//
//   1. "May I open a position now?"  checkRiskLimits() updates the running
//      peak / drawdown figures in RiskState and fails on a drawdown or a
//      daily-loss breach. A failure only suppresses new entries on that
//      bar; it never closes a position.
//
//   2. "How big?"  calculatePositionSize() returns the target portfolio
//      fraction in (0, 0.99] using the configured sizing method.
//
// Every breach is published as a RiskEvent on the injected bus and echoed to
// std::cerr.
//
// RiskManager holds no trading state of its own. All mutable figures live in
// the RiskState passed by the caller (StrategyContext::risk), so the same
// instance can be exercised against any number of states in tests.
//
// Thread model:
//   Called only from the strategy loop thread.
//
// Ownership:
//   Borrows the EventBus and copies the configuration.
// -----------------------------------------------------------------------------
class RiskManager {
 public:
  // Largest fraction percent-risk sizing may return.
  static constexpr double kMaxPositionFraction = 0.99;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @throws ConfigurationError if the configured method is percent_risk and
  //         risk.stop_loss.default_percent is not positive, since the size
  //         would be unbounded.
  // -------------------------------------------------------------------------
  RiskManager(EventBus& bus, const config::StrategyConfig& config);

  RiskManager(const RiskManager&) = delete;
  RiskManager& operator=(const RiskManager&) = delete;

  // Sizes with the configured method.
  double calculatePositionSize() const;

  // -------------------------------------------------------------------------
  // calculatePositionSize(method)
  // -------------------------------------------------------------------------
  //
  // @return Fixed:       risk.position_sizing.fixed.size, or
  //                      trading.position_size when that is not configured.
  //         PercentRisk: min(risk_per_trade / stop_loss.default_percent, 0.99).
  //
  // @throws ConfigurationError for PercentRisk with a non-positive stop-loss
  //         percent.
  // -------------------------------------------------------------------------
  double calculatePositionSize(config::SizingMethod method) const;

  // -------------------------------------------------------------------------
  // checkRiskLimits(portfolio_value, state, now)
  // -------------------------------------------------------------------------
  //
  // @brief  Updates peak / drawdown figures and tests both portfolio limits.
  //
  // @param  portfolio_value  Current total portfolio value.
  // @param  state            Running figures; peak_portfolio_value,
  //                          current_drawdown and max_drawdown_seen are
  //                          updated in place.
  // @param  now              Timestamp stamped on any RiskEvent.
  //
  // @return true if neither limit is breached.
  //
  // @details
  //   peak      = max(peak, value)        (first call seeds it)
  //   drawdown  = (peak - value) / peak   (0 if peak <= 0)
  //   max_seen  = max(max_seen, drawdown)
  //   drawdown  > max_drawdown_percent         → MAX_DRAWDOWN_EXCEEDED
  //   |daily_pnl| / value > daily_loss_limit   → DAILY_LOSS_LIMIT_EXCEEDED
  //
  // The drawdown test runs first; when it fails the daily-loss test is not
  // reached. With unchanged inputs repeated calls give the same result and
  // leave the state unchanged.
  //
  // @throws DataError if the daily-loss test is reached with a non-positive
  //         portfolio value.
  // -------------------------------------------------------------------------
  bool checkRiskLimits(double portfolio_value, domain::RiskState& state,
                       Timestamp now);

  // Adds the realised currency P&L of a closed trade to daily_pnl.
  void recordRealizedPnL(domain::RiskState& state, double amount) const;

  // Day boundary: daily_pnl back to zero. Peak, drawdown and the loss
  // streak are cumulative and are not touched.
  void resetDaily(domain::RiskState& state) const;

 private:
  void publishBreach(RiskEventType type, const char* measure, double value,
                     double limit, Timestamp now);

  EventBus& bus_;
  const config::StrategyConfig config_;
};

}  // namespace intraday
