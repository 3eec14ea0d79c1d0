#include "intraday/risk/risk_manager.hpp"
#include "intraday/domain/errors.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace intraday {

namespace {

void requirePositiveStopLoss(double stop_loss_percent) {
  if (!(stop_loss_percent > 0.0)) {
    throw ConfigurationError(
        "percent_risk sizing requires risk.stop_loss.default_percent > 0, got " +
        std::to_string(stop_loss_percent));
  }
}

}  // namespace

RiskManager::RiskManager(EventBus& bus, const config::StrategyConfig& config)
    : bus_(bus), config_(config) {
  if (config_.risk.position_sizing.method ==
      config::SizingMethod::PercentRisk) {
    requirePositiveStopLoss(config_.risk.stop_loss.default_percent);
  }
}

double RiskManager::calculatePositionSize() const {
  return calculatePositionSize(config_.risk.position_sizing.method);
}

double RiskManager::calculatePositionSize(config::SizingMethod method) const {
  switch (method) {
    case config::SizingMethod::PercentRisk: {
      const double stop_loss = config_.risk.stop_loss.default_percent;
      requirePositiveStopLoss(stop_loss);
      return std::min(config_.risk.position_sizing.risk_per_trade / stop_loss,
                      kMaxPositionFraction);
    }
    case config::SizingMethod::Fixed:
      break;
  }
  return config_.fixedPositionSize();
}

// -----------------------------------------------------------------------------
// checkRiskLimits: drawdown first, then daily loss
// -----------------------------------------------------------------------------
bool RiskManager::checkRiskLimits(double portfolio_value,
                                  domain::RiskState& state, Timestamp now) {
  // --- Peak and drawdown bookkeeping ----------------------------------------
  const double peak =
      std::max(state.peak_portfolio_value.value_or(portfolio_value),
               portfolio_value);
  state.peak_portfolio_value = peak;

  const double drawdown = peak > 0.0 ? (peak - portfolio_value) / peak : 0.0;
  state.current_drawdown = drawdown;
  state.max_drawdown_seen = std::max(state.max_drawdown_seen, drawdown);

  const auto& limits = config_.risk.portfolio;
  if (drawdown > limits.max_drawdown_percent) {
    publishBreach(RiskEventType::MaxDrawdownExceeded, "current_drawdown",
                  drawdown, limits.max_drawdown_percent, now);
    return false;
  }

  // --- Daily loss ------------------------------------------------------------
  // abs(): a large daily gain trips the limit as well as a large loss.
  if (!(portfolio_value > 0.0)) {
    throw DataError("daily loss check needs a positive portfolio value, got " +
                    std::to_string(portfolio_value));
  }
  const double daily_loss_percent = std::abs(state.daily_pnl) / portfolio_value;
  if (daily_loss_percent > limits.daily_loss_limit_percent) {
    publishBreach(RiskEventType::DailyLossLimitExceeded, "daily_loss_percent",
                  daily_loss_percent, limits.daily_loss_limit_percent, now);
    return false;
  }

  return true;
}

void RiskManager::recordRealizedPnL(domain::RiskState& state,
                                    double amount) const {
  state.daily_pnl += amount;
}

void RiskManager::resetDaily(domain::RiskState& state) const {
  state.daily_pnl = 0.0;
}

void RiskManager::publishBreach(RiskEventType type, const char* measure,
                                double value, double limit, Timestamp now) {
  std::cerr << "[RiskManager] " << toString(type) << " for "
            << config_.trading.symbol << " (" << measure << "=" << value
            << ", limit=" << limit << "). Entries suppressed this bar.\n";

  RiskEvent event;
  event.type = type;
  event.symbol = config_.trading.symbol;
  event.details = {{measure, value}, {"limit", limit}};
  event.timestamp = now;
  bus_.publish(event);
}

}  // namespace intraday
