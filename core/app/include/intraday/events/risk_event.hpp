#pragma once

#include "intraday/domain/timestamp.hpp"

#include <map>
#include <string>

namespace intraday {

enum class RiskEventType {
  MaxDrawdownExceeded,
  DailyLossLimitExceeded,
};

inline const char* toString(RiskEventType type) {
  switch (type) {
    case RiskEventType::MaxDrawdownExceeded:    return "MAX_DRAWDOWN_EXCEEDED";
    case RiskEventType::DailyLossLimitExceeded: return "DAILY_LOSS_LIMIT_EXCEEDED";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// RiskEvent
// -----------------------------------------------------------------------------
//
// @brief  Published by RiskManager every time checkRiskLimits() fails.
//
// @details
// A breach is a control signal: it suppresses new entries for the bar on
// which it was observed. It does not close an open position. details holds
// the measured value and the configured limit, e.g.
//   { "current_drawdown": 0.2, "limit": 0.15 }
// -----------------------------------------------------------------------------
struct RiskEvent {
  RiskEventType type{RiskEventType::MaxDrawdownExceeded};
  std::string symbol;
  std::map<std::string, double> details;
  Timestamp timestamp{};
};

}  // namespace intraday
