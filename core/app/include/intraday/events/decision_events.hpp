#pragma once

#include "intraday/domain/exit_reason.hpp"
#include "intraday/domain/timestamp.hpp"

#include <string>

namespace intraday {

// -----------------------------------------------------------------------------
// EntryDecisionEvent
// -----------------------------------------------------------------------------
//
// @brief  Outbound instruction: hold `target_fraction` of the portfolio in
//         `symbol`.
//
// @details
// Published by IntradayStrategy after PositionTracker has accepted the
// FLAT → OPEN transition. The core does not route orders; an execution
// collaborator subscribed to the strategy bus turns this into an order.
// -----------------------------------------------------------------------------
struct EntryDecisionEvent {
  std::string symbol;
  double target_fraction{0.0};
  double price{0.0};
  Timestamp timestamp{};
};

// -----------------------------------------------------------------------------
// ExitDecisionEvent
// -----------------------------------------------------------------------------
// Outbound instruction: liquidate the whole position in `symbol`. reason is
// never ExitReason::None.
// -----------------------------------------------------------------------------
struct ExitDecisionEvent {
  std::string symbol;
  bool liquidate{true};
  domain::ExitReason reason{domain::ExitReason::None};
  double price{0.0};
  Timestamp timestamp{};
};

}  // namespace intraday
