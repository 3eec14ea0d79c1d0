#pragma once

#include "intraday/domain/exit_reason.hpp"
#include "intraday/domain/timestamp.hpp"

#include <optional>
#include <string>

namespace intraday {
namespace domain {

enum class TradeAction {
  Entry,
  Exit,
};

inline const char* toString(TradeAction action) {
  switch (action) {
    case TradeAction::Entry: return "ENTRY";
    case TradeAction::Exit:  return "EXIT";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// TradeRecord: one entry of the append-only audit trail
// -----------------------------------------------------------------------------
//
// @brief  Created by PositionTracker on every FLAT/OPEN transition and never
//         modified afterwards.
//
// @details
// quantity is the target portfolio fraction for an ENTRY and 0 for an EXIT
// (the exit liquidates whatever is held).
//
// The exit-only fields (exit_reason, entry_price, pnl_percent,
// duration_minutes) are empty on ENTRY records. pnl_percent is expressed in
// percent (0.5 means +0.5 %).
// -----------------------------------------------------------------------------
struct TradeRecord {
  TradeAction action{TradeAction::Entry};
  std::string symbol;
  double quantity{0.0};
  double price{0.0};
  Timestamp timestamp{};

  std::optional<ExitReason> exit_reason;
  std::optional<double> entry_price;
  std::optional<double> pnl_percent;
  std::optional<double> duration_minutes;
};

}  // namespace domain
}  // namespace intraday
