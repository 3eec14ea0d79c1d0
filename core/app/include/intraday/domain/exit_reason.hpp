#pragma once

namespace intraday {
namespace domain {

// -----------------------------------------------------------------------------
// ExitReason
// -----------------------------------------------------------------------------
// Result of SignalEngine::generateExitSignal(). The enumerator order mirrors
// the evaluation priority: StopLoss wins over TakeProfit, which wins over
// TimeExit, when several hold on the same bar.
// -----------------------------------------------------------------------------
enum class ExitReason {
  None,
  StopLoss,
  TakeProfit,
  TimeExit,
};

inline const char* toString(ExitReason reason) {
  switch (reason) {
    case ExitReason::None:       return "NONE";
    case ExitReason::StopLoss:   return "STOP_LOSS";
    case ExitReason::TakeProfit: return "TAKE_PROFIT";
    case ExitReason::TimeExit:   return "TIME_EXIT";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace intraday
