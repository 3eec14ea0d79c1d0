#pragma once

#include "intraday/domain/timestamp.hpp"

#include <map>
#include <string>

namespace intraday {

enum class SignalType {
  Entry,       // All enabled entry conditions held on this bar
  Indicators,  // Per-bar indicator dump (behavior.log_indicators)
};

inline const char* toString(SignalType type) {
  switch (type) {
    case SignalType::Entry:      return "ENTRY";
    case SignalType::Indicators: return "INDICATORS";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// SignalEvent
// -----------------------------------------------------------------------------
// Structured log record of a signal. indicator_values is a flat name → value
// map ("price", "ema", "rsi", "obv", "obv_increasing", "bb_upper", ...);
// booleans are carried as 0.0 / 1.0.
// -----------------------------------------------------------------------------
struct SignalEvent {
  SignalType type{SignalType::Entry};
  std::string symbol;
  std::map<std::string, double> indicator_values;
  Timestamp timestamp{};
};

}  // namespace intraday
