#pragma once

#include "intraday/domain/timestamp.hpp"

#include <optional>

namespace intraday {
namespace domain {

// Bollinger Band values for one bar.
struct BollingerBands {
  double upper{0.0};
  double middle{0.0};
  double lower{0.0};
};

// MACD line, signal line and histogram for one bar.
struct MacdValues {
  double macd{0.0};
  double signal{0.0};
  double histogram{0.0};
};

// -----------------------------------------------------------------------------
// IndicatorSnapshot: precomputed indicator values for one consolidated bar
// -----------------------------------------------------------------------------
//
// @brief  Read-only input to SignalEngine. Produced fresh for every bar by the
//         external indicator collaborator; the core never mutates it.
//
// @details
// EMA and RSI are always present. OBV is present only when the OBV indicator
// is enabled. Bollinger Bands and MACD are optional extras that are logged
// with the INDICATORS signal but do not take part in entry decisions.
// -----------------------------------------------------------------------------
struct IndicatorSnapshot {
  double close{0.0};           // Close price of the consolidated bar
  Timestamp timestamp{};       // Bar time
  double ema{0.0};
  double rsi{0.0};
  std::optional<double> obv;
  std::optional<BollingerBands> bollinger_bands;
  std::optional<MacdValues> macd;
};

}  // namespace domain
}  // namespace intraday
