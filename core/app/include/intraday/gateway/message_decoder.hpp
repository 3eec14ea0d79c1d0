#pragma once

#include "intraday/events/event.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace intraday {

// One decoded wire message: the inbound event plus the raw timestamp that
// drives the simulation clock.
struct DecodedMessage {
  std::int64_t timestamp_ms{0};
  Event event;
};

// -----------------------------------------------------------------------------
// decodeMessage(payload)
// -----------------------------------------------------------------------------
//
// @brief  Parses one JSON message from the indicator feed into an inbound
//         Event. The "type" field selects the event:
//
//   "bar"      timestamp_ms, symbol, close, ema, rsi, portfolio_value
//              optional: obv, bb_upper, bb_middle, bb_lower (all three or
//              none), macd, macd_signal, macd_histogram (all three or none),
//              is_invested (false), is_warming_up (false),
//              indicators_ready (true)
//   "tick"     timestamp_ms, obv; optional is_warming_up (false)
//   "day_end"  timestamp_ms, portfolio_value
//   "run_end"  timestamp_ms, portfolio_value
//
// @throws DataError on invalid JSON, an unknown type, a missing required
//         field or a field of the wrong type. The message names the field.
// -----------------------------------------------------------------------------
DecodedMessage decodeMessage(const std::string& payload);

// Same, for an already-parsed document.
DecodedMessage decodeJson(const nlohmann::json& message);

}  // namespace intraday
