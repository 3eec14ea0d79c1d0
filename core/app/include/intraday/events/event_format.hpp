#pragma once

#include "intraday/events/event.hpp"

#include <nlohmann/json.hpp>

#include <optional>

namespace intraday {

// -----------------------------------------------------------------------------
// formatEvent(event)
// -----------------------------------------------------------------------------
//
// @brief  Renders an outbound event as one flat JSON record with a "type"
//         field ("trade", "signal", "risk", "performance", "entry_decision",
//         "exit_decision").
//
// @return The record, or std::nullopt for inbound events (bar, tick,
//         day_end, run_end), which are never echoed.
//
// @details
// Shared by EventLogger (console) and IpcServer (PUB socket) so both
// destinations see the same key names. Timestamps are epoch milliseconds
// under "timestamp_ms".
// -----------------------------------------------------------------------------
std::optional<nlohmann::json> formatEvent(const Event& event);

}  // namespace intraday
