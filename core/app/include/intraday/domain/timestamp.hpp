#pragma once

#include <chrono>

namespace intraday {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// Wall-clock (or simulated) point in time carried by every bar, trade record
// and structured event. Bars arrive from the external feed with millisecond
// epoch timestamps; see time_utils.hpp for the conversions.
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

}  // namespace intraday
