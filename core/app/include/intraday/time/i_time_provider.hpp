#pragma once

#include <cstdint>

namespace intraday {

// -----------------------------------------------------------------------------
// ITimeProvider: replay clock of the engine
// -----------------------------------------------------------------------------
//
// @brief  Abstracts the current time so that nothing in the engine reads
//         the machine's wall clock.
//
// @details
// In this engine the provider is SimulationTimeProvider, advanced by the
// gateway from each message's timestamp_ms as the message arrives. That is
// ahead of the strategy queue, so decision timing uses the bar's own
// timestamp and the strategy reads the clock for diagnostics only. Tests
// advance it by hand.
//
// Time is int64 milliseconds since the Unix epoch, the same unit the wire
// format uses. Convert with ms_to_timestamp() / timestamp_to_ms().
//
// Thread-safety contract:
//   now_ms() must be safe to call concurrently with the writer.
//
// Ownership:
//   Borrowed by const reference. The owner (TradingEngine, or the test)
//   outlives every component holding the reference.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Epoch milliseconds. 0 before any time has been set.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace intraday
