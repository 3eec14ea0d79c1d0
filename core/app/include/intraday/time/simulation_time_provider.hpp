#pragma once

#include "intraday/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace intraday {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: clock driven by the inbound event stream
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose value is whatever the last inbound message
//         said the time was.
//
// @details
// MarketDataGateway calls advance_time() with each message's timestamp_ms
// before pushing the decoded event to the strategy loop. By the time the
// strategy evaluates a bar, now_ms() therefore reports that bar's time,
// which is what the TIME_EXIT rule measures holding duration against.
//
// advance_time() refuses to move the clock backwards. An out-of-order
// message is still forwarded (the strategy rejects it and logs), but it
// cannot rewind the clock for the events that follow it.
//
// Thread model:
//   One writer (gateway thread), any number of readers (strategy loop, IPC).
//   The value is a lock-free std::atomic<int64_t>.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;

  std::int64_t now_ms() const override;

  // Moves the clock to new_time_ms. Returns false (and leaves the clock
  // unchanged) if new_time_ms is earlier than the current value.
  bool advance_time(std::int64_t new_time_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace intraday
