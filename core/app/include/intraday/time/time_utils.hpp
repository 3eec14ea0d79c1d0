#pragma once

#include "intraday/domain/timestamp.hpp"

#include <chrono>
#include <cstdint>

namespace intraday {

// -----------------------------------------------------------------------------
// Time conversions
// -----------------------------------------------------------------------------
// The wire format and ITimeProvider speak int64 epoch milliseconds; domain
// structs carry Timestamp (system_clock::time_point). These bridge the two.
// -----------------------------------------------------------------------------

inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// Elapsed time between two timestamps in (fractional) minutes. Negative if
// `to` precedes `from`.
inline double minutes_between(Timestamp from, Timestamp to) {
  return std::chrono::duration<double, std::ratio<60>>(to - from).count();
}

}  // namespace intraday
