#include "intraday/time/simulation_time_provider.hpp"

namespace intraday {

std::int64_t SimulationTimeProvider::now_ms() const {
  return current_time_ms_.load();
}

// -----------------------------------------------------------------------------
// advance_time(): monotonic store
// -----------------------------------------------------------------------------
// compare_exchange loop so a concurrent reader never observes the clock going
// backwards, even if a second writer is ever added.
// -----------------------------------------------------------------------------
bool SimulationTimeProvider::advance_time(std::int64_t new_time_ms) {
  std::int64_t current = current_time_ms_.load();
  while (new_time_ms >= current) {
    if (current_time_ms_.compare_exchange_weak(current, new_time_ms)) {
      return true;
    }
  }
  return false;
}

}  // namespace intraday
