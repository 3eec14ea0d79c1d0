#pragma once

#include "intraday/eventbus/event_bus.hpp"

#include <cstdint>
#include <iostream>
#include <mutex>
#include <ostream>

namespace intraday {

// -----------------------------------------------------------------------------
// EventLogger: console sink for structured events
// -----------------------------------------------------------------------------
//
// @brief  Subscribes to an EventBus and writes every outbound event as one
//         line: a bracketed category tag followed by the flat JSON record
//         from formatEvent().
//
//           [TRADE] {"action":"ENTRY","price":50250.0,...}
//           [RISK] {"event_type":"MAX_DRAWDOWN_EXCEEDED",...}
//
// @details
// Risk events go to the error stream; everything else to the output stream.
// Inbound events (bars, ticks, day/run end) are not logged. Whether an event
// exists at all is decided by the publisher (behavior.log_* flags); the
// logger prints whatever reaches it.
//
// Streams default to std::cout / std::cerr and are injectable for tests.
//
// Thread model:
//   The callback runs on whichever thread publishes. Writes are serialised
//   by an internal mutex so lines never interleave.
// -----------------------------------------------------------------------------
class EventLogger {
 public:
  explicit EventLogger(EventBus& bus, std::ostream& out = std::cout,
                       std::ostream& err = std::cerr);
  ~EventLogger();

  EventLogger(const EventLogger&) = delete;
  EventLogger& operator=(const EventLogger&) = delete;

  std::uint64_t linesWritten() const;

 private:
  void onEvent(const Event& event);

  EventBus& bus_;
  std::ostream& out_;
  std::ostream& err_;
  mutable std::mutex mutex_;
  std::uint64_t lines_written_{0};
  EventBus::SubscriptionId sub_id_{0};
};

}  // namespace intraday
