#pragma once

#include "intraday/events/event.hpp"
#include "intraday/time/simulation_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

namespace intraday {

// -----------------------------------------------------------------------------
// MarketDataGateway: ZeroMQ SUB → inbound events
// -----------------------------------------------------------------------------
//
// @brief  Receives the indicator feed's JSON messages, advances the
//         simulation clock and hands each decoded event to a sink (the
//         strategy loop's push()).
//
// @details
// Per message:
//   1. decodeMessage() (see message_decoder.hpp for the wire format).
//   2. time_provider.advance_time(timestamp_ms). A timestamp earlier than
//      the clock is logged; the event is still forwarded so the strategy
//      can reject and report it.
//   3. event_sink(event).
//
// A message that fails to decode is logged with its payload and dropped.
// The socket is never torn down because of a bad message.
//
// handleMessage() is public so the decode → clock → sink path can be driven
// without a socket.
//
// Thread model:
//   run() blocks the calling thread (MarketDataThread) until stop(). The
//   receive timeout bounds how long stop() takes to be noticed. A stop()
//   that lands before run() starts makes run() return at once.
//   handleMessage() runs on whichever thread calls it.
// -----------------------------------------------------------------------------
class MarketDataGateway {
 public:
  using EventSink = std::function<void(Event)>;

  MarketDataGateway(SimulationTimeProvider& time_provider, EventSink event_sink,
                    const std::string& endpoint = "tcp://127.0.0.1:5555");

  MarketDataGateway(const MarketDataGateway&) = delete;
  MarketDataGateway& operator=(const MarketDataGateway&) = delete;
  MarketDataGateway(MarketDataGateway&&) = delete;
  MarketDataGateway& operator=(MarketDataGateway&&) = delete;

  void run();
  void stop();

  // Returns true if the payload decoded and was forwarded.
  bool handleMessage(const std::string& payload);

  std::uint64_t messagesForwarded() const { return forwarded_.load(); }
  std::uint64_t messagesDropped() const { return dropped_.load(); }

 private:
  static constexpr int kRecvTimeoutMs = 100;

  SimulationTimeProvider& time_provider_;
  EventSink event_sink_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> stop_requested_{false};
  std::atomic<std::uint64_t> forwarded_{0};
  std::atomic<std::uint64_t> dropped_{0};
};

}  // namespace intraday
