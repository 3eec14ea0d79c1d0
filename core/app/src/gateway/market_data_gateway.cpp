#include "intraday/gateway/market_data_gateway.hpp"
#include "intraday/domain/errors.hpp"
#include "intraday/gateway/message_decoder.hpp"

#include <iostream>
#include <utility>

namespace intraday {

MarketDataGateway::MarketDataGateway(SimulationTimeProvider& time_provider,
                                     EventSink event_sink,
                                     const std::string& endpoint)
    : time_provider_(time_provider), event_sink_(std::move(event_sink)) {
  socket_.set(zmq::sockopt::subscribe, "");
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.connect(endpoint);
}

// -----------------------------------------------------------------------------
// run(): receive loop
// -----------------------------------------------------------------------------
// recv() returns an empty result on timeout; that is the point where a
// stop() request is observed.
// -----------------------------------------------------------------------------
void MarketDataGateway::run() {
  while (!stop_requested_.load()) {
    zmq::message_t msg;
    auto result = socket_.recv(msg, zmq::recv_flags::none);
    if (!result.has_value()) {
      continue;
    }
    handleMessage(msg.to_string());
  }
}

void MarketDataGateway::stop() { stop_requested_.store(true); }

bool MarketDataGateway::handleMessage(const std::string& payload) {
  DecodedMessage decoded;
  try {
    decoded = decodeMessage(payload);
  } catch (const DataError& e) {
    ++dropped_;
    std::cerr << "[MarketDataGateway] dropped message: " << e.what()
              << " | payload: " << payload << "\n";
    return false;
  }

  if (!time_provider_.advance_time(decoded.timestamp_ms)) {
    std::cerr << "[MarketDataGateway] message at " << decoded.timestamp_ms
              << " ms is older than the clock (" << time_provider_.now_ms()
              << " ms); clock not moved\n";
  }

  event_sink_(std::move(decoded.event));
  ++forwarded_;
  return true;
}

}  // namespace intraday
