#pragma once

#include "intraday/events/event.hpp"
#include "intraday/gateway/market_data_gateway.hpp"
#include "intraday/time/simulation_time_provider.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace intraday {

// Feed counters as reported by STATUS. Totals cover every start()/stop()
// cycle of the thread, not just the current gateway.
struct FeedStats {
  std::uint64_t forwarded{0};
  std::uint64_t dropped{0};
  bool connected{false};
};

// -----------------------------------------------------------------------------
// MarketDataThread
// -----------------------------------------------------------------------------
//
// @brief  Runs MarketDataGateway::run() on its own thread and keeps the
//         feed's forwarded/dropped totals after the gateway is gone.
//
// @details
// The gateway (and its ZeroMQ SUB socket) is created in start() and
// destroyed in stop(), so the socket only lives as long as the thread that
// reads it. stop() folds the gateway's counters into the running totals
// before destroying it.
//
// Thread model:
//   start() and stop() are called from the owning thread. stats() may be
//   called from any thread (the IPC thread serves it for STATUS); the
//   gateway pointer is swapped under gateway_mutex_.
//
// Ownership:
//   Owned by TradingEngine. Owns the gateway. Borrows the simulation clock,
//   which must outlive this object.
// -----------------------------------------------------------------------------
class MarketDataThread {
 public:
  using EventSink = MarketDataGateway::EventSink;

  MarketDataThread(SimulationTimeProvider& time_provider, EventSink event_sink,
                   std::string endpoint = "tcp://127.0.0.1:5555");
  ~MarketDataThread();

  MarketDataThread(const MarketDataThread&) = delete;
  MarketDataThread& operator=(const MarketDataThread&) = delete;
  MarketDataThread(MarketDataThread&&) = delete;
  MarketDataThread& operator=(MarketDataThread&&) = delete;

  // Idempotent.
  void start();

  // Idempotent; safe if never started. Blocks until the recv loop exits.
  void stop();

  FeedStats stats() const;

  const std::string& endpoint() const { return endpoint_; }

 private:
  SimulationTimeProvider& time_provider_;
  EventSink event_sink_;
  std::string endpoint_;

  mutable std::mutex gateway_mutex_;
  std::unique_ptr<MarketDataGateway> gateway_;
  std::uint64_t forwarded_total_{0};
  std::uint64_t dropped_total_{0};

  std::thread thread_;
};

}  // namespace intraday
