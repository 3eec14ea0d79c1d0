#include "intraday/network/market_data_thread.hpp"

#include <iostream>
#include <utility>

namespace intraday {

MarketDataThread::MarketDataThread(SimulationTimeProvider& time_provider,
                                   EventSink event_sink, std::string endpoint)
    : time_provider_(time_provider),
      event_sink_(std::move(event_sink)),
      endpoint_(std::move(endpoint)) {}

MarketDataThread::~MarketDataThread() { stop(); }

void MarketDataThread::start() {
  if (thread_.joinable()) {
    return;
  }

  MarketDataGateway* gateway = nullptr;
  {
    std::lock_guard lock(gateway_mutex_);
    gateway_ = std::make_unique<MarketDataGateway>(time_provider_, event_sink_,
                                                   endpoint_);
    gateway = gateway_.get();
  }

  // The thread only touches the gateway it was started with; stop() joins
  // before that gateway is destroyed.
  thread_ = std::thread([this, gateway] {
    std::cout << "[MarketDataThread] subscribed to " << endpoint_ << "\n";
    gateway->run();
  });
}

void MarketDataThread::stop() {
  {
    std::lock_guard lock(gateway_mutex_);
    if (gateway_) {
      gateway_->stop();
    }
  }
  if (thread_.joinable()) {
    thread_.join();
  }

  std::lock_guard lock(gateway_mutex_);
  if (!gateway_) {
    return;
  }
  const std::uint64_t forwarded = gateway_->messagesForwarded();
  const std::uint64_t dropped = gateway_->messagesDropped();
  forwarded_total_ += forwarded;
  dropped_total_ += dropped;
  gateway_.reset();

  std::cout << "[MarketDataThread] " << endpoint_ << " closed: forwarded "
            << forwarded << " messages, dropped " << dropped << " (totals "
            << forwarded_total_ << "/" << dropped_total_ << ")\n";
}

FeedStats MarketDataThread::stats() const {
  std::lock_guard lock(gateway_mutex_);
  FeedStats s;
  s.forwarded = forwarded_total_;
  s.dropped = dropped_total_;
  if (gateway_) {
    s.forwarded += gateway_->messagesForwarded();
    s.dropped += gateway_->messagesDropped();
    s.connected = true;
  }
  return s;
}

}  // namespace intraday
