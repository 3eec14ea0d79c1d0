#pragma once

#include "intraday/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace intraday {

// -----------------------------------------------------------------------------
// EventBus: synchronous publish/subscribe over the Event variant
// -----------------------------------------------------------------------------
//
// @brief  The only channel between components. The decision core publishes
//         decisions and structured log records here; the strategy loop
//         publishes inbound market events here for IntradayStrategy.
//
// @details
// Components that need to report something (RiskManager, PositionTracker,
// SignalEngine, PerformanceTracker) receive an `EventBus&` and nothing else.
// They do not know whether the record ends up on the console, on a ZeroMQ
// socket, or in a test's vector; that is decided by whoever subscribed.
//
// Delivery is synchronous: publish() runs every matching callback on the
// calling thread before it returns. A callback may itself publish or
// unsubscribe.
//
// Thread model:
//   subscribe/unsubscribe/publish are safe from any thread. The subscriber
//   list is copied under the mutex and callbacks run without it held.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Receives every published event.
  SubscriptionId subscribe(GenericCallback callback);

  // Receives only events holding EventType, unwrapped.
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // After this returns no future publish() reaches the callback. A publish
  // already in flight on another thread may still deliver once.
  void unsubscribe(SubscriptionId id);

  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  return subscribe(GenericCallback(
      [cb = std::move(callback)](const Event& event) {
        if (const auto* typed = std::get_if<EventType>(&event)) {
          cb(*typed);
        }
      }));
}

}  // namespace intraday
