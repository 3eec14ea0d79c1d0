#pragma once

#include "intraday/concurrent/thread_safe_queue.hpp"
#include "intraday/eventbus/event_bus.hpp"
#include "intraday/events/event.hpp"

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>

namespace intraday {

// -----------------------------------------------------------------------------
// EventLoopThread: one worker thread draining a queue into a bus
// -----------------------------------------------------------------------------
//
// @brief  Serialises every event pushed to it onto a single thread and
//         republishes it there on its own EventBus.
//
// @details
// The decision core is single-threaded by construction: it is only ever
// entered from subscribers of one EventLoopThread's bus. Any thread may
// push(); only the loop thread publishes.
//
// A subscriber that throws does not kill the loop. The exception is logged
// with the loop's name and counted in failedDispatches(); the next event is
// processed normally.
//
// Lifecycle:
//   construct → subscribe on eventBus() → start() → push()... → stop().
//   stop() drains nothing: events still queued when it is called are left in
//   the queue. start() after stop() resumes with them.
//
// Thread model:
//   start/stop/push/eventBus are safe from any thread. Subscribers run on
//   the loop thread only.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  explicit EventLoopThread(std::string name = "EventLoop");
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // Idempotent.
  void start();

  // Joins the worker. Idempotent. Must not be called from the loop thread.
  void stop();

  void push(Event event) { queue_.push(std::move(event)); }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

  bool running() const { return running_.load(); }
  std::size_t pending() const { return queue_.size(); }
  std::uint64_t failedDispatches() const { return failed_dispatches_.load(); }

 private:
  void run();
  void dispatch(const Event& event);

  std::string name_;
  ThreadSafeQueue<Event> queue_;
  EventBus bus_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> failed_dispatches_{0};
  std::thread thread_;
};

}  // namespace intraday
