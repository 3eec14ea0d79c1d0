// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for intraday::ThreadSafeQueue<T>.
//
// Validates:
//   - FIFO order for a single producer (the gateway's ordering guarantee)
//   - try_pop() / pop_for() on empty and non-empty queues
//   - Blocking pop() wakes on a push from another thread
//   - No loss or duplication under several producers and consumers
//   - Move-only payloads
//
// Every spawned thread is joined before assertions run.
// =============================================================================

#include "intraday/concurrent/thread_safe_queue.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  intraday::ThreadSafeQueue<int> queue;
};

// -----------------------------------------------------------------------------
// 1. Items come back in push order.
// Why: bars must reach the strategy in the order the feed sent them.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, PreservesFifoOrder) {
  EXPECT_TRUE(queue.empty());
  for (int i = 1; i <= 5; ++i) {
    queue.push(i);
  }
  EXPECT_EQ(queue.size(), 5u);

  for (int i = 1; i <= 5; ++i) {
    EXPECT_EQ(queue.pop(), i);
  }
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 2. Non-blocking and timed pops on an empty queue return empty.
// Why: the event loop relies on pop_for() returning so it can see stop().
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, EmptyQueuePopsReturnNullopt) {
  EXPECT_FALSE(queue.try_pop().has_value());

  auto start = std::chrono::steady_clock::now();
  auto item = queue.pop_for(std::chrono::milliseconds(20));
  auto waited = std::chrono::steady_clock::now() - start;

  EXPECT_FALSE(item.has_value());
  EXPECT_GE(waited, std::chrono::milliseconds(15));
}

// -----------------------------------------------------------------------------
// 3. pop_for() returns an item pushed while it waits.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, TimedPopReceivesLatePush) {
  std::thread producer([this] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.push(7);
  });

  auto item = queue.pop_for(std::chrono::seconds(2));
  producer.join();

  ASSERT_TRUE(item.has_value());
  EXPECT_EQ(*item, 7);
}

// -----------------------------------------------------------------------------
// 4. Blocking pop() waits for a producer.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, BlockingPopWaitsForPush) {
  std::atomic<bool> popped{false};
  int value = 0;

  std::thread consumer([&] {
    value = queue.pop();
    popped.store(true);
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_FALSE(popped.load());

  queue.push(99);
  consumer.join();

  EXPECT_TRUE(popped.load());
  EXPECT_EQ(value, 99);
}

// -----------------------------------------------------------------------------
// 5. Several producers and consumers: every item delivered exactly once.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ConcurrentProducersAndConsumers) {
  constexpr int kProducers = 4;
  constexpr int kPerProducer = 1000;
  constexpr int kTotal = kProducers * kPerProducer;

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([this, p] {
      for (int i = 0; i < kPerProducer; ++i) {
        queue.push(p * kPerProducer + i);
      }
    });
  }

  std::mutex seen_mutex;
  std::set<int> seen;
  std::atomic<int> remaining{kTotal};
  std::vector<std::thread> consumers;
  for (int c = 0; c < 3; ++c) {
    consumers.emplace_back([&] {
      while (remaining.load() > 0) {
        auto item = queue.pop_for(std::chrono::milliseconds(5));
        if (item) {
          std::lock_guard lock(seen_mutex);
          seen.insert(*item);
          --remaining;
        }
      }
    });
  }

  for (auto& t : producers) t.join();
  for (auto& t : consumers) t.join();

  EXPECT_EQ(static_cast<int>(seen.size()), kTotal);
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 6. Move-only payloads are supported.
// -----------------------------------------------------------------------------
TEST(ThreadSafeQueueMoveOnly, HoldsUniquePtr) {
  intraday::ThreadSafeQueue<std::unique_ptr<int>> q;
  q.push(std::make_unique<int>(5));

  auto item = q.try_pop();
  ASSERT_TRUE(item.has_value());
  ASSERT_NE(*item, nullptr);
  EXPECT_EQ(**item, 5);
}
