// =============================================================================
// market_data_thread_test.cpp
// =============================================================================
// Tests for intraday::MarketDataThread against a real ZeroMQ PUB socket on
// loopback.
//
// Validates:
//   - Forwarded and dropped counters are visible while the feed runs
//   - stop() keeps the totals and reports the feed disconnected
//   - start() / stop() are idempotent and stop() works if never started
//
// PUB/SUB drops messages sent before the subscription is in place, so the
// publisher repeats its message until the counter moves.
// =============================================================================

#include "intraday/network/market_data_thread.hpp"
#include "intraday/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>
#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <chrono>
#include <functional>
#include <string>
#include <thread>

namespace {

constexpr const char* kFeedEndpoint = "tcp://127.0.0.1:59556";

const std::string kBarPayload =
    R"({"type":"bar","timestamp_ms":1700000000000,"symbol":"BTCUSD",)"
    R"("close":50000.0,"ema":49900.0,"rsi":25.0,"portfolio_value":100000.0})";

// Publishes `payload` every 10 ms until `done` holds or `timeout` passes.
bool publishUntil(zmq::socket_t& pub, const std::string& payload,
                  const std::function<bool()>& done,
                  std::chrono::milliseconds timeout = std::chrono::seconds(3)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    pub.send(zmq::buffer(payload), zmq::send_flags::none);
    if (done()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return done();
}

}  // namespace

class MarketDataThreadTest : public ::testing::Test {
 protected:
  void SetUp() override {
    pub.set(zmq::sockopt::linger, 0);
    pub.bind(kFeedEndpoint);
  }

  intraday::SimulationTimeProvider clock;
  std::atomic<int> sink_calls{0};

  zmq::context_t context{1};
  zmq::socket_t pub{context, zmq::socket_type::pub};
};

// -----------------------------------------------------------------------------
// 1. Counters move while running and survive stop().
// Why: STATUS reads them on the IPC thread, including after the gateway
//      and its socket have been torn down.
// -----------------------------------------------------------------------------
TEST_F(MarketDataThreadTest, CountersSurviveStop) {
  intraday::MarketDataThread feed(
      clock, [this](intraday::Event) { ++sink_calls; }, kFeedEndpoint);

  EXPECT_FALSE(feed.stats().connected);
  feed.start();
  EXPECT_TRUE(feed.stats().connected);

  ASSERT_TRUE(publishUntil(pub, kBarPayload,
                           [&] { return feed.stats().forwarded >= 1; }));
  ASSERT_TRUE(publishUntil(pub, "garbage",
                           [&] { return feed.stats().dropped >= 1; }));

  feed.stop();

  const intraday::FeedStats after = feed.stats();
  EXPECT_FALSE(after.connected);
  EXPECT_GE(after.forwarded, 1u);
  EXPECT_GE(after.dropped, 1u);
  EXPECT_EQ(after.forwarded, static_cast<std::uint64_t>(sink_calls.load()));
  EXPECT_EQ(clock.now_ms(), 1700000000000);
}

// -----------------------------------------------------------------------------
// 2. Idempotent start/stop, and stop() before any start().
// -----------------------------------------------------------------------------
TEST_F(MarketDataThreadTest, IdempotentStartStop) {
  intraday::MarketDataThread feed(
      clock, [this](intraday::Event) { ++sink_calls; }, kFeedEndpoint);

  EXPECT_NO_FATAL_FAILURE(feed.stop());
  feed.start();
  feed.start();
  feed.stop();
  feed.stop();

  const intraday::FeedStats s = feed.stats();
  EXPECT_FALSE(s.connected);
  EXPECT_EQ(s.dropped, 0u);
}
