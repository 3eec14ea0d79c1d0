// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for intraday::EventBus.
//
// Validates:
//   - Generic subscription sees every event alternative
//   - Typed subscription sees only its own alternative
//   - Unsubscribe stops delivery; unknown ids are ignored
//   - A subscriber may publish from inside its callback
//   - Payload survives the variant round trip
//
// All tests are single-threaded. Cross-thread delivery is covered by
// trading_engine_test.cpp.
// =============================================================================

#include "intraday/eventbus/event_bus.hpp"
#include "intraday/events/event.hpp"
#include "intraday/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

class EventBusTest : public ::testing::Test {
 protected:
  intraday::EventBus bus;

  static intraday::BarEvent makeBar(double close) {
    intraday::BarEvent bar;
    bar.symbol = "BTCUSD";
    bar.snapshot.close = close;
    bar.snapshot.ema = close - 10.0;
    bar.snapshot.rsi = 25.0;
    bar.snapshot.timestamp = intraday::ms_to_timestamp(1'700'000'000'000);
    bar.portfolio_value = 100000.0;
    return bar;
  }

  static intraday::TickEvent makeTick(double obv) {
    intraday::TickEvent tick;
    tick.obv = obv;
    tick.timestamp = intraday::ms_to_timestamp(1'700'000'060'000);
    return tick;
  }
};

// -----------------------------------------------------------------------------
// 1. A generic subscriber is invoked for every alternative.
// Why: EventLogger and the IPC forwarder subscribe generically; a skipped
//      alternative would silently disappear from logs and telemetry.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int calls = 0;
  bus.subscribe([&calls](const intraday::Event&) { ++calls; });

  bus.publish(makeBar(50000.0));
  bus.publish(makeTick(1200.0));
  bus.publish(intraday::DayEndEvent{});
  bus.publish(intraday::EntryDecisionEvent{"BTCUSD", 0.99});

  EXPECT_EQ(calls, 4);
}

// -----------------------------------------------------------------------------
// 2. A typed subscriber fires only for its own type.
// Why: IntradayStrategy registers four typed handlers on one bus; a bar
//      handler fed a tick would read garbage.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersByType) {
  int bars = 0;
  int ticks = 0;
  bus.subscribe<intraday::BarEvent>(
      [&bars](const intraday::BarEvent&) { ++bars; });
  bus.subscribe<intraday::TickEvent>(
      [&ticks](const intraday::TickEvent&) { ++ticks; });

  bus.publish(makeBar(50000.0));
  bus.publish(makeBar(50010.0));
  bus.publish(makeTick(1200.0));

  EXPECT_EQ(bars, 2);
  EXPECT_EQ(ticks, 1);
}

// -----------------------------------------------------------------------------
// 3. Unsubscribe stops delivery for later publishes.
// Why: components unsubscribe in their destructors; a late callback would
//      touch a destroyed object.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int calls = 0;
  auto id = bus.subscribe<intraday::BarEvent>(
      [&calls](const intraday::BarEvent&) { ++calls; });

  bus.publish(makeBar(50000.0));
  EXPECT_EQ(calls, 1);

  bus.unsubscribe(id);
  bus.publish(makeBar(50010.0));
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(bus.subscriberCount(), 0u);
}

// -----------------------------------------------------------------------------
// 4. Unsubscribing an unknown id is a no-op.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeUnknownIdIsNoOp) {
  bus.subscribe([](const intraday::Event&) {});
  EXPECT_NO_THROW(bus.unsubscribe(9999));
  EXPECT_EQ(bus.subscriberCount(), 1u);
}

// -----------------------------------------------------------------------------
// 5. Publishing from inside a callback does not deadlock.
// Why: the strategy publishes decisions and trade events while handling a
//      bar that was itself delivered by publish().
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, ReentrantPublishDoesNotDeadlock) {
  std::vector<std::string> seen;

  bus.subscribe<intraday::BarEvent>(
      [this, &seen](const intraday::BarEvent& bar) {
        seen.push_back("bar");
        bus.publish(intraday::EntryDecisionEvent{bar.symbol, 0.99});
      });
  bus.subscribe<intraday::EntryDecisionEvent>(
      [&seen](const intraday::EntryDecisionEvent&) {
        seen.push_back("entry");
      });

  bus.publish(makeBar(50000.0));

  ASSERT_EQ(seen.size(), 2u);
  EXPECT_EQ(seen[0], "bar");
  EXPECT_EQ(seen[1], "entry");
}

// -----------------------------------------------------------------------------
// 6. Optional snapshot fields survive dispatch.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, BarPayloadIsDeliveredIntact) {
  intraday::BarEvent received;
  bus.subscribe<intraday::BarEvent>(
      [&received](const intraday::BarEvent& e) { received = e; });

  auto bar = makeBar(50123.5);
  bar.snapshot.obv = 987.0;
  bar.snapshot.macd = intraday::domain::MacdValues{1.0, 0.5, 0.5};
  bar.is_invested = true;
  bus.publish(bar);

  EXPECT_EQ(received.symbol, "BTCUSD");
  EXPECT_DOUBLE_EQ(received.snapshot.close, 50123.5);
  ASSERT_TRUE(received.snapshot.obv.has_value());
  EXPECT_DOUBLE_EQ(*received.snapshot.obv, 987.0);
  ASSERT_TRUE(received.snapshot.macd.has_value());
  EXPECT_DOUBLE_EQ(received.snapshot.macd->histogram, 0.5);
  EXPECT_FALSE(received.snapshot.bollinger_bands.has_value());
  EXPECT_TRUE(received.is_invested);
}
