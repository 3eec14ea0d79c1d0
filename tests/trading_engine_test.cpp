// =============================================================================
// trading_engine_test.cpp
// =============================================================================
// Tests for intraday::TradingEngine with the network surfaces disabled
// (empty endpoints), so events are injected with pushEvent() and every
// decision runs on the real strategy loop thread.
//
// Validates:
//   - Lifecycle: start() / stop() / destructor, both idempotent
//   - A pushed bar produces an EntryDecisionEvent across threads
//   - PING / STATUS (metrics and feed counters) / unknown command responses
//   - runEnded() after a RunEndEvent
//   - ConfigurationError from start() leaves the engine stopped
//
// Design: Each test creates its own TradingEngine. No global state.
// =============================================================================

#include "intraday/domain/errors.hpp"
#include "intraday/engine/trading_engine.hpp"
#include "intraday/time/simulation_time_provider.hpp"
#include "intraday/time/time_utils.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <chrono>
#include <functional>
#include <future>
#include <thread>

namespace {

constexpr std::int64_t kT0 = 1'700'000'000'000;

intraday::BarEvent bullishBar(std::int64_t ts_ms, double close) {
  intraday::BarEvent bar;
  bar.symbol = "BTCUSD";
  bar.snapshot.close = close;
  bar.snapshot.ema = close - 100.0;
  bar.snapshot.rsi = 25.0;
  bar.snapshot.obv = 1000.0;
  bar.snapshot.timestamp = intraday::ms_to_timestamp(ts_ms);
  bar.portfolio_value = 100000.0;
  return bar;
}

// Polls `done` until it holds or `timeout` passes.
bool waitFor(const std::function<bool()>& done,
             std::chrono::milliseconds timeout = std::chrono::seconds(2)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (done()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return done();
}

}  // namespace

class TradingEngineTestFixture : public ::testing::Test {
 protected:
  intraday::config::StrategyConfig config;
  intraday::SimulationTimeProvider sim_clock;
};

// -----------------------------------------------------------------------------
// 1. End to end: a bullish bar pushed from this thread must produce an
//    EntryDecisionEvent on the strategy loop.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTestFixture, BarProducesEntryDecision) {
  intraday::TradingEngine engine(config, sim_clock, "", "", "");

  std::promise<intraday::EntryDecisionEvent> promise;
  auto future = promise.get_future();
  std::atomic<bool> fulfilled{false};

  engine.strategyEventBus().subscribe<intraday::EntryDecisionEvent>(
      [&](const intraday::EntryDecisionEvent& e) {
        if (!fulfilled.exchange(true)) {
          promise.set_value(e);
        }
      });

  engine.start();
  sim_clock.advance_time(kT0);
  engine.pushEvent(bullishBar(kT0, 50000.0));

  ASSERT_EQ(future.wait_for(std::chrono::seconds(2)),
            std::future_status::ready)
      << "Timed out: bar did not produce an EntryDecisionEvent";

  const auto decision = future.get();
  EXPECT_EQ(decision.symbol, "BTCUSD");
  EXPECT_DOUBLE_EQ(decision.target_fraction, 0.99);
  EXPECT_DOUBLE_EQ(decision.price, 50000.0);
  EXPECT_EQ(decision.timestamp, intraday::ms_to_timestamp(kT0));

  ASSERT_TRUE(waitFor([&] { return engine.metricsSnapshot().total_trades == 1; }));
  EXPECT_EQ(engine.metricsSnapshot().position_status, "OPEN");

  engine.stop();
}

// -----------------------------------------------------------------------------
// 2. Idempotent start: calling start() twice must not crash or spawn extra
//    threads.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTestFixture, IdempotentStart) {
  intraday::TradingEngine engine(config, sim_clock, "", "", "");

  EXPECT_NO_FATAL_FAILURE(engine.start());
  EXPECT_NO_FATAL_FAILURE(engine.start());
  EXPECT_TRUE(engine.running());

  engine.stop();
  EXPECT_FALSE(engine.running());
}

// -----------------------------------------------------------------------------
// 3. Idempotent stop: stop() without start(), or twice, must not crash.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTestFixture, IdempotentStop) {
  intraday::TradingEngine engine(config, sim_clock, "", "", "");
  EXPECT_NO_FATAL_FAILURE(engine.stop());

  engine.start();
  EXPECT_NO_FATAL_FAILURE(engine.stop());
  EXPECT_NO_FATAL_FAILURE(engine.stop());
}

// -----------------------------------------------------------------------------
// 4. RAII: the destructor stops the loop even without an explicit stop().
//    If it failed to join, this test would hang or abort.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTestFixture, DestructorStopsThreads) {
  {
    intraday::TradingEngine engine(config, sim_clock, "", "", "");
    engine.start();
    engine.pushEvent(bullishBar(kT0, 50000.0));
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
  }
  SUCCEED();
}

// -----------------------------------------------------------------------------
// 5. Command handler responses.
// Why: the IPC thread calls executeCommand(); its JSON shape is the only
//      contract an external monitor relies on.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTestFixture, CommandResponses) {
  intraday::TradingEngine engine(config, sim_clock, "", "", "");
  engine.start();

  const auto ping = nlohmann::json::parse(engine.executeCommand("PING"));
  EXPECT_EQ(ping.at("status"), "ok");
  EXPECT_EQ(ping.at("response"), "PONG");

  const auto status = nlohmann::json::parse(engine.executeCommand("STATUS"));
  EXPECT_EQ(status.at("status"), "ok");
  EXPECT_EQ(status.at("running"), true);
  EXPECT_EQ(status.at("run_ended"), false);
  EXPECT_EQ(status.at("symbol"), "BTCUSD");
  EXPECT_EQ(status.at("metrics").at("position_status"), "FLAT");
  EXPECT_EQ(status.at("metrics").at("total_trades").get<int>(), 0);
  // No market data endpoint: the feed block is present and idle.
  EXPECT_EQ(status.at("feed").at("forwarded").get<int>(), 0);
  EXPECT_EQ(status.at("feed").at("dropped").get<int>(), 0);
  EXPECT_EQ(status.at("feed").at("connected"), false);

  const auto bad = nlohmann::json::parse(engine.executeCommand("LIQUIDATE"));
  EXPECT_EQ(bad.at("status"), "error");
  EXPECT_EQ(bad.at("response"), "Unknown command: LIQUIDATE");

  engine.stop();
}

// -----------------------------------------------------------------------------
// 6. A RunEndEvent flips runEnded(), which main() polls to exit.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTestFixture, RunEndSetsRunEnded) {
  intraday::TradingEngine engine(config, sim_clock, "", "", "");
  engine.start();
  EXPECT_FALSE(engine.runEnded());

  engine.pushEvent(
      intraday::RunEndEvent{intraday::ms_to_timestamp(kT0), 100000.0});

  EXPECT_TRUE(waitFor([&] { return engine.runEnded(); }));
  engine.stop();
}

// -----------------------------------------------------------------------------
// 7. An unusable sizing configuration fails start() before any thread runs.
// -----------------------------------------------------------------------------
TEST_F(TradingEngineTestFixture, StartRejectsInvalidSizingConfiguration) {
  config.risk.position_sizing.method =
      intraday::config::SizingMethod::PercentRisk;
  config.risk.stop_loss.default_percent = 0.0;

  intraday::TradingEngine engine(config, sim_clock, "", "", "");
  EXPECT_THROW(engine.start(), intraday::ConfigurationError);
  EXPECT_FALSE(engine.running());
  EXPECT_NO_FATAL_FAILURE(engine.stop());
}
