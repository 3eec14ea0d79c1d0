#pragma once

#include "intraday/analytics/performance_tracker.hpp"
#include "intraday/concurrent/event_loop_thread.hpp"
#include "intraday/config/strategy_config.hpp"
#include "intraday/logging/event_logger.hpp"
#include "intraday/network/ipc_server.hpp"
#include "intraday/network/market_data_thread.hpp"
#include "intraday/strategy/intraday_strategy.hpp"
#include "intraday/time/simulation_time_provider.hpp"

#include <atomic>
#include <memory>
#include <string>

namespace intraday {

// -----------------------------------------------------------------------------
// TradingEngine: process-level owner of threads and components
// -----------------------------------------------------------------------------
//
// @brief  Wires the decision core to its host surfaces and owns every
//         thread in the process.
//
// @details
// Threads:
//
//   market data thread   MarketDataGateway: ZMQ SUB → decode → advance
//                        clock → strategy_loop_.push()
//   strategy loop        EventLoopThread: IntradayStrategy, EventLogger and
//                        the telemetry forwarder all run here
//   IPC thread           IpcServer: PUB telemetry, REP commands
//
// Every mutation of trading state happens on the strategy loop. Decisions
// and structured events are published on strategyEventBus(); an execution
// collaborator subscribes there.
//
// An empty endpoint string disables the corresponding surface. Tests
// construct the engine with all endpoints empty and drive it through
// pushEvent().
//
// Lifecycle:
//   construct → (subscribe on strategyEventBus()) → start() → ... → stop().
//   stop() tears down in reverse: feed, strategy loop, components, IPC.
//
// Ownership:
//   Owns the config copy, the loop and all components. Borrows the clock,
//   which must outlive the engine.
// -----------------------------------------------------------------------------
class TradingEngine {
 public:
  explicit TradingEngine(
      const config::StrategyConfig& config,
      SimulationTimeProvider& sim_clock,
      std::string market_data_endpoint = "tcp://127.0.0.1:5555",
      std::string ipc_cmd_endpoint = "tcp://127.0.0.1:5556",
      std::string ipc_pub_endpoint = "tcp://127.0.0.1:5557");

  ~TradingEngine();

  TradingEngine(const TradingEngine&) = delete;
  TradingEngine& operator=(const TradingEngine&) = delete;
  TradingEngine(TradingEngine&&) = delete;
  TradingEngine& operator=(TradingEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Builds the strategy and logger, starts the strategy loop, then the IPC
  // server and the market data thread. Idempotent.
  //
  // @throws ConfigurationError if the sizing configuration is unusable.
  //         Nothing is left running in that case.
  // -------------------------------------------------------------------------
  void start();

  // Idempotent. Events still queued on the strategy loop are discarded.
  void stop();

  // Enqueues an event on the strategy loop. Safe from any thread.
  void pushEvent(Event event);

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  //   PING    → {"status":"ok","response":"PONG"}
  //   STATUS  → {"status":"ok","running":..,"run_ended":..,"symbol":..,
  //              "metrics":{...},
  //              "feed":{"forwarded":..,"dropped":..,"connected":..}}
  //   other   → {"status":"error","response":"Unknown command: <cmd>"}
  //
  // Runs on the IPC thread; reads only the strategy's metrics snapshot and
  // the feed counters.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  MetricsSnapshot metricsSnapshot() const;

  // Zeroes when no market data endpoint is configured.
  FeedStats feedStats() const;

  // True once a RunEndEvent has been handled.
  bool runEnded() const;

  bool running() const { return running_.load(); }

  const config::StrategyConfig& config() const { return config_; }

  EventBus& strategyEventBus();

 private:
  const config::StrategyConfig config_;
  SimulationTimeProvider& sim_clock_;

  std::string market_data_endpoint_;
  std::string ipc_cmd_endpoint_;
  std::string ipc_pub_endpoint_;

  EventLoopThread strategy_loop_{"StrategyLoop"};

  std::unique_ptr<IntradayStrategy> strategy_;
  std::unique_ptr<EventLogger> event_logger_;
  std::unique_ptr<IpcServer> ipc_server_;
  std::unique_ptr<MarketDataThread> market_data_thread_;

  EventBus::SubscriptionId telemetry_sub_id_{0};
  std::atomic<bool> running_{false};
};

}  // namespace intraday
