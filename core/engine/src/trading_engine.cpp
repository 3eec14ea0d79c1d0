#include "intraday/engine/trading_engine.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace intraday {

namespace {

nlohmann::json metricsToJson(const MetricsSnapshot& m) {
  nlohmann::json j;
  j["portfolio_value"] = m.portfolio_value;
  j["total_trades"] = m.total_trades;
  j["signals_generated"] = m.signals_generated;
  j["winning_trades"] = m.winning_trades;
  j["losing_trades"] = m.losing_trades;
  j["win_rate_percent"] = m.win_rate_percent;
  j["current_drawdown"] = m.current_drawdown;
  j["max_drawdown"] = m.max_drawdown_seen;
  j["consecutive_losses"] = m.consecutive_losses;
  j["daily_pnl"] = m.daily_pnl;
  j["average_pnl_percent"] = m.average_pnl_percent;
  j["average_duration_minutes"] = m.average_duration_minutes;
  j["position_status"] = m.position_status;
  if (m.entry_price) {
    j["entry_price"] = *m.entry_price;
  }
  if (m.best_trade_pnl_percent) {
    j["best_trade_pnl_percent"] = *m.best_trade_pnl_percent;
  }
  if (m.worst_trade_pnl_percent) {
    j["worst_trade_pnl_percent"] = *m.worst_trade_pnl_percent;
  }
  return j;
}

}  // namespace

TradingEngine::TradingEngine(const config::StrategyConfig& config,
                             SimulationTimeProvider& sim_clock,
                             std::string market_data_endpoint,
                             std::string ipc_cmd_endpoint,
                             std::string ipc_pub_endpoint)
    : config_(config),
      sim_clock_(sim_clock),
      market_data_endpoint_(std::move(market_data_endpoint)),
      ipc_cmd_endpoint_(std::move(ipc_cmd_endpoint)),
      ipc_pub_endpoint_(std::move(ipc_pub_endpoint)) {}

TradingEngine::~TradingEngine() { stop(); }

void TradingEngine::start() {
  if (running_) {
    return;
  }

  // --- Components first: a ConfigurationError leaves no thread behind ------
  strategy_ = std::make_unique<IntradayStrategy>(strategy_loop_.eventBus(),
                                                 config_, sim_clock_);
  event_logger_ = std::make_unique<EventLogger>(strategy_loop_.eventBus());

  strategy_loop_.start();

  // Built before the IPC thread exists so STATUS never races the pointer;
  // started last, below.
  if (!market_data_endpoint_.empty()) {
    market_data_thread_ = std::make_unique<MarketDataThread>(
        sim_clock_, [this](Event event) { pushEvent(std::move(event)); },
        market_data_endpoint_);
  }

  // --- IPC: outbound events on the strategy bus → PUB socket ---------------
  if (!ipc_cmd_endpoint_.empty() && !ipc_pub_endpoint_.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        ipc_cmd_endpoint_, ipc_pub_endpoint_);
    ipc_server_->start();

    telemetry_sub_id_ = strategy_loop_.eventBus().subscribe(
        [this](const Event& e) { ipc_server_->pushTelemetry(e); });
  }

  // --- Feed last, once everything downstream is listening -------------------
  if (market_data_thread_) {
    market_data_thread_->start();
  }

  running_ = true;

  std::cout << "[TradingEngine] started for " << config_.trading.symbol
            << ". Threads: strategy"
            << (ipc_server_ ? ", ipc" : "")
            << (market_data_thread_ ? ", market_data" : "") << ".\n";
}

void TradingEngine::stop() {
  if (!running_) {
    return;
  }

  if (market_data_thread_) {
    market_data_thread_->stop();
  }
  strategy_loop_.stop();

  if (ipc_server_) {
    strategy_loop_.eventBus().unsubscribe(telemetry_sub_id_);
  }
  event_logger_.reset();

  // IPC goes after the loop so telemetry queued by the last events is
  // flushed, but before the strategy and feed so STATUS never sees a null
  // pointer.
  ipc_server_.reset();
  market_data_thread_.reset();
  strategy_.reset();

  running_ = false;

  std::cout << "[TradingEngine] stopped. All threads joined.\n";
}

void TradingEngine::pushEvent(Event event) {
  strategy_loop_.push(std::move(event));
}

std::string TradingEngine::executeCommand(const std::string& cmd) {
  nlohmann::json response;

  if (cmd == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (cmd == "STATUS") {
    response["status"] = "ok";
    response["running"] = running_.load();
    response["run_ended"] = runEnded();
    response["symbol"] = config_.trading.symbol;
    response["metrics"] = metricsToJson(metricsSnapshot());
    const FeedStats feed = feedStats();
    response["feed"] = {{"forwarded", feed.forwarded},
                        {"dropped", feed.dropped},
                        {"connected", feed.connected}};
  } else {
    response["status"] = "error";
    response["response"] = "Unknown command: " + cmd;
  }

  return response.dump();
}

MetricsSnapshot TradingEngine::metricsSnapshot() const {
  return strategy_ ? strategy_->metricsSnapshot() : MetricsSnapshot{};
}

FeedStats TradingEngine::feedStats() const {
  return market_data_thread_ ? market_data_thread_->stats() : FeedStats{};
}

bool TradingEngine::runEnded() const {
  return strategy_ && strategy_->runEnded();
}

EventBus& TradingEngine::strategyEventBus() {
  return strategy_loop_.eventBus();
}

}  // namespace intraday
