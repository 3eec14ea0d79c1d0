#pragma once

#include "intraday/concurrent/thread_safe_queue.hpp"
#include "intraday/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace intraday {

// -----------------------------------------------------------------------------
// IpcServer: monitoring surface over ZeroMQ
// -----------------------------------------------------------------------------
//
// @brief  Publishes every outbound event (decisions, trades, signals, risk
//         breaches, performance reports) on a PUB socket and answers simple
//         text commands on a REP socket.
//
// @details
// Sockets:
//   PUB  (default tcp://127.0.0.1:5557)  one flat JSON object per event,
//        rendered by formatEvent(). Inbound events are not republished.
//   REP  (default tcp://127.0.0.1:5556)  request string → CommandHandler →
//        reply string. TradingEngine::executeCommand() is the handler in
//        production: PING → PONG, STATUS → metrics JSON, else an error JSON.
//
// Telemetry is handed over through pushTelemetry(), which only enqueues, so
// a slow or absent subscriber never stalls the strategy loop. Sends use
// dontwait; if the PUB high-water mark is reached the event is dropped.
//
// Thread model:
//   start() creates the context and both sockets and launches the I/O
//   thread, which is then the only thread touching them. pushTelemetry()
//   is safe from any thread. The CommandHandler runs on the I/O thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");
  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  void start();

  // Flushes queued telemetry, then closes the sockets.
  void stop();

  void pushTelemetry(Event event);

  // JSON text that would be published for `event`, if any.
  static std::optional<std::string> formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace intraday
