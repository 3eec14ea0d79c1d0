// -----------------------------------------------------------------------------
// intraday_engine: process entry point
//
//   1) Load the strategy configuration (argv[1], default
//      config/strategy_config.json). A missing or malformed file falls back
//      to defaults; an unknown top-level section is fatal.
//   2) Create the simulation clock and the TradingEngine, which subscribes
//      to the indicator feed on tcp://127.0.0.1:5555 and serves IPC on
//      5556 (REP) / 5557 (PUB).
//   3) Run until the feed sends run_end or the operator presses Ctrl-C.
//   4) Stop the engine (joins every thread) and exit.
// -----------------------------------------------------------------------------

#include "intraday/config/config_loader.hpp"
#include "intraday/domain/errors.hpp"
#include "intraday/engine/trading_engine.hpp"
#include "intraday/time/simulation_time_provider.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

namespace {

constexpr const char* kDefaultConfigPath = "config/strategy_config.json";

// Set by the SIGINT handler; polled by main().
volatile std::sig_atomic_t g_stop_requested = 0;

void sigint_handler(int /*signum*/) { g_stop_requested = 1; }

}  // namespace

int main(int argc, char* argv[]) {
  const std::string config_path = argc > 1 ? argv[1] : kDefaultConfigPath;

  intraday::config::ConfigLoadResult loaded;
  try {
    loaded = intraday::config::ConfigLoader::loadFile(config_path);
  } catch (const intraday::ConfigurationError& e) {
    std::cerr << "[main] invalid configuration: " << e.what() << "\n";
    return 1;
  }
  if (loaded.used_defaults) {
    std::cerr << "[main] running with the default configuration\n";
  }

  intraday::SimulationTimeProvider sim_clock;
  intraday::TradingEngine engine(loaded.config, sim_clock);

  try {
    engine.start();
  } catch (const intraday::ConfigurationError& e) {
    std::cerr << "[main] cannot start engine: " << e.what() << "\n";
    return 1;
  }

  std::signal(SIGINT, sigint_handler);

  std::cout << "[main] waiting for the indicator feed on "
               "tcp://127.0.0.1:5555. Ctrl-C to stop.\n";

  while (g_stop_requested == 0 && !engine.runEnded()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (g_stop_requested != 0) {
    std::cout << "\n[main] SIGINT received. Shutting down...\n";
  } else {
    std::cout << "[main] run_end received. Shutting down...\n";
  }

  engine.stop();
  return 0;
}
