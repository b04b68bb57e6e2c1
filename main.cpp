// -----------------------------------------------------------------------------
// bgcore: single executable entry point.
//
//   1) Load the JSON config (argv[1], else $BGCORE_CONFIG, else
//      ./bgcore.json). Credentials come from BITGET_API_KEY,
//      BITGET_API_SECRET and BITGET_API_PASSPHRASE.
//   2) Build the TradingEngine. Paper mode trades against the simulated
//      exchange on live public market data; live mode trades on Bitget.
//   3) Start it and block until SIGINT / SIGTERM.
//   4) Stop: drain in-flight acknowledgements, reconcile anything still
//      Pending, save the ledger snapshot.
//
// Thread layout:
//   main thread        → waits for the shutdown signal
//   stream loop        → MarketDataCache + OrderLedger
//   decision loop      → strategy, RiskGate, order submission, resync
//   coordinator timer  → decision ticks, pending sweep, periodic save
//   websocket threads  → public / private stream channels
//   ipc thread         → operator commands + telemetry (when enabled)
//
// Exit codes: 0 clean shutdown, 1 configuration error, 2 startup failure.
// -----------------------------------------------------------------------------

#include "bgcore/domain/errors.hpp"
#include "bgcore/engine/engine_config.hpp"
#include "bgcore/engine/trading_engine.hpp"
#include "bgcore/time/live_time_provider.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

// Set by the signal handler, polled by main(). sig_atomic_t is the only
// type a handler may portably write.
static volatile std::sig_atomic_t g_shutdown_requested = 0;

static void shutdown_handler(int /*signum*/) { g_shutdown_requested = 1; }

static std::string config_path(int argc, char** argv) {
  if (argc > 1) {
    return argv[1];
  }
  if (auto env = bgcore::processEnv("BGCORE_CONFIG")) {
    return *env;
  }
  return "bgcore.json";
}

int main(int argc, char** argv) {
  const std::string path = config_path(argc, argv);

  bgcore::EngineConfig config;
  try {
    config = bgcore::loadConfig(path);
  } catch (const bgcore::ConfigError& e) {
    std::cerr << "[main] Configuration error: " << e.what() << "\n";
    return 1;
  }

  bgcore::LiveTimeProvider clock;

  try {
    bgcore::TradingEngine engine(config, clock);

    std::signal(SIGINT, shutdown_handler);
    std::signal(SIGTERM, shutdown_handler);

    engine.start();
    std::cout << "[main] Running in " << bgcore::toString(config.exchange.mode)
              << " mode with config " << path << ". Press Ctrl-C to stop.\n";

    while (g_shutdown_requested == 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "\n[main] Shutdown signal received. Stopping engine...\n";
    engine.stop();

    const std::string status = engine.executeCommand("STATUS");
    std::cout << "[main] Final status: " << status << "\n";
  } catch (const bgcore::ConfigError& e) {
    std::cerr << "[main] Configuration error: " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "[main] Startup failed: " << e.what() << "\n";
    return 2;
  }

  return 0;
}
