// -----------------------------------------------------------------------------
// optrisk_server — single executable entry point.
//
//   1) Load the engine configuration (risk limits, pricing parameters,
//      command endpoint) from the JSON file named on the command line, or
//      use the built-in defaults when none is given.
//   2) Create the LiveTimeProvider that supplies the valuation date for
//      requests that do not carry one.
//   3) Create the ValidationEngine and start it. The engine binds the REP
//      socket and answers VALIDATE / POSITIONS / RECORD / PAYOFF / PING
//      envelopes on its server thread.
//   4) Wait on the main thread until SIGINT or SIGTERM.
//   5) Shut down cleanly.
//
// Thread layout:
//   main thread     → config, engine.start(), wait for shutdown, engine.stop()
//   server thread   → ValidationServer recv loop + executeCommand()
// -----------------------------------------------------------------------------

#include "optrisk/config/engine_config.hpp"
#include "optrisk/domain/errors.hpp"
#include "optrisk/engine/validation_engine.hpp"
#include "optrisk/time/live_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

// -----------------------------------------------------------------------------
// Shutdown flag for the signal handler. Lock-free atomic store is the only
// operation performed inside the handler.
// -----------------------------------------------------------------------------
static std::atomic<bool> g_shutdown{false};

static void shutdown_handler(int /*signum*/) { g_shutdown.store(true); }

int main(int argc, char** argv) {
  if (argc > 2) {
    std::cerr << "usage: " << argv[0] << " [config.json]\n";
    return 2;
  }

  // -------------------------------------------------------------------------
  // 1) Configuration.
  // -------------------------------------------------------------------------
  optrisk::EngineConfig config;
  if (argc == 2) {
    try {
      config = optrisk::loadEngineConfig(argv[1]);
    } catch (const optrisk::ConfigError& e) {
      std::cerr << "[main] " << e.what() << "\n";
      return 1;
    }
    std::cout << "[main] Loaded config from " << argv[1] << "\n";
  } else {
    std::cout << "[main] No config file given, using defaults.\n";
  }

  if (config.endpoint.empty()) {
    std::cerr << "[main] server.endpoint must not be empty.\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 2) + 3) Clock and engine.
  // -------------------------------------------------------------------------
  optrisk::LiveTimeProvider clock;
  optrisk::ValidationEngine engine(config, clock);

  try {
    engine.start();
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] Cannot bind " << config.endpoint << ": " << e.what()
              << "\n";
    return 1;
  }

  std::signal(SIGINT, shutdown_handler);
  std::signal(SIGTERM, shutdown_handler);

  std::cout << "[main] Listening on " << config.endpoint << "\n"
            << "[main] Press Ctrl-C to shut down.\n";

  // -------------------------------------------------------------------------
  // 4) Wait for a shutdown signal.
  // -------------------------------------------------------------------------
  while (!g_shutdown.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  // -------------------------------------------------------------------------
  // 5) Clean shutdown: joins the server thread.
  // -------------------------------------------------------------------------
  std::cout << "\n[main] Shutdown requested. Stopping engine...\n";
  engine.stop();

  return 0;
}
