// -----------------------------------------------------------------------------
// optrisk: single executable entry point.
//
//   optrisk <config.json> [open_positions.json]
//
//   1) Load the engine config (ConfigError aborts startup).
//   2) Pick the clock: live wall clock, or a simulation clock advanced by
//      feed timestamps.
//   3) Create the RiskManager, subscribe exit logging on the notification bus.
//   4) start(): hydrate positions from the optional positions file, then
//      spawn notification, IPC, sweep and market data threads.
//   5) Wait for SIGINT / SIGTERM, then stop() and join everything.
//
// Thread layout:
//   main thread          → start(), wait, stop()
//   market_data thread   → ZMQ SUB recv → PositionStore::onTick
//   sweep thread         → RuleEngine → ExitCoordinator
//   notification thread  → exit logging, IPC telemetry
//   ipc thread           → REP commands, PUB telemetry
// -----------------------------------------------------------------------------

#include "optrisk/config/engine_config.hpp"
#include "optrisk/engine/risk_manager.hpp"
#include "optrisk/risk/i_reconciler.hpp"
#include "optrisk/time/live_time_provider.hpp"
#include "optrisk/time/simulation_time_provider.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

// Set by the signal handler, polled by main(). The only global in the program.
static volatile std::sig_atomic_t g_shutdown_requested = 0;

static void shutdown_handler(int /*signum*/) { g_shutdown_requested = 1; }

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "usage: " << argv[0]
              << " <config.json> [open_positions.json]\n";
    return 2;
  }

  // ---  1) Config -----------------------------------------------------------
  optrisk::config::EngineConfig config;
  try {
    config = optrisk::config::loadEngineConfig(argv[1]);
  } catch (const optrisk::config::ConfigError& e) {
    std::cerr << "[main] " << e.what() << "\n";
    return 1;
  }

  // ---  2) Clock ------------------------------------------------------------
  std::unique_ptr<optrisk::ITimeProvider> clock;
  if (config.clock == optrisk::config::ClockMode::Simulation) {
    clock = std::make_unique<optrisk::SimulationTimeProvider>();
  } else {
    clock = std::make_unique<optrisk::LiveTimeProvider>();
  }

  // ---  3) Engine -----------------------------------------------------------
  optrisk::RiskManager manager(config, *clock);

  manager.notificationBus().subscribe<optrisk::ExitNotificationEvent>(
      [](const optrisk::ExitNotificationEvent& e) {
        std::cout << "[Exit] position=" << e.position.id << " "
                  << e.position.instrument.composite()
                  << " reason=" << e.reason << " price=" << e.exit_price
                  << " pnl=" << e.pnl << " pnl_pct=" << e.pnl_pct
                  << " peak=" << e.peak_profit_pct << "\n";
      });
  manager.notificationBus().subscribe<optrisk::ExitFailedEvent>(
      [](const optrisk::ExitFailedEvent& e) {
        std::cerr << "[ExitFailed] position=" << e.position_id
                  << " reason=" << e.reason << " error=" << e.error << "\n";
      });

  // ---  4) Start (with optional hydration) ----------------------------------
  try {
    if (argc >= 3) {
      optrisk::JsonFileReconciler reconciler(argv[2]);
      manager.start(&reconciler);
    } else {
      manager.start();
    }
  } catch (const std::runtime_error& e) {
    std::cerr << "[main] Startup failed: " << e.what() << "\n";
    return 1;
  }

  std::signal(SIGINT, shutdown_handler);
  std::signal(SIGTERM, shutdown_handler);
  std::cout << "[main] Running. Press Ctrl-C to shut down.\n";

  // ---  5) Wait, then shut down ---------------------------------------------
  while (g_shutdown_requested == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] Shutdown requested. Stopping engine...\n";
  manager.stop();
  return 0;
}
