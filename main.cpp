// -----------------------------------------------------------------------------
// riskledger — single-account paper trading engine
//
//   1) Load the JSON configuration (argv[1], default config/riskledger.json).
//   2) Build the simulation clock and the PriceCache that serves quotes to
//      the ledger and the risk gate.
//   3) Build RiskGate + ExecutionLedger and hand both to the
//      ExecutionController for the configured account.
//   4) Start the IpcServer: operator commands go to
//      ExecutionController::executeCommand, and controller events are
//      bridged from the EventBus into the telemetry queue.
//   5) Start the MarketDataThread and wait for Ctrl-C.
//   6) Shut down: stop market data, then the IPC server, then let everything
//      unwind.
//
// Thread layout:
//   main thread  -> waits for SIGINT
//   feed thread  -> MarketDataGateway::run() (ZMQ SUB recv loop)
//   IPC thread   -> IpcServer (REP commands, which run submit(); PUB drain)
// -----------------------------------------------------------------------------

#include "riskledger/config/config_loader.hpp"
#include "riskledger/engine/execution_controller.hpp"
#include "riskledger/eventbus/event_bus.hpp"
#include "riskledger/events/event.hpp"
#include "riskledger/ledger/execution_ledger.hpp"
#include "riskledger/market/price_cache.hpp"
#include "riskledger/network/ipc_server.hpp"
#include "riskledger/network/market_data_thread.hpp"
#include "riskledger/risk/risk_gate.hpp"
#include "riskledger/time/live_time_provider.hpp"
#include "riskledger/time/simulation_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

static std::atomic<bool> g_shutdown{false};

static void sigint_handler(int /*signum*/) { g_shutdown.store(true); }

int main(int argc, char** argv) {
  const std::string config_path =
      (argc > 1) ? argv[1] : "config/riskledger.json";

  riskledger::EngineConfig config;
  try {
    config = riskledger::loadConfig(config_path);
  } catch (const riskledger::ConfigError& e) {
    std::cerr << "[main] CRITICAL: configuration error: " << e.what() << "\n";
    return 1;
  }

  // ---- 1) clock and quotes ------------------------------------------------
  // Start at wall-clock time so the daily counters open on today's trading
  // day; ticks move the clock from there.
  riskledger::SimulationTimeProvider sim_clock{
      riskledger::LiveTimeProvider{}.now_ms()};
  riskledger::PriceCache prices(sim_clock,
                                config.market_data.max_quote_age_ms);

  // ---- 2) per-account pipeline --------------------------------------------
  riskledger::LedgerConfig ledger_config;
  ledger_config.initial_cash = config.initial_cash;
  ledger_config.commission = config.commission;
  ledger_config.max_trade_history = config.max_trade_history;

  riskledger::EventBus event_bus;
  riskledger::ExecutionController controller(
      config.account_id,
      std::make_unique<riskledger::RiskGate>(sim_clock, config.risk_limits,
                                             config.commission),
      std::make_unique<riskledger::ExecutionLedger>(prices, sim_clock,
                                                    ledger_config),
      prices, event_bus, sim_clock);

  // ---- 3) operator surface ------------------------------------------------
  riskledger::IpcServer ipc_server(
      [&controller](const std::string& cmd) {
        return controller.executeCommand(cmd);
      },
      config.ipc.command_endpoint, config.ipc.telemetry_endpoint);

  event_bus.subscribe([&ipc_server](const riskledger::Event& event) {
    ipc_server.pushTelemetry(event);
  });

  event_bus.subscribe<riskledger::RiskRejectionEvent>(
      [](const riskledger::RiskRejectionEvent& e) {
        std::cout << "[main] rejected order " << e.order_id << " ("
                  << e.check << "): " << e.reason << "\n";
      });

  try {
    ipc_server.start();
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] CRITICAL: cannot bind IPC sockets: " << e.what()
              << "\n";
    return 1;
  }

  // ---- 4) market data on its own thread -----------------------------------
  riskledger::MarketDataThread market_data(
      sim_clock,
      [&prices](const riskledger::MarketDataEvent& tick) {
        prices.updatePrice(tick.symbol, tick.price, tick.timestamp_ms);
      },
      config.market_data.endpoint);
  market_data.start();

  std::signal(SIGINT, sigint_handler);
  std::cout << "[main] Market data from " << config.market_data.endpoint
            << "\n"
            << "[main] Commands on " << config.ipc.command_endpoint
            << ", telemetry on " << config.ipc.telemetry_endpoint << "\n"
            << "[main] Press Ctrl-C to shut down.\n";

  while (!g_shutdown.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  // ---- 5) shutdown --------------------------------------------------------
  std::cout << "\n[main] SIGINT received. Stopping market data...\n";
  market_data.stop();
  std::cout << "[main] Stopping IPC server...\n";
  ipc_server.stop();

  const auto performance = controller.ledger().getPerformance();
  std::cout << "[main] final equity " << performance.equity.toString()
            << ", trades " << performance.trade_count << "\n";
  return 0;
}
