// -----------------------------------------------------------------------------
// tradegate_engine: replay driver for the admission engine.
//
//   tradegate_engine <config.json> [replay.jsonl]
//
//   1) Load and validate the configuration (exit 1 on ConfigError).
//   2) Create a SimulationTimeProvider and the AdmissionEngine on it.
//   3) Subscribe printers for decisions and ledger faults on the output bus.
//   4) Replay the JSON-lines file (stdin when omitted) through the
//      ReplayGateway. Records are dispatched on the main thread in file
//      order, so every record sees the clock and ledger state left by the
//      one before it.
//   5) Print a final STATUS and shut down.
//
// SIGINT stops the replay before the next line; shutdown still runs.
// -----------------------------------------------------------------------------

#include "tradegate/config/config_error.hpp"
#include "tradegate/config/config_loader.hpp"
#include "tradegate/engine/admission_engine.hpp"
#include "tradegate/gateway/replay_gateway.hpp"
#include "tradegate/time/simulation_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <csignal>
#include <fstream>
#include <iostream>
#include <stdexcept>

// Set once before SIGINT is installed; only used to call stop(), which is a
// single atomic store.
static tradegate::ReplayGateway* g_gateway_ptr = nullptr;

static void sigint_handler(int /*signum*/) {
  if (g_gateway_ptr != nullptr) {
    g_gateway_ptr->stop();
  }
}

static int usage(const char* argv0) {
  std::cerr << "usage: " << argv0 << " <config.json> [replay.jsonl]\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 2 || argc > 3) {
    return usage(argv[0]);
  }

  // -------------------------------------------------------------------------
  // 1) Configuration
  // -------------------------------------------------------------------------
  tradegate::EngineConfig config;
  try {
    config = tradegate::loadConfigFile(argv[1]);
  } catch (const tradegate::ConfigError& e) {
    std::cerr << "[main] Configuration error: " << e.what() << "\n";
    return 1;
  }

  std::ifstream replay_file;
  if (argc == 3) {
    replay_file.open(argv[2]);
    if (!replay_file) {
      std::cerr << "[main] Cannot open replay file '" << argv[2] << "'\n";
      return 1;
    }
  }
  std::istream& replay = argc == 3 ? static_cast<std::istream&>(replay_file)
                                   : std::cin;

  // -------------------------------------------------------------------------
  // 2) Clock and engine
  // -------------------------------------------------------------------------
  tradegate::SimulationTimeProvider sim_clock;
  tradegate::AdmissionEngine engine(config, sim_clock);

  // -------------------------------------------------------------------------
  // 3) Output printers. Dispatch is on the main thread, so these run there.
  // -------------------------------------------------------------------------
  engine.outputBus().subscribe<tradegate::AdmissionDecisionEvent>(
      [](const tradegate::AdmissionDecisionEvent& e) {
        nlohmann::json line;
        line["decision"] = tradegate::toJson(e.decision);
        std::cout << line.dump() << "\n";
      });

  engine.outputBus().subscribe<tradegate::LedgerFaultEvent>(
      [](const tradegate::LedgerFaultEvent& e) {
        nlohmann::json line;
        line["fault"] = tradegate::toJson(e);
        std::cout << line.dump() << "\n";
      });

  // -------------------------------------------------------------------------
  // 4) Replay
  // -------------------------------------------------------------------------
  tradegate::ReplayGateway gateway(
      sim_clock,
      [&engine](tradegate::Event event) { engine.dispatch(event); },
      [&engine](const std::string& cmd) { return engine.executeCommand(cmd); },
      [&engine](const tradegate::NewsEvent& event) {
        if (!engine.addNewsEvent(event)) {
          std::cout << "[main] News event '" << event.name
                    << "' not watched; ignored.\n";
        }
      },
      std::cout);

  g_gateway_ptr = &gateway;
  std::signal(SIGINT, sigint_handler);

  const tradegate::ReplayGateway::Stats stats = gateway.run(replay);

  std::signal(SIGINT, SIG_DFL);
  g_gateway_ptr = nullptr;

  std::cout << "[main] Replay finished: " << stats.lines << " record(s), "
            << stats.dispatched << " dispatched, " << stats.skipped
            << " skipped.\n";

  // -------------------------------------------------------------------------
  // 5) Final status
  // -------------------------------------------------------------------------
  std::cout << engine.executeCommand("STATUS") << "\n";
  return 0;
}
