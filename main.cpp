// -----------------------------------------------------------------------------
// escrow_node: single executable entry point.
//
//   1) Load the node configuration (arbiter, custody identity, endpoints,
//      genesis balances) from the JSON file named on the command line.
//   2) Create a LiveTimeProvider as the clock for agreement timestamps.
//   3) Create the EscrowNode. Its constructor seeds the in-memory ledger and
//      builds the EscrowEngine.
//   4) Subscribe logging callbacks to the engine's event bus.
//   5) start() the node: the IpcServer binds its REP and PUB sockets and
//      begins answering JSON commands on its worker thread.
//   6) Idle on the main thread until SIGINT or SIGTERM, then stop().
//
// Thread layout:
//   main thread   → setup, idle wait, shutdown
//   ipc thread    → IpcServer::run() → EscrowNode::executeCommand()
//                   → EscrowEngine (all engine calls are serialized here)
//
// Usage:
//   escrow_node <config.json>
// -----------------------------------------------------------------------------

#include "escrow/config/node_config.hpp"
#include "escrow/engine/escrow_node.hpp"
#include "escrow/events/agreement_update_event.hpp"
#include "escrow/events/funds_transferred_event.hpp"
#include "escrow/time/live_time_provider.hpp"

#include <zmq.hpp>

#include <chrono>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <utility>

// -----------------------------------------------------------------------------
// Shutdown flag, the only global in the program. Written by the signal
// handler, polled by main().
// -----------------------------------------------------------------------------
static volatile std::sig_atomic_t g_shutdown_requested = 0;

static void shutdown_handler(int /*signum*/) { g_shutdown_requested = 1; }

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "usage: " << argv[0] << " <config.json>\n";
    return 2;
  }

  // -------------------------------------------------------------------------
  // 1) Configuration. A bad file is fatal before anything is started.
  // -------------------------------------------------------------------------
  escrow::NodeConfig config;
  try {
    config = escrow::ConfigLoader::LoadFromFile(argv[1]);
  } catch (const std::runtime_error& e) {
    std::cerr << "[main] ERROR: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 2) + 3) Clock and node.
  // -------------------------------------------------------------------------
  escrow::LiveTimeProvider clock;
  escrow::EscrowNode node(clock, std::move(config));

  // -------------------------------------------------------------------------
  // 4) Logging callbacks. These run on whichever thread drives the engine
  //    (the IPC worker once started).
  // -------------------------------------------------------------------------
  node.eventBus().subscribe<escrow::AgreementUpdateEvent>(
      [](const escrow::AgreementUpdateEvent& e) {
        std::cout << "[AgreementUpdate] id=" << e.agreement.id
                  << " op=" << e.operation << " caller=" << e.caller << " "
                  << escrow::domain::to_string(e.previous_status) << " -> "
                  << escrow::domain::to_string(e.agreement.status) << "\n";
      });

  node.eventBus().subscribe<escrow::FundsTransferredEvent>(
      [](const escrow::FundsTransferredEvent& e) {
        std::cout << "[FundsTransferred] id=" << e.agreement_id
                  << " from=" << e.from << " to=" << e.to
                  << " amount=" << e.amount << "\n";
      });

  // -------------------------------------------------------------------------
  // 5) Start serving. Binding failures (port in use, bad endpoint) are fatal.
  // -------------------------------------------------------------------------
  try {
    node.start();
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] ERROR: failed to start IPC server: " << e.what()
              << "\n";
    return 1;
  }

  std::signal(SIGINT, shutdown_handler);
  std::signal(SIGTERM, shutdown_handler);

  std::cout << "[main] escrow node running. CMD=" << node.config().cmd_endpoint
            << " PUB=" << node.config().pub_endpoint << "\n"
            << "[main] Press Ctrl-C to shut down.\n";

  // -------------------------------------------------------------------------
  // 6) Idle until a signal arrives, then shut down cleanly.
  // -------------------------------------------------------------------------
  while (g_shutdown_requested == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] Shutdown requested. Stopping node...\n";
  node.stop();

  return 0;
}
