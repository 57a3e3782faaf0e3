#pragma once

#include "escrow/config/node_config.hpp"
#include "escrow/eventbus/event_bus.hpp"
#include "escrow/ledger/in_memory_ledger.hpp"
#include "escrow/lifecycle/escrow_engine.hpp"
#include "escrow/network/ipc_server.hpp"
#include "escrow/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>

namespace escrow {

// -----------------------------------------------------------------------------
// EscrowNode
// -----------------------------------------------------------------------------
//
// @brief  Process-level host of one EscrowEngine: owns its ledger, event bus
//         and IPC server, and turns JSON commands into engine calls.
//
// @details
// main() and the tests use the node instead of wiring the engine by hand.
//
// Command protocol (one JSON object per request and per reply):
//
//   {"cmd":"create","caller":"V","buyer":"B","amount":1000,"description":".."}
//       → {"status":"ok","agreement_id":1}
//   {"cmd":"fund"|"accept"|"complete"|"dispute"|"refund",
//    "caller":"B","agreement_id":1}
//       → {"status":"ok","result":true}
//   {"cmd":"get_agreement","agreement_id":1}
//       → {"status":"ok","agreement":{...}|null}
//   {"cmd":"get_escrow_balance","agreement_id":1}
//       → {"status":"ok","escrow_balance":{...}|null}
//   {"cmd":"balance","identity":"B"}   → {"status":"ok","identity":"B","balance":N}
//   {"cmd":"status"}                   → node summary
//   {"cmd":"ping"}                     → {"status":"ok","response":"pong"}
//
// Engine failures reply {"status":"error","error":"InvalidStatus","code":102}.
// Requests that cannot be interpreted (bad JSON, missing or mistyped field,
// unknown cmd) reply {"status":"error","error":"BadRequest","response":"..."}.
//
// Ownership:
//   EscrowNode
//    ├── clock_          (const ITimeProvider&, non-owning, owned by main)
//    ├── config_         (NodeConfig, value member)
//    ├── ledger_         (InMemoryLedger, value member, seeded from genesis)
//    ├── bus_            (EventBus, value member)
//    ├── engine_         (unique_ptr<EscrowEngine>)
//    └── ipc_server_     (unique_ptr<IpcServer>, only while started)
//
// The engine is created in the constructor, so executeCommand() works
// without start(); start() only brings the sockets up. Members are declared
// so the engine is destroyed before the bus and ledger it references.
//
// Thread model:
//   Construct, start() and stop() on one thread (main). Once started, every
//   executeCommand() runs on the IPC worker thread. Without start(), callers
//   (tests) invoke executeCommand() directly and must serialize themselves.
// -----------------------------------------------------------------------------
class EscrowNode {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  clock   Time source for the engine. Must outlive the node.
  // @param  config  Settings, endpoints and genesis balances. The genesis
  //                 balances are credited to the ledger here, once.
  // -------------------------------------------------------------------------
  EscrowNode(const ITimeProvider& clock, NodeConfig config);

  // Calls stop().
  ~EscrowNode();

  EscrowNode(const EscrowNode&) = delete;
  EscrowNode& operator=(const EscrowNode&) = delete;
  EscrowNode(EscrowNode&&) = delete;
  EscrowNode& operator=(EscrowNode&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Brings up the IPC server and the telemetry bridge. If either endpoint in
  // the config is empty, no server is created and start() only marks the
  // node running. Idempotent.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // Detaches the telemetry bridge and joins the IPC worker. The engine and
  // its state survive; start() may be called again. Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  bool isRunning() const { return running_; }

  // -------------------------------------------------------------------------
  // executeCommand(request)
  // -------------------------------------------------------------------------
  // Parses one JSON command, runs it against the engine and returns the JSON
  // reply. Never throws for bad input; malformed requests produce a
  // BadRequest reply.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& request);

  EscrowEngine& engine() { return *engine_; }
  const EscrowEngine& engine() const { return *engine_; }
  InMemoryLedger& ledger() { return ledger_; }
  EventBus& eventBus() { return bus_; }
  const NodeConfig& config() const { return config_; }

 private:
  nlohmann::json dispatch(const nlohmann::json& request);
  nlohmann::json runTransition(const std::string& cmd,
                               const domain::CallContext& ctx,
                               domain::AgreementId id);
  nlohmann::json statusReply() const;

  const ITimeProvider& clock_;
  NodeConfig config_;

  InMemoryLedger ledger_;
  EventBus bus_;
  std::unique_ptr<EscrowEngine> engine_;

  std::unique_ptr<IpcServer> ipc_server_;
  std::vector<EventBus::SubscriptionId> telemetry_subs_;

  bool running_{false};
};

}  // namespace escrow
