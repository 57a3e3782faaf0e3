#pragma once

#include "escrow/domain/agreement.hpp"
#include "escrow/domain/escrow_settings.hpp"

#include <map>
#include <string>

namespace escrow {

// -----------------------------------------------------------------------------
// NodeConfig: everything the escrow_node reads from its config file
// -----------------------------------------------------------------------------
//
// @details
// Example file:
//
//   {
//     "arbiter": "arbiter",
//     "custody_identity": "escrow-custody",
//     "cmd_endpoint": "tcp://127.0.0.1:5556",
//     "pub_endpoint": "tcp://127.0.0.1:5557",
//     "genesis_balances": { "alice": 5000, "bob": 5000 }
//   }
//
// `arbiter` is required; everything else has the default shown in the struct.
// An empty endpoint disables the IPC server (used by tests that drive the
// node through executeCommand() directly).
// -----------------------------------------------------------------------------
struct NodeConfig {
  domain::EscrowSettings settings;
  std::string cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string pub_endpoint{"tcp://127.0.0.1:5557"};

  // Credited to the in-memory ledger once, when the node is constructed.
  std::map<domain::Identity, domain::Amount> genesis_balances;
};

// -----------------------------------------------------------------------------
// ConfigLoader
// -----------------------------------------------------------------------------
// Parses NodeConfig from JSON (nlohmann/json).
//
// Both functions throw std::runtime_error with a message naming the problem:
// unreadable file, malformed JSON, missing or empty "arbiter", a value of the
// wrong type, a custody identity equal to the arbiter.
// -----------------------------------------------------------------------------
class ConfigLoader {
 public:
  static NodeConfig LoadFromFile(const std::string& path);
  static NodeConfig LoadFromString(const std::string& json_text);
};

}  // namespace escrow
