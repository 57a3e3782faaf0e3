#pragma once

#include "escrow/domain/agreement.hpp"

namespace escrow {
namespace domain {

// -----------------------------------------------------------------------------
// EscrowSettings: engine-wide identities fixed at startup
// -----------------------------------------------------------------------------
//
// @brief  Immutable parameters an EscrowEngine needs besides its
//         collaborators.
//
// @details
// `arbiter` is the single distinguished identity allowed to resolve a
// dispute (by refunding). There is no arbiter rotation: the identity is
// copied into the engine at construction and stays fixed for its lifetime.
//
// `custody_identity` is the ledger account the engine deposits escrowed funds
// into on fund, and pays out of on complete/refund. It must not be used by
// any party for anything else.
//
// Loaded from the node's JSON configuration (config/node_config.hpp) and
// passed by value to the EscrowEngine constructor.
// -----------------------------------------------------------------------------
struct EscrowSettings {
  Identity arbiter;
  Identity custody_identity{"escrow-custody"};
};

}  // namespace domain
}  // namespace escrow
