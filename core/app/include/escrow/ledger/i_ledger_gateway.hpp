#pragma once

#include "escrow/domain/agreement.hpp"
#include "escrow/domain/result.hpp"

namespace escrow {

// -----------------------------------------------------------------------------
// ILedgerGateway: abstract value-transfer primitive
// -----------------------------------------------------------------------------
//
// @brief  The engine's only way to move value. Implementations own the real
//         balances; the engine never adjusts a balance itself.
//
// @details
// Contract every implementation must honour:
//   - transfer() is atomic: it either moves the whole amount or moves
//     nothing and reports the failure.
//   - A transfer that would overdraw `from` fails with
//     EscrowError::InsufficientFunds.
//   - transfer() is deterministic for a given ledger state and does not
//     retry internally.
//
// The EscrowEngine calls transfer() only after its existence, authorization
// and status checks passed, and commits its own status change only after
// transfer() succeeded. So the gateway never observes a transfer for an
// invalid transition, and a failed transfer leaves the agreement untouched.
//
// Implementations:
//   - InMemoryLedger  → process-local balance map (node and tests).
//   - A chain or bank adapter would implement the same interface.
//
// Ownership:
//   The EscrowEngine holds a non-owning reference. The host (EscrowNode or a
//   test fixture) owns the ledger and must keep it alive longer than the
//   engine.
// -----------------------------------------------------------------------------
class ILedgerGateway {
 public:
  virtual ~ILedgerGateway() = default;

  // -------------------------------------------------------------------------
  // transfer(from, to, amount)
  // -------------------------------------------------------------------------
  // @brief  Moves `amount` from `from` to `to`.
  //
  // @return The amount moved on success, or InsufficientFunds.
  // -------------------------------------------------------------------------
  virtual Result<domain::Amount> transfer(const domain::Identity& from,
                                          const domain::Identity& to,
                                          domain::Amount amount) = 0;

  // Current balance of `who`. Unknown identities hold 0.
  virtual domain::Amount balance_of(const domain::Identity& who) const = 0;
};

}  // namespace escrow
