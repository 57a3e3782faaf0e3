#pragma once

#include "escrow/ledger/i_ledger_gateway.hpp"

#include <map>
#include <shared_mutex>

namespace escrow {

// -----------------------------------------------------------------------------
// InMemoryLedger: process-local implementation of ILedgerGateway
// -----------------------------------------------------------------------------
//
// @brief  Keeps one balance per identity in a map and moves value between
//         them atomically.
//
// @details
// This is the ledger the escrow_node runs against and the one every test
// uses. It is seeded through credit() (the node credits the config's
// genesis_balances at startup) and afterwards only transfer() changes it,
// so total_supply() is conserved by every lifecycle operation.
//
// Semantics:
//   - An identity that was never credited has balance 0.
//   - transfer() with amount 0 succeeds and changes nothing.
//   - transfer() from an identity to itself succeeds if the balance covers
//     the amount, and changes nothing.
//   - transfer() that would overdraw `from` fails with InsufficientFunds and
//     changes nothing.
//
// Thread model:
//   Writers (credit, transfer) take a unique_lock on balances_mutex_; readers
//   (balance_of, total_supply, snapshot) take a shared_lock. The node's IPC
//   thread is the only writer in practice, but status queries may read
//   concurrently.
//
// Ownership:
//   Owned by EscrowNode (or a test fixture) by value. The EscrowEngine holds
//   an ILedgerGateway& to it.
// -----------------------------------------------------------------------------
class InMemoryLedger final : public ILedgerGateway {
 public:
  InMemoryLedger() = default;

  InMemoryLedger(const InMemoryLedger&) = delete;
  InMemoryLedger& operator=(const InMemoryLedger&) = delete;
  InMemoryLedger(InMemoryLedger&&) = delete;
  InMemoryLedger& operator=(InMemoryLedger&&) = delete;

  // -------------------------------------------------------------------------
  // credit(who, amount)
  // -------------------------------------------------------------------------
  // @brief  Mints `amount` into `who`'s balance.
  //
  // @details
  // Only used to seed the ledger (genesis balances, test setup). Lifecycle
  // operations never call it.
  // -------------------------------------------------------------------------
  void credit(const domain::Identity& who, domain::Amount amount);

  Result<domain::Amount> transfer(const domain::Identity& from,
                                  const domain::Identity& to,
                                  domain::Amount amount) override;

  domain::Amount balance_of(const domain::Identity& who) const override;

  // Sum of every balance.
  domain::Amount total_supply() const;

  // Copy of every non-zero balance, ordered by identity.
  std::map<domain::Identity, domain::Amount> snapshot() const;

 private:
  mutable std::shared_mutex balances_mutex_;
  std::map<domain::Identity, domain::Amount> balances_;
};

}  // namespace escrow
