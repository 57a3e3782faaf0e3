#pragma once

#include "escrow/concurrent/agreement_id_generator.hpp"
#include "escrow/domain/agreement.hpp"
#include "escrow/domain/call_context.hpp"
#include "escrow/domain/escrow_settings.hpp"
#include "escrow/domain/result.hpp"
#include "escrow/eventbus/event_bus.hpp"
#include "escrow/ledger/i_ledger_gateway.hpp"
#include "escrow/lifecycle/transition_rules.hpp"
#include "escrow/time/i_time_provider.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>

namespace escrow {

// -----------------------------------------------------------------------------
// EscrowEngine: agreement registry, custody bookkeeping, lifecycle rules
// -----------------------------------------------------------------------------
//
// @brief  Owns every agreement and every escrow balance, and is the only
//         component allowed to change either.
//
// @details
// State (all owned by value, no process-wide globals):
//   agreements_       AgreementId → Agreement     (never erased)
//   escrow_balances_  AgreementId → EscrowBalance (present iff custody held)
//   id_gen_           next ID to assign
//
// Every mutating operation runs the same pipeline and stops at the first
// failure, with nothing changed:
//
//   1. existence      the ID resolves to a stored agreement    → NotFound
//   2. authorization  caller holds the row's Role              → NotAuthorized
//   3. status         agreement is in the row's required state → InvalidStatus
//   4. transfer       ledger moves the funds (if any)          → InsufficientFunds
//   5. commit         status, escrow balance, events
//
// Because the ledger transfer happens before anything is written, a transfer
// failure needs no rollback: the agreement is exactly as it was. Conversely
// no transfer is ever attempted for a call that failed steps 1-3.
//
// Invariants maintained:
//   - IDs are 1, 2, 3, ... with no gap; a failed create does not consume one.
//   - escrow_balances_ has an entry for an ID iff its agreement is Funded,
//     Accepted or Disputed, and that entry's balance equals the amount.
//   - vendor, buyer, amount, description, created_at never change.
//
// Known gaps, kept as-is: vendor == buyer is accepted; the arbiter is a single
// fixed identity; nothing expires, so an agreement may stay Pending, Funded,
// Accepted or Disputed forever.
//
// Thread model:
//   Not synchronized. The host must serialize calls (the node runs every
//   command on its IPC thread). Events are published synchronously on the
//   calling thread, after the state change is committed. Subscribers must not
//   throw: the EventBus logs and counts a std::exception, and anything else
//   propagates out of the operation with the change already applied.
//
// Ownership:
//   Holds non-owning references to the ledger, clock and bus; all three must
//   outlive the engine.
// -----------------------------------------------------------------------------
class EscrowEngine {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  ledger    Gateway used for every fund movement. The engine's
  //                   custody account lives on this ledger.
  // @param  clock     Source for created_at and event timestamps.
  // @param  bus       Receives AgreementUpdateEvent / FundsTransferredEvent.
  // @param  settings  Arbiter and custody identities (copied).
  // -------------------------------------------------------------------------
  EscrowEngine(ILedgerGateway& ledger, const ITimeProvider& clock,
               EventBus& bus, domain::EscrowSettings settings);

  EscrowEngine(const EscrowEngine&) = delete;
  EscrowEngine& operator=(const EscrowEngine&) = delete;
  EscrowEngine(EscrowEngine&&) = delete;
  EscrowEngine& operator=(EscrowEngine&&) = delete;

  // -------------------------------------------------------------------------
  // create_agreement(ctx, buyer, amount, description)
  // -------------------------------------------------------------------------
  //
  // @brief  Registers a new Pending agreement with ctx.caller as vendor.
  //
  // @return The new agreement's ID (== previous ID + 1), or
  //         InvalidArgument  description is not UTF-8 or longer than
  //                          kMaxDescriptionLength scalar values;
  //         AlreadyExists    the next ID is already occupied (the sequence
  //                          and the registry disagree).
  //
  // @details
  // Any identity may create. No funds move. created_at is read from the
  // clock once.
  // -------------------------------------------------------------------------
  Result<domain::AgreementId> create_agreement(const domain::CallContext& ctx,
                                               const domain::Identity& buyer,
                                               domain::Amount amount,
                                               const std::string& description);

  // -------------------------------------------------------------------------
  // fund_agreement(ctx, id)
  // -------------------------------------------------------------------------
  // Buyer deposits `amount` into custody. Pending → Funded; creates the
  // escrow balance. Errors: NotFound, NotAuthorized, InvalidStatus,
  // InsufficientFunds.
  // -------------------------------------------------------------------------
  Result<bool> fund_agreement(const domain::CallContext& ctx,
                              domain::AgreementId id);

  // Buyer acknowledges a funded agreement. Funded → Accepted. No funds move.
  Result<bool> accept_agreement(const domain::CallContext& ctx,
                                domain::AgreementId id);

  // -------------------------------------------------------------------------
  // complete_agreement(ctx, id)
  // -------------------------------------------------------------------------
  // Buyer releases custody to the vendor. Accepted → Completed; deletes the
  // escrow balance.
  // -------------------------------------------------------------------------
  Result<bool> complete_agreement(const domain::CallContext& ctx,
                                  domain::AgreementId id);

  // Buyer raises a dispute. Accepted → Disputed. Custody stays in place.
  Result<bool> dispute_agreement(const domain::CallContext& ctx,
                                 domain::AgreementId id);

  // -------------------------------------------------------------------------
  // refund_agreement(ctx, id)
  // -------------------------------------------------------------------------
  // Arbiter returns custody to the buyer. Disputed → Refunded; deletes the
  // escrow balance. This is the only way a dispute is resolved.
  // -------------------------------------------------------------------------
  Result<bool> refund_agreement(const domain::CallContext& ctx,
                                domain::AgreementId id);

  // Snapshot of the agreement, or std::nullopt. Never fails.
  std::optional<domain::Agreement> get_agreement(domain::AgreementId id) const;

  // Custody held for the agreement, or std::nullopt when none is held.
  std::optional<domain::EscrowBalance> get_escrow_balance(
      domain::AgreementId id) const;

  // -------------------------------------------------------------------------
  // hydrateAgreement(agreement)
  // -------------------------------------------------------------------------
  //
  // @brief  Inserts a pre-existing agreement (e.g. restored from an external
  //         store) into the registry.
  //
  // @details
  // Warm-up only: call before the engine serves any operation. The record is
  // taken as-is, including its ID and status; if the status holds custody an
  // escrow balance equal to `amount` is recorded too (the caller is
  // responsible for the custody account actually holding it).
  //
  // The ID sequence is NOT advanced. If the restored IDs overlap the
  // sequence, the next create fails with AlreadyExists instead of
  // overwriting a record.
  //
  // Overwrites any record with the same ID. No events are published.
  // -------------------------------------------------------------------------
  void hydrateAgreement(const domain::Agreement& agreement);

  // ID the next successful create will return.
  domain::AgreementId next_agreement_id() const;

  // Number of stored agreements, terminal ones included.
  std::size_t agreement_count() const;

  // Number of agreements currently holding custody.
  std::size_t escrow_count() const;

  const domain::Identity& arbiter() const;
  const domain::Identity& custody_identity() const;

 private:
  // -------------------------------------------------------------------------
  // applyTransition(ctx, id, op)
  // -------------------------------------------------------------------------
  // Runs the five-step pipeline for the table row of `op`. All public
  // transition operations forward here.
  // -------------------------------------------------------------------------
  Result<bool> applyTransition(const domain::CallContext& ctx,
                               domain::AgreementId id, Operation op);

  // True if `caller` holds `role` for `agreement`.
  bool isAuthorized(Role role, const domain::Agreement& agreement,
                    const domain::Identity& caller) const;

  // Logs a rejected call on stderr.
  void reject(const char* operation, domain::AgreementId id,
              EscrowError error) const;

  ILedgerGateway& ledger_;
  const ITimeProvider& clock_;
  EventBus& bus_;
  const domain::EscrowSettings settings_;

  AgreementIdGenerator id_gen_;
  std::unordered_map<domain::AgreementId, domain::Agreement> agreements_;
  std::unordered_map<domain::AgreementId, domain::EscrowBalance>
      escrow_balances_;
};

}  // namespace escrow
