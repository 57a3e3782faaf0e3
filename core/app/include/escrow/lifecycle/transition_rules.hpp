#pragma once

#include "escrow/domain/agreement_status.hpp"

namespace escrow {

// -----------------------------------------------------------------------------
// Operation: the five transitions an existing agreement can go through
// -----------------------------------------------------------------------------
// create is not listed: it has no precondition status and no required role,
// so it does not fit the table below and is handled separately by the engine.
// -----------------------------------------------------------------------------
enum class Operation {
  Fund,
  Accept,
  Complete,
  Dispute,
  Refund,
};

// -----------------------------------------------------------------------------
// Role: who may drive a transition
// -----------------------------------------------------------------------------
// Buyer:   the agreement's buyer identity.
// Arbiter: the engine-wide arbiter from EscrowSettings.
// The vendor holds no role: once the agreement exists the vendor only
// receives funds.
// -----------------------------------------------------------------------------
enum class Role {
  Buyer,
  Arbiter,
};

// -----------------------------------------------------------------------------
// FundFlow: the ledger transfer paired with a transition
// -----------------------------------------------------------------------------
enum class FundFlow {
  None,             // status change only
  BuyerToCustody,   // deposit `amount`, creates the escrow balance
  CustodyToVendor,  // release the escrow balance, deletes it
  CustodyToBuyer,   // return the escrow balance, deletes it
};

// -----------------------------------------------------------------------------
// TransitionRule
// -----------------------------------------------------------------------------
//
// @brief  One row of the lifecycle table:
//
//   operation  required  role     next       funds
//   ---------  --------  -------  ---------  ---------------
//   Fund       Pending   Buyer    Funded     BuyerToCustody
//   Accept     Funded    Buyer    Accepted   None
//   Complete   Accepted  Buyer    Completed  CustodyToVendor
//   Dispute    Accepted  Buyer    Disputed   None
//   Refund     Disputed  Arbiter  Refunded   CustodyToBuyer
//
// @details
// The table is static and immutable. The EscrowEngine looks up the row for
// the requested operation and evaluates it against the stored agreement:
// role first, then required status, then the fund flow.
// -----------------------------------------------------------------------------
struct TransitionRule {
  Operation operation;
  domain::AgreementStatus required;
  Role role;
  domain::AgreementStatus next;
  FundFlow flow;
};

// Row of the table for `op`. Never fails: every Operation has a row.
const TransitionRule& rule_for(Operation op);

// True for the statuses in which the engine holds custody for the agreement:
// Funded, Accepted, Disputed.
bool holds_escrow(domain::AgreementStatus status);

// Lower-case operation name used in events and the command protocol
// ("fund", "accept", ...).
const char* to_string(Operation op);

}  // namespace escrow
