#pragma once

namespace escrow {
namespace domain {

// -----------------------------------------------------------------------------
// AgreementStatus: agreement lifecycle state machine
// -----------------------------------------------------------------------------
//
// @brief  Enumerates every state an escrow agreement can occupy between its
//         creation by the vendor and its final settlement.
//
// @details
// The lifecycle is a strict state machine. The EscrowEngine enforces the
// transition graph (see lifecycle/transition_rules.hpp):
//
//   Pending ──fund──> Funded ──accept──> Accepted ──complete──> Completed
//                                           │
//                                           └──dispute──> Disputed ──refund──> Refunded
//
// Terminal states: Completed, Refunded. Agreements in a terminal state are
// kept forever as the permanent record of the settlement.
//
// Custody: an escrow balance exists exactly while the agreement is Funded,
// Accepted or Disputed.
//
// Thread model:
//   Plain enum, value type. Safe to copy and compare from any thread.
// -----------------------------------------------------------------------------
enum class AgreementStatus {
  Pending,    // Created by the vendor, waiting for the buyer's deposit
  Funded,     // Buyer deposited `amount` into custody
  Accepted,   // Buyer acknowledged the funded agreement
  Completed,  // Custody released to the vendor; terminal state
  Disputed,   // Buyer raised a dispute, waiting for the arbiter
  Refunded,   // Custody returned to the buyer; terminal state
};

// -----------------------------------------------------------------------------
// to_string(status)
// -----------------------------------------------------------------------------
// @brief  Human-readable name of the status ("Pending", "Funded", ...). Used
//         for log lines and the JSON wire format.
// -----------------------------------------------------------------------------
const char* to_string(AgreementStatus status);

}  // namespace domain
}  // namespace escrow
