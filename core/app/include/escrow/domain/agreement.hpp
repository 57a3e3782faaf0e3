#pragma once

#include "escrow/domain/agreement_status.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace escrow {
namespace domain {

// -----------------------------------------------------------------------------
// AgreementId
// -----------------------------------------------------------------------------
// Responsibility: Identifies one agreement inside an EscrowEngine. Assigned by
// the engine's AgreementIdGenerator: dense, starting at 1, never reused.
// ID 0 is never assigned and reads as "unset".
// -----------------------------------------------------------------------------
using AgreementId = std::uint64_t;

// -----------------------------------------------------------------------------
// Identity
// -----------------------------------------------------------------------------
// Responsibility: Names a party (vendor, buyer, arbiter) or a ledger account
// (the engine's custody account). Opaque to the engine: two identities are
// the same party iff the strings compare equal.
// -----------------------------------------------------------------------------
using Identity = std::string;

// -----------------------------------------------------------------------------
// Amount
// -----------------------------------------------------------------------------
// Responsibility: Unsigned quantity of value moved by the ledger. There are no
// fractional units; the ledger's smallest unit is 1.
// -----------------------------------------------------------------------------
using Amount = std::uint64_t;

// Maximum description length, counted in UTF-8 scalar values (not bytes).
constexpr std::size_t kMaxDescriptionLength = 256;

// -----------------------------------------------------------------------------
// Agreement
// -----------------------------------------------------------------------------
// Responsibility: One escrow transaction between a vendor and a buyer.
//
// @details
// Every field except `status` is fixed when the vendor creates the agreement.
// The authoritative copy lives in the EscrowEngine's registry and only the
// engine's transition operations change its status. Copies handed out by
// get_agreement() and carried by AgreementUpdateEvent are snapshots.
//
// Agreements are never deleted: Completed and Refunded records remain as the
// permanent history of the settlement.
// -----------------------------------------------------------------------------
struct Agreement {
  AgreementId id{};          // Assigned by the engine, starts at 1
  Identity vendor;           // Creator; receives custody on completion
  Identity buyer;            // Only party allowed to fund/accept/complete/dispute
  Amount amount{0};          // Deposit required from the buyer
  std::string description;   // Free text, at most kMaxDescriptionLength scalars
  AgreementStatus status{AgreementStatus::Pending};
  std::int64_t created_at{0};  // Engine clock at creation, epoch milliseconds
};

// -----------------------------------------------------------------------------
// EscrowBalance
// -----------------------------------------------------------------------------
// Responsibility: The funds the engine holds in custody for one agreement.
//
// @details
// Present from a successful fund until the agreement completes or is
// refunded. Its absence is meaningful: either the agreement was never funded
// or the custody has already been disbursed. The balance always equals the
// agreement's amount (no partial release).
// -----------------------------------------------------------------------------
struct EscrowBalance {
  AgreementId agreement_id{};
  Amount balance{0};
};

inline bool operator==(const EscrowBalance& lhs, const EscrowBalance& rhs) {
  return lhs.agreement_id == rhs.agreement_id && lhs.balance == rhs.balance;
}

}  // namespace domain
}  // namespace escrow
