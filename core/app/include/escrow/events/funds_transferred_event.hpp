#pragma once

#include "escrow/domain/agreement.hpp"

#include <cstdint>

namespace escrow {

// -----------------------------------------------------------------------------
// FundsTransferredEvent
// -----------------------------------------------------------------------------
// Published by the EscrowEngine for every ledger transfer it performed on
// behalf of an agreement: buyer → custody on fund, custody → vendor on
// complete, custody → buyer on refund. Published before the matching
// AgreementUpdateEvent of the same operation.
// -----------------------------------------------------------------------------
struct FundsTransferredEvent {
  domain::AgreementId agreement_id{};
  domain::Identity from;
  domain::Identity to;
  domain::Amount amount{0};
  std::int64_t timestamp_ms{0};
};

}  // namespace escrow
