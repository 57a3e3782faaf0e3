#pragma once

#include "escrow/domain/agreement.hpp"
#include "escrow/domain/agreement_status.hpp"

#include <cstdint>
#include <string>

namespace escrow {

// -----------------------------------------------------------------------------
// AgreementUpdateEvent
// -----------------------------------------------------------------------------
//
// @brief  Published by the EscrowEngine after every committed lifecycle
//         operation, carrying a snapshot of the agreement.
//
// @details
// `agreement` is the state after the operation. `previous_status` is the
// state before it; for "create" there is no previous state and it equals
// Pending. `operation` names the call that produced it ("create", "fund",
// "accept", "complete", "dispute", "refund") and `caller` the identity that
// made it.
//
// Never published for a rejected operation, so subscribers see exactly the
// sequence of committed transitions.
//
// Thread model:
//   Value type, passed by const reference through the EventBus and copied
//   into the IPC telemetry queue.
// -----------------------------------------------------------------------------
struct AgreementUpdateEvent {
  domain::Agreement agreement;
  domain::AgreementStatus previous_status{domain::AgreementStatus::Pending};
  std::string operation;
  domain::Identity caller;
  std::int64_t timestamp_ms{0};
};

}  // namespace escrow
