#pragma once

#include <cstdint>

namespace escrow {

// -----------------------------------------------------------------------------
// EscrowError: failure kinds reported by the engine and the ledger gateway
// -----------------------------------------------------------------------------
//
// @brief  Every way a lifecycle operation can fail. A failed operation never
//         leaves a side effect behind: the caller sees the error kind and the
//         unchanged prior state.
//
// @details
// Numeric codes are part of the node's wire protocol and must stay stable:
//
//   NotAuthorized      100  caller does not hold the role for the transition
//   AlreadyExists      101  next agreement ID is already occupied
//   InvalidStatus      102  agreement is not in the precondition status
//   InsufficientFunds  103  ledger could not move the amount
//   NotFound           104  no agreement with this ID
//   InvalidArgument    105  create input out of bounds (description)
//
// None of these are retried inside the engine. The caller decides whether to
// retry with corrected input or a different identity.
// -----------------------------------------------------------------------------
enum class EscrowError : std::uint32_t {
  NotAuthorized = 100,
  AlreadyExists = 101,
  InvalidStatus = 102,
  InsufficientFunds = 103,
  NotFound = 104,
  InvalidArgument = 105,
};

// Stable name for logs and replies, e.g. "InvalidStatus".
const char* to_string(EscrowError error);

// Numeric wire code, e.g. 102 for InvalidStatus.
inline std::uint32_t error_code(EscrowError error) {
  return static_cast<std::uint32_t>(error);
}

}  // namespace escrow
