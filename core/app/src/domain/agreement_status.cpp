#include "escrow/domain/agreement_status.hpp"
#include "escrow/domain/escrow_error.hpp"

namespace escrow {

// -----------------------------------------------------------------------------
// to_string(AgreementStatus)
// -----------------------------------------------------------------------------
const char* domain::to_string(AgreementStatus status) {
  using S = AgreementStatus;
  switch (status) {
    case S::Pending:   return "Pending";
    case S::Funded:    return "Funded";
    case S::Accepted:  return "Accepted";
    case S::Completed: return "Completed";
    case S::Disputed:  return "Disputed";
    case S::Refunded:  return "Refunded";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// to_string(EscrowError)
// -----------------------------------------------------------------------------
const char* to_string(EscrowError error) {
  switch (error) {
    case EscrowError::NotAuthorized:     return "NotAuthorized";
    case EscrowError::AlreadyExists:     return "AlreadyExists";
    case EscrowError::InvalidStatus:     return "InvalidStatus";
    case EscrowError::InsufficientFunds: return "InsufficientFunds";
    case EscrowError::NotFound:          return "NotFound";
    case EscrowError::InvalidArgument:   return "InvalidArgument";
  }
  return "Unknown";
}

}  // namespace escrow
