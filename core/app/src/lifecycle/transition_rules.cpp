#include "escrow/lifecycle/transition_rules.hpp"

#include <array>
#include <cstddef>

namespace escrow {

namespace {

using S = domain::AgreementStatus;

// Indexed by Operation.
constexpr std::array<TransitionRule, 5> kRules{{
    {Operation::Fund,     S::Pending,  Role::Buyer,   S::Funded,    FundFlow::BuyerToCustody},
    {Operation::Accept,   S::Funded,   Role::Buyer,   S::Accepted,  FundFlow::None},
    {Operation::Complete, S::Accepted, Role::Buyer,   S::Completed, FundFlow::CustodyToVendor},
    {Operation::Dispute,  S::Accepted, Role::Buyer,   S::Disputed,  FundFlow::None},
    {Operation::Refund,   S::Disputed, Role::Arbiter, S::Refunded,  FundFlow::CustodyToBuyer},
}};

}  // namespace

// -----------------------------------------------------------------------------
// rule_for: table lookup
// -----------------------------------------------------------------------------
const TransitionRule& rule_for(Operation op) {
  return kRules[static_cast<std::size_t>(op)];
}

bool holds_escrow(domain::AgreementStatus status) {
  return status == S::Funded ||
         status == S::Accepted ||
         status == S::Disputed;
}

const char* to_string(Operation op) {
  switch (op) {
    case Operation::Fund:     return "fund";
    case Operation::Accept:   return "accept";
    case Operation::Complete: return "complete";
    case Operation::Dispute:  return "dispute";
    case Operation::Refund:   return "refund";
  }
  return "unknown";
}

}  // namespace escrow
