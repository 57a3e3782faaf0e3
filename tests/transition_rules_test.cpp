// =============================================================================
// transition_rules_test.cpp
// =============================================================================
// Unit tests for the lifecycle table in escrow/lifecycle/transition_rules.hpp.
//
// Validates:
//   - Each operation's row: required status, role, next status, fund flow
//   - No row leaves a terminal status
//   - Fund flows agree with which statuses hold custody
//   - Which statuses hold custody funds
// =============================================================================

#include "escrow/lifecycle/transition_rules.hpp"

#include <gtest/gtest.h>

#include <array>
#include <string>

using escrow::FundFlow;
using escrow::Operation;
using escrow::Role;
using S = escrow::domain::AgreementStatus;

namespace {

constexpr std::array<S, 6> kAllStatuses{
    S::Pending, S::Funded, S::Accepted, S::Completed, S::Disputed, S::Refunded};

constexpr std::array<Operation, 5> kAllOperations{
    Operation::Fund, Operation::Accept, Operation::Complete,
    Operation::Dispute, Operation::Refund};

}  // namespace

// -----------------------------------------------------------------------------
// 1. Rows of the table.
// -----------------------------------------------------------------------------
TEST(TransitionRulesTest, RowsMatchLifecycle) {
  const auto& fund = escrow::rule_for(Operation::Fund);
  EXPECT_EQ(fund.required, S::Pending);
  EXPECT_EQ(fund.role, Role::Buyer);
  EXPECT_EQ(fund.next, S::Funded);
  EXPECT_EQ(fund.flow, FundFlow::BuyerToCustody);

  const auto& accept = escrow::rule_for(Operation::Accept);
  EXPECT_EQ(accept.required, S::Funded);
  EXPECT_EQ(accept.role, Role::Buyer);
  EXPECT_EQ(accept.next, S::Accepted);
  EXPECT_EQ(accept.flow, FundFlow::None);

  const auto& complete = escrow::rule_for(Operation::Complete);
  EXPECT_EQ(complete.required, S::Accepted);
  EXPECT_EQ(complete.role, Role::Buyer);
  EXPECT_EQ(complete.next, S::Completed);
  EXPECT_EQ(complete.flow, FundFlow::CustodyToVendor);

  const auto& dispute = escrow::rule_for(Operation::Dispute);
  EXPECT_EQ(dispute.required, S::Accepted);
  EXPECT_EQ(dispute.role, Role::Buyer);
  EXPECT_EQ(dispute.next, S::Disputed);
  EXPECT_EQ(dispute.flow, FundFlow::None);

  const auto& refund = escrow::rule_for(Operation::Refund);
  EXPECT_EQ(refund.required, S::Disputed);
  EXPECT_EQ(refund.role, Role::Arbiter);
  EXPECT_EQ(refund.next, S::Refunded);
  EXPECT_EQ(refund.flow, FundFlow::CustodyToBuyer);
}

// -----------------------------------------------------------------------------
// 2. rule_for(op).operation == op for every op.
// -----------------------------------------------------------------------------
TEST(TransitionRulesTest, RowIsIndexedByOperation) {
  for (auto op : kAllOperations) {
    EXPECT_EQ(escrow::rule_for(op).operation, op) << escrow::to_string(op);
  }
}

// -----------------------------------------------------------------------------
// 3. Completed and Refunded are never a required status, so no operation
//    leaves them; every other status is left by at least one operation.
// -----------------------------------------------------------------------------
TEST(TransitionRulesTest, OnlyTerminalStatusesHaveNoOutgoingRow) {
  for (auto status : kAllStatuses) {
    int outgoing = 0;
    for (auto op : kAllOperations) {
      if (escrow::rule_for(op).required == status) {
        ++outgoing;
      }
    }
    const bool terminal = status == S::Completed || status == S::Refunded;
    EXPECT_EQ(outgoing == 0, terminal) << escrow::domain::to_string(status);
  }
}

// -----------------------------------------------------------------------------
// 4. Only rows leaving a custody-holding status release funds, and only the
//    fund row creates custody.
// -----------------------------------------------------------------------------
TEST(TransitionRulesTest, FundFlowsAgreeWithCustody) {
  for (auto op : kAllOperations) {
    const auto& rule = escrow::rule_for(op);
    switch (rule.flow) {
      case FundFlow::BuyerToCustody:
        EXPECT_FALSE(escrow::holds_escrow(rule.required));
        EXPECT_TRUE(escrow::holds_escrow(rule.next));
        break;
      case FundFlow::CustodyToVendor:
      case FundFlow::CustodyToBuyer:
        EXPECT_TRUE(escrow::holds_escrow(rule.required));
        EXPECT_FALSE(escrow::holds_escrow(rule.next));
        break;
      case FundFlow::None:
        EXPECT_EQ(escrow::holds_escrow(rule.required),
                  escrow::holds_escrow(rule.next))
            << escrow::to_string(op);
        break;
    }
  }
}

// -----------------------------------------------------------------------------
// 5. Custody is held between fund and the release transition.
// -----------------------------------------------------------------------------
TEST(TransitionRulesTest, HoldsEscrow) {
  EXPECT_FALSE(escrow::holds_escrow(S::Pending));
  EXPECT_TRUE(escrow::holds_escrow(S::Funded));
  EXPECT_TRUE(escrow::holds_escrow(S::Accepted));
  EXPECT_TRUE(escrow::holds_escrow(S::Disputed));
  EXPECT_FALSE(escrow::holds_escrow(S::Completed));
  EXPECT_FALSE(escrow::holds_escrow(S::Refunded));
}

TEST(TransitionRulesTest, Names) {
  EXPECT_EQ(std::string(escrow::to_string(Operation::Fund)), "fund");
  EXPECT_EQ(std::string(escrow::to_string(Operation::Refund)), "refund");
  EXPECT_EQ(std::string(escrow::domain::to_string(S::Disputed)), "Disputed");
}
