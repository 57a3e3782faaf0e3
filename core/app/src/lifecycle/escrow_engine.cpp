#include "escrow/lifecycle/escrow_engine.hpp"
#include "escrow/util/utf8.hpp"

#include <iostream>
#include <utility>

namespace escrow {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
EscrowEngine::EscrowEngine(ILedgerGateway& ledger, const ITimeProvider& clock,
                           EventBus& bus, domain::EscrowSettings settings)
    : ledger_(ledger),
      clock_(clock),
      bus_(bus),
      settings_(std::move(settings)) {}

// -----------------------------------------------------------------------------
// create_agreement: validate input, claim the next ID, store Pending record
// -----------------------------------------------------------------------------
Result<domain::AgreementId> EscrowEngine::create_agreement(
    const domain::CallContext& ctx, const domain::Identity& buyer,
    domain::Amount amount, const std::string& description) {
  auto length = util::utf8_scalar_count(description);
  if (!length || *length > domain::kMaxDescriptionLength) {
    reject("create", id_gen_.peek(), EscrowError::InvalidArgument);
    return EscrowError::InvalidArgument;
  }

  domain::AgreementId id = id_gen_.peek();
  if (agreements_.count(id) != 0) {
    reject("create", id, EscrowError::AlreadyExists);
    return EscrowError::AlreadyExists;
  }

  domain::Agreement agreement;
  agreement.id = id;
  agreement.vendor = ctx.caller;
  agreement.buyer = buyer;
  agreement.amount = amount;
  agreement.description = description;
  agreement.status = domain::AgreementStatus::Pending;
  agreement.created_at = clock_.now_ms();

  agreements_.emplace(id, agreement);
  id_gen_.commit();

  AgreementUpdateEvent update;
  update.agreement = agreement;
  update.previous_status = domain::AgreementStatus::Pending;
  update.operation = "create";
  update.caller = ctx.caller;
  update.timestamp_ms = agreement.created_at;
  bus_.publish(update);

  return id;
}

Result<bool> EscrowEngine::fund_agreement(const domain::CallContext& ctx,
                                          domain::AgreementId id) {
  return applyTransition(ctx, id, Operation::Fund);
}

Result<bool> EscrowEngine::accept_agreement(const domain::CallContext& ctx,
                                            domain::AgreementId id) {
  return applyTransition(ctx, id, Operation::Accept);
}

Result<bool> EscrowEngine::complete_agreement(const domain::CallContext& ctx,
                                              domain::AgreementId id) {
  return applyTransition(ctx, id, Operation::Complete);
}

Result<bool> EscrowEngine::dispute_agreement(const domain::CallContext& ctx,
                                             domain::AgreementId id) {
  return applyTransition(ctx, id, Operation::Dispute);
}

Result<bool> EscrowEngine::refund_agreement(const domain::CallContext& ctx,
                                            domain::AgreementId id) {
  return applyTransition(ctx, id, Operation::Refund);
}

// -----------------------------------------------------------------------------
// applyTransition: existence → role → status → transfer → commit
// -----------------------------------------------------------------------------
Result<bool> EscrowEngine::applyTransition(const domain::CallContext& ctx,
                                           domain::AgreementId id,
                                           Operation op) {
  const TransitionRule& rule = rule_for(op);
  const char* op_name = to_string(op);

  // --- 1. Existence ---------------------------------------------------------
  auto it = agreements_.find(id);
  if (it == agreements_.end()) {
    reject(op_name, id, EscrowError::NotFound);
    return EscrowError::NotFound;
  }
  domain::Agreement& agreement = it->second;

  // --- 2. Authorization -----------------------------------------------------
  if (!isAuthorized(rule.role, agreement, ctx.caller)) {
    reject(op_name, id, EscrowError::NotAuthorized);
    return EscrowError::NotAuthorized;
  }

  // --- 3. Status ------------------------------------------------------------
  if (agreement.status != rule.required) {
    reject(op_name, id, EscrowError::InvalidStatus);
    return EscrowError::InvalidStatus;
  }

  // --- 4. Transfer ----------------------------------------------------------
  // Resolve the leg for this row. Releases pay out the recorded escrow
  // balance rather than re-reading the agreement amount.
  domain::Identity from;
  domain::Identity to;
  domain::Amount amount = 0;

  switch (rule.flow) {
    case FundFlow::None:
      break;

    case FundFlow::BuyerToCustody:
      from = agreement.buyer;
      to = settings_.custody_identity;
      amount = agreement.amount;
      break;

    case FundFlow::CustodyToVendor:
    case FundFlow::CustodyToBuyer: {
      auto balance_it = escrow_balances_.find(id);
      if (balance_it == escrow_balances_.end()) {
        // Status says custody is held but there is no record of it.
        std::cerr << "[EscrowEngine] ERROR: agreement_id=" << id
                  << " is " << domain::to_string(agreement.status)
                  << " but has no escrow balance.\n";
        reject(op_name, id, EscrowError::NotFound);
        return EscrowError::NotFound;
      }
      from = settings_.custody_identity;
      to = rule.flow == FundFlow::CustodyToVendor ? agreement.vendor
                                                  : agreement.buyer;
      amount = balance_it->second.balance;
      break;
    }
  }

  if (rule.flow != FundFlow::None) {
    Result<domain::Amount> moved = ledger_.transfer(from, to, amount);
    if (!moved.ok()) {
      reject(op_name, id, moved.error());
      return moved.error();
    }
  }

  // --- 5. Commit ------------------------------------------------------------
  const domain::AgreementStatus previous = agreement.status;
  agreement.status = rule.next;

  if (rule.flow == FundFlow::BuyerToCustody) {
    escrow_balances_[id] = domain::EscrowBalance{id, amount};
  } else if (rule.flow != FundFlow::None) {
    escrow_balances_.erase(id);
  }

  const std::int64_t now = clock_.now_ms();

  if (rule.flow != FundFlow::None) {
    FundsTransferredEvent transferred;
    transferred.agreement_id = id;
    transferred.from = from;
    transferred.to = to;
    transferred.amount = amount;
    transferred.timestamp_ms = now;
    bus_.publish(transferred);
  }

  AgreementUpdateEvent update;
  update.agreement = agreement;
  update.previous_status = previous;
  update.operation = op_name;
  update.caller = ctx.caller;
  update.timestamp_ms = now;
  bus_.publish(update);

  return true;
}

// -----------------------------------------------------------------------------
// isAuthorized: match caller against the row's role
// -----------------------------------------------------------------------------
bool EscrowEngine::isAuthorized(Role role, const domain::Agreement& agreement,
                                const domain::Identity& caller) const {
  switch (role) {
    case Role::Buyer:
      return caller == agreement.buyer;
    case Role::Arbiter:
      return caller == settings_.arbiter;
  }
  return false;
}

void EscrowEngine::reject(const char* operation, domain::AgreementId id,
                          EscrowError error) const {
  std::cerr << "[EscrowEngine] WARNING: " << operation
            << " rejected for agreement_id=" << id << ": "
            << to_string(error) << "\n";
}

// -----------------------------------------------------------------------------
// Read accessors
// -----------------------------------------------------------------------------
std::optional<domain::Agreement> EscrowEngine::get_agreement(
    domain::AgreementId id) const {
  auto it = agreements_.find(id);
  if (it == agreements_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<domain::EscrowBalance> EscrowEngine::get_escrow_balance(
    domain::AgreementId id) const {
  auto it = escrow_balances_.find(id);
  if (it == escrow_balances_.end()) {
    return std::nullopt;
  }
  return it->second;
}

// -----------------------------------------------------------------------------
// hydrateAgreement: warm-up injection, sequence untouched
// -----------------------------------------------------------------------------
void EscrowEngine::hydrateAgreement(const domain::Agreement& agreement) {
  agreements_[agreement.id] = agreement;

  if (holds_escrow(agreement.status)) {
    escrow_balances_[agreement.id] =
        domain::EscrowBalance{agreement.id, agreement.amount};
  } else {
    escrow_balances_.erase(agreement.id);
  }
}

domain::AgreementId EscrowEngine::next_agreement_id() const {
  return id_gen_.peek();
}

std::size_t EscrowEngine::agreement_count() const {
  return agreements_.size();
}

std::size_t EscrowEngine::escrow_count() const {
  return escrow_balances_.size();
}

const domain::Identity& EscrowEngine::arbiter() const {
  return settings_.arbiter;
}

const domain::Identity& EscrowEngine::custody_identity() const {
  return settings_.custody_identity;
}

}  // namespace escrow
