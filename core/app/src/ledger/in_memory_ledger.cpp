#include "escrow/ledger/in_memory_ledger.hpp"

#include <mutex>

namespace escrow {

// -----------------------------------------------------------------------------
// credit(): seed a balance
// -----------------------------------------------------------------------------
void InMemoryLedger::credit(const domain::Identity& who,
                            domain::Amount amount) {
  if (amount == 0) {
    return;
  }
  std::unique_lock lock(balances_mutex_);
  balances_[who] += amount;
}

// -----------------------------------------------------------------------------
// transfer(): all-or-nothing move between two balances
// -----------------------------------------------------------------------------
Result<domain::Amount> InMemoryLedger::transfer(const domain::Identity& from,
                                                const domain::Identity& to,
                                                domain::Amount amount) {
  std::unique_lock lock(balances_mutex_);

  auto from_it = balances_.find(from);
  domain::Amount available = from_it == balances_.end() ? 0 : from_it->second;
  if (available < amount) {
    return EscrowError::InsufficientFunds;
  }

  if (amount == 0 || from == to) {
    return amount;
  }

  // from_it is valid here: available >= amount > 0 means `from` has an entry.
  from_it->second -= amount;
  if (from_it->second == 0) {
    balances_.erase(from_it);
  }
  balances_[to] += amount;

  return amount;
}

// -----------------------------------------------------------------------------
// balance_of()
// -----------------------------------------------------------------------------
domain::Amount InMemoryLedger::balance_of(const domain::Identity& who) const {
  std::shared_lock lock(balances_mutex_);
  auto it = balances_.find(who);
  return it == balances_.end() ? 0 : it->second;
}

// -----------------------------------------------------------------------------
// total_supply()
// -----------------------------------------------------------------------------
domain::Amount InMemoryLedger::total_supply() const {
  std::shared_lock lock(balances_mutex_);
  domain::Amount total = 0;
  for (const auto& [who, amount] : balances_) {
    total += amount;
  }
  return total;
}

std::map<domain::Identity, domain::Amount> InMemoryLedger::snapshot() const {
  std::shared_lock lock(balances_mutex_);
  return balances_;
}

}  // namespace escrow
