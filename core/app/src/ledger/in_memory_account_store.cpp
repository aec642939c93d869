#include "backtest/ledger/in_memory_account_store.hpp"

#include <cmath>

namespace backtest {

const char* to_string(LedgerStatus status) {
  switch (status) {
    case LedgerStatus::Ok:
      return "Ok";
    case LedgerStatus::NotFound:
      return "NotFound";
    case LedgerStatus::InsufficientFunds:
      return "InsufficientFunds";
    case LedgerStatus::InvalidAmount:
      return "InvalidAmount";
  }
  return "Unknown";
}

InMemoryAccountStore::Entry* InMemoryAccountStore::find(
    domain::AccountId id) const {
  auto it = accounts_.find(id);
  return (it != accounts_.end()) ? it->second.get() : nullptr;
}

std::optional<domain::Account> InMemoryAccountStore::get(
    domain::AccountId id) const {
  std::shared_lock map_lock(accounts_mutex_);
  const Entry* entry = find(id);
  if (entry == nullptr) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock(entry->mutex);
  return entry->account;
}

// -----------------------------------------------------------------------------
// reserve: check-and-debit under the account's mutex
// -----------------------------------------------------------------------------
LedgerStatus InMemoryAccountStore::reserve(domain::AccountId id,
                                           double amount) {
  if (!std::isfinite(amount) || amount < 0.0) {
    return LedgerStatus::InvalidAmount;
  }

  std::shared_lock map_lock(accounts_mutex_);
  Entry* entry = find(id);
  if (entry == nullptr) {
    return LedgerStatus::NotFound;
  }

  std::lock_guard<std::mutex> lock(entry->mutex);
  if (amount > entry->account.cash) {
    return LedgerStatus::InsufficientFunds;
  }
  entry->account.cash -= amount;
  return LedgerStatus::Ok;
}

LedgerStatus InMemoryAccountStore::release(domain::AccountId id,
                                           double amount) {
  if (!std::isfinite(amount) || amount < 0.0) {
    return LedgerStatus::InvalidAmount;
  }

  std::shared_lock map_lock(accounts_mutex_);
  Entry* entry = find(id);
  if (entry == nullptr) {
    return LedgerStatus::NotFound;
  }

  std::lock_guard<std::mutex> lock(entry->mutex);
  entry->account.cash += amount;
  return LedgerStatus::Ok;
}

LedgerStatus InMemoryAccountStore::applyPnl(domain::AccountId id,
                                            double delta) {
  if (!std::isfinite(delta)) {
    return LedgerStatus::InvalidAmount;
  }

  std::shared_lock map_lock(accounts_mutex_);
  Entry* entry = find(id);
  if (entry == nullptr) {
    return LedgerStatus::NotFound;
  }

  std::lock_guard<std::mutex> lock(entry->mutex);
  if (entry->account.cash + delta < 0.0) {
    return LedgerStatus::InsufficientFunds;
  }
  entry->account.cash += delta;
  return LedgerStatus::Ok;
}

bool InMemoryAccountStore::add(const domain::Account& account) {
  if (!std::isfinite(account.cash) || account.cash < 0.0) {
    return false;
  }

  std::unique_lock map_lock(accounts_mutex_);
  if (accounts_.count(account.id) != 0) {
    return false;
  }
  auto entry = std::make_unique<Entry>();
  entry->account = account;
  accounts_.emplace(account.id, std::move(entry));
  return true;
}

}  // namespace backtest
