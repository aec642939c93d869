#pragma once

#include "backtest/domain/account.hpp"
#include "backtest/ledger/i_account_store.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>

namespace backtest {

// -----------------------------------------------------------------------------
// InMemoryAccountStore
// -----------------------------------------------------------------------------
//
// @brief  Reference IAccountStore backed by a hash map.
//
// @details
// Two levels of locking:
//
//   1. accounts_mutex_ (shared_mutex) guards the map's structure. add()
//      takes it exclusively; every other operation takes it shared, so
//      lookups for different accounts never block one another.
//
//   2. Each Entry carries its own std::mutex that guards the Account value.
//      Mutations on one account serialize on that mutex while operations on
//      other accounts proceed in parallel.
//
// Entries are held by unique_ptr so their address (and mutex) stays stable
// across rehashes.
//
// Thread model: Every public method is safe to call from any thread.
// -----------------------------------------------------------------------------
class InMemoryAccountStore final : public IAccountStore {
 public:
  InMemoryAccountStore() = default;

  InMemoryAccountStore(const InMemoryAccountStore&) = delete;
  InMemoryAccountStore& operator=(const InMemoryAccountStore&) = delete;

  std::optional<domain::Account> get(domain::AccountId id) const override;
  LedgerStatus reserve(domain::AccountId id, double amount) override;
  LedgerStatus release(domain::AccountId id, double amount) override;
  LedgerStatus applyPnl(domain::AccountId id, double delta) override;
  bool add(const domain::Account& account) override;

 private:
  struct Entry {
    mutable std::mutex mutex;
    domain::Account account;
  };

  // Caller holds accounts_mutex_ (shared or exclusive).
  Entry* find(domain::AccountId id) const;

  mutable std::shared_mutex accounts_mutex_;
  std::unordered_map<domain::AccountId, std::unique_ptr<Entry>> accounts_;
};

}  // namespace backtest
