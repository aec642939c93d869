#pragma once

#include "backtest/domain/account.hpp"

#include <memory>
#include <mutex>
#include <unordered_map>

namespace backtest {

// -----------------------------------------------------------------------------
// AccountLockTable - one mutex per account id
// -----------------------------------------------------------------------------
//
// @brief  Serializes multi-step transitions against the same account.
//
// @details
// The coordinator's order flow (read account, reserve, open position) spans
// several store calls. Each call is atomic by itself, but the sequence is
// not. acquire(id) returns a lock that the coordinator holds for the whole
// order, so two orders against one account run one after the other while
// orders against different accounts still run in parallel.
//
// Mutexes are created on first use and never removed. The table's own mutex
// is held only while looking up (or inserting) the per-account mutex, never
// while the caller holds the returned lock.
// -----------------------------------------------------------------------------
class AccountLockTable {
 public:
  AccountLockTable() = default;

  AccountLockTable(const AccountLockTable&) = delete;
  AccountLockTable& operator=(const AccountLockTable&) = delete;

  // Blocks until the account's mutex is held. Release by destroying (or
  // unlocking) the returned lock.
  std::unique_lock<std::mutex> acquire(domain::AccountId id);

 private:
  std::mutex table_mutex_;
  std::unordered_map<domain::AccountId, std::unique_ptr<std::mutex>> locks_;
};

}  // namespace backtest
