#pragma once

#include "backtest/domain/account.hpp"

#include <optional>

namespace backtest {

// -----------------------------------------------------------------------------
// LedgerStatus
// -----------------------------------------------------------------------------
// Outcome of a cash-mutating ledger operation. On anything but Ok the
// account's cash is unchanged.
// -----------------------------------------------------------------------------
enum class LedgerStatus {
  Ok,
  NotFound,           // Unknown account id
  InsufficientFunds,  // Operation would drive cash below zero
  InvalidAmount,      // Negative or non-finite amount where one is required
};

const char* to_string(LedgerStatus status);

// -----------------------------------------------------------------------------
// IAccountStore - account ledger contract
// -----------------------------------------------------------------------------
//
// @brief  Owns each account's cash balance.
//
// @details
// The core never creates accounts implicitly: get() on an unknown id
// returns std::nullopt and every mutation returns NotFound. Accounts enter
// the store through add(), called by whatever seeds the run (the request
// loader, a persistence adapter, a test fixture).
//
// Each operation is atomic with respect to the account it touches. Callers
// that need a multi-step transition (reserve, then open a position) hold the
// account's lock from AccountLockTable around the whole sequence.
// -----------------------------------------------------------------------------
class IAccountStore {
 public:
  virtual ~IAccountStore() = default;

  // Snapshot of the account, or std::nullopt if unknown.
  virtual std::optional<domain::Account> get(domain::AccountId id) const = 0;

  // -------------------------------------------------------------------------
  // reserve(id, amount)
  // -------------------------------------------------------------------------
  // @brief  Removes `amount` from the account's available cash.
  //
  // @return Ok, NotFound, InsufficientFunds (amount > cash) or InvalidAmount
  //         (amount < 0).
  // -------------------------------------------------------------------------
  virtual LedgerStatus reserve(domain::AccountId id, double amount) = 0;

  // Returns a previously reserved `amount` to available cash.
  virtual LedgerStatus release(domain::AccountId id, double amount) = 0;

  // -------------------------------------------------------------------------
  // applyPnl(id, delta)
  // -------------------------------------------------------------------------
  // @brief  Adds `delta` (either sign) to cash.
  //
  // @return InsufficientFunds if cash + delta would be negative; the balance
  //         is left untouched.
  // -------------------------------------------------------------------------
  virtual LedgerStatus applyPnl(domain::AccountId id, double delta) = 0;

  // Seeds a new account. Returns false on a duplicate id or negative cash.
  virtual bool add(const domain::Account& account) = 0;
};

}  // namespace backtest
