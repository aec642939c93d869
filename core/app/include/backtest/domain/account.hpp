#pragma once

#include <cstdint>
#include <string>

namespace backtest {
namespace domain {

using AccountId = std::int64_t;

// -----------------------------------------------------------------------------
// Account
// -----------------------------------------------------------------------------
//
// @brief  Cash state of one trading account.
//
// @details
// `cash` is the available balance. Reserving funds for a buy removes them
// from `cash` immediately, so there is no separate "reserved" field: an
// amount is either available or already committed to an open position.
// `cash` never goes negative; the account store refuses any operation that
// would make it so.
//
// `initial_capital` is informational for the core (the risk validator sizes
// its position cap from it); it is not updated by trading.
//
// Value type. The authoritative copy lives in the account store; get()
// returns a snapshot.
// -----------------------------------------------------------------------------
struct Account {
  AccountId id{};
  std::string name;
  double initial_capital{0.0};
  double cash{0.0};
  bool active{true};
};

}  // namespace domain
}  // namespace backtest
