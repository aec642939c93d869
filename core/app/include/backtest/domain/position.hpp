#pragma once

#include "backtest/domain/account.hpp"
#include "backtest/domain/stop_loss.hpp"
#include "backtest/time/time_utils.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace backtest {
namespace domain {

// -----------------------------------------------------------------------------
// PositionId
// -----------------------------------------------------------------------------
// Unique, stable identifier assigned by the position store when a position
// is opened (or carved out by a partial sell). Starts at 1; 0 means "unset".
// -----------------------------------------------------------------------------
using PositionId = std::uint64_t;

enum class PositionStatus {
  Open,
  Closed,
};

// -----------------------------------------------------------------------------
// PositionExit
// -----------------------------------------------------------------------------
// Exit economics, present only once a position is Closed.
//   realized_pl = (exit_price - entry_price) * quantity  (before commission)
// -----------------------------------------------------------------------------
struct PositionExit {
  Timestamp time{};
  double price{0.0};
  std::string reason;
  double realized_pl{0.0};
};

// -----------------------------------------------------------------------------
// Position: one long lot of a symbol
// -----------------------------------------------------------------------------
//
// @brief  Entry economics of a holding plus, once closed, its exit.
//
// @details
// Lifecycle: Open -> Closed, never back. The position store is the only
// writer; it performs the transition atomically and never touches a Closed
// record again, so a Closed Position is effectively immutable.
//
// Invariants:
//   quantity > 0
//   status == Closed  <=>  exit.has_value()
//
// Each buy opens its own lot; lots for the same symbol are not netted.
// -----------------------------------------------------------------------------
struct Position {
  PositionId id{};
  AccountId account_id{};
  std::string symbol;
  Timestamp entry_time{};
  double entry_price{0.0};
  std::int64_t quantity{0};
  StopLoss stop_loss{NoStopLoss{}};
  PositionStatus status{PositionStatus::Open};
  std::optional<PositionExit> exit;

  bool isOpen() const { return status == PositionStatus::Open; }
};

}  // namespace domain
}  // namespace backtest
