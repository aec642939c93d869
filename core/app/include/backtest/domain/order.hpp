#pragma once

#include "backtest/domain/account.hpp"
#include "backtest/domain/error.hpp"
#include "backtest/domain/position.hpp"
#include "backtest/domain/stop_loss.hpp"
#include "backtest/time/time_utils.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace backtest {
namespace domain {

// -----------------------------------------------------------------------------
// Side
// -----------------------------------------------------------------------------
enum class Side {
  Buy,
  Sell,
};

inline const char* to_string(Side side) {
  return side == Side::Buy ? "Buy" : "Sell";
}

// -----------------------------------------------------------------------------
// OrderRequest
// -----------------------------------------------------------------------------
//
// @brief  A request to fill one order against one account, handed to the
//         OrderExecutionCoordinator.
//
// @details
// `timestamp` is the simulated time the order is placed at; the fill price is
// the close of the latest bar at or before it.
//
// Optional fields:
//   stop_loss        Buys only. Copied onto the opened position.
//   reference_price  Quote the caller saw when deciding to trade. The risk
//                    validator's pre-trade estimates use it. When absent the
//                    coordinator quotes the oracle itself.
//   position_id      Sells only. Close this specific lot instead of the
//                    first open lot for the symbol (stop-loss exits use it).
//   reason           Sells only. Recorded as the position's exit reason.
// -----------------------------------------------------------------------------
struct OrderRequest {
  AccountId account_id{};
  std::string symbol;
  Side side{Side::Buy};
  std::int64_t quantity{0};
  Timestamp timestamp{};
  StopLoss stop_loss{NoStopLoss{}};
  std::optional<double> reference_price;
  std::optional<PositionId> position_id;
  std::string reason;
};

// -----------------------------------------------------------------------------
// OrderResult
// -----------------------------------------------------------------------------
//
// @brief  Outcome of OrderExecutionCoordinator::execute().
//
// @details
// On success `position_id` is the opened lot (buy) or the closed lot (sell),
// and realized_pl / net_pl are set for sells:
//   net_pl = realized_pl - commission
// On failure `error` says why, `message` carries the human-readable text,
// and no account or position state was changed.
// -----------------------------------------------------------------------------
struct OrderResult {
  bool success{false};
  ErrorKind error{ErrorKind::None};
  std::string message;
  std::optional<PositionId> position_id;
  double execution_price{0.0};
  double commission{0.0};
  std::optional<double> realized_pl;
  std::optional<double> net_pl;
  Timestamp execution_time{};
};

}  // namespace domain
}  // namespace backtest
