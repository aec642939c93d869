#pragma once

#include "backtest/domain/error.hpp"
#include "backtest/domain/order.hpp"
#include "backtest/domain/position.hpp"
#include "backtest/time/time_utils.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace backtest {
namespace domain {

// -----------------------------------------------------------------------------
// TradeRecord
// -----------------------------------------------------------------------------
// One successful fill, appended to the run's trade log in execution order.
// `exit_reason` and `realized_pl` are set for sells only. Never modified once
// appended.
// -----------------------------------------------------------------------------
struct TradeRecord {
  Timestamp timestamp{};
  std::string symbol;
  Side side{Side::Buy};
  std::int64_t quantity{0};
  double price{0.0};
  double commission{0.0};
  PositionId position_id{};
  std::optional<std::string> exit_reason;
  std::optional<double> realized_pl;
};

// -----------------------------------------------------------------------------
// RejectedOrder
// -----------------------------------------------------------------------------
// An intent or stop exit the coordinator refused. Recorded so a run's report
// shows what the strategy wanted but could not do.
// -----------------------------------------------------------------------------
struct RejectedOrder {
  Timestamp timestamp{};
  std::string symbol;
  Side side{Side::Buy};
  std::int64_t quantity{0};
  ErrorKind error{ErrorKind::None};
  std::string message;
};

// -----------------------------------------------------------------------------
// DailySnapshot
// -----------------------------------------------------------------------------
// End-of-day mark-to-market of the account:
//   total_equity = cash + positions_value
// One per simulated day, strictly increasing by date.
// -----------------------------------------------------------------------------
struct DailySnapshot {
  Timestamp date{};
  double cash{0.0};
  double positions_value{0.0};
  double total_equity{0.0};
  std::int64_t open_positions{0};
};

}  // namespace domain
}  // namespace backtest
