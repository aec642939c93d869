#pragma once

#include "backtest/domain/account.hpp"
#include "backtest/domain/trade_record.hpp"
#include "backtest/time/time_utils.hpp"

#include <cstdint>
#include <vector>

namespace backtest {
namespace domain {

// -----------------------------------------------------------------------------
// BacktestResult
// -----------------------------------------------------------------------------
//
// @brief  Everything a finished (or cancelled) run reports.
//
// @details
// Summary statistics are computed by computeMetrics() from `daily_snapshots`
// and `trades` after the last simulated day. `total_trades` counts closed
// round trips (sell fills), not individual fills.
//
// If `cancelled` is true the run stopped at a day boundary; every snapshot
// present belongs to a fully processed day.
// -----------------------------------------------------------------------------
struct BacktestResult {
  AccountId account_id{};
  Timestamp start_date{};
  Timestamp end_date{};
  double initial_capital{0.0};
  double final_equity{0.0};
  double total_return{0.0};
  double max_drawdown{0.0};
  double sharpe_ratio{0.0};
  double win_rate{0.0};
  std::int64_t total_trades{0};
  std::vector<TradeRecord> trades;
  std::vector<DailySnapshot> daily_snapshots;
  std::vector<RejectedOrder> rejected_orders;
  bool cancelled{false};
};

}  // namespace domain
}  // namespace backtest
