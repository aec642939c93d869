#pragma once

#include "backtest/domain/trade_record.hpp"

#include <cstdint>
#include <vector>

namespace backtest {

struct PerformanceMetrics {
  double final_equity{0.0};
  double total_return{0.0};
  double max_drawdown{0.0};
  double sharpe_ratio{0.0};
  double win_rate{0.0};
  std::int64_t total_trades{0};
};

// Trading days per year used to annualize the Sharpe ratio.
inline constexpr double kTradingDaysPerYear = 252.0;

// -----------------------------------------------------------------------------
// computeMetrics(initial_capital, snapshots, trades)
// -----------------------------------------------------------------------------
//
// @brief  Reduces an equity curve and a trade log to summary statistics.
//
// @details
//   final_equity  last snapshot's total_equity, or initial_capital when
//                 there are no snapshots.
//   total_return  (final_equity - initial_capital) / initial_capital.
//   max_drawdown  max over t of (peak_t - equity_t) / peak_t, where the
//                 running peak starts at initial_capital. A fraction in
//                 [0, 1]; 0 for a curve that never dips below its peak.
//   sharpe_ratio  mean(r) / stdev(r) * sqrt(252) over the daily returns
//                 r_i = equity_i / equity_{i-1} - 1 of consecutive
//                 snapshots, population stdev. 0 with fewer than two
//                 snapshots or zero stdev. No risk-free rate.
//   total_trades  number of closed trades (sell records).
//   win_rate      closed trades with realized_pl > 0 / total_trades; 0 when
//                 there are none.
//
// Pure function. initial_capital must be positive.
// -----------------------------------------------------------------------------
PerformanceMetrics computeMetrics(
    double initial_capital,
    const std::vector<domain::DailySnapshot>& snapshots,
    const std::vector<domain::TradeRecord>& trades);

}  // namespace backtest
