#include "backtest/metrics/metrics.hpp"

#include <algorithm>
#include <cmath>

namespace backtest {

namespace {

double maxDrawdown(double initial_capital,
                   const std::vector<domain::DailySnapshot>& snapshots) {
  double peak = initial_capital;
  double worst = 0.0;
  for (const auto& snap : snapshots) {
    peak = std::max(peak, snap.total_equity);
    if (peak > 0.0) {
      worst = std::max(worst, (peak - snap.total_equity) / peak);
    }
  }
  return worst;
}

double sharpeRatio(const std::vector<domain::DailySnapshot>& snapshots) {
  if (snapshots.size() < 2) {
    return 0.0;
  }

  std::vector<double> returns;
  returns.reserve(snapshots.size() - 1);
  for (std::size_t i = 1; i < snapshots.size(); ++i) {
    const double prev = snapshots[i - 1].total_equity;
    if (prev == 0.0) {
      continue;
    }
    returns.push_back(snapshots[i].total_equity / prev - 1.0);
  }
  if (returns.empty()) {
    return 0.0;
  }

  double mean = 0.0;
  for (double r : returns) {
    mean += r;
  }
  mean /= static_cast<double>(returns.size());

  double variance = 0.0;
  for (double r : returns) {
    variance += (r - mean) * (r - mean);
  }
  variance /= static_cast<double>(returns.size());

  const double stdev = std::sqrt(variance);
  if (stdev == 0.0) {
    return 0.0;
  }
  return mean / stdev * std::sqrt(kTradingDaysPerYear);
}

}  // namespace

PerformanceMetrics computeMetrics(
    double initial_capital,
    const std::vector<domain::DailySnapshot>& snapshots,
    const std::vector<domain::TradeRecord>& trades) {
  PerformanceMetrics m;

  m.final_equity =
      snapshots.empty() ? initial_capital : snapshots.back().total_equity;
  m.total_return = (initial_capital != 0.0)
                       ? (m.final_equity - initial_capital) / initial_capital
                       : 0.0;
  m.max_drawdown = maxDrawdown(initial_capital, snapshots);
  m.sharpe_ratio = sharpeRatio(snapshots);

  std::int64_t wins = 0;
  for (const auto& trade : trades) {
    if (trade.side != domain::Side::Sell) {
      continue;
    }
    ++m.total_trades;
    if (trade.realized_pl.value_or(0.0) > 0.0) {
      ++wins;
    }
  }
  m.win_rate = (m.total_trades > 0)
                   ? static_cast<double>(wins) /
                         static_cast<double>(m.total_trades)
                   : 0.0;
  return m;
}

}  // namespace backtest
