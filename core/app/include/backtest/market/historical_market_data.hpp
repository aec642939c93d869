#pragma once

#include "backtest/domain/bar.hpp"
#include "backtest/market/i_market_data_source.hpp"
#include "backtest/time/i_time_provider.hpp"
#include "backtest/time/time_utils.hpp"

#include <cstdint>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace backtest {

// -----------------------------------------------------------------------------
// HistoricalMarketData - in-memory bar oracle for backtests
// -----------------------------------------------------------------------------
//
// @brief  IMarketDataSource over bars loaded up front, with "now" read from
//         an injected ITimeProvider.
//
// @details
// Bars are stored per symbol, sorted ascending by timestamp. Lookups are
// binary searches (std::upper_bound) bounded by the provider's current time,
// so a query can never reach a bar the simulation has not arrived at yet.
//
// The oracle does not own or advance the clock. In a backtest the runner
// advances the SimulationTimeProvider passed here; in tests the fixture does.
//
// Thread model:
//   addBars() takes a unique lock; every query takes a shared lock, so any
//   number of readers may query concurrently. Loading is expected to finish
//   before the run starts.
//
// Ownership:
//   Holds a reference to the time provider, which must outlive the oracle.
// -----------------------------------------------------------------------------
class HistoricalMarketData final : public IMarketDataSource {
 public:
  explicit HistoricalMarketData(const ITimeProvider& time_provider);

  HistoricalMarketData(const HistoricalMarketData&) = delete;
  HistoricalMarketData& operator=(const HistoricalMarketData&) = delete;

  // -------------------------------------------------------------------------
  // addBars(symbol, bars)
  // -------------------------------------------------------------------------
  // @brief  Loads bars for a symbol, merging with any already loaded.
  //
  // @details
  // The input need not be sorted. Each bar's symbol field is overwritten
  // with `symbol`. If two bars share a timestamp the one loaded last wins.
  //
  // Side-effects: Replaces the stored series for `symbol`.
  // -------------------------------------------------------------------------
  void addBars(const std::string& symbol, std::vector<domain::Bar> bars);

  // Symbols with at least one bar, sorted.
  std::vector<std::string> symbols() const;

  Timestamp currentTime() const override;

  domain::Bar priceAt(const std::string& symbol,
                      Timestamp as_of) const override;

  std::vector<domain::Bar> history(const std::string& symbol,
                                   Timestamp start,
                                   Timestamp end) const override;

  bool isAvailable(const std::string& symbol,
                   Timestamp as_of) const override;

 private:
  // Returns the latest bar at or before as_of, or nullptr. Caller holds
  // mutex_ (shared).
  const domain::Bar* latestAtOrBefore(const std::string& symbol,
                                      Timestamp as_of) const;

  const ITimeProvider& time_provider_;

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, std::vector<domain::Bar>> bars_;
};

// -----------------------------------------------------------------------------
// selectLookbackWindow(bars, start, end, lookback_days)
// -----------------------------------------------------------------------------
//
// @brief  Filters a bar series down to what a run over [start, end] can use.
//
// @return Bars with  start - lookback_days <= timestamp <= end, in input
//         order.
//
// @details
// Indicators such as a 50-day moving average need bars from before the
// first simulated day. The loader keeps `lookback_days` calendar days of
// warm-up history ahead of `start` and drops everything after `end`.
// -----------------------------------------------------------------------------
inline constexpr std::int64_t kDefaultLookbackDays = 100;

std::vector<domain::Bar> selectLookbackWindow(
    const std::vector<domain::Bar>& bars,
    Timestamp start,
    Timestamp end,
    std::int64_t lookback_days = kDefaultLookbackDays);

}  // namespace backtest
