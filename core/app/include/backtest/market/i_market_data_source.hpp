#pragma once

#include "backtest/domain/bar.hpp"
#include "backtest/time/time_utils.hpp"

#include <string>
#include <vector>

namespace backtest {

// -----------------------------------------------------------------------------
// IMarketDataSource - temporal-aware market data contract
// -----------------------------------------------------------------------------
//
// @brief  Read-only view of bar data bounded by a current time.
//
// @details
// Every component that needs prices (strategy, coordinator, runner) reads
// them through this interface and nothing else. Implementations must never
// hand out a bar whose timestamp is later than currentTime():
//
//   priceAt(symbol, as_of)   as_of > currentTime()  -> domain::TemporalViolation
//   history(symbol, s, e)    e is clamped to currentTime()
//   isAvailable(symbol, t)   t > currentTime()      -> false
//
// A backtest implementation reads currentTime() from a SimulationTimeProvider
// that the runner advances; a live implementation reads the wall clock.
// Consumers cannot tell the difference.
// -----------------------------------------------------------------------------
class IMarketDataSource {
 public:
  virtual ~IMarketDataSource() = default;

  virtual Timestamp currentTime() const = 0;

  // -------------------------------------------------------------------------
  // priceAt(symbol, as_of)
  // -------------------------------------------------------------------------
  // @return The latest bar for `symbol` dated at or before `as_of`.
  //
  // @throws domain::TemporalViolation if as_of > currentTime().
  // @throws domain::DataNotFound if the symbol is unknown or has no bar at or
  //         before as_of.
  // -------------------------------------------------------------------------
  virtual domain::Bar priceAt(const std::string& symbol,
                              Timestamp as_of) const = 0;

  // -------------------------------------------------------------------------
  // history(symbol, start, end)
  // -------------------------------------------------------------------------
  // @return Bars with start <= timestamp <= min(end, currentTime()),
  //         ascending by timestamp. Empty for an unknown symbol. Never
  //         throws for a future `end`.
  // -------------------------------------------------------------------------
  virtual std::vector<domain::Bar> history(const std::string& symbol,
                                           Timestamp start,
                                           Timestamp end) const = 0;

  // True iff priceAt(symbol, as_of) would succeed.
  virtual bool isAvailable(const std::string& symbol,
                           Timestamp as_of) const = 0;
};

}  // namespace backtest
