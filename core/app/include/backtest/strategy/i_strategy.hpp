#pragma once

#include "backtest/domain/order.hpp"
#include "backtest/domain/position.hpp"
#include "backtest/domain/stop_loss.hpp"
#include "backtest/market/i_market_data_source.hpp"
#include "backtest/time/time_utils.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace backtest {

// -----------------------------------------------------------------------------
// MarketSnapshot
// -----------------------------------------------------------------------------
// What a strategy may look at on one simulated day: the current time and a
// read-only handle to the oracle. Anything the oracle will not serve (bars
// after `as_of`) the strategy cannot see either.
// -----------------------------------------------------------------------------
struct MarketSnapshot {
  Timestamp as_of;
  const IMarketDataSource& market;
};

// -----------------------------------------------------------------------------
// OrderIntent
// -----------------------------------------------------------------------------
// A strategy's request to trade. The runner stamps it with the account and
// the current time and hands it to the coordinator; it is not an order until
// then. `reference_price` is the close the strategy decided on.
// -----------------------------------------------------------------------------
struct OrderIntent {
  std::string symbol;
  domain::Side side{domain::Side::Buy};
  std::int64_t quantity{0};
  domain::StopLoss stop_loss{domain::NoStopLoss{}};
  std::optional<double> reference_price;
  std::string reason;
};

// -----------------------------------------------------------------------------
// IStrategy - pluggable trading decision logic
// -----------------------------------------------------------------------------
//
// @brief  Called once per simulated day with the market view and the
//         account's open positions; returns the trades it wants, in the
//         order they should be attempted.
//
// @details
// signals() is non-const: a strategy may keep state between days (the
// crossover strategy remembers the last bar it evaluated per symbol). A
// strategy instance therefore belongs to one run at a time.
//
// Implementations must be deterministic functions of their inputs and their
// own prior state. They must not read the wall clock or any data source
// other than snapshot.market.
// -----------------------------------------------------------------------------
class IStrategy {
 public:
  virtual ~IStrategy() = default;

  virtual std::string name() const = 0;

  virtual std::vector<OrderIntent> signals(
      const MarketSnapshot& snapshot,
      const std::vector<domain::Position>& open_positions) = 0;

  // Clears per-run state so the instance can drive another run.
  virtual void reset() {}
};

}  // namespace backtest
