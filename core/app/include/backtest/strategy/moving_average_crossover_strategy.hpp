#pragma once

#include "backtest/domain/bar.hpp"
#include "backtest/domain/stop_loss.hpp"
#include "backtest/strategy/i_strategy.hpp"
#include "backtest/time/time_utils.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace backtest {

// Parameters of MovingAverageCrossoverStrategy. Defaults match the JSON
// request defaults (shortPeriod 20, longPeriod 50, positionSize 100).
struct MovingAverageCrossoverParams {
  std::vector<std::string> symbols;
  int short_period{20};
  int long_period{50};
  std::int64_t position_size{100};
  domain::StopLoss stop_loss{domain::NoStopLoss{}};
};

// -----------------------------------------------------------------------------
// MovingAverageCrossoverStrategy
// -----------------------------------------------------------------------------
//
// @brief  Buys when the short simple moving average of closes crosses above
//         the long one, sells when it crosses back below.
//
// @details
// Per symbol, per day:
//
//   1. Fetch history over the last 2 * long_period calendar days up to now.
//      Fewer than long_period + 1 bars: skip (not enough data to compare
//      today with yesterday).
//   2. If the newest bar is the one already evaluated on a previous day
//      (weekend, holiday), skip. Each bar is acted on at most once.
//   3. short/long = SMA over the last short_period/long_period closes;
//      prev_short/prev_long = the same, excluding the newest bar.
//   4. prev_short <= prev_long && short > long, no open position in the
//      symbol  -> Buy position_size with the configured stop-loss.
//      prev_short >= prev_long && short < long, an open position exists
//      -> Sell position_size.
//
// Symbols the oracle has no data for are skipped without error.
//
// Thread model: Not thread-safe. One instance drives one run.
// -----------------------------------------------------------------------------
class MovingAverageCrossoverStrategy final : public IStrategy {
 public:
  // @throws std::invalid_argument if short_period <= 0,
  //         long_period <= short_period or position_size <= 0.
  explicit MovingAverageCrossoverStrategy(MovingAverageCrossoverParams params);

  std::string name() const override;

  std::vector<OrderIntent> signals(
      const MarketSnapshot& snapshot,
      const std::vector<domain::Position>& open_positions) override;

  void reset() override;

  const MovingAverageCrossoverParams& params() const { return params_; }

 private:
  // Mean close of the `period` bars ending just before `end` (exclusive).
  static double simpleMovingAverage(const std::vector<domain::Bar>& bars,
                                    std::size_t end,
                                    int period);

  const MovingAverageCrossoverParams params_;

  // Newest bar timestamp already evaluated, per symbol.
  std::map<std::string, Timestamp> last_evaluated_;
};

}  // namespace backtest
