#include "backtest/strategy/moving_average_crossover_strategy.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace backtest {

MovingAverageCrossoverStrategy::MovingAverageCrossoverStrategy(
    MovingAverageCrossoverParams params)
    : params_(std::move(params)) {
  if (params_.short_period <= 0) {
    throw std::invalid_argument("shortPeriod must be positive");
  }
  if (params_.long_period <= params_.short_period) {
    throw std::invalid_argument("longPeriod must be greater than shortPeriod");
  }
  if (params_.position_size <= 0) {
    throw std::invalid_argument("positionSize must be positive");
  }
}

std::string MovingAverageCrossoverStrategy::name() const {
  return "MA" + std::to_string(params_.short_period) + "/" +
         std::to_string(params_.long_period) + " crossover";
}

void MovingAverageCrossoverStrategy::reset() {
  last_evaluated_.clear();
}

double MovingAverageCrossoverStrategy::simpleMovingAverage(
    const std::vector<domain::Bar>& bars, std::size_t end, int period) {
  double sum = 0.0;
  for (std::size_t i = end - static_cast<std::size_t>(period); i < end; ++i) {
    sum += bars[i].close;
  }
  return sum / static_cast<double>(period);
}

// -----------------------------------------------------------------------------
// signals: one crossover check per symbol per new bar
// -----------------------------------------------------------------------------
std::vector<OrderIntent> MovingAverageCrossoverStrategy::signals(
    const MarketSnapshot& snapshot,
    const std::vector<domain::Position>& open_positions) {
  std::vector<OrderIntent> intents;

  const Timestamp lookback_start =
      add_days(snapshot.as_of, -2 * static_cast<std::int64_t>(params_.long_period));
  const std::size_t required = static_cast<std::size_t>(params_.long_period) + 1;

  for (const auto& symbol : params_.symbols) {
    const std::vector<domain::Bar> bars =
        snapshot.market.history(symbol, lookback_start, snapshot.as_of);
    if (bars.size() < required) {
      continue;
    }

    const Timestamp newest = bars.back().timestamp;
    auto seen = last_evaluated_.find(symbol);
    if (seen != last_evaluated_.end() && seen->second >= newest) {
      continue;
    }
    last_evaluated_[symbol] = newest;

    const std::size_t n = bars.size();
    const double short_ma = simpleMovingAverage(bars, n, params_.short_period);
    const double long_ma = simpleMovingAverage(bars, n, params_.long_period);
    const double prev_short =
        simpleMovingAverage(bars, n - 1, params_.short_period);
    const double prev_long =
        simpleMovingAverage(bars, n - 1, params_.long_period);

    const bool bullish = prev_short <= prev_long && short_ma > long_ma;
    const bool bearish = prev_short >= prev_long && short_ma < long_ma;

    const bool holding = std::any_of(
        open_positions.begin(), open_positions.end(),
        [&symbol](const domain::Position& p) { return p.symbol == symbol; });

    const std::string tag = "MA" + std::to_string(params_.short_period);
    const std::string against = "MA" + std::to_string(params_.long_period);

    if (bullish && !holding) {
      OrderIntent intent;
      intent.symbol = symbol;
      intent.side = domain::Side::Buy;
      intent.quantity = params_.position_size;
      intent.stop_loss = params_.stop_loss;
      intent.reference_price = bars.back().close;
      intent.reason = tag + " crossed above " + against;
      intents.push_back(std::move(intent));
    } else if (bearish && holding) {
      OrderIntent intent;
      intent.symbol = symbol;
      intent.side = domain::Side::Sell;
      intent.quantity = params_.position_size;
      intent.reference_price = bars.back().close;
      intent.reason = tag + " crossed below " + against;
      intents.push_back(std::move(intent));
    }
  }

  return intents;
}

}  // namespace backtest
