#pragma once

#include "backtest/strategy/i_strategy.hpp"
#include "backtest/strategy/moving_average_crossover_strategy.hpp"

#include <memory>
#include <string>
#include <variant>

namespace backtest {

// -----------------------------------------------------------------------------
// StrategyParams
// -----------------------------------------------------------------------------
// One alternative per concrete strategy. The request parser produces one of
// these from "strategyType"; makeStrategy() turns it into an instance.
// -----------------------------------------------------------------------------
using StrategyParams = std::variant<MovingAverageCrossoverParams>;

// "strategyType" value for each alternative.
inline constexpr const char* kMovingAverageCrossoverType = "ma_crossover";

std::string strategyType(const StrategyParams& params);

// @throws std::invalid_argument if the parameters are rejected by the
//         strategy's constructor.
std::unique_ptr<IStrategy> makeStrategy(const StrategyParams& params);

}  // namespace backtest
