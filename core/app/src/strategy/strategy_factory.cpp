#include "backtest/strategy/strategy_factory.hpp"

#include <type_traits>

namespace backtest {

std::string strategyType(const StrategyParams& params) {
  return std::visit(
      [](const auto& p) -> std::string {
        using T = std::decay_t<decltype(p)>;
        static_assert(std::is_same_v<T, MovingAverageCrossoverParams>,
                      "unhandled strategy parameters");
        return kMovingAverageCrossoverType;
      },
      params);
}

std::unique_ptr<IStrategy> makeStrategy(const StrategyParams& params) {
  return std::visit(
      [](const auto& p) -> std::unique_ptr<IStrategy> {
        using T = std::decay_t<decltype(p)>;
        static_assert(std::is_same_v<T, MovingAverageCrossoverParams>,
                      "unhandled strategy parameters");
        return std::make_unique<MovingAverageCrossoverStrategy>(p);
      },
      params);
}

}  // namespace backtest
