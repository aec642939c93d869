// =============================================================================
// moving_average_crossover_test.cpp
// =============================================================================
// Unit tests for backtest::MovingAverageCrossoverStrategy and the strategy
// factory.
//
// Uses a 2/4 crossover over a hand-built series so every SMA is easy to
// check by hand:
//
//   day     0..5   6    7..10   11
//   close   10     20   20      5
//
//   day 6:  SMA2 15.0 > SMA4 12.5, yesterday 10 == 10   -> bullish cross
//   day 11: SMA2 12.5 < SMA4 16.25, yesterday 20 == 20  -> bearish cross
//
// Validates:
//   - Buy on an upward cross only when flat; sell on a downward cross only
//     when holding
//   - Not enough bars -> no signal
//   - Each bar is evaluated at most once until reset()
//   - Unknown symbols are skipped
//   - Parameter validation and the factory
// =============================================================================

#include "backtest/market/historical_market_data.hpp"
#include "backtest/strategy/moving_average_crossover_strategy.hpp"
#include "backtest/strategy/strategy_factory.hpp"
#include "backtest/time/simulation_time_provider.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using backtest::MarketSnapshot;
using backtest::MovingAverageCrossoverParams;
using backtest::MovingAverageCrossoverStrategy;
using backtest::OrderIntent;
using backtest::domain::Position;
using backtest::domain::Side;
using backtest::test::day;
using backtest::test::dayMs;
using backtest::test::makeSeries;

class MovingAverageCrossoverTest : public ::testing::Test {
 protected:
  void SetUp() override {
    market.addBars("AAPL", makeSeries("AAPL", 0,
                                      {10, 10, 10, 10, 10, 10, 20, 20, 20,
                                       20, 20, 5}));
    params.symbols = {"AAPL"};
    params.short_period = 2;
    params.long_period = 4;
    params.position_size = 100;
    params.stop_loss = backtest::domain::PriceStopLoss{15.0};
  }

  std::vector<OrderIntent> signalsOn(MovingAverageCrossoverStrategy& strategy,
                                     std::int64_t n,
                                     const std::vector<Position>& open = {}) {
    clock.advance_time(dayMs(n));
    return strategy.signals(MarketSnapshot{day(n), market}, open);
  }

  static Position holding(const std::string& symbol) {
    Position p;
    p.id = 1;
    p.account_id = 1;
    p.symbol = symbol;
    p.entry_price = 20.0;
    p.quantity = 100;
    p.status = backtest::domain::PositionStatus::Open;
    return p;
  }

  backtest::SimulationTimeProvider clock{dayMs(0)};
  backtest::HistoricalMarketData market{clock};
  MovingAverageCrossoverParams params;
};

// -----------------------------------------------------------------------------
// 1. Upward cross while flat -> one Buy carrying the configured stop.
// -----------------------------------------------------------------------------
TEST_F(MovingAverageCrossoverTest, BuysOnUpwardCross) {
  MovingAverageCrossoverStrategy strategy(params);

  for (std::int64_t n = 0; n < 6; ++n) {
    EXPECT_TRUE(signalsOn(strategy, n).empty()) << "day " << n;
  }

  const auto intents = signalsOn(strategy, 6);
  ASSERT_EQ(intents.size(), 1u);
  const OrderIntent& intent = intents[0];
  EXPECT_EQ(intent.symbol, "AAPL");
  EXPECT_EQ(intent.side, Side::Buy);
  EXPECT_EQ(intent.quantity, 100);
  EXPECT_EQ(intent.reason, "MA2 crossed above MA4");
  ASSERT_TRUE(intent.reference_price.has_value());
  EXPECT_DOUBLE_EQ(*intent.reference_price, 20.0);

  const auto* stop =
      std::get_if<backtest::domain::PriceStopLoss>(&intent.stop_loss);
  ASSERT_NE(stop, nullptr);
  EXPECT_DOUBLE_EQ(stop->threshold, 15.0);
}

TEST_F(MovingAverageCrossoverTest, NoBuyWhileHolding) {
  MovingAverageCrossoverStrategy strategy(params);
  EXPECT_TRUE(signalsOn(strategy, 6, {holding("AAPL")}).empty());
}

// -----------------------------------------------------------------------------
// 2. Downward cross while holding -> one Sell.
// -----------------------------------------------------------------------------
TEST_F(MovingAverageCrossoverTest, SellsOnDownwardCrossWhenHolding) {
  MovingAverageCrossoverStrategy strategy(params);

  for (std::int64_t n = 7; n < 11; ++n) {
    EXPECT_TRUE(signalsOn(strategy, n, {holding("AAPL")}).empty())
        << "day " << n;
  }

  const auto intents = signalsOn(strategy, 11, {holding("AAPL")});
  ASSERT_EQ(intents.size(), 1u);
  EXPECT_EQ(intents[0].side, Side::Sell);
  EXPECT_EQ(intents[0].quantity, 100);
  EXPECT_EQ(intents[0].reason, "MA2 crossed below MA4");
  EXPECT_DOUBLE_EQ(*intents[0].reference_price, 5.0);
}

TEST_F(MovingAverageCrossoverTest, NoSellWhenFlat) {
  MovingAverageCrossoverStrategy strategy(params);
  EXPECT_TRUE(signalsOn(strategy, 11).empty());
}

TEST_F(MovingAverageCrossoverTest, HoldingOtherSymbolDoesNotCount) {
  MovingAverageCrossoverStrategy strategy(params);
  const auto intents = signalsOn(strategy, 6, {holding("MSFT")});
  ASSERT_EQ(intents.size(), 1u);
  EXPECT_EQ(intents[0].side, Side::Buy);
}

// -----------------------------------------------------------------------------
// 3. Warm-up: long_period + 1 bars are needed.
// -----------------------------------------------------------------------------
TEST_F(MovingAverageCrossoverTest, NeedsLongPeriodPlusOneBars) {
  // Four bars, one short of what a 2/4 crossover needs.
  backtest::SimulationTimeProvider late_clock{dayMs(0)};
  backtest::HistoricalMarketData sparse{late_clock};
  sparse.addBars("AAPL", makeSeries("AAPL", 2, {10, 10, 10, 20}));

  MovingAverageCrossoverStrategy strategy(params);
  late_clock.advance_time(dayMs(5));
  EXPECT_TRUE(strategy.signals(MarketSnapshot{day(5), sparse}, {}).empty());
}

// -----------------------------------------------------------------------------
// 4. A bar is evaluated once. Calling again on the same day, or on a day
//    with no new bar, yields nothing until reset().
// -----------------------------------------------------------------------------
TEST_F(MovingAverageCrossoverTest, EvaluatesEachBarOnce) {
  MovingAverageCrossoverStrategy strategy(params);
  ASSERT_EQ(signalsOn(strategy, 6).size(), 1u);
  EXPECT_TRUE(signalsOn(strategy, 6).empty());

  strategy.reset();
  EXPECT_EQ(signalsOn(strategy, 6).size(), 1u);
}

TEST_F(MovingAverageCrossoverTest, DayWithoutNewBarIsSkipped) {
  backtest::SimulationTimeProvider gap_clock{dayMs(0)};
  backtest::HistoricalMarketData gappy{gap_clock};
  gappy.addBars("AAPL", makeSeries("AAPL", 0, {10, 10, 10, 10, 10, 10, 20}));

  MovingAverageCrossoverStrategy strategy(params);
  gap_clock.advance_time(dayMs(6));
  ASSERT_EQ(strategy.signals(MarketSnapshot{day(6), gappy}, {}).size(), 1u);

  // Day 7 has no bar; the newest visible bar is still day 6.
  gap_clock.advance_time(dayMs(7));
  EXPECT_TRUE(strategy.signals(MarketSnapshot{day(7), gappy}, {}).empty());
}

TEST_F(MovingAverageCrossoverTest, UnknownSymbolIsSkipped) {
  params.symbols = {"NOPE", "AAPL"};
  MovingAverageCrossoverStrategy strategy(params);
  const auto intents = signalsOn(strategy, 6);
  ASSERT_EQ(intents.size(), 1u);
  EXPECT_EQ(intents[0].symbol, "AAPL");
}

// -----------------------------------------------------------------------------
// 5. Parameters, naming and the factory.
// -----------------------------------------------------------------------------
TEST(MovingAverageCrossoverParamsTest, RejectsInvalidParameters) {
  MovingAverageCrossoverParams bad;
  bad.short_period = 0;
  EXPECT_THROW(MovingAverageCrossoverStrategy{bad}, std::invalid_argument);

  bad = MovingAverageCrossoverParams{};
  bad.long_period = 20;  // not greater than short_period
  EXPECT_THROW(MovingAverageCrossoverStrategy{bad}, std::invalid_argument);

  bad = MovingAverageCrossoverParams{};
  bad.position_size = 0;
  EXPECT_THROW(MovingAverageCrossoverStrategy{bad}, std::invalid_argument);
}

TEST(MovingAverageCrossoverParamsTest, NameReflectsPeriods) {
  MovingAverageCrossoverStrategy defaults(MovingAverageCrossoverParams{});
  EXPECT_EQ(defaults.name(), "MA20/50 crossover");

  MovingAverageCrossoverParams fast;
  fast.short_period = 5;
  fast.long_period = 15;
  EXPECT_EQ(MovingAverageCrossoverStrategy(fast).name(), "MA5/15 crossover");
}

TEST(StrategyFactoryTest, BuildsCrossoverStrategy) {
  MovingAverageCrossoverParams p;
  p.symbols = {"AAPL", "MSFT"};
  const backtest::StrategyParams params = p;

  EXPECT_EQ(backtest::strategyType(params), "ma_crossover");

  auto strategy = backtest::makeStrategy(params);
  ASSERT_NE(strategy, nullptr);
  EXPECT_EQ(strategy->name(), "MA20/50 crossover");
}

TEST(StrategyFactoryTest, PropagatesParameterErrors) {
  MovingAverageCrossoverParams p;
  p.position_size = -1;
  EXPECT_THROW(backtest::makeStrategy(backtest::StrategyParams{p}),
               std::invalid_argument);
}
