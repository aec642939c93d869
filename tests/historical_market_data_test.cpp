// =============================================================================
// historical_market_data_test.cpp
// =============================================================================
// Unit tests for backtest::HistoricalMarketData, the bar oracle.
//
// Validates:
//   - priceAt returns the latest bar at or before as_of
//   - priceAt refuses any as_of after the simulation clock (lookahead)
//   - priceAt reports DataNotFound for unknown symbols and early dates
//   - history clamps its end to the clock and is ascending
//   - isAvailable never throws, even for future dates
//   - Randomized: no query ever yields a bar later than "now"
//   - selectLookbackWindow keeps exactly the warm-up + run window
// =============================================================================

#include "backtest/domain/error.hpp"
#include "backtest/market/historical_market_data.hpp"
#include "backtest/time/live_time_provider.hpp"
#include "backtest/time/simulation_time_provider.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <random>

using backtest::test::day;
using backtest::test::dayMs;
using backtest::test::makeBar;
using backtest::test::makeSeries;

class HistoricalMarketDataTest : public ::testing::Test {
 protected:
  void SetUp() override {
    // AAPL trades on days 0..9 with close 100 + day; MSFT only on even days.
    market.addBars("AAPL", makeSeries("AAPL", 0,
                                      {100, 101, 102, 103, 104, 105, 106,
                                       107, 108, 109}));
    market.addBars("MSFT", {makeBar("MSFT", day(8), 58.0),
                            makeBar("MSFT", day(0), 50.0),
                            makeBar("MSFT", day(4), 54.0),
                            makeBar("MSFT", day(2), 52.0),
                            makeBar("MSFT", day(6), 56.0)});
  }

  backtest::SimulationTimeProvider clock{dayMs(0)};
  backtest::HistoricalMarketData market{clock};
};

// -----------------------------------------------------------------------------
// 1. Point lookups return the latest bar at or before as_of.
// -----------------------------------------------------------------------------
TEST_F(HistoricalMarketDataTest, PriceAtReturnsLatestBarAtOrBefore) {
  clock.advance_time(dayMs(9));

  EXPECT_DOUBLE_EQ(market.priceAt("AAPL", day(5)).close, 105.0);

  // MSFT has no bar on day 5; the day-4 bar is the answer.
  const auto msft = market.priceAt("MSFT", day(5));
  EXPECT_DOUBLE_EQ(msft.close, 54.0);
  EXPECT_EQ(msft.timestamp, day(4));
  EXPECT_EQ(msft.symbol, "MSFT");
}

// -----------------------------------------------------------------------------
// 2. A point query one millisecond past "now" is lookahead and must throw.
// Why: this check is the only thing standing between a strategy and
//      tomorrow's close.
// -----------------------------------------------------------------------------
TEST_F(HistoricalMarketDataTest, PriceAtRejectsFutureQueries) {
  clock.advance_time(dayMs(3));

  EXPECT_NO_THROW(market.priceAt("AAPL", day(3)));
  EXPECT_THROW(market.priceAt("AAPL", day(4)),
               backtest::domain::TemporalViolation);
  EXPECT_THROW(market.priceAt("AAPL", day(3) + std::chrono::milliseconds(1)),
               backtest::domain::TemporalViolation);
  // Even for a symbol the oracle has never heard of.
  EXPECT_THROW(market.priceAt("NOPE", day(4)),
               backtest::domain::TemporalViolation);
}

TEST_F(HistoricalMarketDataTest, PriceAtReportsMissingData) {
  clock.advance_time(dayMs(5));

  EXPECT_THROW(market.priceAt("NOPE", day(5)), backtest::domain::DataNotFound);
  EXPECT_THROW(market.priceAt("AAPL", day(-1)), backtest::domain::DataNotFound);
}

// -----------------------------------------------------------------------------
// 3. history() clamps to the clock instead of throwing.
// -----------------------------------------------------------------------------
TEST_F(HistoricalMarketDataTest, HistoryClampsEndToCurrentTime) {
  clock.advance_time(dayMs(4));

  const auto bars = market.history("AAPL", day(2), day(9));
  ASSERT_EQ(bars.size(), 3u);
  EXPECT_EQ(bars[0].timestamp, day(2));
  EXPECT_EQ(bars[1].timestamp, day(3));
  EXPECT_EQ(bars[2].timestamp, day(4));

  const auto msft = market.history("MSFT", day(0), day(100));
  ASSERT_EQ(msft.size(), 3u);
  EXPECT_DOUBLE_EQ(msft[0].close, 50.0);
  EXPECT_DOUBLE_EQ(msft[2].close, 54.0);
}

TEST_F(HistoricalMarketDataTest, HistoryEdgeCases) {
  clock.advance_time(dayMs(9));

  EXPECT_TRUE(market.history("NOPE", day(0), day(9)).empty());
  EXPECT_TRUE(market.history("AAPL", day(5), day(4)).empty());
  EXPECT_EQ(market.history("AAPL", day(5), day(5)).size(), 1u);
}

// -----------------------------------------------------------------------------
// 4. isAvailable answers the same question as priceAt without throwing.
// -----------------------------------------------------------------------------
TEST_F(HistoricalMarketDataTest, IsAvailableNeverThrows) {
  clock.advance_time(dayMs(3));

  EXPECT_TRUE(market.isAvailable("AAPL", day(3)));
  EXPECT_TRUE(market.isAvailable("MSFT", day(3)));
  EXPECT_FALSE(market.isAvailable("AAPL", day(4)));
  EXPECT_FALSE(market.isAvailable("AAPL", day(-1)));
  EXPECT_FALSE(market.isAvailable("NOPE", day(3)));
}

TEST_F(HistoricalMarketDataTest, LaterLoadReplacesSameTimestamp) {
  clock.advance_time(dayMs(9));
  market.addBars("AAPL", {makeBar("AAPL", day(5), 999.0)});

  EXPECT_DOUBLE_EQ(market.priceAt("AAPL", day(5)).close, 999.0);
  EXPECT_EQ(market.history("AAPL", day(0), day(9)).size(), 10u);
}

TEST_F(HistoricalMarketDataTest, SymbolsAreSorted) {
  const auto symbols = market.symbols();
  ASSERT_EQ(symbols.size(), 2u);
  EXPECT_EQ(symbols[0], "AAPL");
  EXPECT_EQ(symbols[1], "MSFT");
}

// -----------------------------------------------------------------------------
// 5. Randomized lookahead property: for random clock positions and random
//    queries, nothing served is ever later than the clock, and every point
//    query past the clock throws.
// -----------------------------------------------------------------------------
TEST(HistoricalMarketDataPropertyTest, NeverServesBarsFromTheFuture) {
  std::mt19937 rng(20240101u);
  std::uniform_int_distribution<int> close_dist(10, 500);
  std::uniform_int_distribution<int> day_dist(-10, 400);

  std::vector<double> closes(365);
  for (auto& c : closes) {
    c = static_cast<double>(close_dist(rng));
  }

  backtest::SimulationTimeProvider clock{dayMs(0)};
  backtest::HistoricalMarketData market{clock};
  market.addBars("RND", makeSeries("RND", 0, closes));

  for (int step = 0; step < 60; ++step) {
    clock.advance_time(dayMs(step * 6));
    const auto now = market.currentTime();

    for (int q = 0; q < 20; ++q) {
      const auto as_of = day(day_dist(rng));
      const auto end = day(day_dist(rng));

      for (const auto& bar : market.history("RND", day(-10), end)) {
        ASSERT_LE(bar.timestamp, now);
      }

      if (as_of > now) {
        ASSERT_THROW(market.priceAt("RND", as_of),
                     backtest::domain::TemporalViolation);
        ASSERT_FALSE(market.isAvailable("RND", as_of));
      } else if (market.isAvailable("RND", as_of)) {
        const auto bar = market.priceAt("RND", as_of);
        ASSERT_LE(bar.timestamp, as_of);
        ASSERT_LE(bar.timestamp, now);
      }
    }
  }
}

// -----------------------------------------------------------------------------
// 6. With a wall clock every historical bar is visible.
// -----------------------------------------------------------------------------
TEST(HistoricalMarketDataLiveTest, LiveClockSeesAllHistory) {
  backtest::LiveTimeProvider clock;
  backtest::HistoricalMarketData market{clock};
  market.addBars("AAPL", makeSeries("AAPL", 0, {1.0, 2.0, 3.0}));

  EXPECT_DOUBLE_EQ(market.priceAt("AAPL", day(2)).close, 3.0);
  EXPECT_EQ(market.history("AAPL", day(0), day(2)).size(), 3u);
}

// -----------------------------------------------------------------------------
// 7. Lookback window: [start - lookback_days, end], inclusive.
// -----------------------------------------------------------------------------
TEST(SelectLookbackWindowTest, KeepsWarmupAndRunWindow) {
  std::vector<double> closes(300, 10.0);
  const auto bars = makeSeries("AAPL", 0, closes);  // days 0..299

  const auto window =
      backtest::selectLookbackWindow(bars, day(150), day(200));
  ASSERT_FALSE(window.empty());
  EXPECT_EQ(window.front().timestamp, day(50));   // 150 - 100
  EXPECT_EQ(window.back().timestamp, day(200));
  EXPECT_EQ(window.size(), 151u);

  const auto narrow =
      backtest::selectLookbackWindow(bars, day(150), day(160), 10);
  EXPECT_EQ(narrow.front().timestamp, day(140));
  EXPECT_EQ(narrow.size(), 21u);
}
