// =============================================================================
// time_utils_test.cpp
// =============================================================================
// Unit tests for the calendar helpers and the two time providers.
//
// Validates:
//   - make_date / format_date / parse_date agree on UTC calendar dates
//   - parse_date rejects malformed and impossible dates
//   - whole_days_between truncates toward zero
//   - SimulationTimeProvider only moves forward, except through reset()
//   - LiveTimeProvider tracks the wall clock
// =============================================================================

#include "backtest/domain/error.hpp"
#include "backtest/time/live_time_provider.hpp"
#include "backtest/time/simulation_time_provider.hpp"
#include "backtest/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <chrono>

using backtest::Timestamp;

// -----------------------------------------------------------------------------
// 1. Dates are UTC midnights and round-trip through the text form.
// -----------------------------------------------------------------------------
TEST(TimeUtilsTest, MakeDateIsUtcMidnight) {
  EXPECT_EQ(backtest::timestamp_to_ms(backtest::make_date(1970, 1, 1)), 0);
  EXPECT_EQ(backtest::timestamp_to_ms(backtest::make_date(1970, 1, 2)),
            backtest::kMsPerDay);
  EXPECT_EQ(backtest::format_date(backtest::make_date(2024, 2, 29)),
            "2024-02-29");
  EXPECT_EQ(backtest::format_date(backtest::make_date(1999, 12, 31)),
            "1999-12-31");
}

TEST(TimeUtilsTest, ParseDateAcceptsDateAndDateTime) {
  auto plain = backtest::parse_date("2023-06-15");
  ASSERT_TRUE(plain.has_value());
  EXPECT_EQ(*plain, backtest::make_date(2023, 6, 15));

  // Time-of-day suffix is ignored: trading dates only.
  auto with_time = backtest::parse_date("2023-06-15T16:00:00");
  ASSERT_TRUE(with_time.has_value());
  EXPECT_EQ(*with_time, backtest::make_date(2023, 6, 15));
}

// -----------------------------------------------------------------------------
// 2. Malformed input and impossible dates are rejected, not normalized.
// -----------------------------------------------------------------------------
TEST(TimeUtilsTest, ParseDateRejectsInvalidInput) {
  EXPECT_FALSE(backtest::parse_date("").has_value());
  EXPECT_FALSE(backtest::parse_date("2023/06/15").has_value());
  EXPECT_FALSE(backtest::parse_date("2023-13-01").has_value());
  EXPECT_FALSE(backtest::parse_date("2023-02-29").has_value());
  EXPECT_FALSE(backtest::parse_date("20230615").has_value());
  EXPECT_FALSE(backtest::parse_date("June 15, 2023").has_value());
}

TEST(TimeUtilsTest, StartOfDayTruncates) {
  const Timestamp noon =
      backtest::make_date(2024, 3, 10) + std::chrono::hours(12);
  EXPECT_EQ(backtest::start_of_day(noon), backtest::make_date(2024, 3, 10));
}

// -----------------------------------------------------------------------------
// 3. Held-days arithmetic truncates partial days.
// -----------------------------------------------------------------------------
TEST(TimeUtilsTest, WholeDaysBetweenTruncates) {
  const Timestamp entry = backtest::make_date(2024, 1, 1);

  EXPECT_EQ(backtest::whole_days_between(entry, entry), 0);
  EXPECT_EQ(backtest::whole_days_between(
                entry, entry + std::chrono::hours(23)), 0);
  EXPECT_EQ(backtest::whole_days_between(entry, backtest::add_days(entry, 10)),
            10);
  EXPECT_EQ(backtest::whole_days_between(
                entry, backtest::add_days(entry, 2) + std::chrono::hours(22)),
            2);
}

// -----------------------------------------------------------------------------
// 4. The simulation clock moves forward or stays put; never backwards.
// -----------------------------------------------------------------------------
TEST(SimulationTimeProviderTest, AdvancesMonotonically) {
  backtest::SimulationTimeProvider clock;
  EXPECT_EQ(clock.now_ms(), 0);

  clock.advance_time(1000);
  EXPECT_EQ(clock.now_ms(), 1000);

  clock.advance_time(1000);  // same instant is allowed
  EXPECT_EQ(clock.now_ms(), 1000);

  EXPECT_THROW(clock.advance_time(999), backtest::domain::TemporalViolation);
  EXPECT_EQ(clock.now_ms(), 1000);
}

TEST(SimulationTimeProviderTest, StartsAtGivenTime) {
  backtest::SimulationTimeProvider clock(5000);
  EXPECT_EQ(clock.now_ms(), 5000);
  EXPECT_THROW(clock.advance_time(0), backtest::domain::TemporalViolation);
}

TEST(SimulationTimeProviderTest, ResetMovesEitherWay) {
  backtest::SimulationTimeProvider clock;
  const auto pre_epoch = backtest::timestamp_to_ms(backtest::make_date(1965, 1, 1));
  ASSERT_LT(pre_epoch, 0);

  clock.reset(pre_epoch);
  EXPECT_EQ(clock.now_ms(), pre_epoch);
  clock.advance_time(pre_epoch + 1000);
  EXPECT_EQ(clock.now_ms(), pre_epoch + 1000);

  clock.reset(5000);
  clock.reset(0);
  EXPECT_EQ(clock.now_ms(), 0);
  EXPECT_THROW(clock.advance_time(-1), backtest::domain::TemporalViolation);
}

TEST(LiveTimeProviderTest, TracksWallClock) {
  backtest::LiveTimeProvider clock;
  const auto before = backtest::timestamp_to_ms(std::chrono::system_clock::now());
  const auto now = clock.now_ms();
  const auto after = backtest::timestamp_to_ms(std::chrono::system_clock::now());
  EXPECT_GE(now, before);
  EXPECT_LE(now, after);
}
