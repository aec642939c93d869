#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace backtest {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// The engine-wide point-in-time type. Bars, positions, trades and snapshots
// all carry one. Daily bars are stamped at 00:00:00 UTC of their trading
// date, and the backtest clock advances in whole UTC days, so a bar dated D
// becomes visible exactly when the simulation reaches D.
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

// Milliseconds in one calendar day (no leap seconds in the civil calendar
// used by the engine).
inline constexpr std::int64_t kMsPerDay = 24LL * 60 * 60 * 1000;

// -------------------------------------------------------------------------
// ms_to_timestamp / timestamp_to_ms
// -------------------------------------------------------------------------
// @brief  Bridge between ITimeProvider's int64 epoch milliseconds and
//         Timestamp. Inverse of each other at millisecond resolution.
// -------------------------------------------------------------------------
inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// -------------------------------------------------------------------------
// make_date(year, month, day)
// -------------------------------------------------------------------------
// @brief  Builds the Timestamp for 00:00:00 UTC of a proleptic Gregorian
//         calendar date.
//
// @details
// Uses the days-from-civil algorithm, so it does not depend on the process
// time zone (std::mktime would). Month and day are not range checked here;
// parse_date() performs validation for untrusted input.
// -------------------------------------------------------------------------
Timestamp make_date(int year, unsigned month, unsigned day);

// -------------------------------------------------------------------------
// parse_date(text)
// -------------------------------------------------------------------------
// @brief  Parses "YYYY-MM-DD", optionally followed by a "THH:MM:SS" suffix
//         which is ignored (request payloads often carry full ISO-8601
//         date-times for what are really trading dates).
//
// @return The UTC midnight Timestamp, or std::nullopt on malformed input or
//         an impossible calendar date (e.g. 2023-02-29).
// -------------------------------------------------------------------------
std::optional<Timestamp> parse_date(const std::string& text);

// Formats the UTC calendar date of tp as "YYYY-MM-DD".
std::string format_date(Timestamp tp);

// Truncates tp to 00:00:00 UTC of the same calendar day.
Timestamp start_of_day(Timestamp tp);

inline Timestamp add_days(Timestamp tp, std::int64_t days) {
  return tp + std::chrono::milliseconds{days * kMsPerDay};
}

// -------------------------------------------------------------------------
// whole_days_between(from, to)
// -------------------------------------------------------------------------
// @brief  Number of complete 24-hour periods from `from` to `to`,
//         truncated toward zero (2.9 days -> 2, -0.5 days -> 0).
//
// @details
// Used for time-based stop-losses: a position opened on day D has been
// held for n days on day D+n regardless of intraday entry time.
// -------------------------------------------------------------------------
inline std::int64_t whole_days_between(Timestamp from, Timestamp to) {
  return (timestamp_to_ms(to) - timestamp_to_ms(from)) / kMsPerDay;
}

}  // namespace backtest
