#pragma once

#include "backtest/time/time_utils.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace backtest {
namespace domain {

// -----------------------------------------------------------------------------
// Indicators
// -----------------------------------------------------------------------------
// Pre-computed technical indicators attached to a bar by the data pipeline.
// The core never computes these; any of them may be absent (e.g. sma_200 is
// undefined for the first 199 bars of a series).
// -----------------------------------------------------------------------------
struct Indicators {
  std::optional<double> macd;
  std::optional<double> macd_signal;
  std::optional<double> macd_histogram;
  std::optional<double> sma_200;
  std::optional<double> sma_50;
  std::optional<double> vol_ma_20;
  std::optional<double> rsi_14;
};

// -----------------------------------------------------------------------------
// Bar
// -----------------------------------------------------------------------------
//
// @brief  One OHLCV observation for a symbol.
//
// @details
// Daily bars are stamped at 00:00 UTC of their trading date. The oracle
// serves a bar only once the simulation clock has reached that timestamp.
// Value type: copies handed out by the oracle are snapshots.
// -----------------------------------------------------------------------------
struct Bar {
  std::string symbol;
  Timestamp timestamp{};
  double open{0.0};
  double high{0.0};
  double low{0.0};
  double close{0.0};
  double adjusted_close{0.0};
  std::int64_t volume{0};
  Indicators indicators;
};

}  // namespace domain
}  // namespace backtest
