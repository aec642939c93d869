#pragma once

#include "backtest/domain/account.hpp"
#include "backtest/domain/bar.hpp"
#include "backtest/domain/risk_limits.hpp"
#include "backtest/domain/stop_loss.hpp"
#include "backtest/execution/order_execution_coordinator.hpp"
#include "backtest/strategy/strategy_factory.hpp"
#include "backtest/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace backtest {

// -----------------------------------------------------------------------------
// ConfigError
// -----------------------------------------------------------------------------
// Malformed or inconsistent backtest request. what() names the offending
// field. JSON syntax and type errors from nlohmann are wrapped in this.
// -----------------------------------------------------------------------------
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// -----------------------------------------------------------------------------
// BacktestRequest
// -----------------------------------------------------------------------------
//
// @brief  Everything needed to compose and run one backtest, as read from a
//         JSON request.
//
// @details
// Request shape (camelCase keys; optional ones show their default):
//
//   {
//     "accountId":      1,
//     "accountName":    "Backtest account",
//     "startDate":      "2023-01-01",
//     "endDate":        "2023-12-31",
//     "initialCapital": 100000,
//     "symbols":        ["AAPL"],
//     "strategyType":   "ma_crossover",
//     "shortPeriod":    20,
//     "longPeriod":     50,
//     "positionSize":   100,
//     "stopLoss":       {"priceThreshold": 45}   or {"daysToHold": 10}
//                       or {"trailingPercent": 5}; at most one key,
//     "riskLimits":     {"maxPositionFraction": 0.25,
//                        "estimatedCommission": 5},
//     "commission":     5,
//     "saleCommission": "deduct" | "report_only",
//     "lookbackDays":   100,
//     "bars": {
//       "AAPL": [{"date": "2023-01-03", "open": 130.3, "high": 130.9,
//                 "low": 124.2, "close": 125.1, "adjustedClose": 124.2,
//                 "volume": 112117500, "sma50": 140.1, "rsi14": 34.2}, ...]
//     }
//   }
//
// "bars" is the input the data pipeline would otherwise supply. Indicator
// keys (macd, macdSignal, macdHistogram, sma200, sma50, volMa20, rsi14) are
// optional per bar.
// -----------------------------------------------------------------------------
struct BacktestRequest {
  domain::AccountId account_id{};
  std::string account_name{"Backtest account"};
  Timestamp start_date{};
  Timestamp end_date{};
  double initial_capital{0.0};

  StrategyParams strategy{MovingAverageCrossoverParams{}};

  domain::RiskLimits risk_limits{};
  double commission{5.0};
  SaleCommissionPolicy sale_commission{
      SaleCommissionPolicy::DeductFromProceeds};

  std::int64_t lookback_days{100};

  // Raw bars per symbol, before the lookback window is applied.
  std::map<std::string, std::vector<domain::Bar>> bars;
};

// @throws ConfigError
BacktestRequest parseBacktestRequest(const nlohmann::json& json);

// Parses JSON text. @throws ConfigError
BacktestRequest parseBacktestRequestText(const std::string& text);

// Reads and parses a request file. @throws ConfigError
BacktestRequest loadBacktestRequest(const std::string& path);

// -----------------------------------------------------------------------------
// parseStopLoss(json)
// -----------------------------------------------------------------------------
// null or {} -> NoStopLoss; {"priceThreshold": p} -> PriceStopLoss;
// {"daysToHold": n} -> DaysStopLoss; {"trailingPercent": x} ->
// TrailingStopLoss. More than one key is a ConfigError.
// -----------------------------------------------------------------------------
domain::StopLoss parseStopLoss(const nlohmann::json& json);

// Parses one bar object. @throws ConfigError
domain::Bar parseBar(const std::string& symbol, const nlohmann::json& json);

}  // namespace backtest
