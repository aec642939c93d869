#pragma once

#include "backtest/domain/backtest_result.hpp"
#include "backtest/domain/trade_record.hpp"

#include <nlohmann/json.hpp>

namespace backtest {
namespace domain {

// -----------------------------------------------------------------------------
// JSON rendering of run results
// -----------------------------------------------------------------------------
// ADL hooks for nlohmann::json, so `nlohmann::json j = result;` works.
// Field names are camelCase and stable; dates are "YYYY-MM-DD".
//
// BacktestResult:
//   accountId, startDate, endDate, initialCapital, finalEquity, totalReturn,
//   maxDrawdown, sharpeRatio, winRate, totalTrades, trades[],
//   dailySnapshots[], rejectedOrders[], cancelled
//
// TradeRecord:
//   date, symbol, side ("Buy"/"Sell"), quantity, price, commission,
//   positionId, and for sells exitReason, realizedPl
//
// DailySnapshot:
//   date, cash, positionsValue, totalEquity, openPositions
//
// RejectedOrder:
//   date, symbol, side, quantity, error (ErrorKind name), message
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& json, const TradeRecord& trade);
void to_json(nlohmann::json& json, const DailySnapshot& snapshot);
void to_json(nlohmann::json& json, const RejectedOrder& rejected);
void to_json(nlohmann::json& json, const BacktestResult& result);

}  // namespace domain

// Pretty-printed result document, as written by the command-line driver.
std::string resultToJsonString(const domain::BacktestResult& result,
                               int indent = 2);

}  // namespace backtest
