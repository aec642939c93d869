#include "backtest/serialization/result_json.hpp"
#include "backtest/domain/error.hpp"
#include "backtest/time/time_utils.hpp"

namespace backtest {
namespace domain {

void to_json(nlohmann::json& json, const TradeRecord& trade) {
  json = nlohmann::json{
      {"date", format_date(trade.timestamp)},
      {"symbol", trade.symbol},
      {"side", to_string(trade.side)},
      {"quantity", trade.quantity},
      {"price", trade.price},
      {"commission", trade.commission},
      {"positionId", trade.position_id},
  };
  if (trade.exit_reason) {
    json["exitReason"] = *trade.exit_reason;
  }
  if (trade.realized_pl) {
    json["realizedPl"] = *trade.realized_pl;
  }
}

void to_json(nlohmann::json& json, const DailySnapshot& snapshot) {
  json = nlohmann::json{
      {"date", format_date(snapshot.date)},
      {"cash", snapshot.cash},
      {"positionsValue", snapshot.positions_value},
      {"totalEquity", snapshot.total_equity},
      {"openPositions", snapshot.open_positions},
  };
}

void to_json(nlohmann::json& json, const RejectedOrder& rejected) {
  json = nlohmann::json{
      {"date", format_date(rejected.timestamp)},
      {"symbol", rejected.symbol},
      {"side", to_string(rejected.side)},
      {"quantity", rejected.quantity},
      {"error", to_string(rejected.error)},
      {"message", rejected.message},
  };
}

void to_json(nlohmann::json& json, const BacktestResult& result) {
  json = nlohmann::json{
      {"accountId", result.account_id},
      {"startDate", format_date(result.start_date)},
      {"endDate", format_date(result.end_date)},
      {"initialCapital", result.initial_capital},
      {"finalEquity", result.final_equity},
      {"totalReturn", result.total_return},
      {"maxDrawdown", result.max_drawdown},
      {"sharpeRatio", result.sharpe_ratio},
      {"winRate", result.win_rate},
      {"totalTrades", result.total_trades},
      {"trades", result.trades},
      {"dailySnapshots", result.daily_snapshots},
      {"rejectedOrders", result.rejected_orders},
      {"cancelled", result.cancelled},
  };
}

}  // namespace domain

std::string resultToJsonString(const domain::BacktestResult& result,
                               int indent) {
  const nlohmann::json json = result;
  return json.dump(indent);
}

}  // namespace backtest
