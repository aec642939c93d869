#pragma once

#include "backtest/domain/account.hpp"
#include "backtest/domain/error.hpp"
#include "backtest/domain/order.hpp"
#include "backtest/domain/position.hpp"
#include "backtest/domain/trade_record.hpp"
#include "backtest/time/time_utils.hpp"

#include <cstdint>
#include <string>

namespace backtest {

// -----------------------------------------------------------------------------
// Run progress events
// -----------------------------------------------------------------------------
// Published by BacktestRunner on its EventBus, synchronously, on the thread
// that called run(). All are plain values; `timestamp` is simulated time and
// `sequence_id` increases by one per event within a run, so a subscriber can
// reconstruct the exact order things happened in.
// -----------------------------------------------------------------------------

struct BacktestStartedEvent {
  domain::AccountId account_id{};
  std::string strategy;
  Timestamp start_date{};
  Timestamp end_date{};
  double initial_capital{0.0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// A fill that made it into the trade log.
struct TradeExecutedEvent {
  domain::TradeRecord trade;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// An intent or stop exit the coordinator refused. The day carries on.
struct OrderRejectedEvent {
  domain::RejectedOrder rejection;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// StopLossTriggeredEvent
// -----------------------------------------------------------------------------
// A position's stop-loss fired. Published before the exit order is sent,
// so it is followed by either a TradeExecutedEvent or an OrderRejectedEvent
// for the same symbol.
// -----------------------------------------------------------------------------
struct StopLossTriggeredEvent {
  domain::PositionId position_id{};
  std::string symbol;
  double trigger_price{0.0};
  std::string reason;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// End-of-day mark-to-market. Exactly one per simulated day.
struct SnapshotEvent {
  domain::DailySnapshot snapshot;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

struct BacktestCompletedEvent {
  domain::AccountId account_id{};
  double final_equity{0.0};
  double total_return{0.0};
  std::int64_t total_trades{0};
  bool cancelled{false};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace backtest
