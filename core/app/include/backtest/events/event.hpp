#pragma once

#include "backtest/events/event_types.hpp"

#include <variant>

namespace backtest {

// -----------------------------------------------------------------------------
// Event
// -----------------------------------------------------------------------------
// The one envelope type the EventBus carries. Subscribers either take every
// Event and std::visit it (a logger) or subscribe to a single alternative
// with EventBus::subscribe<T>().
// -----------------------------------------------------------------------------
using Event = std::variant<
    BacktestStartedEvent,
    TradeExecutedEvent,
    OrderRejectedEvent,
    StopLossTriggeredEvent,
    SnapshotEvent,
    BacktestCompletedEvent>;

}  // namespace backtest
