#include "backtest/engine/backtest_runner.hpp"
#include "backtest/events/event_types.hpp"
#include "backtest/metrics/metrics.hpp"
#include "backtest/risk/risk_validator.hpp"

#include <iostream>
#include <utility>

namespace backtest {

BacktestRunner::BacktestRunner(SimulationTimeProvider& clock,
                               const IMarketDataSource& market,
                               IAccountStore& accounts,
                               IPositionStore& positions,
                               BacktestSettings settings)
    : clock_(clock),
      market_(market),
      accounts_(accounts),
      positions_(positions),
      coordinator_(market, accounts, positions, settings.risk_limits,
                   std::move(settings.commission_model),
                   settings.coordinator_options) {}

void BacktestRunner::cancel() {
  cancel_requested_.store(true, std::memory_order_release);
}

bool BacktestRunner::cancelRequested() const {
  return cancel_requested_.load(std::memory_order_acquire);
}

// -----------------------------------------------------------------------------
// run: validate, loop over calendar days, compute metrics
// -----------------------------------------------------------------------------
domain::BacktestResult BacktestRunner::run(const BacktestConfig& config) {
  if (config.strategy == nullptr) {
    throw BacktestError(domain::ErrorKind::ValidationFailed,
                        "Backtest requires a strategy");
  }
  if (!(config.initial_capital > 0.0)) {
    throw BacktestError(domain::ErrorKind::ValidationFailed,
                        "Initial capital must be positive");
  }
  const Timestamp first_day = start_of_day(config.start_date);
  const Timestamp last_day = start_of_day(config.end_date);
  if (first_day > last_day) {
    throw BacktestError(domain::ErrorKind::ValidationFailed,
                        "Start date " + format_date(first_day) +
                            " is after end date " + format_date(last_day));
  }
  if (!accounts_.get(config.account_id)) {
    throw BacktestError(domain::ErrorKind::NotFound,
                        "Account " + std::to_string(config.account_id) +
                            " not found");
  }

  cancel_requested_.store(false, std::memory_order_release);
  sequence_ = 0;
  config.strategy->reset();

  // A run starts on its first day, whatever the clock held before (the epoch
  // default, or the last day of a previous run).
  clock_.reset(timestamp_to_ms(first_day));

  RunState state;
  state.config = &config;
  state.result.account_id = config.account_id;
  state.result.start_date = first_day;
  state.result.end_date = last_day;
  state.result.initial_capital = config.initial_capital;

  std::cout << "[BacktestRunner] Starting " << config.strategy->name()
            << " from " << format_date(first_day) << " to "
            << format_date(last_day) << " with $"
            << formatMoney(config.initial_capital) << "\n";

  BacktestStartedEvent started;
  started.account_id = config.account_id;
  started.strategy = config.strategy->name();
  started.start_date = first_day;
  started.end_date = last_day;
  started.initial_capital = config.initial_capital;
  started.timestamp = first_day;
  started.sequence_id = nextSequence();
  bus_.publish(started);

  for (Timestamp day = first_day; day <= last_day; day = add_days(day, 1)) {
    // --- 1. Cancellation is only honoured between days ----------------------
    if (cancelRequested()) {
      state.result.cancelled = true;
      std::cout << "[BacktestRunner] Cancelled before "
                << format_date(day) << "\n";
      break;
    }

    // --- 2. Advance simulated time ------------------------------------------
    clock_.advance_time(timestamp_to_ms(day));

    // --- 3-4. Stop-losses, then the strategy ---------------------------------
    processStopLosses(state, day);
    processSignals(state, day);

    // --- 5. End-of-day mark-to-market ---------------------------------------
    takeSnapshot(state, day);
  }

  const PerformanceMetrics metrics = computeMetrics(
      config.initial_capital, state.result.daily_snapshots,
      state.result.trades);
  state.result.final_equity = metrics.final_equity;
  state.result.total_return = metrics.total_return;
  state.result.max_drawdown = metrics.max_drawdown;
  state.result.sharpe_ratio = metrics.sharpe_ratio;
  state.result.win_rate = metrics.win_rate;
  state.result.total_trades = metrics.total_trades;

  std::cout << "[BacktestRunner] Completed: final equity $"
            << formatMoney(metrics.final_equity) << ", total return "
            << metrics.total_return * 100.0 << "%, closed trades "
            << metrics.total_trades << "\n";

  BacktestCompletedEvent completed;
  completed.account_id = config.account_id;
  completed.final_equity = metrics.final_equity;
  completed.total_return = metrics.total_return;
  completed.total_trades = metrics.total_trades;
  completed.cancelled = state.result.cancelled;
  completed.timestamp = ms_to_timestamp(clock_.now_ms());
  completed.sequence_id = nextSequence();
  bus_.publish(completed);

  return std::move(state.result);
}

// -----------------------------------------------------------------------------
// processStopLosses: evaluate every open lot before the strategy runs
// -----------------------------------------------------------------------------
void BacktestRunner::processStopLosses(RunState& state, Timestamp day) {
  const domain::AccountId account_id = state.config->account_id;

  for (const auto& position : positions_.openPositions(account_id)) {
    if (!market_.isAvailable(position.symbol, day)) {
      continue;
    }
    const double price = market_.priceAt(position.symbol, day).close;

    const StopDecision decision =
        coordinator_.validator().evaluateStopLoss(position, price, day);
    if (!decision.triggered) {
      continue;
    }

    StopLossTriggeredEvent triggered;
    triggered.position_id = position.id;
    triggered.symbol = position.symbol;
    triggered.trigger_price = decision.trigger_price.value_or(price);
    triggered.reason = decision.reason;
    triggered.timestamp = day;
    triggered.sequence_id = nextSequence();
    bus_.publish(triggered);

    domain::OrderRequest exit;
    exit.account_id = account_id;
    exit.symbol = position.symbol;
    exit.side = domain::Side::Sell;
    exit.quantity = position.quantity;
    exit.timestamp = day;
    exit.reference_price = triggered.trigger_price;
    exit.position_id = position.id;
    exit.reason = decision.reason;
    submit(state, exit);
  }
}

void BacktestRunner::processSignals(RunState& state, Timestamp day) {
  const domain::AccountId account_id = state.config->account_id;

  const MarketSnapshot snapshot{day, market_};
  const std::vector<OrderIntent> intents = state.config->strategy->signals(
      snapshot, positions_.openPositions(account_id));

  for (const auto& intent : intents) {
    domain::OrderRequest order;
    order.account_id = account_id;
    order.symbol = intent.symbol;
    order.side = intent.side;
    order.quantity = intent.quantity;
    order.timestamp = day;
    order.stop_loss = intent.stop_loss;
    order.reference_price = intent.reference_price;
    order.reason = intent.reason;
    submit(state, order);
  }
}

void BacktestRunner::takeSnapshot(RunState& state, Timestamp day) {
  const domain::AccountId account_id = state.config->account_id;

  const std::optional<domain::Account> account = accounts_.get(account_id);
  const std::vector<domain::Position> open = positions_.openPositions(account_id);

  double positions_value = 0.0;
  for (const auto& position : open) {
    const double mark = market_.isAvailable(position.symbol, day)
                            ? market_.priceAt(position.symbol, day).close
                            : position.entry_price;
    positions_value += mark * static_cast<double>(position.quantity);
  }

  domain::DailySnapshot snap;
  snap.date = day;
  snap.cash = account ? account->cash : 0.0;
  snap.positions_value = positions_value;
  snap.total_equity = snap.cash + positions_value;
  snap.open_positions = static_cast<std::int64_t>(open.size());
  state.result.daily_snapshots.push_back(snap);

  SnapshotEvent event;
  event.snapshot = snap;
  event.timestamp = day;
  event.sequence_id = nextSequence();
  bus_.publish(event);
}

// -----------------------------------------------------------------------------
// submit: execute through the coordinator, record the outcome
// -----------------------------------------------------------------------------
bool BacktestRunner::submit(RunState& state, const domain::OrderRequest& order) {
  const domain::OrderResult outcome = coordinator_.execute(order);

  if (!outcome.success) {
    domain::RejectedOrder rejected;
    rejected.timestamp = order.timestamp;
    rejected.symbol = order.symbol;
    rejected.side = order.side;
    rejected.quantity = order.quantity;
    rejected.error = outcome.error;
    rejected.message = outcome.message;
    state.result.rejected_orders.push_back(rejected);

    OrderRejectedEvent event;
    event.rejection = rejected;
    event.timestamp = order.timestamp;
    event.sequence_id = nextSequence();
    bus_.publish(event);
    return false;
  }

  domain::TradeRecord trade;
  trade.timestamp = outcome.execution_time;
  trade.symbol = order.symbol;
  trade.side = order.side;
  trade.quantity = order.quantity;
  trade.price = outcome.execution_price;
  trade.commission = outcome.commission;
  trade.position_id = outcome.position_id.value_or(0);
  if (order.side == domain::Side::Sell) {
    trade.exit_reason = order.reason;
    trade.realized_pl = outcome.realized_pl;
  }
  state.result.trades.push_back(trade);

  TradeExecutedEvent event;
  event.trade = trade;
  event.timestamp = order.timestamp;
  event.sequence_id = nextSequence();
  bus_.publish(event);
  return true;
}

}  // namespace backtest
