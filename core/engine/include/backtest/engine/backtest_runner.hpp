#pragma once

#include "backtest/domain/account.hpp"
#include "backtest/domain/backtest_result.hpp"
#include "backtest/domain/error.hpp"
#include "backtest/domain/risk_limits.hpp"
#include "backtest/eventbus/event_bus.hpp"
#include "backtest/execution/commission_model.hpp"
#include "backtest/execution/order_execution_coordinator.hpp"
#include "backtest/ledger/i_account_store.hpp"
#include "backtest/market/i_market_data_source.hpp"
#include "backtest/positions/i_position_store.hpp"
#include "backtest/strategy/i_strategy.hpp"
#include "backtest/time/simulation_time_provider.hpp"
#include "backtest/time/time_utils.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

namespace backtest {

// -----------------------------------------------------------------------------
// BacktestError
// -----------------------------------------------------------------------------
// Thrown by BacktestRunner::run() when a run cannot start: unknown account
// (kind NotFound) or an invalid configuration (kind ValidationFailed).
// -----------------------------------------------------------------------------
class BacktestError : public std::runtime_error {
 public:
  BacktestError(domain::ErrorKind kind, const std::string& what)
      : std::runtime_error(what), kind_(kind) {}

  domain::ErrorKind kind() const { return kind_; }

 private:
  domain::ErrorKind kind_;
};

// -----------------------------------------------------------------------------
// BacktestConfig
// -----------------------------------------------------------------------------
// One run's inputs. `strategy` is not owned; the caller keeps it alive for
// the duration of run(). Dates are truncated to 00:00 UTC.
// -----------------------------------------------------------------------------
struct BacktestConfig {
  domain::AccountId account_id{};
  Timestamp start_date{};
  Timestamp end_date{};
  double initial_capital{0.0};
  IStrategy* strategy{nullptr};
};

// Execution settings fixed for the runner's lifetime.
struct BacktestSettings {
  domain::RiskLimits risk_limits{};
  std::shared_ptr<const ICommissionModel> commission_model{
      std::make_shared<FlatCommissionModel>()};
  CoordinatorOptions coordinator_options{};
};

// -----------------------------------------------------------------------------
// BacktestRunner
// -----------------------------------------------------------------------------
//
// @brief  Drives a strategy day by day through historical data and reports
//         the trades, the equity curve and summary metrics.
//
// @details
// For each calendar day D in [start_date, end_date], strictly in order:
//
//   1. Cancellation check. A cancel() seen here ends the run; D is not
//      processed at all.
//   2. clock.advance_time(D). From here on the oracle serves nothing later
//      than D.
//   3. Stop-losses: every open position of the account with a bar at or
//      before D is evaluated; triggered ones are sold through the
//      coordinator as targeted exits carrying the trigger reason.
//   4. Strategy: signals() is called once with the post-stop open
//      positions; each intent is executed in order. Failures become
//      RejectedOrder entries and the day continues.
//   5. Snapshot: cash plus each open position marked at D's close (entry
//      price when the symbol has no bar yet).
//
// Progress is published on eventBus() as it happens. Metrics are computed
// once the loop ends (or is cancelled).
//
// Error handling:
//   BacktestError            unknown account, null strategy, non-positive
//                            capital, or start after end. Nothing runs.
//   domain::TemporalViolation propagates out of run(); a run that tried to
//                            read the future has no valid result.
//
// Thread model:
//   run() executes on the calling thread and must not be called
//   concurrently on one runner. cancel() is safe from any thread, including
//   from an EventBus callback during run().
//
// Ownership:
//   References the clock, oracle and both stores (all must outlive the
//   runner). Owns the EventBus and the OrderExecutionCoordinator.
// -----------------------------------------------------------------------------
class BacktestRunner {
 public:
  BacktestRunner(SimulationTimeProvider& clock,
                 const IMarketDataSource& market,
                 IAccountStore& accounts,
                 IPositionStore& positions,
                 BacktestSettings settings = {});

  BacktestRunner(const BacktestRunner&) = delete;
  BacktestRunner& operator=(const BacktestRunner&) = delete;
  BacktestRunner(BacktestRunner&&) = delete;
  BacktestRunner& operator=(BacktestRunner&&) = delete;

  // -------------------------------------------------------------------------
  // run(config)
  // -------------------------------------------------------------------------
  // @return The BacktestResult. `cancelled` is set if cancel() stopped the
  //         loop early.
  //
  // @throws BacktestError, domain::TemporalViolation (see class comment).
  //
  // Side-effects: Resets the strategy and sets the clock to the first day,
  //               then advances it; mutates the account and position
  //               stores; publishes events.
  // -------------------------------------------------------------------------
  domain::BacktestResult run(const BacktestConfig& config);

  // Requests the current run to stop at the next day boundary. Cleared at
  // the start of every run().
  void cancel();
  bool cancelRequested() const;

  EventBus& eventBus() { return bus_; }

  const OrderExecutionCoordinator& coordinator() const { return coordinator_; }

 private:
  // Per-run mutable state, reset by run().
  struct RunState {
    const BacktestConfig* config{nullptr};
    domain::BacktestResult result;
  };

  void processStopLosses(RunState& state, Timestamp day);
  void processSignals(RunState& state, Timestamp day);
  void takeSnapshot(RunState& state, Timestamp day);

  // Executes one order and records it as a trade or a rejection.
  // Returns true if it filled.
  bool submit(RunState& state, const domain::OrderRequest& order);

  std::uint64_t nextSequence() { return ++sequence_; }

  SimulationTimeProvider& clock_;
  const IMarketDataSource& market_;
  IAccountStore& accounts_;
  IPositionStore& positions_;

  EventBus bus_;
  OrderExecutionCoordinator coordinator_;

  std::atomic<bool> cancel_requested_{false};
  std::uint64_t sequence_{0};
};

}  // namespace backtest
