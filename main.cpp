// -----------------------------------------------------------------------------
// backtest_app - command-line driver for one backtest run.
//
//   backtest_app <request.json> [result.json]
//
//   1) Load the JSON request (dates, capital, strategy parameters, risk
//      limits, commission policy, bars).
//   2) Build the simulation clock, the bar oracle (bars trimmed to the
//      lookback window), the account and position stores, and seed the
//      account with the initial capital.
//   3) Create the BacktestRunner and subscribe logging callbacks to its
//      EventBus so trades, rejections, stop-loss exits and snapshots are
//      printed as they happen.
//   4) Run. Ctrl-C cancels at the next day boundary and still writes the
//      partial result.
//   5) Write the result JSON to the output file, or stdout if none given.
//
// Exit codes: 0 success (including a cancelled run), 1 bad request or
// arguments, 2 the run failed.
// -----------------------------------------------------------------------------

#include "backtest/config/backtest_request.hpp"
#include "backtest/domain/error.hpp"
#include "backtest/engine/backtest_runner.hpp"
#include "backtest/events/event.hpp"
#include "backtest/events/event_types.hpp"
#include "backtest/execution/commission_model.hpp"
#include "backtest/ledger/in_memory_account_store.hpp"
#include "backtest/market/historical_market_data.hpp"
#include "backtest/positions/in_memory_position_store.hpp"
#include "backtest/risk/risk_validator.hpp"
#include "backtest/serialization/result_json.hpp"
#include "backtest/strategy/strategy_factory.hpp"
#include "backtest/time/simulation_time_provider.hpp"

#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <variant>

// -----------------------------------------------------------------------------
// The SIGINT handler needs to reach the runner. The pointer refers to a
// stack-local object in main(), is set once before the handler is installed
// and cleared before that object is destroyed.
// -----------------------------------------------------------------------------
static backtest::BacktestRunner* g_runner_ptr = nullptr;

// cancel() is a single atomic store.
static void sigint_handler(int /*signum*/) {
  if (g_runner_ptr != nullptr) {
    g_runner_ptr->cancel();
  }
}

static void subscribeLogging(backtest::EventBus& bus) {
  using namespace backtest;

  bus.subscribe<TradeExecutedEvent>([](const TradeExecutedEvent& e) {
    const domain::TradeRecord& t = e.trade;
    std::cout << "[Trade] " << format_date(t.timestamp) << " "
              << domain::to_string(t.side) << " " << t.quantity << " "
              << t.symbol << " @ $" << formatMoney(t.price)
              << " commission=$" << formatMoney(t.commission)
              << " position=" << t.position_id;
    if (t.realized_pl) {
      std::cout << " realized_pl=$" << formatMoney(*t.realized_pl);
    }
    if (t.exit_reason && !t.exit_reason->empty()) {
      std::cout << " reason=\"" << *t.exit_reason << "\"";
    }
    std::cout << "\n";
  });

  bus.subscribe<OrderRejectedEvent>([](const OrderRejectedEvent& e) {
    const domain::RejectedOrder& r = e.rejection;
    std::cerr << "[Rejected] " << format_date(r.timestamp) << " "
              << domain::to_string(r.side) << " " << r.quantity << " "
              << r.symbol << ": " << domain::to_string(r.error) << " - "
              << r.message << "\n";
  });

  bus.subscribe<StopLossTriggeredEvent>([](const StopLossTriggeredEvent& e) {
    std::cout << "[StopLoss] " << format_date(e.timestamp) << " "
              << e.symbol << " position=" << e.position_id << " @ $"
              << formatMoney(e.trigger_price) << ": " << e.reason << "\n";
  });

  // One line per simulated day, only when something is held, to keep long
  // runs readable.
  bus.subscribe<SnapshotEvent>([](const SnapshotEvent& e) {
    const domain::DailySnapshot& s = e.snapshot;
    if (s.open_positions == 0) {
      return;
    }
    std::cout << "[Snapshot] " << format_date(s.date) << " equity=$"
              << formatMoney(s.total_equity) << " cash=$"
              << formatMoney(s.cash) << " positions=" << s.open_positions
              << "\n";
  });
}

int main(int argc, char** argv) {
  if (argc < 2 || argc > 3) {
    std::cerr << "usage: " << argv[0] << " <request.json> [result.json]\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 1) Request.
  // -------------------------------------------------------------------------
  backtest::BacktestRequest request;
  try {
    request = backtest::loadBacktestRequest(argv[1]);
  } catch (const backtest::ConfigError& e) {
    std::cerr << "[main] Invalid request: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 2) Clock, oracle, stores.
  // The clock starts at 0; the runner advances it to each simulated day.
  // -------------------------------------------------------------------------
  backtest::SimulationTimeProvider sim_clock;
  backtest::HistoricalMarketData market(sim_clock);
  for (const auto& [symbol, bars] : request.bars) {
    market.addBars(symbol,
                   backtest::selectLookbackWindow(bars, request.start_date,
                                                  request.end_date,
                                                  request.lookback_days));
  }

  backtest::InMemoryAccountStore accounts;
  backtest::domain::Account account;
  account.id = request.account_id;
  account.name = request.account_name;
  account.initial_capital = request.initial_capital;
  account.cash = request.initial_capital;
  if (!accounts.add(account)) {
    std::cerr << "[main] Could not seed account " << account.id << "\n";
    return 1;
  }

  backtest::InMemoryPositionStore positions;

  // -------------------------------------------------------------------------
  // 3) Runner and logging.
  // -------------------------------------------------------------------------
  backtest::BacktestSettings settings;
  settings.risk_limits = request.risk_limits;
  settings.commission_model =
      std::make_shared<backtest::FlatCommissionModel>(request.commission);
  settings.coordinator_options.sale_commission_policy = request.sale_commission;

  backtest::BacktestRunner runner(sim_clock, market, accounts, positions,
                                  settings);
  subscribeLogging(runner.eventBus());

  std::unique_ptr<backtest::IStrategy> strategy;
  try {
    strategy = backtest::makeStrategy(request.strategy);
  } catch (const std::invalid_argument& e) {
    std::cerr << "[main] Invalid strategy parameters: " << e.what() << "\n";
    return 1;
  }

  std::visit(
      [&](const auto& params) {
        std::cout << "[main] Strategy " << strategy->name() << " ("
                  << backtest::strategyType(request.strategy)
                  << "), stop loss "
                  << backtest::domain::describe(params.stop_loss)
                  << ", sale commission "
                  << backtest::to_string(request.sale_commission) << "\n";
      },
      request.strategy);

  backtest::BacktestConfig config;
  config.account_id = request.account_id;
  config.start_date = request.start_date;
  config.end_date = request.end_date;
  config.initial_capital = request.initial_capital;
  config.strategy = strategy.get();

  // -------------------------------------------------------------------------
  // 4) Run.
  // -------------------------------------------------------------------------
  g_runner_ptr = &runner;
  std::signal(SIGINT, sigint_handler);

  backtest::domain::BacktestResult result;
  try {
    result = runner.run(config);
  } catch (const backtest::BacktestError& e) {
    std::cerr << "[main] Backtest failed ("
              << backtest::domain::to_string(e.kind()) << "): " << e.what()
              << "\n";
    g_runner_ptr = nullptr;
    return 2;
  } catch (const backtest::domain::TemporalViolation& e) {
    std::cerr << "[main] Backtest aborted, lookahead detected: " << e.what()
              << "\n";
    g_runner_ptr = nullptr;
    return 2;
  }

  std::signal(SIGINT, SIG_DFL);
  g_runner_ptr = nullptr;

  // -------------------------------------------------------------------------
  // 5) Result.
  // -------------------------------------------------------------------------
  const std::string document = backtest::resultToJsonString(result);
  if (argc == 3) {
    std::ofstream out(argv[2]);
    if (!out) {
      std::cerr << "[main] Cannot write " << argv[2] << "\n";
      return 1;
    }
    out << document << "\n";
    std::cout << "[main] Result written to " << argv[2] << "\n";
  } else {
    std::cout << document << "\n";
  }

  return 0;
}
