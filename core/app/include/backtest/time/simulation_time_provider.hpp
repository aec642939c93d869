#pragma once

#include "backtest/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace backtest {

// -----------------------------------------------------------------------------
// SimulationTimeProvider - clock driven by the backtest loop
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose current time is set explicitly by
//         BacktestRunner as it walks the date range.
//
// @details
// The runner calls advance_time(day) at the top of every simulated day,
// before it evaluates stop-losses or asks the strategy for signals. From
// then on every oracle query sees `day` as "now" and nothing later.
//
// Unlike a tick replayer, the backtest loop must never rewind: a clock that
// goes backwards would let a component read a bar and then act as if it had
// not seen it yet. advance_time() therefore rejects any move backwards with
// domain::TemporalViolation. Advancing to the same instant is allowed.
// The only way back is reset(), which the runner calls once at the start of
// each run, before any component has read a bar.
//
// Thread model:
//   Single writer (the runner thread). Any number of readers. The value is a
//   std::atomic<int64_t>; the monotonic check uses compare_exchange so a
//   concurrent writer cannot slip an older time in between.
//
// Ownership:
//   Owned by whoever composes the run (main() or a test fixture), shared by
//   reference with the oracle (as ITimeProvider) and the runner (to advance).
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  // Starts at 0 ms: no simulated day has begun yet.
  SimulationTimeProvider() = default;

  // Starts at the given epoch milliseconds.
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  SimulationTimeProvider(const SimulationTimeProvider&) = delete;
  SimulationTimeProvider& operator=(const SimulationTimeProvider&) = delete;

  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Moves the clock forward to new_time_ms.
  //
  // @throws domain::TemporalViolation if new_time_ms is earlier than the
  //         current value. The clock is left unchanged.
  //
  // Thread-safety: Safe from any thread; intended for a single writer.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

  // -------------------------------------------------------------------------
  // reset(start_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the clock to start_ms unconditionally, earlier or later.
  //
  // Used by BacktestRunner to position the clock at the first day of a run,
  // which may precede the epoch or the previous run's last day. Must not be
  // called while a run is in progress.
  // -------------------------------------------------------------------------
  void reset(std::int64_t start_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace backtest
