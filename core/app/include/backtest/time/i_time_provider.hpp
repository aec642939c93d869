#pragma once

#include <cstdint>

namespace backtest {

// -----------------------------------------------------------------------------
// ITimeProvider - abstract source of "now"
// -----------------------------------------------------------------------------
//
// @brief  Decouples the engine's notion of the current time from
//         std::chrono::system_clock.
//
// @details
// The market data oracle asks its ITimeProvider for "now" on every query and
// refuses to serve bars beyond it. Which provider is injected is the only
// difference between a backtest and a live session:
//
//   - SimulationTimeProvider → "now" is whatever the backtest loop says it
//                              is; the loop advances it one day at a time.
//   - LiveTimeProvider       → "now" is the wall clock.
//
// Nothing else in the core knows which one it is talking to.
//
// Representation: int64 milliseconds since the Unix epoch. time_utils.hpp
// converts to and from Timestamp.
//
// Thread-safety contract:
//   now_ms() must be safe to call concurrently from any thread. Writers
//   (SimulationTimeProvider::advance_time) synchronize internally.
//
// Ownership:
//   Consumers hold a const reference. The provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Returns the current time in epoch milliseconds.
  //
  // @return 0 for a simulation clock that has not been advanced yet.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace backtest
