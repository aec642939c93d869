#pragma once

#include "backtest/time/i_time_provider.hpp"

namespace backtest {

// -----------------------------------------------------------------------------
// LiveTimeProvider - wall-clock ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  "Now" is std::chrono::system_clock::now().
//
// @details
// Injecting this instead of a SimulationTimeProvider turns the historical
// oracle into a live view: every bar up to the present is visible and any
// point query for a future instant still raises TemporalViolation. No other
// component changes.
//
// Thread model: stateless; safe from any thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace backtest
