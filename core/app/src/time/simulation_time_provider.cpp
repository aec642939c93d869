#include "backtest/time/simulation_time_provider.hpp"

#include "backtest/domain/error.hpp"
#include "backtest/time/time_utils.hpp"

namespace backtest {

// -----------------------------------------------------------------------------
// now_ms(): atomic read of the simulated clock
// -----------------------------------------------------------------------------
std::int64_t SimulationTimeProvider::now_ms() const {
  return current_time_ms_.load();
}

// -----------------------------------------------------------------------------
// advance_time(): monotonic atomic write
// -----------------------------------------------------------------------------
void SimulationTimeProvider::advance_time(std::int64_t new_time_ms) {
  std::int64_t current = current_time_ms_.load();
  while (true) {
    if (new_time_ms < current) {
      throw domain::TemporalViolation(
          "Cannot move simulation time backwards: current=" +
          format_date(ms_to_timestamp(current)) +
          ", requested=" + format_date(ms_to_timestamp(new_time_ms)));
    }
    // On failure compare_exchange_weak reloads `current`; re-check ordering
    // against the value another writer just stored.
    if (current_time_ms_.compare_exchange_weak(current, new_time_ms)) {
      return;
    }
  }
}

void SimulationTimeProvider::reset(std::int64_t start_ms) {
  current_time_ms_.store(start_ms);
}

}  // namespace backtest
