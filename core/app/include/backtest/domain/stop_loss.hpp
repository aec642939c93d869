#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace backtest {
namespace domain {

// -----------------------------------------------------------------------------
// StopLoss - exit rule attached to a position
// -----------------------------------------------------------------------------
//
// @brief  Tagged variant over the supported stop-loss kinds.
//
// @details
//   NoStopLoss       - never triggers.
//   PriceStopLoss    - triggers once the close is at or below `threshold`.
//   DaysStopLoss     - triggers once the position has been held for `days`
//                      whole days.
//   TrailingStopLoss - reserved. Carried on positions and serialized, but
//                      the risk validator never triggers it.
//
// Each alternative holds exactly the fields its rule needs, so a "price stop
// without a price" cannot be represented. RiskValidator::evaluateStopLoss
// dispatches with std::visit; adding a kind is a compile error there until
// it is handled.
// -----------------------------------------------------------------------------
struct NoStopLoss {};

struct PriceStopLoss {
  double threshold{0.0};
};

struct DaysStopLoss {
  std::int64_t days{0};
};

struct TrailingStopLoss {
  double percent{0.0};
};

using StopLoss =
    std::variant<NoStopLoss, PriceStopLoss, DaysStopLoss, TrailingStopLoss>;

// Short description for logs, e.g. "price<=45.00", "days>=10", "none".
std::string describe(const StopLoss& stop_loss);

}  // namespace domain
}  // namespace backtest
