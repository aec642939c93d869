#pragma once

#include <stdexcept>
#include <string>

namespace backtest {
namespace domain {

// -----------------------------------------------------------------------------
// ErrorKind - failure taxonomy shared by every core component
// -----------------------------------------------------------------------------
//
// @brief  Classifies why an operation did not succeed.
//
// @details
// Business outcomes (a rejected order, a sell with nothing to sell) are not
// exceptional: they travel back to the caller inside result structs
// (OrderResult, SizingResult, ...) tagged with one of these kinds, and the
// backtest carries on.
//
// Only two kinds are ever raised as exceptions:
//   TemporalViolation - a point query asked for data beyond simulated "now".
//                       This is lookahead bias; every downstream number
//                       would be invalid, so the whole run aborts.
//   DataNotFound      - the oracle has no bar for a symbol at or before the
//                       requested time. The coordinator converts it into a
//                       failed order; the loop skips the symbol.
// -----------------------------------------------------------------------------
enum class ErrorKind {
  None,
  ValidationFailed,      // Risk rule violated; order rejected pre-trade
  NotFound,              // Unknown account or position
  NoOpenPosition,        // Sell with no Open position for the symbol
  InsufficientFunds,     // Reservation larger than available cash
  InsufficientQuantity,  // Sell larger than the held position
  InvalidStopPrice,      // Sizing input with stop >= entry
  DataNotFound,          // No market data at or before the requested time
  TemporalViolation,     // Point query beyond simulated "now"
  Internal,              // Unexpected fault caught at a component boundary
};

// Stable, human-readable name ("InsufficientFunds", ...). Used in logs and
// in the serialized rejected-order list.
const char* to_string(ErrorKind kind);

// -----------------------------------------------------------------------------
// TemporalViolation
// -----------------------------------------------------------------------------
// Thrown by the market data oracle on a point query whose as-of time is
// later than the current simulation time, and by the simulation clock when
// asked to move backwards. Never caught inside the core.
// -----------------------------------------------------------------------------
class TemporalViolation : public std::logic_error {
 public:
  explicit TemporalViolation(const std::string& what)
      : std::logic_error(what) {}
};

// -----------------------------------------------------------------------------
// DataNotFound
// -----------------------------------------------------------------------------
// Thrown by the market data oracle when a symbol is unknown or has no bar at
// or before the requested time.
// -----------------------------------------------------------------------------
class DataNotFound : public std::runtime_error {
 public:
  explicit DataNotFound(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace domain
}  // namespace backtest
