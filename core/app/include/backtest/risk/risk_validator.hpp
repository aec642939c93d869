#pragma once

#include "backtest/domain/account.hpp"
#include "backtest/domain/error.hpp"
#include "backtest/domain/order.hpp"
#include "backtest/domain/position.hpp"
#include "backtest/domain/risk_limits.hpp"
#include "backtest/time/time_utils.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace backtest {

struct ValidationResult {
  bool valid{false};
  std::string message;  // Empty when valid
};

// -----------------------------------------------------------------------------
// StopDecision
// -----------------------------------------------------------------------------
// `reason` is always set, including when nothing triggered ("No stop loss
// configured", "Stop loss conditions not met"). `trigger_price` is the
// price the exit should be attempted at, present only when triggered.
// -----------------------------------------------------------------------------
struct StopDecision {
  bool triggered{false};
  std::string reason;
  std::optional<double> trigger_price;
};

struct SizingResult {
  domain::ErrorKind error{domain::ErrorKind::None};
  std::int64_t shares{0};
  std::string message;

  bool ok() const { return error == domain::ErrorKind::None; }
};

// -----------------------------------------------------------------------------
// RiskValidator
// -----------------------------------------------------------------------------
//
// @brief  Stateless pre-trade checks, stop-loss evaluation and risk-based
//         position sizing.
//
// @details
// Holds nothing but a copy of the RiskLimits it was built with, so every
// method is a pure function of its arguments and safe to call from any
// thread.
//
// Pre-trade checks (validate), first failure wins:
//
//   1. Account must be active.
//   2. Quantity must be positive.
//   3. Order value (reference_price * quantity) must not exceed
//      max_position_fraction * initial_capital. Applied to both sides.
//   4. Buys only: order value + estimated_commission must not exceed the
//      account's available cash.
//
// These are estimates against the quote the caller saw. The coordinator
// re-prices against the oracle before it moves any money, and the ledger
// enforces the hard cash constraint.
// -----------------------------------------------------------------------------
class RiskValidator {
 public:
  explicit RiskValidator(const domain::RiskLimits& limits = {});

  // -------------------------------------------------------------------------
  // validate(order, account, reference_price)
  // -------------------------------------------------------------------------
  // @return {true, ""} if the order passes every check, otherwise
  //         {false, <first failing rule>}.
  //
  // Side-effects: None.
  // -------------------------------------------------------------------------
  ValidationResult validate(const domain::OrderRequest& order,
                            const domain::Account& account,
                            double reference_price) const;

  // -------------------------------------------------------------------------
  // evaluateStopLoss(position, current_price, current_time)
  // -------------------------------------------------------------------------
  // @brief  Decides whether an Open position's stop-loss fires.
  //
  // @details
  //   PriceStopLoss     current_price <= threshold. Trigger price is
  //                     current_price.
  //   DaysStopLoss      whole_days_between(entry_time, current_time) >= days.
  //                     Trigger price is current_price.
  //   NoStopLoss        never.
  //   TrailingStopLoss  never (no high-water mark is tracked).
  //
  // Closed positions never trigger.
  // -------------------------------------------------------------------------
  StopDecision evaluateStopLoss(const domain::Position& position,
                                double current_price,
                                Timestamp current_time) const;

  // -------------------------------------------------------------------------
  // positionSize(balance, risk_fraction, entry_price, stop_price)
  // -------------------------------------------------------------------------
  // @brief  Shares such that hitting the stop loses at most
  //         balance * risk_fraction:
  //
  //           floor(balance * risk_fraction / (entry_price - stop_price))
  //
  // @return error InvalidStopPrice if stop_price >= entry_price,
  //         ValidationFailed if balance or risk_fraction is negative.
  //
  // Example: balance 10,000, risk 0.02, entry 50, stop 49 -> 200 shares.
  // -------------------------------------------------------------------------
  SizingResult positionSize(double balance,
                            double risk_fraction,
                            double entry_price,
                            double stop_price) const;

  const domain::RiskLimits& limits() const { return limits_; }

 private:
  const domain::RiskLimits limits_;
};

// Formats an amount the way risk and order messages print money:
// two decimals with thousands separators ("1,234.50", "-7.00").
// Non-finite amounts print as "inf", "-inf" or "nan".
std::string formatMoney(double amount);

}  // namespace backtest
