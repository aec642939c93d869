#pragma once

namespace backtest {
namespace domain {

// -----------------------------------------------------------------------------
// RiskLimits: pre-trade risk parameters
// -----------------------------------------------------------------------------
//
// @brief  Thresholds applied by RiskValidator::validate().
//
// @details
// Copied by value into the validator at construction and constant for the
// lifetime of a run. The JSON request may override any field
// ("riskLimits": {"maxPositionFraction": ..., "estimatedCommission": ...}).
// -----------------------------------------------------------------------------
struct RiskLimits {
  /// Largest order value allowed, as a fraction of the account's initial
  /// capital. 0.25 means no single order may exceed 25% of starting equity.
  double max_position_fraction{0.25};

  /// Commission assumed by the pre-trade cash check for buys. The actual
  /// commission is charged later by the coordinator's commission model.
  double estimated_commission{5.0};
};

}  // namespace domain
}  // namespace backtest
