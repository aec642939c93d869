#pragma once

#include <cstdint>

namespace backtest {

// -----------------------------------------------------------------------------
// ICommissionModel - pluggable commission calculation
// -----------------------------------------------------------------------------
//
// @brief  Computes the commission charged on one fill.
//
// @details
// Injected into OrderExecutionCoordinator as shared_ptr<const ...>, so one
// model may be shared by several coordinators. Implementations must be pure
// (same inputs, same output) for backtests to stay deterministic.
// -----------------------------------------------------------------------------
class ICommissionModel {
 public:
  virtual ~ICommissionModel() = default;

  virtual double commission(std::int64_t quantity, double price) const = 0;
};

// -----------------------------------------------------------------------------
// FlatCommissionModel
// -----------------------------------------------------------------------------
// The same fee on every fill regardless of size. Default 5.00.
// -----------------------------------------------------------------------------
class FlatCommissionModel final : public ICommissionModel {
 public:
  static constexpr double kDefaultFee = 5.0;

  explicit FlatCommissionModel(double fee = kDefaultFee) : fee_(fee) {}

  double commission(std::int64_t /*quantity*/,
                    double /*price*/) const override {
    return fee_;
  }

  double fee() const { return fee_; }

 private:
  double fee_;
};

}  // namespace backtest
