#pragma once

#include "backtest/domain/order.hpp"
#include "backtest/domain/position.hpp"
#include "backtest/domain/risk_limits.hpp"
#include "backtest/execution/commission_model.hpp"
#include "backtest/ledger/account_lock_table.hpp"
#include "backtest/ledger/i_account_store.hpp"
#include "backtest/market/i_market_data_source.hpp"
#include "backtest/positions/i_position_store.hpp"
#include "backtest/risk/risk_validator.hpp"

#include <memory>
#include <optional>

namespace backtest {

// -----------------------------------------------------------------------------
// SaleCommissionPolicy
// -----------------------------------------------------------------------------
// How a sell's commission reaches the ledger.
//
//   DeductFromProceeds  cash += price * qty - commission
//   ReportOnly          cash += price * qty; the commission only shows up in
//                       the result's net_pl
//
// Buys always reserve price * qty + commission.
// -----------------------------------------------------------------------------
enum class SaleCommissionPolicy {
  DeductFromProceeds,
  ReportOnly,
};

const char* to_string(SaleCommissionPolicy policy);

struct CoordinatorOptions {
  SaleCommissionPolicy sale_commission_policy{
      SaleCommissionPolicy::DeductFromProceeds};
};

// -----------------------------------------------------------------------------
// OrderExecutionCoordinator - all-or-nothing order fills
// -----------------------------------------------------------------------------
//
// @brief  Turns an OrderRequest into ledger and position-book changes, or
//         into a failed OrderResult with nothing changed.
//
// @details
// Flow of execute(), entirely under the account's lock from
// AccountLockTable:
//
//   1. Load the account.                          NotFound
//   2. Reference quote = request quote, or the oracle's close at the order
//      time. RiskValidator::validate().           ValidationFailed
//   3. Execution price = oracle close at the order time.
//   4. Commission from the injected model.
//   5. Buy:  reserve price*qty + commission       InsufficientFunds
//            open the position; if that throws the reservation is released.
//   6. Sell: target = request.position_id, else the oldest Open lot of the
//            symbol (FIFO).                       NoOpenPosition
//            requested qty <= held qty.           InsufficientQuantity
//            close the lot (or reduce it for a partial sell), then credit
//            the proceeds per SaleCommissionPolicy.
//
// Every check that can fail runs before the first mutation, so a failed
// result always means no state changed.
//
// Exceptions:
//   domain::TemporalViolation is rethrown; it means the caller asked for the
//   future and the run must abort. domain::DataNotFound becomes a failed
//   result with ErrorKind::DataNotFound. Any other std::exception is logged
//   and returned as ErrorKind::Internal with its what() text.
//
// Thread model:
//   execute() is safe to call concurrently. Orders against the same account
//   are serialized; orders against different accounts run in parallel.
//
// Ownership:
//   Holds references to the oracle and both stores, which must outlive the
//   coordinator. Shares ownership of the commission model.
// -----------------------------------------------------------------------------
class OrderExecutionCoordinator {
 public:
  OrderExecutionCoordinator(
      const IMarketDataSource& market,
      IAccountStore& accounts,
      IPositionStore& positions,
      const domain::RiskLimits& limits = {},
      std::shared_ptr<const ICommissionModel> commission_model =
          std::make_shared<FlatCommissionModel>(),
      CoordinatorOptions options = {});

  OrderExecutionCoordinator(const OrderExecutionCoordinator&) = delete;
  OrderExecutionCoordinator& operator=(const OrderExecutionCoordinator&) =
      delete;

  // -------------------------------------------------------------------------
  // execute(order)
  // -------------------------------------------------------------------------
  // @brief  Fills the order completely or not at all.
  //
  // @return OrderResult. On success: position_id, execution_price,
  //         commission, execution_time, and for sells realized_pl / net_pl.
  //
  // @throws domain::TemporalViolation if order.timestamp is later than the
  //         oracle's current time.
  // -------------------------------------------------------------------------
  domain::OrderResult execute(const domain::OrderRequest& order);

  const RiskValidator& validator() const { return validator_; }
  const CoordinatorOptions& options() const { return options_; }

 private:
  domain::OrderResult executeLocked(const domain::OrderRequest& order);

  domain::OrderResult executeBuy(const domain::OrderRequest& order,
                                 double price,
                                 double commission);

  domain::OrderResult executeSell(const domain::OrderRequest& order,
                                  const domain::Account& account,
                                  double price,
                                  double commission);

  // Resolves which Open lot a sell applies to. std::nullopt if none.
  std::optional<domain::Position> sellTarget(
      const domain::OrderRequest& order) const;

  const IMarketDataSource& market_;
  IAccountStore& accounts_;
  IPositionStore& positions_;
  const RiskValidator validator_;
  std::shared_ptr<const ICommissionModel> commission_model_;
  const CoordinatorOptions options_;

  AccountLockTable locks_;
};

}  // namespace backtest
