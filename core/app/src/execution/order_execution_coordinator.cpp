#include "backtest/execution/order_execution_coordinator.hpp"
#include "backtest/domain/error.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace backtest {

namespace {

domain::OrderResult failure(domain::ErrorKind kind, std::string message) {
  domain::OrderResult result;
  result.success = false;
  result.error = kind;
  result.message = std::move(message);
  return result;
}

domain::OrderResult ledgerFailure(LedgerStatus status, double amount,
                                  double available) {
  switch (status) {
    case LedgerStatus::NotFound:
      return failure(domain::ErrorKind::NotFound, "Account not found");
    case LedgerStatus::InsufficientFunds:
      return failure(domain::ErrorKind::InsufficientFunds,
                     "Insufficient funds. Required: $" + formatMoney(amount) +
                         ", Available: $" + formatMoney(available));
    case LedgerStatus::InvalidAmount:
    case LedgerStatus::Ok:
      break;
  }
  return failure(domain::ErrorKind::Internal,
                 std::string("Ledger rejected amount $") + formatMoney(amount) +
                     " (" + to_string(status) + ")");
}

}  // namespace

const char* to_string(SaleCommissionPolicy policy) {
  switch (policy) {
    case SaleCommissionPolicy::DeductFromProceeds:
      return "DeductFromProceeds";
    case SaleCommissionPolicy::ReportOnly:
      return "ReportOnly";
  }
  return "Unknown";
}

OrderExecutionCoordinator::OrderExecutionCoordinator(
    const IMarketDataSource& market,
    IAccountStore& accounts,
    IPositionStore& positions,
    const domain::RiskLimits& limits,
    std::shared_ptr<const ICommissionModel> commission_model,
    CoordinatorOptions options)
    : market_(market),
      accounts_(accounts),
      positions_(positions),
      validator_(limits),
      commission_model_(std::move(commission_model)),
      options_(options) {
  if (!commission_model_) {
    throw std::invalid_argument(
        "OrderExecutionCoordinator requires a commission model");
  }
}

// -----------------------------------------------------------------------------
// execute: serialize per account, translate exceptions at the boundary
// -----------------------------------------------------------------------------
domain::OrderResult OrderExecutionCoordinator::execute(
    const domain::OrderRequest& order) {
  auto account_lock = locks_.acquire(order.account_id);

  try {
    return executeLocked(order);
  } catch (const domain::TemporalViolation&) {
    throw;
  } catch (const domain::DataNotFound& e) {
    return failure(domain::ErrorKind::DataNotFound, e.what());
  } catch (const std::exception& e) {
    std::cerr << "[OrderExecutionCoordinator] ERROR: order for "
              << order.symbol << " (account " << order.account_id
              << ") failed: " << e.what() << "\n";
    return failure(domain::ErrorKind::Internal, e.what());
  }
}

domain::OrderResult OrderExecutionCoordinator::executeLocked(
    const domain::OrderRequest& order) {
  // --- 1. Account -----------------------------------------------------------
  const std::optional<domain::Account> account = accounts_.get(order.account_id);
  if (!account) {
    return failure(domain::ErrorKind::NotFound,
                   "Account " + std::to_string(order.account_id) +
                       " not found");
  }

  // --- 2. Pre-trade validation against the caller's quote -------------------
  const double reference_price =
      order.reference_price
          ? *order.reference_price
          : market_.priceAt(order.symbol, order.timestamp).close;

  const ValidationResult validation =
      validator_.validate(order, *account, reference_price);
  if (!validation.valid) {
    return failure(domain::ErrorKind::ValidationFailed, validation.message);
  }

  // --- 3. Execution price ---------------------------------------------------
  const double price = market_.priceAt(order.symbol, order.timestamp).close;

  // --- 4. Commission --------------------------------------------------------
  const double commission = commission_model_->commission(order.quantity, price);

  return (order.side == domain::Side::Buy)
             ? executeBuy(order, price, commission)
             : executeSell(order, *account, price, commission);
}

// -----------------------------------------------------------------------------
// executeBuy: reserve, then open; release if opening fails
// -----------------------------------------------------------------------------
domain::OrderResult OrderExecutionCoordinator::executeBuy(
    const domain::OrderRequest& order, double price, double commission) {
  const double total_cost =
      price * static_cast<double>(order.quantity) + commission;

  const LedgerStatus reserved = accounts_.reserve(order.account_id, total_cost);
  if (reserved != LedgerStatus::Ok) {
    const auto account = accounts_.get(order.account_id);
    return ledgerFailure(reserved, total_cost, account ? account->cash : 0.0);
  }

  domain::Position opened;
  try {
    opened = positions_.open(order.account_id, order.symbol, price,
                             order.quantity, order.timestamp, order.stop_loss);
  } catch (const std::exception& e) {
    const LedgerStatus released =
        accounts_.release(order.account_id, total_cost);
    if (released != LedgerStatus::Ok) {
      std::cerr << "[OrderExecutionCoordinator] CRITICAL: could not release $"
                << formatMoney(total_cost) << " for account "
                << order.account_id << " (" << to_string(released) << ")\n";
    }
    return failure(domain::ErrorKind::Internal,
                   std::string("Failed to open position: ") + e.what());
  }

  domain::OrderResult result;
  result.success = true;
  result.position_id = opened.id;
  result.execution_price = price;
  result.commission = commission;
  result.execution_time = order.timestamp;
  return result;
}

std::optional<domain::Position> OrderExecutionCoordinator::sellTarget(
    const domain::OrderRequest& order) const {
  if (order.position_id) {
    auto pos = positions_.find(*order.position_id);
    if (pos && pos->isOpen() && pos->account_id == order.account_id &&
        pos->symbol == order.symbol) {
      return pos;
    }
    return std::nullopt;
  }

  // Oldest open lot first.
  for (const auto& pos : positions_.openPositions(order.account_id)) {
    if (pos.symbol == order.symbol) {
      return pos;
    }
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// executeSell: every check before the first mutation, then close and credit
// -----------------------------------------------------------------------------
domain::OrderResult OrderExecutionCoordinator::executeSell(
    const domain::OrderRequest& order,
    const domain::Account& account,
    double price,
    double commission) {
  const std::optional<domain::Position> target = sellTarget(order);
  if (!target) {
    return failure(domain::ErrorKind::NoOpenPosition,
                   "No open position for " + order.symbol);
  }

  if (order.quantity > target->quantity) {
    return failure(domain::ErrorKind::InsufficientQuantity,
                   "Insufficient shares. Have " +
                       std::to_string(target->quantity) + ", requested " +
                       std::to_string(order.quantity));
  }

  const double gross = price * static_cast<double>(order.quantity);
  const double credit =
      (options_.sale_commission_policy ==
       SaleCommissionPolicy::DeductFromProceeds)
          ? gross - commission
          : gross;

  // A commission larger than the proceeds makes the credit negative; refuse
  // before closing anything if the account cannot absorb it.
  if (account.cash + credit < 0.0) {
    return failure(domain::ErrorKind::InsufficientFunds,
                   "Insufficient funds to cover commission. Required: $" +
                       formatMoney(-credit) + ", Available: $" +
                       formatMoney(account.cash));
  }

  const std::string reason =
      order.reason.empty() ? std::string("Sell order") : order.reason;

  const std::optional<domain::Position> closed =
      (order.quantity == target->quantity)
          ? positions_.close(target->id, price, order.timestamp, reason)
          : positions_.reduce(target->id, order.quantity, price,
                              order.timestamp, reason);
  if (!closed || !closed->exit) {
    return failure(domain::ErrorKind::NoOpenPosition,
                   "Position " + std::to_string(target->id) +
                       " is no longer open");
  }

  const LedgerStatus credited = accounts_.applyPnl(order.account_id, credit);
  if (credited != LedgerStatus::Ok) {
    // Unreachable while every writer goes through the account lock: the
    // balance was checked above under the same lock.
    std::cerr << "[OrderExecutionCoordinator] CRITICAL: position "
              << closed->id << " closed but proceeds of $"
              << formatMoney(credit) << " were not credited ("
              << to_string(credited) << ")\n";
    return failure(domain::ErrorKind::Internal,
                   std::string("Failed to credit sale proceeds: ") +
                       to_string(credited));
  }

  domain::OrderResult result;
  result.success = true;
  result.position_id = closed->id;
  result.execution_price = price;
  result.commission = commission;
  result.realized_pl = closed->exit->realized_pl;
  result.net_pl = closed->exit->realized_pl - commission;
  result.execution_time = order.timestamp;
  return result;
}

}  // namespace backtest
