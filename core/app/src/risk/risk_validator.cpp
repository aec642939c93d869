#include "backtest/risk/risk_validator.hpp"

#include <cmath>
#include <cstdio>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace backtest {

std::string formatMoney(double amount) {
  if (std::isnan(amount)) {
    return "nan";
  }
  if (std::isinf(amount)) {
    return amount < 0.0 ? "-inf" : "inf";
  }

  // Sized from a dry run: a finite double can need over 300 digits.
  const double magnitude = std::fabs(amount);
  const int length = std::snprintf(nullptr, 0, "%.2f", magnitude);
  if (length <= 0) {
    return std::to_string(amount);
  }
  std::vector<char> buf(static_cast<std::size_t>(length) + 1);
  std::snprintf(buf.data(), buf.size(), "%.2f", magnitude);
  const std::string digits(buf.data(), static_cast<std::size_t>(length));

  const std::size_t dot = digits.find('.');
  if (dot == std::string::npos) {
    return std::to_string(amount);
  }
  std::string whole = digits.substr(0, dot);
  const std::string frac = digits.substr(dot);

  std::string grouped;
  int count = 0;
  for (auto it = whole.rbegin(); it != whole.rend(); ++it) {
    if (count > 0 && count % 3 == 0) {
      grouped.insert(grouped.begin(), ',');
    }
    grouped.insert(grouped.begin(), *it);
    ++count;
  }

  // Avoid printing "-0.00".
  const bool negative = amount < 0.0 && grouped + frac != "0.00";
  return (negative ? "-" : "") + grouped + frac;
}

RiskValidator::RiskValidator(const domain::RiskLimits& limits)
    : limits_(limits) {}

// -----------------------------------------------------------------------------
// validate: first failing rule wins
// -----------------------------------------------------------------------------
ValidationResult RiskValidator::validate(const domain::OrderRequest& order,
                                         const domain::Account& account,
                                         double reference_price) const {
  if (!account.active) {
    return {false, "Account is not active"};
  }

  if (order.quantity <= 0) {
    return {false, "Order quantity must be positive, got " +
                       std::to_string(order.quantity)};
  }

  const double order_value =
      reference_price * static_cast<double>(order.quantity);
  const double max_position_value =
      account.initial_capital * limits_.max_position_fraction;
  if (order_value > max_position_value) {
    return {false, "Order value $" + formatMoney(order_value) +
                       " exceeds maximum position size $" +
                       formatMoney(max_position_value)};
  }

  if (order.side == domain::Side::Buy) {
    const double total_required = order_value + limits_.estimated_commission;
    if (total_required > account.cash) {
      return {false, "Insufficient funds. Required: $" +
                         formatMoney(total_required) + ", Available: $" +
                         formatMoney(account.cash)};
    }
  }

  return {true, ""};
}

// -----------------------------------------------------------------------------
// evaluateStopLoss: dispatch on the stop-loss alternative
// -----------------------------------------------------------------------------
StopDecision RiskValidator::evaluateStopLoss(const domain::Position& position,
                                             double current_price,
                                             Timestamp current_time) const {
  if (!position.isOpen()) {
    return {false, "Position is not open", std::nullopt};
  }

  return std::visit(
      [&](const auto& rule) -> StopDecision {
        using T = std::decay_t<decltype(rule)>;

        if constexpr (std::is_same_v<T, domain::NoStopLoss>) {
          return {false, "No stop loss configured", std::nullopt};

        } else if constexpr (std::is_same_v<T, domain::PriceStopLoss>) {
          if (current_price <= rule.threshold) {
            return {true,
                    "Price stop loss triggered: $" +
                        formatMoney(current_price) + " <= $" +
                        formatMoney(rule.threshold),
                    current_price};
          }

        } else if constexpr (std::is_same_v<T, domain::DaysStopLoss>) {
          const std::int64_t days_held =
              whole_days_between(position.entry_time, current_time);
          if (days_held >= rule.days) {
            return {true,
                    "Time-based stop loss triggered: held for " +
                        std::to_string(days_held) + " days",
                    current_price};
          }

        } else {
          static_assert(std::is_same_v<T, domain::TrailingStopLoss>,
                        "unhandled stop-loss kind");
          // Inert: no high-water mark is tracked per position.
        }

        return {false, "Stop loss conditions not met", std::nullopt};
      },
      position.stop_loss);
}

SizingResult RiskValidator::positionSize(double balance,
                                         double risk_fraction,
                                         double entry_price,
                                         double stop_price) const {
  SizingResult result;

  if (stop_price >= entry_price) {
    result.error = domain::ErrorKind::InvalidStopPrice;
    result.message = "Stop loss price must be below entry price";
    return result;
  }
  if (balance < 0.0 || risk_fraction < 0.0) {
    result.error = domain::ErrorKind::ValidationFailed;
    result.message = "Balance and risk fraction must be non-negative";
    return result;
  }

  const double risk_amount = balance * risk_fraction;
  const double risk_per_share = entry_price - stop_price;
  result.shares =
      static_cast<std::int64_t>(std::floor(risk_amount / risk_per_share));
  return result;
}

}  // namespace backtest
