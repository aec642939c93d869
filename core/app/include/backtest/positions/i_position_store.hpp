#pragma once

#include "backtest/domain/account.hpp"
#include "backtest/domain/position.hpp"
#include "backtest/domain/stop_loss.hpp"
#include "backtest/time/time_utils.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace backtest {

// -----------------------------------------------------------------------------
// IPositionStore - position book contract
// -----------------------------------------------------------------------------
//
// @brief  Owns the open and closed positions of every account.
//
// @details
// Positions are lots: every buy opens a new one with its own id. A position
// moves Open -> Closed exactly once; the store never modifies a Closed
// record afterwards.
//
// Lookups return copies (std::optional / std::vector by value), so callers
// never hold references into the store.
// -----------------------------------------------------------------------------
class IPositionStore {
 public:
  virtual ~IPositionStore() = default;

  // -------------------------------------------------------------------------
  // open(account_id, symbol, entry_price, quantity, entry_time, stop_loss)
  // -------------------------------------------------------------------------
  // @brief  Records a new Open position with a fresh id.
  //
  // @throws std::invalid_argument if quantity <= 0 or entry_price is not a
  //         positive finite number. No record is created.
  // -------------------------------------------------------------------------
  virtual domain::Position open(domain::AccountId account_id,
                                const std::string& symbol,
                                double entry_price,
                                std::int64_t quantity,
                                Timestamp entry_time,
                                const domain::StopLoss& stop_loss) = 0;

  // -------------------------------------------------------------------------
  // close(id, exit_price, exit_time, reason)
  // -------------------------------------------------------------------------
  // @brief  Transitions an Open position to Closed.
  //
  // @return The closed record with
  //           realized_pl = (exit_price - entry_price) * quantity,
  //         or std::nullopt if the id is unknown or already Closed.
  // -------------------------------------------------------------------------
  virtual std::optional<domain::Position> close(domain::PositionId id,
                                                double exit_price,
                                                Timestamp exit_time,
                                                const std::string& reason) = 0;

  // -------------------------------------------------------------------------
  // reduce(id, quantity, exit_price, exit_time, reason)
  // -------------------------------------------------------------------------
  // @brief  Partial close: carves `quantity` shares out of an Open position.
  //
  // @return A new Closed record (new id, same entry economics, `quantity`
  //         shares). The source position keeps its id and stays Open with
  //         the remaining shares. std::nullopt if the id is unknown or
  //         Closed, or if quantity is not strictly between 0 and the held
  //         quantity (use close() for the whole lot).
  // -------------------------------------------------------------------------
  virtual std::optional<domain::Position> reduce(domain::PositionId id,
                                                 std::int64_t quantity,
                                                 double exit_price,
                                                 Timestamp exit_time,
                                                 const std::string& reason) = 0;

  virtual std::optional<domain::Position> find(domain::PositionId id) const = 0;

  // Open positions for the account, in the order they were opened.
  virtual std::vector<domain::Position> openPositions(
      domain::AccountId account_id) const = 0;

  // Every position (open and closed) for the account, in creation order.
  virtual std::vector<domain::Position> allPositions(
      domain::AccountId account_id) const = 0;
};

// -----------------------------------------------------------------------------
// unrealizedPl(position, current_price)
// -----------------------------------------------------------------------------
// (current_price - entry_price) * quantity for an Open position, 0 for a
// Closed one.
// -----------------------------------------------------------------------------
double unrealizedPl(const domain::Position& position, double current_price);

}  // namespace backtest
