#include "backtest/positions/in_memory_position_store.hpp"

#include <cmath>
#include <mutex>
#include <stdexcept>

namespace backtest {

double unrealizedPl(const domain::Position& position, double current_price) {
  if (!position.isOpen()) {
    return 0.0;
  }
  return (current_price - position.entry_price) *
         static_cast<double>(position.quantity);
}

// -----------------------------------------------------------------------------
// open: validate, assign id, append
// -----------------------------------------------------------------------------
domain::Position InMemoryPositionStore::open(
    domain::AccountId account_id,
    const std::string& symbol,
    double entry_price,
    std::int64_t quantity,
    Timestamp entry_time,
    const domain::StopLoss& stop_loss) {
  if (quantity <= 0) {
    throw std::invalid_argument("Position quantity must be positive, got " +
                                std::to_string(quantity));
  }
  if (!std::isfinite(entry_price) || entry_price <= 0.0) {
    throw std::invalid_argument("Position entry price must be positive");
  }

  domain::Position pos;
  pos.account_id = account_id;
  pos.symbol = symbol;
  pos.entry_time = entry_time;
  pos.entry_price = entry_price;
  pos.quantity = quantity;
  pos.stop_loss = stop_loss;
  pos.status = domain::PositionStatus::Open;

  std::unique_lock lock(positions_mutex_);
  pos.id = id_gen_.next_id();
  index_.emplace(pos.id, positions_.size());
  positions_.push_back(pos);
  return pos;
}

// -----------------------------------------------------------------------------
// close: Open -> Closed, exactly once
// -----------------------------------------------------------------------------
std::optional<domain::Position> InMemoryPositionStore::close(
    domain::PositionId id,
    double exit_price,
    Timestamp exit_time,
    const std::string& reason) {
  std::unique_lock lock(positions_mutex_);
  auto it = index_.find(id);
  if (it == index_.end()) {
    return std::nullopt;
  }

  domain::Position& pos = positions_[it->second];
  if (!pos.isOpen()) {
    return std::nullopt;
  }

  domain::PositionExit exit;
  exit.time = exit_time;
  exit.price = exit_price;
  exit.reason = reason;
  exit.realized_pl =
      (exit_price - pos.entry_price) * static_cast<double>(pos.quantity);

  pos.status = domain::PositionStatus::Closed;
  pos.exit = exit;
  return pos;
}

// -----------------------------------------------------------------------------
// reduce: split `quantity` shares off into a new Closed record
// -----------------------------------------------------------------------------
std::optional<domain::Position> InMemoryPositionStore::reduce(
    domain::PositionId id,
    std::int64_t quantity,
    double exit_price,
    Timestamp exit_time,
    const std::string& reason) {
  std::unique_lock lock(positions_mutex_);
  auto it = index_.find(id);
  if (it == index_.end()) {
    return std::nullopt;
  }

  const std::size_t slot = it->second;
  if (!positions_[slot].isOpen() || quantity <= 0 ||
      quantity >= positions_[slot].quantity) {
    return std::nullopt;
  }

  domain::Position carved = positions_[slot];
  carved.id = id_gen_.next_id();
  carved.quantity = quantity;
  carved.status = domain::PositionStatus::Closed;

  domain::PositionExit exit;
  exit.time = exit_time;
  exit.price = exit_price;
  exit.reason = reason;
  exit.realized_pl =
      (exit_price - carved.entry_price) * static_cast<double>(quantity);
  carved.exit = exit;

  // push_back may reallocate; index by slot rather than holding a reference.
  positions_[slot].quantity -= quantity;
  index_.emplace(carved.id, positions_.size());
  positions_.push_back(carved);
  return carved;
}

std::optional<domain::Position> InMemoryPositionStore::find(
    domain::PositionId id) const {
  std::shared_lock lock(positions_mutex_);
  auto it = index_.find(id);
  if (it == index_.end()) {
    return std::nullopt;
  }
  return positions_[it->second];
}

std::vector<domain::Position> InMemoryPositionStore::openPositions(
    domain::AccountId account_id) const {
  std::shared_lock lock(positions_mutex_);
  std::vector<domain::Position> result;
  for (const auto& pos : positions_) {
    if (pos.account_id == account_id && pos.isOpen()) {
      result.push_back(pos);
    }
  }
  return result;
}

std::vector<domain::Position> InMemoryPositionStore::allPositions(
    domain::AccountId account_id) const {
  std::shared_lock lock(positions_mutex_);
  std::vector<domain::Position> result;
  for (const auto& pos : positions_) {
    if (pos.account_id == account_id) {
      result.push_back(pos);
    }
  }
  return result;
}

}  // namespace backtest
