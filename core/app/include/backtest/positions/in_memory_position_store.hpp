#pragma once

#include "backtest/concurrent/id_generator.hpp"
#include "backtest/positions/i_position_store.hpp"

#include <cstddef>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace backtest {

// -----------------------------------------------------------------------------
// InMemoryPositionStore
// -----------------------------------------------------------------------------
//
// @brief  Reference IPositionStore keeping every position in creation order.
//
// @details
// positions_ is an append-only vector, so iterating it yields positions in
// the order they were opened; openPositions() relies on this for FIFO lot
// selection. index_ maps id -> slot for O(1) lookups.
//
// The Open -> Closed transition in close()/reduce() happens under the
// exclusive lock, so two concurrent closes of the same id cannot both
// succeed: the second sees status Closed and returns std::nullopt.
//
// Thread model:
//   Mutations take positions_mutex_ exclusively; lookups take it shared.
//   Every public method is safe to call from any thread.
// -----------------------------------------------------------------------------
class InMemoryPositionStore final : public IPositionStore {
 public:
  InMemoryPositionStore() = default;

  InMemoryPositionStore(const InMemoryPositionStore&) = delete;
  InMemoryPositionStore& operator=(const InMemoryPositionStore&) = delete;

  domain::Position open(domain::AccountId account_id,
                        const std::string& symbol,
                        double entry_price,
                        std::int64_t quantity,
                        Timestamp entry_time,
                        const domain::StopLoss& stop_loss) override;

  std::optional<domain::Position> close(domain::PositionId id,
                                        double exit_price,
                                        Timestamp exit_time,
                                        const std::string& reason) override;

  std::optional<domain::Position> reduce(domain::PositionId id,
                                         std::int64_t quantity,
                                         double exit_price,
                                         Timestamp exit_time,
                                         const std::string& reason) override;

  std::optional<domain::Position> find(domain::PositionId id) const override;

  std::vector<domain::Position> openPositions(
      domain::AccountId account_id) const override;

  std::vector<domain::Position> allPositions(
      domain::AccountId account_id) const override;

 private:
  IdGenerator id_gen_;

  mutable std::shared_mutex positions_mutex_;
  std::vector<domain::Position> positions_;
  std::unordered_map<domain::PositionId, std::size_t> index_;
};

}  // namespace backtest
