#include "backtest/ledger/account_lock_table.hpp"

namespace backtest {

std::unique_lock<std::mutex> AccountLockTable::acquire(domain::AccountId id) {
  std::mutex* account_mutex = nullptr;
  {
    std::lock_guard<std::mutex> guard(table_mutex_);
    auto& slot = locks_[id];
    if (!slot) {
      slot = std::make_unique<std::mutex>();
    }
    account_mutex = slot.get();
  }
  return std::unique_lock<std::mutex>(*account_mutex);
}

}  // namespace backtest
