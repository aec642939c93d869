#pragma once

#include <atomic>
#include <cstdint>

namespace backtest {

// -----------------------------------------------------------------------------
// IdGenerator - thread-safe, monotonically increasing id source
// -----------------------------------------------------------------------------
//
// @brief  Hands out unique ids from an atomic counter.
//
// @details
// Starts at 1; 0 is reserved as the "unset" sentinel in domain structs.
// Ids are unique per generator instance, not globally. The position store
// owns one as a value member, so two stores (two concurrent backtests)
// number their positions independently and a given input always produces
// the same ids.
//
// fetch_add with relaxed ordering is enough: the only requirement is that
// each call returns a distinct value.
//
// Thread model: next_id() is safe to call concurrently from any thread.
// -----------------------------------------------------------------------------
class IdGenerator {
 public:
  IdGenerator() = default;

  IdGenerator(const IdGenerator&) = delete;
  IdGenerator& operator=(const IdGenerator&) = delete;
  IdGenerator(IdGenerator&&) = delete;
  IdGenerator& operator=(IdGenerator&&) = delete;

  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace backtest
