#pragma once

#include <atomic>
#include <cstdint>

namespace riskledger {

// Monotonic id source for orders and trade records. Ids start at 1 so 0 can
// mean "unassigned". reset() is used only by ExecutionLedger::reset().
class OrderIdGenerator {
 public:
  OrderIdGenerator() = default;

  OrderIdGenerator(const OrderIdGenerator&) = delete;
  OrderIdGenerator& operator=(const OrderIdGenerator&) = delete;
  OrderIdGenerator(OrderIdGenerator&&) = delete;
  OrderIdGenerator& operator=(OrderIdGenerator&&) = delete;

  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

  // Id the next call to next_id() will return.
  std::uint64_t peek() const {
    return next_id_.load(std::memory_order_relaxed);
  }

  void reset() { next_id_.store(1, std::memory_order_relaxed); }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace riskledger
