#pragma once

#include "oms/domain/order.hpp"

#include <atomic>

namespace oms {

// -----------------------------------------------------------------------------
// OrderIdGenerator: monotonically increasing order id source
// -----------------------------------------------------------------------------
//
// @brief  Hands out order ids starting at 1 (0 is the "unset" sentinel).
//
// @details
// After a warm-up from the order store the generator is advanced past the
// highest hydrated id with observe(), so restarted engines never reissue an
// id that the store already holds.
//
// Thread model:
//   next_id() and observe() are safe to call concurrently.
//
// Ownership:
//   Owned by OrderManagementEngine as a value member and lent by reference to
//   the OrderStateMachine.
// -----------------------------------------------------------------------------
class OrderIdGenerator {
 public:
  OrderIdGenerator() = default;

  OrderIdGenerator(const OrderIdGenerator&) = delete;
  OrderIdGenerator& operator=(const OrderIdGenerator&) = delete;
  OrderIdGenerator(OrderIdGenerator&&) = delete;
  OrderIdGenerator& operator=(OrderIdGenerator&&) = delete;

  domain::OrderId next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

  // Ensures every future id is strictly greater than `used`.
  void observe(domain::OrderId used) {
    domain::OrderId expected = next_id_.load(std::memory_order_relaxed);
    while (expected <= used &&
           !next_id_.compare_exchange_weak(expected, used + 1,
                                           std::memory_order_relaxed)) {
    }
  }

 private:
  std::atomic<domain::OrderId> next_id_{1};
};

}  // namespace oms
