#pragma once

#include "oms/core/error.hpp"
#include "oms/domain/execution_report.hpp"
#include "oms/domain/order.hpp"
#include "oms/domain/order_status.hpp"
#include "oms/ports/i_order_store.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace oms {

// One audit line per status change.
struct TransitionRecord {
  domain::OrderStatus from{domain::OrderStatus::Pending};
  domain::OrderStatus to{domain::OrderStatus::Pending};
  std::string reason;
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// LedgerEntry
// -----------------------------------------------------------------------------
// Everything the ledger keeps for one order. outstanding_activity counts
// in-flight venue calls plus one token per running algorithmic schedule;
// PENDING_CANCEL is confirmed as CANCELED only when it drops to zero.
// -----------------------------------------------------------------------------
struct LedgerEntry {
  domain::Order order;
  int outstanding_activity{0};
  // Venue quantity covered by the outstanding activity tokens.
  domain::Quantity in_flight_quantity{0};
  // Status confirmed once a PENDING_CANCEL order has no outstanding
  // activity left: CANCELED, or EXPIRED for an expiry that had to drain.
  domain::OrderStatus drain_target{domain::OrderStatus::Canceled};
  std::unordered_set<std::string> seen_execution_ids;
  std::vector<TransitionRecord> history;
  std::vector<domain::FillRecord> fills;
};

// -----------------------------------------------------------------------------
// OrderLedger: authoritative order records
// -----------------------------------------------------------------------------
//
// @brief  Holds every order the engine knows about and serializes all
//         mutation of a given order through one lock.
//
// @details
// Each order lives in its own slot with its own mutex. mutate() locks that
// slot, runs the caller's function, then saves the resulting order to the
// IOrderStore (when one is attached) before releasing the lock. Operations
// on different orders never contend beyond the brief shared lock on the
// index map.
//
// The ledger does not enforce lifecycle rules; the OrderStateMachine is its
// only writer and validates every change before calling mutate().
//
// Thread model:
//   All members are thread-safe. Callbacks passed to mutate()/read() run
//   with the order's lock held and must not re-enter the ledger for the same
//   order.
//
// Ownership:
//   Owned by OrderManagementEngine. Holds a non-owning pointer to the store.
// -----------------------------------------------------------------------------
class OrderLedger {
 public:
  explicit OrderLedger(ports::IOrderStore* store = nullptr);

  OrderLedger(const OrderLedger&) = delete;
  OrderLedger& operator=(const OrderLedger&) = delete;

  // Throws ValidationError when the id is already present.
  void insert(LedgerEntry entry);

  // -------------------------------------------------------------------------
  // hydrate(orders)
  // -------------------------------------------------------------------------
  // Start-up warm-up: adds orders loaded from the store without saving them
  // back. Ids already present are skipped. Returns the number inserted.
  // -------------------------------------------------------------------------
  std::size_t hydrate(const std::vector<domain::Order>& orders);

  bool contains(domain::OrderId order_id) const;
  std::size_t size() const;

  // Throws UnknownOrder.
  domain::Order snapshot(domain::OrderId order_id) const;
  std::vector<domain::Order> snapshots() const;

  template <typename Fn>
  auto mutate(domain::OrderId order_id, Fn&& fn)
      -> decltype(fn(std::declval<LedgerEntry&>()));

  template <typename Fn>
  auto read(domain::OrderId order_id, Fn&& fn) const
      -> decltype(fn(std::declval<const LedgerEntry&>()));

 private:
  struct Slot {
    mutable std::mutex mutex;
    LedgerEntry entry;
  };

  std::shared_ptr<Slot> slot(domain::OrderId order_id) const;
  void persist(const domain::Order& order);

  mutable std::shared_mutex index_mutex_;
  std::unordered_map<domain::OrderId, std::shared_ptr<Slot>> slots_;
  ports::IOrderStore* store_;
};

template <typename Fn>
auto OrderLedger::mutate(domain::OrderId order_id, Fn&& fn)
    -> decltype(fn(std::declval<LedgerEntry&>())) {
  auto s = slot(order_id);
  std::lock_guard lock(s->mutex);
  if constexpr (std::is_void_v<decltype(fn(s->entry))>) {
    fn(s->entry);
    persist(s->entry.order);
  } else {
    auto result = fn(s->entry);
    persist(s->entry.order);
    return result;
  }
}

template <typename Fn>
auto OrderLedger::read(domain::OrderId order_id, Fn&& fn) const
    -> decltype(fn(std::declval<const LedgerEntry&>())) {
  auto s = slot(order_id);
  std::lock_guard lock(s->mutex);
  return fn(static_cast<const LedgerEntry&>(s->entry));
}

}  // namespace oms
