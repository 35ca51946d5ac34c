#include "oms/ledger/order_ledger.hpp"

#include <algorithm>

namespace oms {

OrderLedger::OrderLedger(ports::IOrderStore* store) : store_(store) {}

// -----------------------------------------------------------------------------
// insert(): new order, saved immediately
// -----------------------------------------------------------------------------
void OrderLedger::insert(LedgerEntry entry) {
  auto s = std::make_shared<Slot>();
  s->entry = std::move(entry);
  const domain::OrderId id = s->entry.order.order_id;

  // Lock the slot before publishing it in the index so no other thread can
  // mutate the order ahead of its initial save.
  std::lock_guard slot_lock(s->mutex);
  {
    std::unique_lock lock(index_mutex_);
    if (!slots_.emplace(id, s).second) {
      throw ValidationError("order id " + std::to_string(id) +
                            " already exists");
    }
  }
  persist(s->entry.order);
}

std::size_t OrderLedger::hydrate(const std::vector<domain::Order>& orders) {
  std::size_t inserted = 0;
  std::unique_lock lock(index_mutex_);
  for (const auto& order : orders) {
    auto s = std::make_shared<Slot>();
    s->entry.order = order;
    if (slots_.emplace(order.order_id, std::move(s)).second) {
      ++inserted;
    }
  }
  return inserted;
}

bool OrderLedger::contains(domain::OrderId order_id) const {
  std::shared_lock lock(index_mutex_);
  return slots_.count(order_id) != 0;
}

std::size_t OrderLedger::size() const {
  std::shared_lock lock(index_mutex_);
  return slots_.size();
}

domain::Order OrderLedger::snapshot(domain::OrderId order_id) const {
  return read(order_id, [](const LedgerEntry& e) { return e.order; });
}

// -----------------------------------------------------------------------------
// snapshots(): every order, sorted by id
// -----------------------------------------------------------------------------
std::vector<domain::Order> OrderLedger::snapshots() const {
  std::vector<std::shared_ptr<Slot>> copy;
  {
    std::shared_lock lock(index_mutex_);
    copy.reserve(slots_.size());
    for (const auto& entry : slots_) {
      copy.push_back(entry.second);
    }
  }

  std::vector<domain::Order> out;
  out.reserve(copy.size());
  for (const auto& s : copy) {
    std::lock_guard lock(s->mutex);
    out.push_back(s->entry.order);
  }
  std::sort(out.begin(), out.end(),
            [](const domain::Order& a, const domain::Order& b) {
              return a.order_id < b.order_id;
            });
  return out;
}

std::shared_ptr<OrderLedger::Slot> OrderLedger::slot(
    domain::OrderId order_id) const {
  std::shared_lock lock(index_mutex_);
  auto it = slots_.find(order_id);
  if (it == slots_.end()) {
    throw UnknownOrder(order_id);
  }
  return it->second;
}

void OrderLedger::persist(const domain::Order& order) {
  if (store_ != nullptr) {
    store_->save(order);
  }
}

}  // namespace oms
