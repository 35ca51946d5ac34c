#include "oms/ledger/in_memory_order_store.hpp"

#include <algorithm>

namespace oms {

std::optional<domain::Order> InMemoryOrderStore::load(domain::OrderId order_id) {
  std::lock_guard lock(mutex_);
  auto it = orders_.find(order_id);
  if (it == orders_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void InMemoryOrderStore::save(const domain::Order& order) {
  std::lock_guard lock(mutex_);
  orders_[order.order_id] = order;
  ++save_count_;
}

std::vector<domain::Order> InMemoryOrderStore::loadAll() {
  std::vector<domain::Order> out;
  {
    std::lock_guard lock(mutex_);
    out.reserve(orders_.size());
    for (const auto& entry : orders_) {
      out.push_back(entry.second);
    }
  }
  std::sort(out.begin(), out.end(),
            [](const domain::Order& a, const domain::Order& b) {
              return a.order_id < b.order_id;
            });
  return out;
}

std::size_t InMemoryOrderStore::saveCount() const {
  std::lock_guard lock(mutex_);
  return save_count_;
}

}  // namespace oms
