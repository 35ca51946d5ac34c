#pragma once

#include "oms/ports/i_order_store.hpp"

#include <cstddef>
#include <mutex>
#include <unordered_map>

namespace oms {

// -----------------------------------------------------------------------------
// InMemoryOrderStore
// -----------------------------------------------------------------------------
// IOrderStore kept in a hash map. Used by the gateway executable and by
// tests that check what the ledger persisted; a database-backed store plugs
// in behind the same interface.
// -----------------------------------------------------------------------------
class InMemoryOrderStore final : public ports::IOrderStore {
 public:
  InMemoryOrderStore() = default;

  InMemoryOrderStore(const InMemoryOrderStore&) = delete;
  InMemoryOrderStore& operator=(const InMemoryOrderStore&) = delete;

  std::optional<domain::Order> load(domain::OrderId order_id) override;
  void save(const domain::Order& order) override;
  std::vector<domain::Order> loadAll() override;

  // Total save() calls since construction.
  std::size_t saveCount() const;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<domain::OrderId, domain::Order> orders_;
  std::size_t save_count_{0};
};

}  // namespace oms
