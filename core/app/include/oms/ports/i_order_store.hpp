#pragma once

#include "oms/domain/order.hpp"

#include <optional>
#include <vector>

namespace oms {
namespace ports {

// -----------------------------------------------------------------------------
// IOrderStore: order ledger persistence
// -----------------------------------------------------------------------------
//
// @brief  Durable copy of every order the ledger holds.
//
// @details
// The OrderLedger calls save() after every applied mutation, while it still
// holds that order's lock, so saves for one order arrive in mutation order.
// The store may see the same state more than once (at-least-once). The
// storage engine is the implementation's concern.
//
// loadAll() is used once, during the engine's start-up warm-up, to hydrate
// the ledger before any request is accepted.
//
// Thread model: save() is called concurrently for different orders.
// -----------------------------------------------------------------------------
class IOrderStore {
 public:
  virtual ~IOrderStore() = default;

  virtual std::optional<domain::Order> load(domain::OrderId order_id) = 0;
  virtual void save(const domain::Order& order) = 0;
  virtual std::vector<domain::Order> loadAll() = 0;
};

}  // namespace ports
}  // namespace oms
