#pragma once

#include "oms/domain/compliance.hpp"
#include "oms/domain/order.hpp"

namespace oms {
namespace ports {

// -----------------------------------------------------------------------------
// IComplianceGate: pre-trade compliance oracle
// -----------------------------------------------------------------------------
//
// @brief  Evaluates an order before it is allowed to go live.
//
// @details
// Called once per submission, after OrderStateMachine::create() and before
// accept(). Any check with severity Error and passed == false blocks the
// order; Warning checks are recorded and surfaced but never block.
//
// Implementations may perform I/O and may throw; the caller rejects the
// order and propagates the exception.
//
// Thread model:
//   Called from whichever thread submits the order. Implementations must be
//   safe for concurrent calls.
// -----------------------------------------------------------------------------
class IComplianceGate {
 public:
  virtual ~IComplianceGate() = default;

  virtual domain::ComplianceResult check(const domain::Order& order) = 0;
};

}  // namespace ports
}  // namespace oms
