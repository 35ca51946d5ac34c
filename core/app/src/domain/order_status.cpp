#include "oms/domain/order_status.hpp"

namespace oms {
namespace domain {

// -----------------------------------------------------------------------------
// isTerminal / isFillable
// -----------------------------------------------------------------------------
bool isTerminal(OrderStatus status) {
  using S = OrderStatus;
  return status == S::Filled ||
         status == S::Canceled ||
         status == S::Rejected ||
         status == S::Expired;
}

bool isFillable(OrderStatus status) {
  using S = OrderStatus;
  // PendingCancel stays fillable so in-flight venue calls that complete
  // after the cancel request still land on the order.
  return status == S::New ||
         status == S::PartiallyFilled ||
         status == S::PendingReplace ||
         status == S::PendingCancel;
}

// -----------------------------------------------------------------------------
// toString
// -----------------------------------------------------------------------------
const char* toString(OrderStatus status) {
  using S = OrderStatus;
  switch (status) {
    case S::Pending:         return "PENDING";
    case S::New:             return "NEW";
    case S::PartiallyFilled: return "PARTIALLY_FILLED";
    case S::Filled:          return "FILLED";
    case S::PendingCancel:   return "PENDING_CANCEL";
    case S::Canceled:        return "CANCELED";
    case S::PendingReplace:  return "PENDING_REPLACE";
    case S::Replaced:        return "REPLACED";
    case S::Rejected:        return "REJECTED";
    case S::Expired:         return "EXPIRED";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace oms
