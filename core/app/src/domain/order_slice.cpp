#include "oms/domain/order_slice.hpp"

namespace oms {
namespace domain {

const char* toString(SliceStatus status) {
  switch (status) {
    case SliceStatus::Pending:  return "PENDING";
    case SliceStatus::Active:   return "ACTIVE";
    case SliceStatus::Filled:   return "FILLED";
    case SliceStatus::Canceled: return "CANCELED";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace oms
