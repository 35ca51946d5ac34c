#pragma once

#include "oms/domain/execution_report.hpp"
#include "oms/domain/order.hpp"

#include <cstdint>

namespace oms {
namespace domain {

enum class SliceStatus {
  Pending,
  Active,
  Filled,
  Canceled,
};

// -----------------------------------------------------------------------------
// OrderSlice
// -----------------------------------------------------------------------------
//
// @brief  Child execution unit of an algorithmic parent order.
//
// @details
// quantity is the planned size. target_quantity is fixed at dispatch time and
// includes any remainder carried forward from earlier slices. Once Filled or
// Canceled a slice is never mutated again. A slice that dispatched but filled
// less than its target ends Filled with carried_forward > 0; that remainder
// is added to the next slice.
// -----------------------------------------------------------------------------
struct OrderSlice {
  SliceId slice_id{0};
  OrderId parent_order_id{0};
  Quantity quantity{0};
  std::int64_t scheduled_time_ms{0};
  SliceStatus status{SliceStatus::Pending};

  Quantity target_quantity{0};
  Quantity filled_quantity{0};
  Quantity carried_forward{0};
  bool catch_up{false};
};

inline bool isTerminal(SliceStatus status) {
  return status == SliceStatus::Filled || status == SliceStatus::Canceled;
}

const char* toString(SliceStatus status);

}  // namespace domain
}  // namespace oms
