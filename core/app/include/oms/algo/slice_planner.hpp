#pragma once

#include "oms/domain/order.hpp"
#include "oms/domain/order_slice.hpp"

#include <cstdint>
#include <vector>

namespace oms {
namespace algo {

// -----------------------------------------------------------------------------
// Slice planning
// -----------------------------------------------------------------------------
//
// @brief  Pure functions that turn a parent quantity and a time window into
//         planned OrderSlices.
//
// @details
// Every planner returns slices in scheduled-time order whose quantities sum
// exactly to the requested quantity. Per-slice sizes use floor division and
// the last slice absorbs the remainder. slice_id is the 1-based position in
// the plan; the scheduler makes ids unique per parent by pairing them with
// parent_order_id.
//
// Quantities smaller than the slice count produce leading zero-quantity
// slices; the scheduler cancels those without dispatching.
//
// Every planner throws ValidationError when the plan would exceed
// domain::kMaxAlgorithmSlices slices.
// -----------------------------------------------------------------------------

struct SliceWindow {
  domain::OrderId parent_order_id{0};
  std::int64_t start_ms{0};
  std::int64_t end_ms{0};
  std::int64_t interval_ms{0};
};

// ceil((end - start) / interval), at least 1.
int twapSliceCount(std::int64_t start_ms, std::int64_t end_ms,
                   std::int64_t interval_ms);

// num_slices > 0 overrides the count derived from the window. With an
// explicit count the interval is the window divided evenly.
std::vector<domain::OrderSlice> planTwap(domain::Quantity quantity,
                                         const SliceWindow& window,
                                         int num_slices = 0);

// Negative weights count as zero. A curve that sums to zero (or is empty)
// becomes uniform over `size` buckets.
std::vector<double> normalizeCurve(const std::vector<double>& curve,
                                   std::size_t size);

// One slice per curve bucket, bucket width = window / curve size.
std::vector<domain::OrderSlice> planVwap(domain::Quantity quantity,
                                         const SliceWindow& window,
                                         const std::vector<double>& curve);

// display-sized slices, one per interval starting at window.start_ms.
std::vector<domain::OrderSlice> planIceberg(domain::Quantity quantity,
                                            domain::Quantity display_quantity,
                                            const SliceWindow& window);

// -----------------------------------------------------------------------------
// povChildQuantity
// -----------------------------------------------------------------------------
//
// @brief  Child quantity for one POV tick.
//
// @param  market_volume  Volume printed since the algorithm started.
// @param  executed       Quantity the algorithm has already filled.
// @param  remaining      Parent remaining quantity.
//
// @details
// Targets floor(target * V) cumulative shares, never below ceil(min * V) and
// never above floor(max * V), then subtracts what is already executed. The
// result is clamped to [0, remaining].
// -----------------------------------------------------------------------------
domain::Quantity povChildQuantity(domain::Quantity market_volume,
                                  domain::Quantity executed,
                                  domain::Quantity remaining,
                                  double target_rate, double min_rate,
                                  double max_rate);

}  // namespace algo
}  // namespace oms
