#pragma once

#include "oms/domain/execution_report.hpp"

#include <cstdint>

namespace oms {
namespace ports {

// -----------------------------------------------------------------------------
// IVenueEndpoint: execution venue connectivity
// -----------------------------------------------------------------------------
//
// @brief  Sends one order (or slice) line to one venue and returns the
//         resulting fill.
//
// @param  order       The line to execute. order.venue names the venue.
// @param  timeout_ms  Caller-supplied deadline for this call.
//
// @return ExecutionReport with quantity > 0 and a venue-unique
//         execution_id. report.order_id must equal order.order_id.
//
// @details
// A call that cannot produce a fill (venue down, nothing executable, deadline
// exceeded) throws VenueFailure. The ExecutionDispatcher enforces the
// deadline on its side as well, so an endpoint that overruns is treated as
// timed out even if it eventually returns; such a late fill is still applied
// to the order.
//
// Thread model:
//   Invoked concurrently from the dispatcher's worker threads, possibly for
//   the same venue at the same time. Implementations must be thread-safe.
// -----------------------------------------------------------------------------
class IVenueEndpoint {
 public:
  virtual ~IVenueEndpoint() = default;

  virtual domain::ExecutionReport execute(const domain::VenueOrder& order,
                                          std::int64_t timeout_ms) = 0;
};

}  // namespace ports
}  // namespace oms
