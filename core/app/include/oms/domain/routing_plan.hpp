#pragma once

#include "oms/domain/market_data.hpp"
#include "oms/domain/order.hpp"

#include <vector>

namespace oms {
namespace domain {

// -----------------------------------------------------------------------------
// VenueRoute
// -----------------------------------------------------------------------------
// One allocation line of a routing decision. priority 1 is the best venue.
// -----------------------------------------------------------------------------
struct VenueRoute {
  Venue venue;
  Quantity quantity{0};
  Price expected_price{0.0};
  int priority{0};
};

// -----------------------------------------------------------------------------
// RoutingPlan
// -----------------------------------------------------------------------------
//
// @brief  Immutable output of one Router::route() call.
//
// @details
// routes are ordered by priority. confidence is routed_quantity divided by
// requested_quantity: 1.0 when the visible books covered the request, lower
// when depth ran out. A thin book is reported here, never as an error.
// Re-routing always produces a new plan.
// -----------------------------------------------------------------------------
struct RoutingPlan {
  std::vector<VenueRoute> routes;
  Venue primary_venue;
  Quantity requested_quantity{0};
  Quantity routed_quantity{0};
  double confidence{0.0};

  bool empty() const { return routes.empty(); }
};

}  // namespace domain
}  // namespace oms
