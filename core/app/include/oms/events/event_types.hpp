#pragma once

#include "oms/domain/compliance.hpp"
#include "oms/domain/execution_report.hpp"
#include "oms/domain/order.hpp"
#include "oms/domain/order_slice.hpp"
#include "oms/domain/order_status.hpp"

#include <cstdint>
#include <string>

namespace oms {

// -----------------------------------------------------------------------------
// OrderUpdateEvent
// -----------------------------------------------------------------------------
// Published by the OrderStateMachine after every status change or fill, once
// the order's ledger lock has been released. `order` is the post-change
// snapshot. Downstream consumers (allocation, settlement, analytics,
// telemetry) subscribe to this instead of polling the ledger.
// -----------------------------------------------------------------------------
struct OrderUpdateEvent {
  domain::Order order;
  domain::OrderStatus previous_status{domain::OrderStatus::Pending};
  std::string reason;
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// ExecutionReportEvent
// -----------------------------------------------------------------------------
// One applied execution report plus the order state it produced. Duplicate
// deliveries of the same execution_id are never republished.
// -----------------------------------------------------------------------------
struct ExecutionReportEvent {
  domain::ExecutionReport report;
  domain::Order order;
};

// -----------------------------------------------------------------------------
// RouteRequestEvent
// -----------------------------------------------------------------------------
// Work item for the OrderRoutingThread: route and dispatch the order's
// remaining quantity. Replace requests additionally complete the
// PENDING_REPLACE -> REPLACED -> NEW sequence once the new plan exists.
// -----------------------------------------------------------------------------
struct RouteRequestEvent {
  enum class Kind { Submit, Replace };

  domain::OrderId order_id{0};
  Kind kind{Kind::Submit};
};

struct SliceUpdateEvent {
  domain::OrderSlice slice;
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// VenueFailureEvent
// -----------------------------------------------------------------------------
// One contained venue failure inside a dispatch. fallback_filled is the
// quantity the one-shot fallback plan recovered (0 when no fallback ran).
// -----------------------------------------------------------------------------
struct VenueFailureEvent {
  domain::OrderId order_id{0};
  domain::Venue venue;
  domain::Quantity quantity{0};
  std::string error;
  bool timed_out{false};
  bool fallback_attempted{false};
  domain::Quantity fallback_filled{0};
  std::int64_t timestamp_ms{0};
};

struct ComplianceRejectEvent {
  domain::OrderId order_id{0};
  std::string symbol;
  domain::ComplianceResult result;
  std::int64_t timestamp_ms{0};
};

}  // namespace oms
