#pragma once

#include "oms/events/event_types.hpp"

#include <variant>

namespace oms {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// The single envelope carried by EventBus, EventLoopThread and the IPC
// telemetry queue. Handlers select a concrete type with std::get_if or the
// typed EventBus::subscribe<T>().
// -----------------------------------------------------------------------------
using Event = std::variant<
    OrderUpdateEvent,
    ExecutionReportEvent,
    RouteRequestEvent,
    SliceUpdateEvent,
    VenueFailureEvent,
    ComplianceRejectEvent>;

}  // namespace oms
