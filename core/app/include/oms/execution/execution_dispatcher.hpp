#pragma once

#include "oms/concurrent/thread_pool.hpp"
#include "oms/config/engine_config.hpp"
#include "oms/domain/execution_report.hpp"
#include "oms/domain/order.hpp"
#include "oms/domain/routing_plan.hpp"
#include "oms/eventbus/event_bus.hpp"
#include "oms/ports/i_quote_source.hpp"
#include "oms/ports/i_venue_endpoint.hpp"
#include "oms/routing/router.hpp"
#include "oms/state/order_state_machine.hpp"
#include "oms/time/i_time_provider.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace oms {

// One contained venue failure inside a dispatch.
struct VenueFailureInfo {
  domain::Venue venue;
  domain::Quantity quantity{0};
  std::string error;
  bool timed_out{false};
  bool fallback_attempted{false};
  domain::Quantity fallback_filled{0};
};

// -----------------------------------------------------------------------------
// DispatchResult
// -----------------------------------------------------------------------------
// reports holds every report this dispatch applied to the order, fallback
// fills included; total_filled is the sum of their quantities. A result with
// total_filled < requested_quantity is a partial fill, not an error.
// -----------------------------------------------------------------------------
struct DispatchResult {
  std::vector<domain::ExecutionReport> reports;
  domain::Quantity total_filled{0};
  domain::Quantity requested_quantity{0};
  std::vector<VenueFailureInfo> failures;
};

// -----------------------------------------------------------------------------
// ExecutionDispatcher: concurrent per-venue execution of a RoutingPlan
// -----------------------------------------------------------------------------
//
// @brief  Sends every route of a plan to its venue in parallel, applies the
//         resulting reports to the order, and contains venue failures.
//
// @details
// dispatch() takes one activity token per route (so a concurrent cancel
// waits for the call to finish), submits one task per route to the pool,
// then waits for all of them up to DispatcherConfig::venue_timeout_ms. Each
// task calls IVenueEndpoint::execute() and feeds the report straight into
// OrderStateMachine::applyExecution(); the state machine serializes fills
// for the same order.
//
// A route that throws VenueFailure (or any std::exception from the endpoint)
// or misses the deadline is recorded as a VenueFailureInfo. For each such
// failure handleRoutingFailure() asks the quote source again, routes the
// still-unfilled part of that route across the venues that have not failed
// in this dispatch, and dispatches that sub-plan exactly once with fallback
// disabled. Errors raised by the state machine (terminal order, overfill)
// are recorded without fallback.
//
// A task that missed the deadline while its venue call was running keeps
// running on its worker. If it eventually fills, the fill is still applied to
// the order but is not part of this DispatchResult. A task that missed the
// deadline while still queued is abandoned: when a worker reaches it, it
// releases its activity token without calling the venue.
//
// Every failure is published as a VenueFailureEvent once its fallback (if
// any) has finished.
//
// Thread model:
//   dispatch() may be called concurrently from the routing thread and from
//   scheduler timers. The pool's workers run the venue calls.
//
// Ownership:
//   Owns its ThreadPool. Borrows the state machine, router, quote source,
//   endpoint, clock and bus, which must outlive it.
// -----------------------------------------------------------------------------
class ExecutionDispatcher {
 public:
  ExecutionDispatcher(OrderStateMachine& osm, const Router& router,
                      ports::IQuoteSource& quotes,
                      ports::IVenueEndpoint& endpoint,
                      config::DispatcherConfig config,
                      const ITimeProvider& clock, EventBus* bus = nullptr);
  ~ExecutionDispatcher();

  ExecutionDispatcher(const ExecutionDispatcher&) = delete;
  ExecutionDispatcher& operator=(const ExecutionDispatcher&) = delete;
  ExecutionDispatcher(ExecutionDispatcher&&) = delete;
  ExecutionDispatcher& operator=(ExecutionDispatcher&&) = delete;

  // -------------------------------------------------------------------------
  // dispatch(order, plan, slice_id)
  // -------------------------------------------------------------------------
  //
  // @param  order     Snapshot supplying symbol, side, type and limit. Fills
  //                   are applied to order.order_id.
  // @param  plan      Routes to execute. An empty plan returns an empty
  //                   result.
  // @param  slice_id  Set when dispatching an algorithmic child slice; it is
  //                   copied onto every VenueOrder and report.
  //
  // Never throws for venue-side problems.
  // -------------------------------------------------------------------------
  DispatchResult dispatch(const domain::Order& order,
                          const domain::RoutingPlan& plan,
                          std::optional<domain::SliceId> slice_id = std::nullopt);

  // Stops accepting work and joins the workers after in-flight calls end.
  void shutdown();

 private:
  DispatchResult dispatchPlan(const domain::Order& order,
                              const domain::RoutingPlan& plan,
                              std::optional<domain::SliceId> slice_id,
                              bool allow_fallback);

  // Per-route handshake between the waiting dispatch and the pool worker.
  using RouteState = std::atomic<int>;
  static constexpr int kRouteQueued = 0;
  static constexpr int kRouteStarted = 1;
  static constexpr int kRouteAbandoned = 2;

  // Runs on a pool worker: one venue call plus its state machine update.
  // Returns std::nullopt when the report was a duplicate delivery or the
  // route was abandoned before it started.
  std::optional<domain::ExecutionReport> executeRoute(
      const domain::VenueOrder& venue_order, RouteState& state);

  // Routes and dispatches the unfilled part of one failed route once.
  // Fallback fills are merged into `result`.
  void handleRoutingFailure(const domain::Order& order,
                            VenueFailureInfo& failure,
                            const std::set<domain::Venue>& failed_venues,
                            std::optional<domain::SliceId> slice_id,
                            DispatchResult& result);

  void publishFailure(domain::OrderId order_id, const VenueFailureInfo& info);

  OrderStateMachine& osm_;
  const Router& router_;
  ports::IQuoteSource& quotes_;
  ports::IVenueEndpoint& endpoint_;
  config::DispatcherConfig config_;
  const ITimeProvider& clock_;
  EventBus* bus_;
  ThreadPool pool_;
};

}  // namespace oms
