#include "oms/execution/execution_dispatcher.hpp"
#include "oms/core/error.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <iostream>
#include <utility>

namespace oms {

namespace {

// Releases the activity token taken for one venue call, whatever the call's
// outcome.
class ActivityGuard {
 public:
  ActivityGuard(OrderStateMachine& osm, domain::OrderId order_id,
                domain::Quantity quantity)
      : osm_(osm), order_id_(order_id), quantity_(quantity) {}

  ~ActivityGuard() {
    try {
      osm_.endActivity(order_id_, quantity_);
    } catch (const OmsError& e) {
      std::cerr << "[ExecutionDispatcher] WARNING: endActivity for order "
                << order_id_ << " failed: " << e.what() << "\n";
    }
  }

  ActivityGuard(const ActivityGuard&) = delete;
  ActivityGuard& operator=(const ActivityGuard&) = delete;

 private:
  OrderStateMachine& osm_;
  domain::OrderId order_id_;
  domain::Quantity quantity_;
};

bool dispatchable(domain::OrderStatus status) {
  return !domain::isTerminal(status) &&
         status != domain::OrderStatus::PendingCancel &&
         status != domain::OrderStatus::Pending;
}

}  // namespace

ExecutionDispatcher::ExecutionDispatcher(OrderStateMachine& osm,
                                         const Router& router,
                                         ports::IQuoteSource& quotes,
                                         ports::IVenueEndpoint& endpoint,
                                         config::DispatcherConfig config,
                                         const ITimeProvider& clock,
                                         EventBus* bus)
    : osm_(osm),
      router_(router),
      quotes_(quotes),
      endpoint_(endpoint),
      config_(config),
      clock_(clock),
      bus_(bus),
      pool_(config.worker_threads) {}

ExecutionDispatcher::~ExecutionDispatcher() { shutdown(); }

void ExecutionDispatcher::shutdown() { pool_.shutdown(); }

DispatchResult ExecutionDispatcher::dispatch(
    const domain::Order& order, const domain::RoutingPlan& plan,
    std::optional<domain::SliceId> slice_id) {
  return dispatchPlan(order, plan, slice_id, config_.enable_fallback);
}

// -----------------------------------------------------------------------------
// executeRoute(): pool worker body
// -----------------------------------------------------------------------------
std::optional<domain::ExecutionReport> ExecutionDispatcher::executeRoute(
    const domain::VenueOrder& venue_order, RouteState& state) {
  ActivityGuard guard(osm_, venue_order.order_id, venue_order.quantity);

  int expected = kRouteQueued;
  if (!state.compare_exchange_strong(expected, kRouteStarted)) {
    std::cout << "[ExecutionDispatcher] route " << venue_order.venue
              << " for order " << venue_order.order_id
              << " abandoned before it started; venue not called\n";
    return std::nullopt;
  }

  domain::ExecutionReport report =
      endpoint_.execute(venue_order, config_.venue_timeout_ms);

  if (report.order_id != venue_order.order_id) {
    throw VenueFailure(venue_order.venue,
                       "report for order " + std::to_string(report.order_id) +
                           " returned on order " +
                           std::to_string(venue_order.order_id));
  }
  if (report.quantity > venue_order.quantity) {
    throw VenueFailure(venue_order.venue,
                       "venue filled " + std::to_string(report.quantity) +
                           " of " + std::to_string(venue_order.quantity));
  }
  if (!report.slice_id) {
    report.slice_id = venue_order.slice_id;
  }
  if (report.venue.empty()) {
    report.venue = venue_order.venue;
  }

  bool applied = false;
  try {
    applied = osm_.applyExecution(report);
  } catch (const OmsError& e) {
    // The venue traded but the ledger refused the report.
    std::cerr << "[ExecutionDispatcher] ERROR: execution "
              << report.execution_id << " (" << report.quantity << " @ "
              << report.price << " on " << report.venue << ") for order "
              << report.order_id << " not applied: " << e.what() << "\n";
    throw;
  }
  if (!applied) {
    std::cerr << "[ExecutionDispatcher] WARNING: duplicate execution "
              << report.execution_id << " on order " << report.order_id
              << " ignored\n";
    return std::nullopt;
  }
  return report;
}

// -----------------------------------------------------------------------------
// dispatchPlan(): fan out, wait with deadline, contain failures
// -----------------------------------------------------------------------------
DispatchResult ExecutionDispatcher::dispatchPlan(
    const domain::Order& order, const domain::RoutingPlan& plan,
    std::optional<domain::SliceId> slice_id, bool allow_fallback) {
  DispatchResult result;
  for (const auto& route : plan.routes) {
    result.requested_quantity += route.quantity;
  }
  if (plan.empty()) {
    return result;
  }

  struct InFlight {
    domain::VenueRoute route;
    std::shared_ptr<RouteState> state;
    std::future<std::optional<domain::ExecutionReport>> future;
  };
  std::vector<InFlight> in_flight;
  in_flight.reserve(plan.routes.size());

  for (const auto& route : plan.routes) {
    if (route.quantity <= 0) {
      continue;
    }
    if (!osm_.beginActivity(order.order_id, route.quantity)) {
      std::cerr << "[ExecutionDispatcher] WARNING: order " << order.order_id
                << " no longer accepts venue work; " << route.venue
                << " and later routes not sent\n";
      break;
    }

    domain::VenueOrder venue_order;
    venue_order.order_id = order.order_id;
    venue_order.slice_id = slice_id;
    venue_order.symbol = order.symbol;
    venue_order.side = order.side;
    venue_order.order_type = order.order_type;
    venue_order.quantity = route.quantity;
    venue_order.limit_price = order.limit_price;
    venue_order.expected_price = route.expected_price;
    venue_order.venue = route.venue;

    auto state = std::make_shared<RouteState>(kRouteQueued);
    try {
      in_flight.push_back(InFlight{
          route, state, pool_.enqueue([this, venue_order, state]() {
            return executeRoute(venue_order, *state);
          })});
    } catch (const std::runtime_error& e) {
      // Pool already stopped: the task never ran, so give the token back.
      osm_.endActivity(order.order_id, route.quantity);
      result.failures.push_back(
          VenueFailureInfo{route.venue, route.quantity, e.what(), false,
                           false, 0});
    }
  }

  std::cout << "[ExecutionDispatcher] order " << order.order_id
            << ": dispatched " << in_flight.size() << " route(s)\n";

  // --- Collect: successes and failures separately --------------------------
  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(config_.venue_timeout_ms);
  std::vector<std::size_t> retry;  // indices into result.failures

  for (auto& call : in_flight) {
    VenueFailureInfo failure{call.route.venue, call.route.quantity, "", false,
                             false, 0};
    bool fallback_eligible = false;

    if (call.future.wait_until(deadline) != std::future_status::ready) {
      // A call still queued behind busy workers is abandoned so that it can
      // never execute alongside its fallback.
      int expected = kRouteQueued;
      if (call.state->compare_exchange_strong(expected, kRouteAbandoned)) {
        failure.error = "not started within " +
                        std::to_string(config_.venue_timeout_ms) + " ms";
      } else {
        failure.error = "timed out after " +
                        std::to_string(config_.venue_timeout_ms) + " ms";
      }
      failure.timed_out = true;
      fallback_eligible = true;
    } else {
      try {
        if (auto report = call.future.get()) {
          result.total_filled += report->quantity;
          result.reports.push_back(std::move(*report));
        }
        continue;
      } catch (const VenueFailure& e) {
        failure.error = e.what();
        failure.timed_out = e.timedOut();
        fallback_eligible = true;
      } catch (const OmsError& e) {
        failure.error = e.what();
      } catch (const std::exception& e) {
        failure.error = e.what();
        fallback_eligible = true;
      }
    }

    std::cerr << "[ExecutionDispatcher] WARNING: venue " << failure.venue
              << " failed for order " << order.order_id << ": "
              << failure.error << "\n";
    result.failures.push_back(std::move(failure));
    if (fallback_eligible) {
      retry.push_back(result.failures.size() - 1);
    }
  }

  // --- One fallback per failed venue ---------------------------------------
  // Failures of the fallback sub-dispatch are appended after `own` and were
  // already published by that dispatch.
  const std::size_t own = result.failures.size();
  if (allow_fallback && !retry.empty()) {
    std::set<domain::Venue> failed_venues;
    for (const auto& failure : result.failures) {
      failed_venues.insert(failure.venue);
    }
    for (std::size_t index : retry) {
      VenueFailureInfo failure = result.failures[index];
      handleRoutingFailure(order, failure, failed_venues, slice_id, result);
      result.failures[index] = failure;
    }
  }

  for (std::size_t i = 0; i < own; ++i) {
    publishFailure(order.order_id, result.failures[i]);
  }

  std::cout << "[ExecutionDispatcher] order " << order.order_id << ": filled "
            << result.total_filled << "/" << result.requested_quantity
            << " (" << result.reports.size() << " report(s), "
            << result.failures.size() << " failure(s))\n";
  return result;
}

// -----------------------------------------------------------------------------
// handleRoutingFailure(): fresh quotes, fresh plan, one attempt
// -----------------------------------------------------------------------------
void ExecutionDispatcher::handleRoutingFailure(
    const domain::Order& order, VenueFailureInfo& failure,
    const std::set<domain::Venue>& failed_venues,
    std::optional<domain::SliceId> slice_id, DispatchResult& result) {
  domain::Order current = osm_.snapshot(order.order_id);
  if (!dispatchable(current.status)) {
    std::cout << "[ExecutionDispatcher] order " << order.order_id << " is "
              << domain::toString(current.status)
              << "; no fallback for " << failure.venue << "\n";
    return;
  }

  const domain::Quantity quantity =
      std::min(failure.quantity, current.remaining_quantity);
  if (quantity <= 0) {
    return;
  }

  // Keep the caller's economics (an algorithm may have overridden the limit).
  current.limit_price = order.limit_price;

  failure.fallback_attempted = true;
  const domain::QuoteSnapshot quotes = quotes_.quotes(
      current.symbol, router_.eligibleVenues(failed_venues));
  const domain::RoutingPlan plan =
      router_.route(current, quantity, quotes, failed_venues);
  if (plan.empty()) {
    std::cerr << "[ExecutionDispatcher] WARNING: no fallback venue for "
              << quantity << " of order " << order.order_id << " after "
              << failure.venue << " failed\n";
    return;
  }

  std::cout << "[ExecutionDispatcher] order " << order.order_id
            << ": fallback for " << failure.venue << " -> "
            << plan.routes.size() << " route(s)\n";

  DispatchResult sub = dispatchPlan(current, plan, slice_id, false);
  failure.fallback_filled = sub.total_filled;
  result.total_filled += sub.total_filled;
  for (auto& report : sub.reports) {
    result.reports.push_back(std::move(report));
  }
  for (auto& nested : sub.failures) {
    result.failures.push_back(std::move(nested));
  }
}

void ExecutionDispatcher::publishFailure(domain::OrderId order_id,
                                         const VenueFailureInfo& info) {
  if (bus_ == nullptr) {
    return;
  }
  VenueFailureEvent event;
  event.order_id = order_id;
  event.venue = info.venue;
  event.quantity = info.quantity;
  event.error = info.error;
  event.timed_out = info.timed_out;
  event.fallback_attempted = info.fallback_attempted;
  event.fallback_filled = info.fallback_filled;
  event.timestamp_ms = clock_.now_ms();
  bus_->publish(event);
}

}  // namespace oms
