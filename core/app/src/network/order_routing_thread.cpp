#include "oms/network/order_routing_thread.hpp"
#include "oms/core/error.hpp"

#include <iostream>
#include <string>

namespace oms {

namespace {

const char* kindName(RouteRequestEvent::Kind kind) {
  return kind == RouteRequestEvent::Kind::Replace ? "replace" : "submit";
}

}  // namespace

OrderRoutingThread::OrderRoutingThread(OrderStateMachine& osm,
                                       const Router& router,
                                       ports::IQuoteSource& quotes,
                                       ExecutionDispatcher& dispatcher)
    : osm_(osm), router_(router), quotes_(quotes), dispatcher_(dispatcher) {}

OrderRoutingThread::~OrderRoutingThread() { stop(); }

// -----------------------------------------------------------------------------
// start(): subscribe the router on the loop bus and start the loop
// -----------------------------------------------------------------------------
void OrderRoutingThread::start() {
  if (running_) {
    return;
  }

  subscription_id_ = loop_.eventBus().subscribe<RouteRequestEvent>(
      [this](const RouteRequestEvent& e) { onRouteRequest(e); });
  loop_.start();
  running_ = true;

  std::cout << "[OrderRoutingThread] started.\n";
}

void OrderRoutingThread::stop() {
  if (!running_) {
    return;
  }

  loop_.stop();
  loop_.eventBus().unsubscribe(subscription_id_);
  running_ = false;

  std::cout << "[OrderRoutingThread] stopped.\n";
}

void OrderRoutingThread::push(const RouteRequestEvent& request) {
  {
    std::lock_guard lock(pending_mutex_);
    ++pending_;
  }
  if (!loop_.push(request)) {
    std::cerr << "[OrderRoutingThread] WARNING: stopped, "
              << kindName(request.kind) << " for order " << request.order_id
              << " dropped\n";
    {
      std::lock_guard lock(pending_mutex_);
      --pending_;
    }
    pending_cv_.notify_all();
  }
}

void OrderRoutingThread::waitIdle() {
  std::unique_lock lock(pending_mutex_);
  pending_cv_.wait(lock, [this] { return pending_ == 0; });
}

EventBus& OrderRoutingThread::eventBus() { return loop_.eventBus(); }

// -----------------------------------------------------------------------------
// onRouteRequest(): loop-thread entry point; contains every error
// -----------------------------------------------------------------------------
void OrderRoutingThread::onRouteRequest(const RouteRequestEvent& request) {
  try {
    route(request);
  } catch (const OmsError& e) {
    std::cerr << "[OrderRoutingThread] ERROR: " << kindName(request.kind)
              << " for order " << request.order_id << " failed: " << e.what()
              << "\n";
  } catch (const std::exception& e) {
    std::cerr << "[OrderRoutingThread] ERROR: unexpected failure routing order "
              << request.order_id << ": " << e.what() << "\n";
  }

  {
    std::lock_guard lock(pending_mutex_);
    --pending_;
  }
  pending_cv_.notify_all();
}

void OrderRoutingThread::route(const RouteRequestEvent& request) {
  using domain::OrderStatus;
  using domain::TimeInForce;

  domain::Order order = osm_.snapshot(request.order_id);
  if (domain::isTerminal(order.status) ||
      order.status == OrderStatus::PendingCancel) {
    std::cout << "[OrderRoutingThread] order " << order.order_id << " is "
              << domain::toString(order.status) << ", "
              << kindName(request.kind) << " dropped\n";
    return;
  }

  const auto snapshot =
      quotes_.quotes(order.symbol, router_.eligibleVenues());
  const domain::RoutingPlan plan = router_.route(order, snapshot);

  if (request.kind == RouteRequestEvent::Kind::Replace) {
    order = osm_.completeReplace(order.order_id);
  }

  if (order.time_in_force == TimeInForce::Fok &&
      plan.routed_quantity < order.remaining_quantity) {
    osm_.cancel(order.order_id, "FOK: visible liquidity " +
                                    std::to_string(plan.routed_quantity) +
                                    " < " +
                                    std::to_string(order.remaining_quantity));
    return;
  }

  const DispatchResult result = dispatcher_.dispatch(order, plan);
  std::cout << "[OrderRoutingThread] order " << order.order_id << " "
            << kindName(request.kind) << ": filled " << result.total_filled
            << "/" << result.requested_quantity << " across "
            << plan.routes.size() << " venue(s), " << result.failures.size()
            << " failure(s)\n";

  if (order.time_in_force == TimeInForce::Ioc ||
      order.time_in_force == TimeInForce::Fok) {
    const domain::Order after = osm_.snapshot(order.order_id);
    if (!domain::isTerminal(after.status) && after.remaining_quantity > 0) {
      osm_.cancel(order.order_id,
                  std::string(domain::toString(order.time_in_force)) +
                      " remainder");
    }
  }
}

}  // namespace oms
