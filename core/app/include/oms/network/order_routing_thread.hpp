#pragma once

#include "oms/concurrent/event_loop_thread.hpp"
#include "oms/eventbus/event_bus.hpp"
#include "oms/events/event.hpp"
#include "oms/execution/execution_dispatcher.hpp"
#include "oms/ports/i_quote_source.hpp"
#include "oms/routing/router.hpp"
#include "oms/state/order_state_machine.hpp"

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace oms {

// -----------------------------------------------------------------------------
// OrderRoutingThread: routing and dispatch of non-algorithmic orders
// -----------------------------------------------------------------------------
//
// @brief  Owns an EventLoopThread whose bus carries RouteRequestEvents. Each
//         request is routed against fresh quotes and dispatched, one request
//         at a time, off the submitting thread.
//
// @details
// For every RouteRequestEvent:
//   1. Snapshot the order. Requests for orders that are terminal or have a
//      cancel pending are dropped with a log line.
//   2. Ask the quote source for the router's eligible venues and route the
//      remaining quantity.
//   3. Replace requests complete PENDING_REPLACE -> REPLACED -> NEW once the
//      new plan exists.
//   4. FOK: cancel without dispatching when the plan cannot cover the whole
//      remaining quantity. Otherwise dispatch the plan.
//   5. IOC and FOK: cancel whatever remains unfilled after the dispatch.
// Errors are logged and never escape to the loop.
//
// Thread model:
//   start()/stop() from the owning thread; push() from any thread. All
//   routing work runs on the loop thread.
//
// Ownership:
//   Owned by OrderManagementEngine via std::unique_ptr. Owns the
//   EventLoopThread; borrows every collaborator.
// -----------------------------------------------------------------------------
class OrderRoutingThread {
 public:
  OrderRoutingThread(OrderStateMachine& osm, const Router& router,
                     ports::IQuoteSource& quotes,
                     ExecutionDispatcher& dispatcher);
  ~OrderRoutingThread();

  OrderRoutingThread(const OrderRoutingThread&) = delete;
  OrderRoutingThread& operator=(const OrderRoutingThread&) = delete;
  OrderRoutingThread(OrderRoutingThread&&) = delete;
  OrderRoutingThread& operator=(OrderRoutingThread&&) = delete;

  // Idempotent. stop() routes what is already queued before it returns;
  // a stopped routing thread does not start again.
  void start();
  void stop();

  // Dropped with a warning after stop().
  void push(const RouteRequestEvent& request);

  // Blocks until every request pushed so far has been handled.
  void waitIdle();

  // The loop's bus; RouteRequestEvent subscribers run on the loop thread.
  EventBus& eventBus();

 private:
  void onRouteRequest(const RouteRequestEvent& request);
  void route(const RouteRequestEvent& request);

  OrderStateMachine& osm_;
  const Router& router_;
  ports::IQuoteSource& quotes_;
  ExecutionDispatcher& dispatcher_;

  EventLoopThread loop_;
  EventBus::SubscriptionId subscription_id_{0};
  bool running_{false};

  std::mutex pending_mutex_;
  std::condition_variable pending_cv_;
  std::size_t pending_{0};
};

}  // namespace oms
