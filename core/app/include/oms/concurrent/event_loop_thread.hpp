#pragma once

#include "oms/concurrent/thread_safe_queue.hpp"
#include "oms/eventbus/event_bus.hpp"
#include "oms/events/event.hpp"

#include <thread>

namespace oms {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
//
// @brief  One worker thread draining a ThreadSafeQueue<Event> and publishing
//         each event on its own EventBus.
//
// @details
// Everything subscribed to eventBus() runs on the loop thread, one event at
// a time, in push order. The OrderRoutingThread uses this to serialize
// routing and dispatch of non-algorithmic orders.
//
// The worker sleeps in wait_pop(). stop() closes the queue: events pushed
// before it are still published, push() afterwards is refused, and the loop
// cannot be started again.
//
// Thread model:
//   push() is safe from any thread. start()/stop() from the owning thread.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  EventLoopThread() = default;
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  void start();

  // Drains, then joins the worker. Idempotent.
  void stop();

  // False once stop() has been called; the event is dropped.
  bool push(Event event) { return queue_.push(std::move(event)); }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

 private:
  void run();

  ThreadSafeQueue<Event> queue_;
  EventBus bus_;
  std::thread thread_;
};

}  // namespace oms
