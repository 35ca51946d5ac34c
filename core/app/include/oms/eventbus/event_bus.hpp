#pragma once

#include "oms/events/event.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace oms {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
//
// @brief  In-process publish/subscribe channel for order lifecycle events.
//
// @details
// The OrderStateMachine, ExecutionDispatcher and AlgorithmicScheduler publish
// here; telemetry, downstream collaborators and tests subscribe. Publishers
// never know who listens.
//
// Thread model:
//   subscribe(), unsubscribe() and publish() are safe from any thread.
//   Callbacks run synchronously on the publishing thread, which may be a
//   dispatcher worker, a scheduler timer or the routing thread. Callbacks
//   must therefore be thread-safe and must not block for long.
//
// A callback that throws std::exception is logged and skipped; the remaining
// subscribers still receive the event and publish() does not throw.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Receives every published event.
  SubscriptionId subscribe(GenericCallback callback);

  // Receives only events holding EventType.
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // A publish() already in progress on another thread may still invoke the
  // removed callback once.
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // Takes the current subscriber list snapshot under the lock and invokes the
  // callbacks without it, so a callback may itself publish or unsubscribe.
  // -------------------------------------------------------------------------
  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  using SubscriberEntry = std::pair<SubscriptionId, GenericCallback>;
  using SubscriberList = std::vector<SubscriberEntry>;

  // Copy-on-write: subscribe/unsubscribe swap in a new list, publish() only
  // bumps a reference count.
  mutable std::mutex mutex_;
  SubscriptionId next_id_{0};
  std::shared_ptr<const SubscriberList> subscribers_{
      std::make_shared<const SubscriberList>()};
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace oms
