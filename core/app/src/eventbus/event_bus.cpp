#include "oms/eventbus/event_bus.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

namespace oms {

EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  std::lock_guard lock(mutex_);
  auto next = std::make_shared<SubscriberList>(*subscribers_);
  const SubscriptionId id = next_id_++;
  next->emplace_back(id, std::move(callback));
  subscribers_ = std::move(next);
  return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  const bool known = std::any_of(
      subscribers_->begin(), subscribers_->end(),
      [id](const SubscriberEntry& e) { return e.first == id; });
  if (!known) {
    return;
  }
  auto next = std::make_shared<SubscriberList>();
  next->reserve(subscribers_->size() - 1);
  for (const auto& entry : *subscribers_) {
    if (entry.first != id) {
      next->push_back(entry);
    }
  }
  subscribers_ = std::move(next);
}

void EventBus::publish(const Event& event) {
  std::shared_ptr<const SubscriberList> snapshot;
  {
    std::lock_guard lock(mutex_);
    snapshot = subscribers_;
  }

  for (const auto& [id, callback] : *snapshot) {
    try {
      callback(event);
    } catch (const std::exception& e) {
      std::cerr << "[EventBus] ERROR: subscriber " << id
                << " threw on event #" << event.index() << ": " << e.what()
                << "\n";
    }
  }
}

std::size_t EventBus::subscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_->size();
}

}  // namespace oms
