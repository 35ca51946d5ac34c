// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for oms::EventBus.
//
// Validates:
//   - Generic subscription receives every event alternative
//   - Typed subscription receives only the matching alternative
//   - Multiple subscribers, unsubscribe, unknown ids, empty bus
//   - A callback may publish again without deadlocking
//   - A throwing subscriber does not stop delivery to the others
//   - Payload fields survive the variant dispatch
//   - Concurrent publishers lose no deliveries
// =============================================================================

#include "oms/eventbus/event_bus.hpp"
#include "oms/events/event.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

// =============================================================================
// Test fixture: a fresh bus plus builders for the common event kinds.
// =============================================================================
class EventBusTest : public ::testing::Test {
 protected:
  oms::EventBus bus;

  static oms::OrderUpdateEvent makeUpdate(oms::domain::OrderId id,
                                          oms::domain::OrderStatus status) {
    oms::OrderUpdateEvent e;
    e.order.order_id = id;
    e.order.symbol = "AAPL";
    e.order.status = status;
    e.previous_status = oms::domain::OrderStatus::Pending;
    e.timestamp_ms = 1'000;
    return e;
  }

  static oms::SliceUpdateEvent makeSlice(oms::domain::SliceId id) {
    oms::SliceUpdateEvent e;
    e.slice.slice_id = id;
    e.slice.parent_order_id = 7;
    e.slice.quantity = 500;
    e.timestamp_ms = 2'000;
    return e;
  }
};

// -----------------------------------------------------------------------------
// 1. A generic subscriber sees every alternative in publish order.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  std::vector<std::size_t> indices;
  bus.subscribe([&indices](const oms::Event& e) { indices.push_back(e.index()); });

  bus.publish(makeUpdate(1, oms::domain::OrderStatus::New));
  bus.publish(makeSlice(1));
  bus.publish(oms::VenueFailureEvent{});

  ASSERT_EQ(indices.size(), 3u);
  EXPECT_EQ(indices[0], 0u);
  EXPECT_EQ(indices[1], 3u);
  EXPECT_EQ(indices[2], 4u);
}

// -----------------------------------------------------------------------------
// 2. Typed subscribers ignore other alternatives.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersCorrectly) {
  int updates = 0;
  int slices = 0;
  bus.subscribe<oms::OrderUpdateEvent>(
      [&updates](const oms::OrderUpdateEvent&) { ++updates; });
  bus.subscribe<oms::SliceUpdateEvent>(
      [&slices](const oms::SliceUpdateEvent&) { ++slices; });

  bus.publish(makeUpdate(1, oms::domain::OrderStatus::New));
  bus.publish(makeUpdate(1, oms::domain::OrderStatus::Filled));
  bus.publish(makeSlice(3));
  bus.publish(oms::ComplianceRejectEvent{});

  EXPECT_EQ(updates, 2);
  EXPECT_EQ(slices, 1);
}

TEST_F(EventBusTest, MultipleSubscribersAllReceive) {
  int a = 0;
  int b = 0;
  int c = 0;
  bus.subscribe([&a](const oms::Event&) { ++a; });
  bus.subscribe([&b](const oms::Event&) { ++b; });
  bus.subscribe<oms::SliceUpdateEvent>([&c](const oms::SliceUpdateEvent&) { ++c; });
  EXPECT_EQ(bus.subscriberCount(), 3u);

  bus.publish(makeSlice(1));

  EXPECT_EQ(a, 1);
  EXPECT_EQ(b, 1);
  EXPECT_EQ(c, 1);
}

// -----------------------------------------------------------------------------
// 3. Unsubscribe stops delivery to that subscriber only.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int kept = 0;
  int removed = 0;
  bus.subscribe([&kept](const oms::Event&) { ++kept; });
  const auto id = bus.subscribe([&removed](const oms::Event&) { ++removed; });

  bus.publish(makeSlice(1));
  bus.unsubscribe(id);
  bus.publish(makeSlice(2));

  EXPECT_EQ(kept, 2);
  EXPECT_EQ(removed, 1);
  EXPECT_EQ(bus.subscriberCount(), 1u);
}

TEST_F(EventBusTest, UnsubscribeUnknownIdIsNoOp) {
  bus.subscribe([](const oms::Event&) {});
  EXPECT_NO_THROW(bus.unsubscribe(12345));
  EXPECT_EQ(bus.subscriberCount(), 1u);
}

TEST_F(EventBusTest, PublishWithNoSubscribers) {
  EXPECT_EQ(bus.subscriberCount(), 0u);
  EXPECT_NO_THROW(bus.publish(makeUpdate(1, oms::domain::OrderStatus::New)));
}

// -----------------------------------------------------------------------------
// 4. A callback publishing again must not deadlock: the terminal order update
//    triggers a follow-up slice event, which is delivered to everyone.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanPublishInsideCallback) {
  int slices = 0;
  bus.subscribe<oms::OrderUpdateEvent>([this](const oms::OrderUpdateEvent& e) {
    if (e.order.status == oms::domain::OrderStatus::Canceled) {
      bus.publish(makeSlice(9));
    }
  });
  bus.subscribe<oms::SliceUpdateEvent>(
      [&slices](const oms::SliceUpdateEvent&) { ++slices; });

  bus.publish(makeUpdate(4, oms::domain::OrderStatus::Canceled));

  EXPECT_EQ(slices, 1);
}

TEST_F(EventBusTest, CallbackMayUnsubscribeItself) {
  int calls = 0;
  oms::EventBus::SubscriptionId id = 0;
  id = bus.subscribe([&](const oms::Event&) {
    ++calls;
    bus.unsubscribe(id);
  });

  bus.publish(makeSlice(1));
  bus.publish(makeSlice(2));

  EXPECT_EQ(calls, 1);
  EXPECT_EQ(bus.subscriberCount(), 0u);
}

TEST_F(EventBusTest, ThrowingSubscriberIsIsolated) {
  int before = 0;
  int after = 0;
  bus.subscribe([&before](const oms::Event&) { ++before; });
  bus.subscribe([](const oms::Event&) {
    throw std::runtime_error("telemetry sink closed");
  });
  bus.subscribe([&after](const oms::Event&) { ++after; });

  EXPECT_NO_THROW(bus.publish(makeSlice(1)));
  EXPECT_EQ(before, 1);
  EXPECT_EQ(after, 1);
}

// -----------------------------------------------------------------------------
// 5. Payloads arrive intact.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberReceivesCorrectData) {
  oms::VenueFailureEvent received;
  bus.subscribe<oms::VenueFailureEvent>(
      [&received](const oms::VenueFailureEvent& e) { received = e; });

  oms::VenueFailureEvent sent;
  sent.order_id = 42;
  sent.venue = "BATS";
  sent.quantity = 400;
  sent.error = "venue timeout";
  sent.timed_out = true;
  sent.fallback_attempted = true;
  sent.fallback_filled = 250;
  sent.timestamp_ms = 9'000;
  bus.publish(sent);

  EXPECT_EQ(received.order_id, 42u);
  EXPECT_EQ(received.venue, "BATS");
  EXPECT_EQ(received.quantity, 400);
  EXPECT_EQ(received.error, "venue timeout");
  EXPECT_TRUE(received.timed_out);
  EXPECT_TRUE(received.fallback_attempted);
  EXPECT_EQ(received.fallback_filled, 250);
  EXPECT_EQ(received.timestamp_ms, 9'000);
}

// -----------------------------------------------------------------------------
// 6. Dispatcher workers publish concurrently; every delivery is counted.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, ConcurrentPublishersDeliverEverything) {
  constexpr int kThreads = 4;
  constexpr int kPerThread = 500;

  std::atomic<int> delivered{0};
  bus.subscribe<oms::SliceUpdateEvent>(
      [&delivered](const oms::SliceUpdateEvent&) { delivered.fetch_add(1); });

  std::vector<std::thread> publishers;
  for (int t = 0; t < kThreads; ++t) {
    publishers.emplace_back([this] {
      for (int i = 0; i < kPerThread; ++i) {
        bus.publish(makeSlice(static_cast<oms::domain::SliceId>(i + 1)));
      }
    });
  }
  for (auto& t : publishers) {
    t.join();
  }

  EXPECT_EQ(delivered.load(), kThreads * kPerThread);
}
