// =============================================================================
// algorithmic_scheduler_test.cpp
// =============================================================================
// Integration tests for oms::AlgorithmicScheduler over the real state
// machine, router and dispatcher. Timer threads are disabled
// (tick_interval_ms = 0) and a SimulationTimeProvider is advanced by hand, so
// every slice runs deterministically on the test thread.
//
// Validates:
//   - TWAP: one slice per interval, parent filled after the last slice
//   - Unfilled slice quantity carried to the next slice, catch-up slices
//   - VWAP curve slicing, Iceberg display slicing and re-cutting
//   - POV child sizing from observed market volume, window close
//   - Zero-target slices canceled without a venue call
//   - Every child slice passes the compliance gate first; a blocked or
//     failing gate holds the schedule until it passes again
//   - pause/resume, cancel, replace + replan
//   - Finished timers joined, old finished schedules pruned
//   - monitorProgress() slippage, schedule tracking and score
// =============================================================================

#include "oms/algo/algorithmic_scheduler.hpp"
#include "oms/concurrent/order_id_generator.hpp"
#include "oms/core/error.hpp"
#include "oms/eventbus/event_bus.hpp"
#include "oms/events/event_types.hpp"
#include "oms/execution/execution_dispatcher.hpp"
#include "oms/ledger/order_ledger.hpp"
#include "oms/routing/router.hpp"
#include "oms/state/order_state_machine.hpp"
#include "oms/time/simulation_time_provider.hpp"

#include "test_doubles.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <thread>
#include <utility>
#include <vector>

using oms::domain::AlgorithmType;
using oms::domain::Order;
using oms::domain::OrderStatus;
using oms::domain::SliceStatus;

namespace {

constexpr std::int64_t kStart = 1'000'000;
constexpr std::int64_t kMinute = 60'000;

oms::config::RouterConfig routerConfig() {
  oms::config::RouterConfig cfg;
  cfg.venues = {oms::test::venue("A")};
  return cfg;
}

oms::config::SchedulerConfig schedulerConfig() {
  oms::config::SchedulerConfig cfg;
  cfg.tick_interval_ms = 0;
  cfg.default_slice_interval_ms = 5 * kMinute;
  cfg.max_catch_up_slices = 2;
  return cfg;
}

}  // namespace

// =============================================================================
// Test fixture: caller-driven scheduler over a one-venue market at 150.00 mid.
// =============================================================================
class AlgorithmicSchedulerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    quotes.setBook("AAPL", "A",
                   oms::test::oneLevelBook(149.99, 1'000'000, 150.01,
                                           1'000'000));
  }

  // Accepted algorithmic order, not yet scheduled.
  Order liveOrder(AlgorithmType type, oms::domain::Quantity qty,
                  oms::domain::AlgorithmParams params) {
    oms::domain::OrderRequest r;
    r.symbol = "AAPL";
    r.side = oms::domain::Side::Buy;
    r.order_type = oms::domain::OrderType::Market;
    r.quantity = qty;
    r.algorithm_type = type;
    r.algorithm_params = std::move(params);
    const Order created = osm.create(r);
    return osm.accept(created.order_id, oms::domain::ComplianceResult{});
  }

  Order submit(AlgorithmType type, oms::domain::Quantity qty,
               oms::domain::AlgorithmParams params) {
    const Order live = liveOrder(type, qty, std::move(params));
    scheduler.submit(live);
    return live;
  }

  static oms::domain::AlgorithmParams window(std::int64_t minutes) {
    oms::domain::AlgorithmParams p;
    p.start_time_ms = kStart;
    p.end_time_ms = kStart + minutes * kMinute;
    return p;
  }

  void setFillRatio(double ratio) {
    oms::test::FakeVenueEndpoint::Behaviour b;
    b.fill_ratio = ratio;
    endpoint.setBehaviour("A", b);
  }

  oms::domain::Quantity filled(oms::domain::OrderId id) const {
    return osm.snapshot(id).filled_quantity;
  }

  oms::OrderLedger ledger;
  oms::OrderIdGenerator ids;
  oms::SimulationTimeProvider clock{kStart};
  oms::EventBus bus;
  oms::OrderStateMachine osm{ledger, ids, clock, &bus};
  oms::test::FakeQuoteSource quotes;
  oms::test::FakeVenueEndpoint endpoint;
  oms::test::FakeVolumeSource volume;
  oms::test::FakeComplianceGate gate;
  oms::Router router{routerConfig()};
  oms::ExecutionDispatcher dispatcher{osm,      router,
                                      quotes,   endpoint,
                                      oms::config::DispatcherConfig{},
                                      clock,    &bus};
  oms::AlgorithmicScheduler scheduler{osm,    router, dispatcher,
                                      quotes, volume, gate,
                                      clock,  schedulerConfig(),
                                      oms::config::AnalyticsWeights{},
                                      &bus};
};

// =============================================================================
// submit()
// =============================================================================

TEST_F(AlgorithmicSchedulerTest, SubmitRejectsNonAlgorithmicAndDuplicates) {
  oms::domain::OrderRequest plain;
  plain.symbol = "AAPL";
  plain.quantity = 100;
  const Order created = osm.create(plain);
  const Order live =
      osm.accept(created.order_id, oms::domain::ComplianceResult{});
  EXPECT_THROW(scheduler.submit(live), oms::ValidationError);

  const Order twap = submit(AlgorithmType::Twap, 1000, window(25));
  EXPECT_THROW(scheduler.submit(osm.snapshot(twap.order_id)),
               oms::ValidationError);
  EXPECT_EQ(osm.outstandingActivity(twap.order_id), 1);
}

TEST_F(AlgorithmicSchedulerTest, SubmitRejectsOrderThatIsNotLive) {
  oms::domain::OrderRequest r;
  r.symbol = "AAPL";
  r.quantity = 100;
  r.algorithm_type = AlgorithmType::Twap;
  r.algorithm_params = window(10);
  const Order pending = osm.create(r);

  EXPECT_THROW(scheduler.submit(pending), oms::ValidationError);
  EXPECT_FALSE(scheduler.isActive(pending.order_id));
}

// =============================================================================
// TWAP
// =============================================================================

TEST_F(AlgorithmicSchedulerTest, TwapDispatchesOneSlicePerInterval) {
  auto params = window(25);
  params.slice_interval_ms = 5 * kMinute;
  const Order order = submit(AlgorithmType::Twap, 10'000, params);
  ASSERT_EQ(scheduler.slices(order.order_id).size(), 5u);

  EXPECT_TRUE(scheduler.tick(order.order_id));
  EXPECT_EQ(filled(order.order_id), 2000);

  // Slice 2 is not due yet.
  EXPECT_TRUE(scheduler.tick(order.order_id));
  EXPECT_EQ(filled(order.order_id), 2000);

  for (int i = 1; i < 5; ++i) {
    clock.advance_by(5 * kMinute);
    scheduler.tick(order.order_id);
    EXPECT_EQ(filled(order.order_id), 2000 * (i + 1));
  }
  EXPECT_EQ(osm.snapshot(order.order_id).status, OrderStatus::Filled);

  EXPECT_FALSE(scheduler.tick(order.order_id));
  EXPECT_FALSE(scheduler.isActive(order.order_id));
  EXPECT_EQ(osm.outstandingActivity(order.order_id), 0);

  for (const auto& s : scheduler.slices(order.order_id)) {
    EXPECT_EQ(s.status, SliceStatus::Filled);
    EXPECT_EQ(s.filled_quantity, 2000);
  }

  // Every child was sent with its slice id.
  const auto requests = endpoint.requests();
  ASSERT_EQ(requests.size(), 5u);
  for (std::size_t i = 0; i < requests.size(); ++i) {
    ASSERT_TRUE(requests[i].slice_id.has_value());
    EXPECT_EQ(*requests[i].slice_id, i + 1);
  }
}

TEST_F(AlgorithmicSchedulerTest, UnfilledQuantityCarriesToNextSlice) {
  setFillRatio(0.5);
  const Order order = submit(AlgorithmType::Twap, 10'000, window(25));

  scheduler.tick(order.order_id);
  clock.advance_by(5 * kMinute);
  scheduler.tick(order.order_id);

  const auto slices = scheduler.slices(order.order_id);
  EXPECT_EQ(slices[0].target_quantity, 2000);
  EXPECT_EQ(slices[0].filled_quantity, 1000);
  EXPECT_EQ(slices[0].carried_forward, 1000);
  EXPECT_EQ(slices[0].status, SliceStatus::Filled);
  EXPECT_EQ(slices[1].target_quantity, 3000);
  EXPECT_EQ(slices[1].filled_quantity, 1500);
  EXPECT_EQ(filled(order.order_id), 2500);
}

TEST_F(AlgorithmicSchedulerTest, CatchUpSliceAfterLastPlannedSlice) {
  auto params = window(10);
  params.num_slices = 2;
  setFillRatio(0.5);
  const Order order = submit(AlgorithmType::Twap, 1000, params);

  scheduler.tick(order.order_id);  // 500 target, 250 filled
  clock.advance_by(5 * kMinute);
  scheduler.tick(order.order_id);  // 750 target, 375 filled
  EXPECT_EQ(filled(order.order_id), 625);

  setFillRatio(1.0);
  scheduler.tick(order.order_id);  // catch-up for the 375 carried

  const auto slices = scheduler.slices(order.order_id);
  ASSERT_EQ(slices.size(), 3u);
  EXPECT_TRUE(slices[2].catch_up);
  EXPECT_EQ(slices[2].target_quantity, 375);
  EXPECT_EQ(osm.snapshot(order.order_id).status, OrderStatus::Filled);
}

TEST_F(AlgorithmicSchedulerTest, ScheduleEndsWhenWindowClosesWithCarry) {
  auto params = window(10);
  params.num_slices = 2;
  setFillRatio(0.5);
  const Order order = submit(AlgorithmType::Twap, 1000, params);

  scheduler.tick(order.order_id);
  clock.advance_by(5 * kMinute);
  scheduler.tick(order.order_id);

  clock.advance_by(10 * kMinute);
  EXPECT_FALSE(scheduler.tick(order.order_id));

  const Order after = osm.snapshot(order.order_id);
  EXPECT_EQ(after.status, OrderStatus::PartiallyFilled);
  EXPECT_EQ(after.remaining_quantity, 375);
  EXPECT_EQ(osm.outstandingActivity(order.order_id), 0);
}

// Five window-derived slices for 3 shares: the first four plan nothing.
TEST_F(AlgorithmicSchedulerTest, ZeroTargetSliceIsCanceledWithoutDispatch) {
  const Order order = submit(AlgorithmType::Twap, 3, window(25));
  ASSERT_EQ(scheduler.slices(order.order_id).size(), 5u);

  EXPECT_TRUE(scheduler.tick(order.order_id));

  const auto first = scheduler.slices(order.order_id).front();
  EXPECT_EQ(first.status, SliceStatus::Canceled);
  EXPECT_EQ(first.target_quantity, 0);
  EXPECT_EQ(first.filled_quantity, 0);
  EXPECT_TRUE(endpoint.requests().empty());
  EXPECT_EQ(osm.snapshot(order.order_id).status, OrderStatus::New);
}

TEST_F(AlgorithmicSchedulerTest, FailedSliceIsCanceledAndCarried) {
  endpoint.failVenue("A");
  const Order order = submit(AlgorithmType::Twap, 10'000, window(25));

  scheduler.tick(order.order_id);

  const auto first = scheduler.slices(order.order_id).front();
  EXPECT_EQ(first.status, SliceStatus::Canceled);
  EXPECT_EQ(first.carried_forward, 2000);
  EXPECT_EQ(osm.snapshot(order.order_id).status, OrderStatus::New);
}

// =============================================================================
// VWAP / Iceberg
// =============================================================================

TEST_F(AlgorithmicSchedulerTest, VwapFollowsCustomCurve) {
  auto params = window(10);
  params.custom_curve = {1.0, 3.0};
  const Order order = submit(AlgorithmType::Vwap, 1000, params);

  const auto slices = scheduler.slices(order.order_id);
  ASSERT_EQ(slices.size(), 2u);
  EXPECT_EQ(slices[0].quantity, 250);
  EXPECT_EQ(slices[1].quantity, 750);
  EXPECT_EQ(slices[1].scheduled_time_ms, kStart + 5 * kMinute);
}

TEST_F(AlgorithmicSchedulerTest, VwapUsesHistoricalProfile) {
  volume.setProfile({1.0, 1.0, 2.0, 4.0});
  const Order order = submit(AlgorithmType::Vwap, 8000, window(20));

  const auto slices = scheduler.slices(order.order_id);
  ASSERT_EQ(slices.size(), 4u);
  EXPECT_EQ(slices[0].quantity, 1000);
  EXPECT_EQ(slices[3].quantity, 4000);
}

TEST_F(AlgorithmicSchedulerTest, IcebergRecutsAfterDisplayChange) {
  auto params = window(60);
  params.slice_interval_ms = kMinute;
  params.display_quantity = 300;
  const Order order = submit(AlgorithmType::Iceberg, 1000, params);
  ASSERT_EQ(scheduler.slices(order.order_id).size(), 4u);

  scheduler.tick(order.order_id);
  EXPECT_EQ(filled(order.order_id), 300);

  oms::AlgoAdjustment bigger;
  bigger.display_quantity = 500;
  scheduler.adjustParameters(order.order_id, bigger);

  const auto slices = scheduler.slices(order.order_id);
  ASSERT_EQ(slices.size(), 3u);
  EXPECT_EQ(slices[1].quantity, 500);
  EXPECT_EQ(slices[2].quantity, 200);
  EXPECT_EQ(slices[1].scheduled_time_ms, kStart + kMinute);
  EXPECT_NE(slices[1].slice_id, slices[0].slice_id);
  EXPECT_NE(slices[2].slice_id, slices[1].slice_id);
}

// =============================================================================
// POV
// =============================================================================

TEST_F(AlgorithmicSchedulerTest, PovParticipatesInObservedVolume) {
  const Order order = submit(AlgorithmType::Pov, 5000, window(30));
  EXPECT_TRUE(scheduler.slices(order.order_id).empty());

  volume.setVolume(10'000);
  scheduler.tick(order.order_id);
  EXPECT_EQ(filled(order.order_id), 1000);

  volume.setVolume(15'000);
  clock.advance_by(kMinute);
  scheduler.tick(order.order_id);
  EXPECT_EQ(filled(order.order_id), 1500);

  // No new volume: nothing to send.
  clock.advance_by(kMinute);
  scheduler.tick(order.order_id);
  EXPECT_EQ(scheduler.slices(order.order_id).size(), 2u);

  clock.advance_by(30 * kMinute);
  EXPECT_FALSE(scheduler.tick(order.order_id));
  EXPECT_EQ(osm.snapshot(order.order_id).status, OrderStatus::PartiallyFilled);
  EXPECT_EQ(osm.outstandingActivity(order.order_id), 0);
}

TEST_F(AlgorithmicSchedulerTest, AdjustRatesValidatesAndApplies) {
  const Order order = submit(AlgorithmType::Pov, 5000, window(30));

  oms::AlgoAdjustment bad;
  bad.participation_rate = 0.5;  // above the 0.20 max
  EXPECT_THROW(scheduler.adjustParameters(order.order_id, bad),
               oms::ValidationError);

  oms::AlgoAdjustment bad_limit;
  bad_limit.limit_price = 0.0;
  EXPECT_THROW(scheduler.adjustParameters(order.order_id, bad_limit),
               oms::ValidationError);

  oms::AlgoAdjustment faster;
  faster.participation_rate = 0.3;
  faster.max_participation_rate = 0.4;
  scheduler.adjustParameters(order.order_id, faster);

  volume.setVolume(10'000);
  scheduler.tick(order.order_id);
  EXPECT_EQ(filled(order.order_id), 3000);

  EXPECT_THROW(scheduler.adjustParameters(999, faster), oms::UnknownOrder);
}

// =============================================================================
// Control: pause, cancel, replace
// =============================================================================

TEST_F(AlgorithmicSchedulerTest, PausedScheduleDispatchesNothing) {
  const Order order = submit(AlgorithmType::Twap, 10'000, window(25));

  scheduler.pause(order.order_id, "operator");
  EXPECT_TRUE(scheduler.tick(order.order_id));
  EXPECT_EQ(filled(order.order_id), 0);
  EXPECT_TRUE(scheduler.monitorProgress(order.order_id).paused);

  scheduler.resume(order.order_id);
  scheduler.tick(order.order_id);
  EXPECT_EQ(filled(order.order_id), 2000);
}

// =============================================================================
// Compliance on every slice
// =============================================================================

TEST_F(AlgorithmicSchedulerTest, HaltMidScheduleHoldsFurtherSlices) {
  std::vector<oms::ComplianceRejectEvent> rejects;
  bus.subscribe<oms::ComplianceRejectEvent>(
      [&](const oms::ComplianceRejectEvent& e) { rejects.push_back(e); });

  const Order order = submit(AlgorithmType::Twap, 10'000, window(25));
  scheduler.tick(order.order_id);
  EXPECT_EQ(filled(order.order_id), 2000);

  gate.blockWith("TRADING_HALTED");
  clock.advance_by(5 * kMinute);
  EXPECT_TRUE(scheduler.tick(order.order_id));
  clock.advance_by(5 * kMinute);
  EXPECT_TRUE(scheduler.tick(order.order_id));

  EXPECT_EQ(filled(order.order_id), 2000);
  EXPECT_EQ(endpoint.requests().size(), 1u);
  EXPECT_TRUE(scheduler.monitorProgress(order.order_id).compliance_hold);
  EXPECT_EQ(scheduler.slices(order.order_id)[1].status, SliceStatus::Pending);
  ASSERT_EQ(rejects.size(), 1u);
  EXPECT_EQ(rejects[0].order_id, order.order_id);
  ASSERT_FALSE(rejects[0].result.blockingChecks().empty());
  EXPECT_EQ(rejects[0].result.blockingChecks()[0].name, "TRADING_HALTED");

  // Held slices run one per tick once the gate passes again.
  gate.clear();
  scheduler.tick(order.order_id);
  EXPECT_EQ(filled(order.order_id), 4000);
  EXPECT_FALSE(scheduler.monitorProgress(order.order_id).compliance_hold);
  scheduler.tick(order.order_id);
  EXPECT_EQ(filled(order.order_id), 6000);
}

TEST_F(AlgorithmicSchedulerTest, GateErrorHoldsSchedule) {
  gate.throwOnCheck(true);
  const Order order = submit(AlgorithmType::Twap, 10'000, window(25));

  EXPECT_TRUE(scheduler.tick(order.order_id));
  EXPECT_EQ(filled(order.order_id), 0);
  EXPECT_TRUE(endpoint.requests().empty());
  EXPECT_TRUE(scheduler.monitorProgress(order.order_id).compliance_hold);

  gate.throwOnCheck(false);
  scheduler.tick(order.order_id);
  EXPECT_EQ(filled(order.order_id), 2000);
}

TEST_F(AlgorithmicSchedulerTest, ChildIsCheckedAtSliceSize) {
  const Order order = submit(AlgorithmType::Twap, 10'000, window(25));
  const int before = gate.calls();

  scheduler.tick(order.order_id);

  EXPECT_EQ(gate.calls(), before + 1);
  EXPECT_EQ(gate.lastCheckedQuantity(), 2000);
  EXPECT_EQ(filled(order.order_id), 2000);
}

TEST_F(AlgorithmicSchedulerTest, CancelStopsScheduleAndConfirms) {
  std::vector<oms::SliceUpdateEvent> slice_events;
  bus.subscribe<oms::SliceUpdateEvent>(
      [&](const oms::SliceUpdateEvent& e) { slice_events.push_back(e); });

  const Order order = submit(AlgorithmType::Twap, 10'000, window(25));
  scheduler.tick(order.order_id);

  // The schedule's token keeps the order in PENDING_CANCEL.
  const auto result = osm.cancel(order.order_id, "user");
  EXPECT_TRUE(result.cancelled);
  EXPECT_EQ(result.order.status, OrderStatus::PendingCancel);

  scheduler.notifyCancel(order.order_id);
  EXPECT_FALSE(scheduler.isActive(order.order_id));
  EXPECT_EQ(osm.snapshot(order.order_id).status, OrderStatus::Canceled);
  EXPECT_EQ(filled(order.order_id), 2000);

  const auto slices = scheduler.slices(order.order_id);
  for (std::size_t i = 1; i < slices.size(); ++i) {
    EXPECT_EQ(slices[i].status, SliceStatus::Canceled);
  }
  // Active + Filled for slice 1, Canceled for the other four.
  EXPECT_EQ(slice_events.size(), 2u + 4u);

  clock.advance_by(5 * kMinute);
  EXPECT_FALSE(scheduler.tick(order.order_id));
  EXPECT_EQ(endpoint.requests().size(), 1u);
}

TEST_F(AlgorithmicSchedulerTest, TickNoticesCancelWithoutNotification) {
  const Order order = submit(AlgorithmType::Twap, 10'000, window(25));
  osm.cancel(order.order_id, "user");

  EXPECT_FALSE(scheduler.tick(order.order_id));
  EXPECT_EQ(osm.snapshot(order.order_id).status, OrderStatus::Canceled);
  EXPECT_TRUE(endpoint.requests().empty());
}

TEST_F(AlgorithmicSchedulerTest, ReplanAfterReplace) {
  const Order order = submit(AlgorithmType::Twap, 10'000, window(25));
  scheduler.tick(order.order_id);

  oms::domain::OrderModification smaller;
  smaller.quantity = 6000;
  osm.modify(order.order_id, smaller);

  // Mid-replace: nothing is dispatched.
  clock.advance_by(5 * kMinute);
  scheduler.tick(order.order_id);
  EXPECT_EQ(filled(order.order_id), 2000);

  osm.completeReplace(order.order_id);
  scheduler.replan(order.order_id);

  const auto slices = scheduler.slices(order.order_id);
  oms::domain::Quantity pending = 0;
  for (std::size_t i = 1; i < slices.size(); ++i) {
    EXPECT_EQ(slices[i].quantity, 1000);
    pending += slices[i].quantity;
  }
  EXPECT_EQ(pending, 4000);

  for (int i = 0; i < 4; ++i) {
    scheduler.tick(order.order_id);
    clock.advance_by(5 * kMinute);
  }
  EXPECT_EQ(osm.snapshot(order.order_id).status, OrderStatus::Filled);
  EXPECT_EQ(filled(order.order_id), 6000);
}

// =============================================================================
// monitorProgress()
// =============================================================================

TEST_F(AlgorithmicSchedulerTest, ProgressReportsSlippageAndSchedule) {
  const Order order = submit(AlgorithmType::Twap, 10'000, window(25));
  scheduler.tick(order.order_id);  // 2000 at the 150.01 ask

  clock.advance_by(5 * kMinute);
  auto p = scheduler.monitorProgress(order.order_id);
  EXPECT_DOUBLE_EQ(p.progress, 0.2);
  EXPECT_NEAR(p.benchmark_price, 150.00, 1e-9);
  EXPECT_NEAR(p.slippage_bps, 0.01 / 150.0 * 10'000.0, 1e-6);
  EXPECT_EQ(p.expected_filled, 2000);
  EXPECT_TRUE(p.on_schedule);
  EXPECT_NEAR(p.execution_score, 100.0 - p.slippage_bps * 0.1, 1e-9);
  EXPECT_EQ(p.slices_total, 5u);
  EXPECT_EQ(p.slices_completed, 1u);
  EXPECT_EQ(p.slices_pending, 4u);

  clock.advance_by(10 * kMinute);
  p = scheduler.monitorProgress(order.order_id);
  EXPECT_EQ(p.expected_filled, 6000);
  EXPECT_FALSE(p.on_schedule);
  EXPECT_NEAR(p.execution_score, 90.0 - p.slippage_bps * 0.1, 1e-9);
}

TEST_F(AlgorithmicSchedulerTest, ProgressAgainstMarketVwap) {
  auto params = window(25);
  params.benchmark = oms::domain::BenchmarkType::MarketVwap;
  const Order order = submit(AlgorithmType::Twap, 10'000, params);
  volume.setVwap(150.03);
  scheduler.tick(order.order_id);

  const auto p = scheduler.monitorProgress(order.order_id);
  EXPECT_EQ(p.benchmark, oms::domain::BenchmarkType::MarketVwap);
  EXPECT_DOUBLE_EQ(p.benchmark_price, 150.03);
  // Bought below the market VWAP: negative slippage.
  EXPECT_LT(p.slippage_bps, 0.0);
}

// =============================================================================
// Housekeeping: finished schedules
// =============================================================================

TEST_F(AlgorithmicSchedulerTest, OldFinishedSchedulesArePruned) {
  auto cfg = schedulerConfig();
  cfg.max_finished_schedules = 1;
  oms::AlgorithmicScheduler local{osm,    router, dispatcher,
                                  quotes, volume, gate,
                                  clock,  cfg,    oms::config::AnalyticsWeights{},
                                  &bus};

  auto params = window(5);
  params.num_slices = 1;
  std::vector<oms::domain::OrderId> done;
  for (int i = 0; i < 3; ++i) {
    const Order order = liveOrder(AlgorithmType::Twap, 100, params);
    local.submit(order);
    local.tick(order.order_id);  // fills
    EXPECT_FALSE(local.tick(order.order_id));
    done.push_back(order.order_id);
  }
  EXPECT_EQ(local.trackedSchedules(), 3u);

  const Order next = liveOrder(AlgorithmType::Twap, 100, params);
  local.submit(next);

  EXPECT_EQ(local.trackedSchedules(), 2u);
  EXPECT_THROW(local.monitorProgress(done[0]), oms::UnknownOrder);
  EXPECT_THROW(local.monitorProgress(done[1]), oms::UnknownOrder);
  EXPECT_TRUE(local.monitorProgress(done[2]).finished);
  EXPECT_TRUE(local.isActive(next.order_id));
}

TEST_F(AlgorithmicSchedulerTest, FinishedTimerThreadsAreJoined) {
  auto cfg = schedulerConfig();
  cfg.tick_interval_ms = 5;
  oms::AlgorithmicScheduler local{osm,    router, dispatcher,
                                  quotes, volume, gate,
                                  clock,  cfg,    oms::config::AnalyticsWeights{},
                                  &bus};

  auto one_slice = window(5);
  one_slice.num_slices = 1;
  const Order quick = liveOrder(AlgorithmType::Twap, 100, one_slice);
  local.submit(quick);

  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (local.isActive(quick.order_id) &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  ASSERT_FALSE(local.isActive(quick.order_id));
  EXPECT_EQ(local.runningTimers(), 1u);

  const Order slow = liveOrder(AlgorithmType::Twap, 10'000, window(25));
  local.submit(slow);
  EXPECT_EQ(local.runningTimers(), 1u);

  local.stop();
  EXPECT_EQ(local.runningTimers(), 0u);
}
