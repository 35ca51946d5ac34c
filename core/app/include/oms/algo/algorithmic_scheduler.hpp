#pragma once

#include "oms/config/engine_config.hpp"
#include "oms/domain/compliance.hpp"
#include "oms/domain/order.hpp"
#include "oms/domain/order_slice.hpp"
#include "oms/eventbus/event_bus.hpp"
#include "oms/events/event.hpp"
#include "oms/execution/execution_dispatcher.hpp"
#include "oms/ports/i_compliance_gate.hpp"
#include "oms/ports/i_market_volume_source.hpp"
#include "oms/ports/i_quote_source.hpp"
#include "oms/routing/router.hpp"
#include "oms/state/order_state_machine.hpp"
#include "oms/time/i_time_provider.hpp"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace oms {

// Parameter changes accepted while an algorithm runs. Unset fields stay.
struct AlgoAdjustment {
  std::optional<double> participation_rate;
  std::optional<double> min_participation_rate;
  std::optional<double> max_participation_rate;
  std::optional<domain::Price> limit_price;
  std::optional<domain::Quantity> display_quantity;
};

// -----------------------------------------------------------------------------
// AlgoProgress
// -----------------------------------------------------------------------------
// Snapshot returned by monitorProgress().
//
//   progress         filled / quantity.
//   slippage_bps     signed cost against the benchmark in basis points;
//                    positive means worse than the benchmark for the side.
//   expected_filled  quantity * elapsed fraction of the window (for an
//                    open-ended iceberg: planned quantity already due).
//   on_schedule      filled >= expected_filled * (1 - tolerance).
//   execution_score  100 - |slippage_bps| * slippage_weight
//                    - (on_schedule ? 0 : off_schedule_penalty), in [0, 100].
// -----------------------------------------------------------------------------
struct AlgoProgress {
  domain::OrderId order_id{0};
  domain::AlgorithmType algorithm{domain::AlgorithmType::None};
  domain::OrderStatus status{domain::OrderStatus::Pending};

  double progress{0.0};
  domain::Quantity quantity{0};
  domain::Quantity filled_quantity{0};
  domain::Quantity remaining_quantity{0};
  domain::Price average_price{0.0};

  domain::BenchmarkType benchmark{domain::BenchmarkType::Arrival};
  domain::Price benchmark_price{0.0};
  double slippage_bps{0.0};

  domain::Quantity expected_filled{0};
  bool on_schedule{true};
  double execution_score{100.0};

  bool paused{false};
  bool compliance_hold{false};
  bool finished{false};
  std::size_t slices_total{0};
  std::size_t slices_completed{0};
  std::size_t slices_pending{0};
};

// -----------------------------------------------------------------------------
// AlgorithmicScheduler: TWAP / VWAP / POV / Iceberg execution
// -----------------------------------------------------------------------------
//
// @brief  Decomposes accepted algorithmic parent orders into child slices and
//         drives each slice through Router -> ExecutionDispatcher at its
//         scheduled time. Fills always apply to the parent order.
//
// @details
// submit() plans the slices (POV plans none; it sizes a child on every tick
// from observed market volume), records the arrival price, and takes one
// activity token on the parent so a cancel waits for the schedule to stop.
//
// tick() performs at most one dispatch for the order:
//   - parent terminal or PENDING_CANCEL: cancel every pending slice, release
//     the token, finish.
//   - paused, or parent mid-replace: do nothing.
//   - TWAP/VWAP/Iceberg: dispatch the earliest due pending slice with target
//     = planned quantity + carried-forward remainder (capped at the parent's
//     remaining quantity). The unfilled part of the target is carried to the
//     next slice. A slice whose target is 0 is canceled without dispatch.
//     After the last planned slice, up to max_catch_up_slices catch-up slices
//     are added while the window is still open.
//   - POV: dispatch povChildQuantity() for the volume printed since start;
//     the algorithm finishes at end_time_ms, leaving the parent live.
// A finished schedule releases its token; the parent order itself stays in
// whatever state its fills produced.
//
// Every child is run through the compliance gate, sized to its target,
// before it is routed. A blocking result (or a gate that throws) puts the
// schedule on compliance hold: the slice stays pending, nothing is
// dispatched, and later ticks check again until the gate passes. Entering
// the hold publishes a ComplianceRejectEvent for the parent. A POV child
// refused by the gate is dropped, not kept pending.
//
// With SchedulerConfig::tick_interval_ms > 0 every algorithm gets its own
// timer thread calling tick(). With 0 no threads are started and the owner
// (or a test driving a SimulationTimeProvider) calls tick()/tickAll().
//
// submit() and tickAll() join the timer threads of finished schedules and
// drop the oldest finished schedules beyond
// SchedulerConfig::max_finished_schedules; monitorProgress() and slices()
// on a dropped schedule throw UnknownOrder.
//
// Thread model:
//   Ticks of one algorithm are serialized; different algorithms tick in
//   parallel. pause/resume/adjust/replan/notifyCancel/monitorProgress are
//   safe from any thread and never wait for an in-flight dispatch. Events are
//   published with no scheduler lock held.
//
// Ownership:
//   Owned by OrderManagementEngine. Owns the timer threads; borrows every
//   collaborator.
// -----------------------------------------------------------------------------
class AlgorithmicScheduler {
 public:
  AlgorithmicScheduler(OrderStateMachine& osm, const Router& router,
                       ExecutionDispatcher& dispatcher,
                       ports::IQuoteSource& quotes,
                       ports::IMarketVolumeSource& volume,
                       ports::IComplianceGate& compliance,
                       const ITimeProvider& clock,
                       config::SchedulerConfig config,
                       config::AnalyticsWeights weights,
                       EventBus* bus = nullptr);
  ~AlgorithmicScheduler();

  AlgorithmicScheduler(const AlgorithmicScheduler&) = delete;
  AlgorithmicScheduler& operator=(const AlgorithmicScheduler&) = delete;
  AlgorithmicScheduler(AlgorithmicScheduler&&) = delete;
  AlgorithmicScheduler& operator=(AlgorithmicScheduler&&) = delete;

  // -------------------------------------------------------------------------
  // submit(order)
  // -------------------------------------------------------------------------
  // `order` must be a live (NEW) algorithmic order snapshot.
  //
  // Throws: ValidationError (not algorithmic, already scheduled, not live).
  // -------------------------------------------------------------------------
  void submit(const domain::Order& order);

  // Returns false once the schedule has finished. Throws UnknownOrder.
  bool tick(domain::OrderId order_id);

  // Ticks every unfinished schedule once, in order id order.
  void tickAll();

  void pause(domain::OrderId order_id, const std::string& reason);
  void resume(domain::OrderId order_id);

  // Takes effect from the next slice that has not been dispatched yet.
  // Throws ValidationError for inconsistent rates or non-positive values.
  void adjustParameters(domain::OrderId order_id,
                        const AlgoAdjustment& adjustment);

  // Redistributes the pending slices over the parent's new remaining
  // quantity after a replace.
  void replan(domain::OrderId order_id);

  // Stops the schedule after a cancel: pending slices are canceled and the
  // activity token is released. Dispatches already in flight complete.
  // Unknown ids are ignored.
  void notifyCancel(domain::OrderId order_id);

  AlgoProgress monitorProgress(domain::OrderId order_id) const;
  std::vector<domain::OrderSlice> slices(domain::OrderId order_id) const;
  bool isActive(domain::OrderId order_id) const;

  // Schedules still held, finished ones included.
  std::size_t trackedSchedules() const;
  // Timer threads started and not yet joined.
  std::size_t runningTimers() const;

  // Stops and joins every timer thread. Idempotent.
  void stop();

 private:
  struct AlgoState {
    domain::OrderId order_id{0};
    domain::AlgorithmType type{domain::AlgorithmType::None};
    domain::AlgorithmParams params;
    std::int64_t start_ms{0};
    std::int64_t end_ms{0};
    std::int64_t interval_ms{0};
    std::optional<domain::Price> limit_override;

    std::vector<domain::OrderSlice> slices;
    domain::SliceId next_slice_id{1};
    domain::Quantity carry{0};
    domain::Quantity executed{0};
    int catch_up_used{0};

    domain::Price arrival_price{0.0};
    domain::BenchmarkType benchmark{domain::BenchmarkType::Arrival};

    bool paused{false};
    bool compliance_hold{false};
    bool finished{false};
    bool holds_token{false};
    bool stop_timer{false};

    std::mutex tick_mutex;
    mutable std::mutex mutex;
    std::condition_variable cv;
    std::thread timer;
  };

  std::shared_ptr<AlgoState> find(domain::OrderId order_id) const;

  // Marks the schedule finished and cancels pending slices. Requires
  // state.mutex. Returns true when the caller must release the token.
  bool finishLocked(AlgoState& state, const std::string& reason,
                    std::vector<Event>& events);

  void releaseToken(domain::OrderId order_id);
  void publish(const std::vector<Event>& events);
  SliceUpdateEvent sliceEvent(const domain::OrderSlice& slice) const;

  // Dispatches slices[index] for `parent`. Called with tick_mutex held and
  // state.mutex held via `lock`, which is released around the dispatch.
  void runSlice(AlgoState& state, std::unique_lock<std::mutex>& lock,
                std::size_t index, const domain::Order& parent,
                std::vector<Event>& events);

  // The gate's result when it blocks `child`, std::nullopt when it passes.
  std::optional<domain::ComplianceResult> complianceBlock(
      const domain::Order& child);

  // Joins finished timers and prunes old finished schedules. Takes mutex_.
  void reapFinished();

  domain::Price arrivalPrice(const domain::Order& order);
  void timerLoop(std::shared_ptr<AlgoState> state);

  OrderStateMachine& osm_;
  const Router& router_;
  ExecutionDispatcher& dispatcher_;
  ports::IQuoteSource& quotes_;
  ports::IMarketVolumeSource& volume_;
  ports::IComplianceGate& compliance_;
  const ITimeProvider& clock_;
  config::SchedulerConfig config_;
  config::AnalyticsWeights weights_;
  EventBus* bus_;

  mutable std::mutex mutex_;
  std::map<domain::OrderId, std::shared_ptr<AlgoState>> algos_;
};

}  // namespace oms
