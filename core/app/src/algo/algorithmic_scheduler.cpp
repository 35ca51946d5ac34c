#include "oms/algo/algorithmic_scheduler.hpp"
#include "oms/algo/slice_planner.hpp"
#include "oms/core/error.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <utility>

namespace oms {

namespace {

bool parentWaitsForReplace(domain::OrderStatus status) {
  return status == domain::OrderStatus::PendingReplace ||
         status == domain::OrderStatus::Replaced;
}

void validateRates(double min_rate, double target, double max_rate) {
  if (!(min_rate > 0.0 && min_rate <= target && target <= max_rate &&
        max_rate <= 1.0)) {
    throw ValidationError(
        "participation rates must satisfy 0 < min <= target <= max <= 1");
  }
}

}  // namespace

AlgorithmicScheduler::AlgorithmicScheduler(
    OrderStateMachine& osm, const Router& router,
    ExecutionDispatcher& dispatcher, ports::IQuoteSource& quotes,
    ports::IMarketVolumeSource& volume, ports::IComplianceGate& compliance,
    const ITimeProvider& clock, config::SchedulerConfig config,
    config::AnalyticsWeights weights, EventBus* bus)
    : osm_(osm),
      router_(router),
      dispatcher_(dispatcher),
      quotes_(quotes),
      volume_(volume),
      compliance_(compliance),
      clock_(clock),
      config_(config),
      weights_(weights),
      bus_(bus) {}

AlgorithmicScheduler::~AlgorithmicScheduler() { stop(); }

// -----------------------------------------------------------------------------
// submit(): plan slices, take the schedule's activity token, start the timer
// -----------------------------------------------------------------------------
void AlgorithmicScheduler::submit(const domain::Order& order) {
  if (order.algorithm_type == domain::AlgorithmType::None) {
    throw ValidationError("order " + std::to_string(order.order_id) +
                          " has no algorithm");
  }
  reapFinished();
  {
    std::lock_guard lock(mutex_);
    if (algos_.count(order.order_id) != 0) {
      throw ValidationError("order " + std::to_string(order.order_id) +
                            " is already scheduled");
    }
  }
  if (!osm_.beginActivity(order.order_id)) {
    throw ValidationError("order " + std::to_string(order.order_id) +
                          " is not live");
  }

  auto state = std::make_shared<AlgoState>();
  state->order_id = order.order_id;
  state->type = order.algorithm_type;
  state->params = order.algorithm_params;
  state->start_ms = order.algorithm_params.start_time_ms > 0
                        ? order.algorithm_params.start_time_ms
                        : clock_.now_ms();
  state->end_ms = order.algorithm_params.end_time_ms;
  state->interval_ms = order.algorithm_params.slice_interval_ms > 0
                           ? order.algorithm_params.slice_interval_ms
                           : config_.default_slice_interval_ms;
  state->benchmark =
      order.algorithm_params.benchmark.value_or(config_.default_benchmark);
  state->holds_token = true;

  try {
    state->arrival_price = arrivalPrice(order);

    const algo::SliceWindow window{order.order_id, state->start_ms,
                                   state->end_ms, state->interval_ms};
    const domain::Quantity quantity = order.remaining_quantity;

    switch (order.algorithm_type) {
      case domain::AlgorithmType::Twap:
        state->slices =
            algo::planTwap(quantity, window, order.algorithm_params.num_slices);
        break;

      case domain::AlgorithmType::Vwap: {
        std::vector<double> curve = order.algorithm_params.custom_curve;
        if (curve.empty()) {
          const int buckets =
              order.algorithm_params.num_slices > 0
                  ? order.algorithm_params.num_slices
                  : algo::twapSliceCount(state->start_ms, state->end_ms,
                                         state->interval_ms);
          curve = volume_.historicalVolumeProfile(order.symbol, buckets);
          if (curve.size() != static_cast<std::size_t>(buckets)) {
            curve = algo::normalizeCurve(curve,
                                         static_cast<std::size_t>(buckets));
          }
        }
        state->slices = algo::planVwap(quantity, window, curve);
        break;
      }

      case domain::AlgorithmType::Iceberg:
        state->slices = algo::planIceberg(
            quantity, order.algorithm_params.display_quantity, window);
        break;

      case domain::AlgorithmType::Pov:
      case domain::AlgorithmType::None:
        break;
    }
  } catch (const std::exception&) {
    releaseToken(order.order_id);
    throw;
  }
  state->next_slice_id = state->slices.size() + 1;

  bool inserted = false;
  {
    std::lock_guard lock(mutex_);
    inserted = algos_.emplace(order.order_id, state).second;
    if (inserted && config_.tick_interval_ms > 0) {
      state->timer = std::thread([this, state] { timerLoop(state); });
    }
  }
  if (!inserted) {
    releaseToken(order.order_id);
    throw ValidationError("order " + std::to_string(order.order_id) +
                          " is already scheduled");
  }

  std::cout << "[AlgorithmicScheduler] order " << order.order_id << " "
            << domain::toString(order.algorithm_type) << " scheduled: "
            << state->slices.size() << " slice(s), window [" << state->start_ms
            << ", " << state->end_ms << "], arrival="
            << state->arrival_price << "\n";
}

// -----------------------------------------------------------------------------
// tick(): at most one dispatch for the order
// -----------------------------------------------------------------------------
bool AlgorithmicScheduler::tick(domain::OrderId order_id) {
  auto state = find(order_id);
  std::lock_guard tick_lock(state->tick_mutex);

  const domain::Order parent = osm_.snapshot(order_id);
  std::vector<Event> events;
  bool release = false;
  bool active = true;

  {
    std::unique_lock lock(state->mutex);
    if (state->finished) {
      return false;
    }

    const std::int64_t now = clock_.now_ms();
    const bool window_open = state->end_ms <= 0 || now < state->end_ms;

    if (domain::isTerminal(parent.status) ||
        parent.status == domain::OrderStatus::PendingCancel) {
      release = finishLocked(
          *state,
          std::string("parent is ") + domain::toString(parent.status),
          events);
    } else if (state->paused || parentWaitsForReplace(parent.status)) {
      // Nothing is dispatched until resume()/completeReplace().
    } else if (parent.remaining_quantity == 0) {
      release = finishLocked(*state, "parent fully filled", events);
    } else if (state->type == domain::AlgorithmType::Pov) {
      if (!window_open) {
        release = finishLocked(*state, "participation window closed", events);
      } else if (now >= state->start_ms) {
        lock.unlock();
        const domain::Quantity market_volume =
            volume_.marketVolume(parent.symbol, state->start_ms, now);
        lock.lock();

        if (!state->finished && !state->paused) {
          const domain::Quantity child = algo::povChildQuantity(
              market_volume, state->executed, parent.remaining_quantity,
              state->params.participation_rate,
              state->params.min_participation_rate,
              state->params.max_participation_rate);
          if (child > 0) {
            domain::OrderSlice slice;
            slice.slice_id = state->next_slice_id++;
            slice.parent_order_id = order_id;
            slice.quantity = child;
            slice.scheduled_time_ms = now;
            state->slices.push_back(slice);
            runSlice(*state, lock, state->slices.size() - 1, parent, events);
          }
        }
      }
    } else {
      auto due = std::find_if(
          state->slices.begin(), state->slices.end(),
          [&](const domain::OrderSlice& s) {
            return s.status == domain::SliceStatus::Pending &&
                   s.scheduled_time_ms <= now;
          });
      const bool any_pending = std::any_of(
          state->slices.begin(), state->slices.end(),
          [](const domain::OrderSlice& s) {
            return s.status == domain::SliceStatus::Pending;
          });

      if (due != state->slices.end()) {
        runSlice(*state, lock,
                 static_cast<std::size_t>(due - state->slices.begin()), parent,
                 events);
      } else if (!any_pending) {
        if (state->carry > 0 && window_open &&
            state->catch_up_used < config_.max_catch_up_slices) {
          domain::OrderSlice slice;
          slice.slice_id = state->next_slice_id++;
          slice.parent_order_id = order_id;
          slice.quantity = state->carry;
          slice.scheduled_time_ms = now;
          slice.catch_up = true;
          state->carry = 0;
          ++state->catch_up_used;
          state->slices.push_back(slice);
          runSlice(*state, lock, state->slices.size() - 1, parent, events);
        } else {
          if (parent.remaining_quantity > 0) {
            std::cerr << "[AlgorithmicScheduler] WARNING: order " << order_id
                      << " schedule exhausted with "
                      << parent.remaining_quantity << " unfilled\n";
          }
          release = finishLocked(*state, "schedule complete", events);
        }
      }
    }

    active = !state->finished;
  }

  publish(events);
  if (release) {
    releaseToken(order_id);
  }
  return active;
}

void AlgorithmicScheduler::tickAll() {
  reapFinished();
  std::vector<domain::OrderId> ids;
  {
    std::lock_guard lock(mutex_);
    for (const auto& entry : algos_) {
      ids.push_back(entry.first);
    }
  }
  for (domain::OrderId id : ids) {
    if (!isActive(id)) {
      continue;
    }
    try {
      tick(id);
    } catch (const OmsError& e) {
      std::cerr << "[AlgorithmicScheduler] ERROR: tick for order " << id
                << " failed: " << e.what() << "\n";
    }
  }
}

// -----------------------------------------------------------------------------
// runSlice(): compliance, then route and dispatch one slice with the state
// lock released
// -----------------------------------------------------------------------------
void AlgorithmicScheduler::runSlice(AlgoState& state,
                                    std::unique_lock<std::mutex>& lock,
                                    std::size_t index,
                                    const domain::Order& parent,
                                    std::vector<Event>& events) {
  const domain::SliceId slice_id = state.slices[index].slice_id;

  // POV sizes every child from cumulative volume, so nothing is carried.
  const bool carries = state.type != domain::AlgorithmType::Pov;
  const auto targetOf = [&](const domain::OrderSlice& s) {
    return std::max<domain::Quantity>(
        0, std::min(s.quantity + (carries ? state.carry : 0),
                    parent.remaining_quantity));
  };

  if (targetOf(state.slices[index]) == 0) {
    domain::OrderSlice& slice = state.slices[index];
    slice.target_quantity = 0;
    slice.status = domain::SliceStatus::Canceled;
    events.push_back(sliceEvent(slice));
    return;
  }

  domain::Order proposed = parent;
  if (state.limit_override) {
    proposed.limit_price = state.limit_override;
  }
  proposed.quantity = targetOf(state.slices[index]);
  proposed.filled_quantity = 0;
  proposed.remaining_quantity = proposed.quantity;

  lock.unlock();
  const std::optional<domain::ComplianceResult> block =
      complianceBlock(proposed);
  lock.lock();

  auto pos = std::find_if(state.slices.begin(), state.slices.end(),
                          [&](const domain::OrderSlice& s) {
                            return s.slice_id == slice_id;
                          });
  if (state.finished || pos == state.slices.end() ||
      pos->status != domain::SliceStatus::Pending) {
    return;
  }

  if (block) {
    if (!state.compliance_hold) {
      state.compliance_hold = true;
      events.push_back(ComplianceRejectEvent{parent.order_id, parent.symbol,
                                             *block, clock_.now_ms()});
      std::cerr << "[AlgorithmicScheduler] WARNING: order " << parent.order_id
                << " on compliance hold at slice " << slice_id << "\n";
    }
    if (!carries) {
      state.slices.erase(pos);
    }
    return;
  }
  if (state.compliance_hold) {
    state.compliance_hold = false;
    std::cout << "[AlgorithmicScheduler] order " << parent.order_id
              << " compliance hold cleared\n";
  }

  domain::OrderSlice& slice = *pos;
  const domain::Quantity target = targetOf(slice);
  if (carries) {
    state.carry = 0;
  }
  slice.target_quantity = target;

  if (slice.target_quantity == 0) {
    slice.status = domain::SliceStatus::Canceled;
    events.push_back(sliceEvent(slice));
    return;
  }

  slice.status = domain::SliceStatus::Active;
  events.push_back(sliceEvent(slice));

  domain::Order child = parent;
  if (state.limit_override) {
    child.limit_price = state.limit_override;
  }

  lock.unlock();
  publish(events);
  events.clear();

  domain::Quantity filled = 0;
  try {
    const domain::QuoteSnapshot quotes =
        quotes_.quotes(child.symbol, router_.eligibleVenues());
    const domain::RoutingPlan plan = router_.route(child, target, quotes);
    filled = dispatcher_.dispatch(child, plan, slice_id).total_filled;
  } catch (const std::exception& e) {
    std::cerr << "[AlgorithmicScheduler] WARNING: slice " << slice_id
              << " of order " << parent.order_id
              << " not executed: " << e.what() << "\n";
  }

  lock.lock();
  auto it = std::find_if(state.slices.begin(), state.slices.end(),
                         [&](const domain::OrderSlice& s) {
                           return s.slice_id == slice_id;
                         });
  if (it == state.slices.end()) {
    return;
  }

  const domain::Quantity unfilled = target - filled;
  it->filled_quantity = filled;
  it->carried_forward = carries ? unfilled : 0;
  it->status =
      filled > 0 ? domain::SliceStatus::Filled : domain::SliceStatus::Canceled;
  state.carry += it->carried_forward;
  state.executed += filled;
  events.push_back(sliceEvent(*it));

  std::cout << "[AlgorithmicScheduler] order " << parent.order_id << " slice "
            << slice_id << (it->catch_up ? " (catch-up)" : "") << ": filled "
            << filled << "/" << target << ", carry " << state.carry << "\n";
}

// -----------------------------------------------------------------------------
// pause / resume / adjustParameters
// -----------------------------------------------------------------------------
void AlgorithmicScheduler::pause(domain::OrderId order_id,
                                 const std::string& reason) {
  auto state = find(order_id);
  std::lock_guard lock(state->mutex);
  state->paused = true;
  std::cout << "[AlgorithmicScheduler] order " << order_id
            << " paused: " << reason << "\n";
}

void AlgorithmicScheduler::resume(domain::OrderId order_id) {
  auto state = find(order_id);
  std::lock_guard lock(state->mutex);
  state->paused = false;
  std::cout << "[AlgorithmicScheduler] order " << order_id << " resumed\n";
}

void AlgorithmicScheduler::adjustParameters(domain::OrderId order_id,
                                            const AlgoAdjustment& adjustment) {
  if (adjustment.limit_price && *adjustment.limit_price <= 0.0) {
    throw ValidationError("limit price must be > 0");
  }
  if (adjustment.display_quantity && *adjustment.display_quantity <= 0) {
    throw ValidationError("display quantity must be > 0");
  }

  auto state = find(order_id);
  std::lock_guard lock(state->mutex);
  if (state->finished) {
    throw ValidationError("algorithm for order " + std::to_string(order_id) +
                          " has finished");
  }

  const double target =
      adjustment.participation_rate.value_or(state->params.participation_rate);
  const double min_rate = adjustment.min_participation_rate.value_or(
      state->params.min_participation_rate);
  const double max_rate = adjustment.max_participation_rate.value_or(
      state->params.max_participation_rate);
  validateRates(min_rate, target, max_rate);

  state->params.participation_rate = target;
  state->params.min_participation_rate = min_rate;
  state->params.max_participation_rate = max_rate;
  if (adjustment.limit_price) {
    state->limit_override = adjustment.limit_price;
  }

  if (adjustment.display_quantity) {
    state->params.display_quantity = *adjustment.display_quantity;
    if (state->type == domain::AlgorithmType::Iceberg) {
      // Re-cut the undispatched quantity into slices of the new size.
      domain::Quantity pending = 0;
      std::int64_t first_time = -1;
      for (const auto& s : state->slices) {
        if (s.status == domain::SliceStatus::Pending) {
          pending += s.quantity;
          if (first_time < 0) {
            first_time = s.scheduled_time_ms;
          }
        }
      }
      state->slices.erase(
          std::remove_if(state->slices.begin(), state->slices.end(),
                         [](const domain::OrderSlice& s) {
                           return s.status == domain::SliceStatus::Pending;
                         }),
          state->slices.end());
      if (pending > 0) {
        const algo::SliceWindow window{order_id, first_time, state->end_ms,
                                       state->interval_ms};
        for (auto s : algo::planIceberg(pending, *adjustment.display_quantity,
                                        window)) {
          s.slice_id = state->next_slice_id++;
          state->slices.push_back(s);
        }
      }
    }
  }

  std::cout << "[AlgorithmicScheduler] order " << order_id
            << " parameters adjusted (rate " << target << " in [" << min_rate
            << ", " << max_rate << "])\n";
}

// -----------------------------------------------------------------------------
// replan(): fit pending slices to the parent's new remaining quantity
// -----------------------------------------------------------------------------
void AlgorithmicScheduler::replan(domain::OrderId order_id) {
  auto state = find(order_id);
  const domain::Order parent = osm_.snapshot(order_id);

  std::lock_guard lock(state->mutex);
  if (state->finished || state->type == domain::AlgorithmType::Pov) {
    return;
  }

  domain::Quantity in_flight = 0;
  std::vector<std::size_t> pending;
  domain::Quantity pending_total = 0;
  for (std::size_t i = 0; i < state->slices.size(); ++i) {
    const auto& s = state->slices[i];
    if (s.status == domain::SliceStatus::Active) {
      in_flight += s.target_quantity;
    } else if (s.status == domain::SliceStatus::Pending) {
      pending.push_back(i);
      pending_total += s.quantity;
    }
  }

  const domain::Quantity available =
      std::max<domain::Quantity>(0, parent.remaining_quantity - in_flight);

  if (pending.empty()) {
    state->carry = available;
  } else {
    state->carry = std::min(state->carry, available);
    const domain::Quantity needed = available - state->carry;
    domain::Quantity assigned = 0;
    for (std::size_t k = 0; k < pending.size(); ++k) {
      auto& s = state->slices[pending[k]];
      if (k + 1 == pending.size()) {
        s.quantity = needed - assigned;
      } else if (pending_total > 0) {
        s.quantity = static_cast<domain::Quantity>(
            std::floor(static_cast<double>(needed) *
                       static_cast<double>(s.quantity) /
                       static_cast<double>(pending_total)));
      } else {
        s.quantity = needed / static_cast<domain::Quantity>(pending.size());
      }
      assigned += s.quantity;
    }
  }

  std::cout << "[AlgorithmicScheduler] order " << order_id << " replanned: "
            << pending.size() << " pending slice(s) now cover "
            << (available - state->carry) << ", carry " << state->carry
            << "\n";
}

// -----------------------------------------------------------------------------
// notifyCancel()
// -----------------------------------------------------------------------------
void AlgorithmicScheduler::notifyCancel(domain::OrderId order_id) {
  std::shared_ptr<AlgoState> state;
  {
    std::lock_guard lock(mutex_);
    auto it = algos_.find(order_id);
    if (it == algos_.end()) {
      return;
    }
    state = it->second;
  }

  std::vector<Event> events;
  bool release = false;
  {
    std::lock_guard lock(state->mutex);
    if (state->finished) {
      return;
    }
    release = finishLocked(*state, "cancel requested", events);
  }
  publish(events);
  if (release) {
    releaseToken(order_id);
  }
}

// -----------------------------------------------------------------------------
// monitorProgress()
// -----------------------------------------------------------------------------
AlgoProgress AlgorithmicScheduler::monitorProgress(
    domain::OrderId order_id) const {
  auto state = find(order_id);
  const domain::Order parent = osm_.snapshot(order_id);
  const std::int64_t now = clock_.now_ms();

  AlgoProgress p;
  p.order_id = order_id;
  p.algorithm = parent.algorithm_type;
  p.status = parent.status;
  p.quantity = parent.quantity;
  p.filled_quantity = parent.filled_quantity;
  p.remaining_quantity = parent.remaining_quantity;
  p.average_price = parent.average_price;
  p.progress = parent.quantity > 0
                   ? static_cast<double>(parent.filled_quantity) /
                         static_cast<double>(parent.quantity)
                   : 0.0;

  std::int64_t start_ms = 0;
  std::int64_t end_ms = 0;
  domain::Price arrival = 0.0;
  domain::Quantity due_quantity = 0;
  {
    std::lock_guard lock(state->mutex);
    start_ms = state->start_ms;
    end_ms = state->end_ms;
    arrival = state->arrival_price;
    p.benchmark = state->benchmark;
    p.paused = state->paused;
    p.compliance_hold = state->compliance_hold;
    p.finished = state->finished;
    p.slices_total = state->slices.size();
    for (const auto& s : state->slices) {
      if (domain::isTerminal(s.status)) {
        ++p.slices_completed;
      } else if (s.status == domain::SliceStatus::Pending) {
        ++p.slices_pending;
      }
      if (s.scheduled_time_ms <= now) {
        due_quantity += s.quantity;
      }
    }
  }

  p.benchmark_price = arrival;
  if (p.benchmark == domain::BenchmarkType::MarketVwap) {
    const domain::Price vwap = volume_.marketVwap(parent.symbol, start_ms, now);
    if (vwap > 0.0) {
      p.benchmark_price = vwap;
    }
  }

  if (p.average_price > 0.0 && p.benchmark_price > 0.0) {
    const double diff = parent.side == domain::Side::Buy
                            ? p.average_price - p.benchmark_price
                            : p.benchmark_price - p.average_price;
    p.slippage_bps = diff / p.benchmark_price * 10000.0;
  }

  if (end_ms > start_ms) {
    const double elapsed =
        std::clamp(static_cast<double>(now - start_ms) /
                       static_cast<double>(end_ms - start_ms),
                   0.0, 1.0);
    p.expected_filled = static_cast<domain::Quantity>(
        std::floor(static_cast<double>(parent.quantity) * elapsed));
  } else {
    p.expected_filled = std::min(due_quantity, parent.quantity);
  }
  p.on_schedule = static_cast<double>(p.filled_quantity) >=
                  static_cast<double>(p.expected_filled) *
                      (1.0 - config_.on_schedule_tolerance);

  const double penalty = p.on_schedule ? 0.0 : weights_.off_schedule_penalty;
  p.execution_score = std::clamp(
      100.0 - std::fabs(p.slippage_bps) * weights_.slippage_weight - penalty,
      0.0, 100.0);
  return p;
}

std::vector<domain::OrderSlice> AlgorithmicScheduler::slices(
    domain::OrderId order_id) const {
  auto state = find(order_id);
  std::lock_guard lock(state->mutex);
  return state->slices;
}

bool AlgorithmicScheduler::isActive(domain::OrderId order_id) const {
  std::shared_ptr<AlgoState> state;
  {
    std::lock_guard lock(mutex_);
    auto it = algos_.find(order_id);
    if (it == algos_.end()) {
      return false;
    }
    state = it->second;
  }
  std::lock_guard lock(state->mutex);
  return !state->finished;
}

// -----------------------------------------------------------------------------
// stop(): join every timer thread
// -----------------------------------------------------------------------------
void AlgorithmicScheduler::stop() {
  std::vector<std::shared_ptr<AlgoState>> all;
  std::vector<std::thread> timers;
  {
    std::lock_guard lock(mutex_);
    for (const auto& entry : algos_) {
      all.push_back(entry.second);
      if (entry.second->timer.joinable()) {
        timers.push_back(std::move(entry.second->timer));
      }
    }
  }
  for (const auto& state : all) {
    {
      std::lock_guard lock(state->mutex);
      state->stop_timer = true;
    }
    state->cv.notify_all();
  }
  for (auto& timer : timers) {
    timer.join();
  }
}

std::size_t AlgorithmicScheduler::trackedSchedules() const {
  std::lock_guard lock(mutex_);
  return algos_.size();
}

std::size_t AlgorithmicScheduler::runningTimers() const {
  std::lock_guard lock(mutex_);
  std::size_t n = 0;
  for (const auto& entry : algos_) {
    if (entry.second->timer.joinable()) {
      ++n;
    }
  }
  return n;
}

// -----------------------------------------------------------------------------
// reapFinished(): join timers of finished schedules, then keep at most
// max_finished_schedules finished entries (the newest ones)
// -----------------------------------------------------------------------------
void AlgorithmicScheduler::reapFinished() {
  std::vector<std::thread> timers;
  {
    std::lock_guard lock(mutex_);
    std::vector<domain::OrderId> finished;
    for (auto& entry : algos_) {
      AlgoState& state = *entry.second;
      bool done = false;
      {
        std::lock_guard state_lock(state.mutex);
        done = state.finished;
      }
      if (!done) {
        continue;
      }
      finished.push_back(entry.first);
      if (state.timer.joinable() &&
          state.timer.get_id() != std::this_thread::get_id()) {
        timers.push_back(std::move(state.timer));
      }
    }

    if (finished.size() > config_.max_finished_schedules) {
      const std::size_t excess =
          finished.size() - config_.max_finished_schedules;
      for (std::size_t i = 0; i < excess; ++i) {
        auto it = algos_.find(finished[i]);
        if (!it->second->timer.joinable()) {
          algos_.erase(it);
        }
      }
    }
  }

  // A finished timer returns right after its last tick.
  for (auto& timer : timers) {
    timer.join();
  }
}

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------
std::shared_ptr<AlgorithmicScheduler::AlgoState> AlgorithmicScheduler::find(
    domain::OrderId order_id) const {
  std::lock_guard lock(mutex_);
  auto it = algos_.find(order_id);
  if (it == algos_.end()) {
    throw UnknownOrder(order_id);
  }
  return it->second;
}

bool AlgorithmicScheduler::finishLocked(AlgoState& state,
                                        const std::string& reason,
                                        std::vector<Event>& events) {
  state.finished = true;
  for (auto& s : state.slices) {
    if (s.status == domain::SliceStatus::Pending) {
      s.status = domain::SliceStatus::Canceled;
      events.push_back(sliceEvent(s));
    }
  }
  state.cv.notify_all();

  std::cout << "[AlgorithmicScheduler] order " << state.order_id
            << " schedule finished: " << reason << "\n";
  return std::exchange(state.holds_token, false);
}

std::optional<domain::ComplianceResult> AlgorithmicScheduler::complianceBlock(
    const domain::Order& child) {
  try {
    domain::ComplianceResult result = compliance_.check(child);
    if (result.blocking()) {
      return result;
    }
    return std::nullopt;
  } catch (const std::exception& e) {
    std::cerr << "[AlgorithmicScheduler] ERROR: compliance check for order "
              << child.order_id << " failed: " << e.what() << "\n";
    domain::ComplianceResult result;
    result.passed = false;
    result.checks.push_back(domain::ComplianceCheck{
        "COMPLIANCE_UNAVAILABLE", domain::Severity::Error, false, e.what()});
    return result;
  }
}

void AlgorithmicScheduler::releaseToken(domain::OrderId order_id) {
  try {
    osm_.endActivity(order_id);
  } catch (const OmsError& e) {
    std::cerr << "[AlgorithmicScheduler] WARNING: releasing order "
              << order_id << " failed: " << e.what() << "\n";
  }
}

void AlgorithmicScheduler::publish(const std::vector<Event>& events) {
  if (bus_ == nullptr) {
    return;
  }
  for (const auto& event : events) {
    bus_->publish(event);
  }
}

SliceUpdateEvent AlgorithmicScheduler::sliceEvent(
    const domain::OrderSlice& slice) const {
  return SliceUpdateEvent{slice, clock_.now_ms()};
}

domain::Price AlgorithmicScheduler::arrivalPrice(const domain::Order& order) {
  domain::Price best_bid = 0.0;
  domain::Price best_ask = 0.0;
  try {
    for (const auto& entry :
         quotes_.quotes(order.symbol, router_.eligibleVenues())) {
      const auto& book = entry.second;
      if (!book.bids.empty() && book.bids.front().price > best_bid) {
        best_bid = book.bids.front().price;
      }
      if (!book.asks.empty() && book.asks.front().price > 0.0 &&
          (best_ask == 0.0 || book.asks.front().price < best_ask)) {
        best_ask = book.asks.front().price;
      }
    }
  } catch (const std::exception& e) {
    std::cerr << "[AlgorithmicScheduler] WARNING: no arrival quote for order "
              << order.order_id << ": " << e.what() << "\n";
  }

  if (best_bid > 0.0 && best_ask > 0.0) {
    return (best_bid + best_ask) / 2.0;
  }
  if (best_bid > 0.0 || best_ask > 0.0) {
    return best_bid > 0.0 ? best_bid : best_ask;
  }
  return domain::referencePrice(order);
}

void AlgorithmicScheduler::timerLoop(std::shared_ptr<AlgoState> state) {
  const auto interval = std::chrono::milliseconds(config_.tick_interval_ms);
  while (true) {
    {
      std::unique_lock lock(state->mutex);
      if (state->cv.wait_for(lock, interval, [&] {
            return state->stop_timer || state->finished;
          })) {
        return;
      }
    }
    try {
      if (!tick(state->order_id)) {
        return;
      }
    } catch (const std::exception& e) {
      std::cerr << "[AlgorithmicScheduler] ERROR: tick for order "
                << state->order_id << " failed: " << e.what() << "\n";
    }
  }
}

}  // namespace oms
