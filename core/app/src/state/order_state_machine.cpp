#include "oms/state/order_state_machine.hpp"
#include "oms/core/error.hpp"

#include <algorithm>
#include <iostream>
#include <optional>
#include <sstream>
#include <utility>

namespace oms {

namespace {

using domain::OrderStatus;

bool requiresLimitPrice(domain::OrderType type) {
  return type == domain::OrderType::Limit ||
         type == domain::OrderType::StopLimit;
}

bool requiresStopPrice(domain::OrderType type) {
  return type == domain::OrderType::Stop ||
         type == domain::OrderType::StopLimit;
}

bool expires(domain::TimeInForce tif) {
  return tif == domain::TimeInForce::Day || tif == domain::TimeInForce::Gtd;
}

std::string describeBlocking(const domain::ComplianceResult& result) {
  std::ostringstream out;
  out << "compliance:";
  for (const auto& check : result.blockingChecks()) {
    out << " " << check.name;
  }
  return out.str();
}

}  // namespace

OrderStateMachine::OrderStateMachine(OrderLedger& ledger,
                                     OrderIdGenerator& ids,
                                     const ITimeProvider& clock,
                                     EventBus* bus)
    : ledger_(ledger), ids_(ids), clock_(clock), bus_(bus) {}

// -----------------------------------------------------------------------------
// isValidTransition: the OrderStatus graph
// -----------------------------------------------------------------------------
bool OrderStateMachine::isValidTransition(OrderStatus from, OrderStatus to) {
  using S = OrderStatus;

  switch (from) {
    case S::Pending:
      return to == S::New ||
             to == S::Rejected ||
             to == S::PendingCancel;

    case S::New:
    case S::PartiallyFilled:
      return to == S::PartiallyFilled ||
             to == S::Filled ||
             to == S::PendingCancel ||
             to == S::PendingReplace ||
             to == S::Expired;

    case S::PendingCancel:
      return to == S::Canceled ||
             to == S::Expired ||
             to == S::Filled;

    case S::PendingReplace:
      return to == S::Replaced ||
             to == S::Filled ||
             to == S::PendingCancel;

    case S::Replaced:
      return to == S::New ||
             to == S::PartiallyFilled;

    case S::Filled:
    case S::Canceled:
    case S::Rejected:
    case S::Expired:
      return false;
  }

  return false;
}

// -----------------------------------------------------------------------------
// transition: validate, then record
// -----------------------------------------------------------------------------
void OrderStateMachine::transition(LedgerEntry& entry, OrderStatus to,
                                   const std::string& reason,
                                   std::int64_t now_ms) {
  domain::Order& order = entry.order;
  const OrderStatus from = order.status;

  if (!isValidTransition(from, to)) {
    throw InvalidTransition(order.order_id, from, to);
  }

  order.status = to;
  order.updated_at_ms = now_ms;
  entry.history.push_back(TransitionRecord{from, to, reason, now_ms});

  std::cout << "[OrderStateMachine] order " << order.order_id << " "
            << domain::toString(from) << " -> " << domain::toString(to);
  if (!reason.empty()) {
    std::cout << " (" << reason << ")";
  }
  std::cout << "\n";
}

void OrderStateMachine::publish(const std::vector<Event>& events) {
  if (bus_ == nullptr) {
    return;
  }
  for (const auto& event : events) {
    bus_->publish(event);
  }
}

// -----------------------------------------------------------------------------
// validateRequest
// -----------------------------------------------------------------------------
void OrderStateMachine::validateRequest(const domain::OrderRequest& request,
                                        std::int64_t now_ms) const {
  if (request.quantity <= 0) {
    throw ValidationError("quantity must be > 0");
  }
  if (request.symbol.empty()) {
    throw ValidationError("symbol is required");
  }
  if (request.price < 0.0) {
    throw ValidationError("price must be >= 0");
  }

  if (requiresLimitPrice(request.order_type)) {
    const bool has_limit =
        (request.limit_price && *request.limit_price > 0.0) ||
        (!request.limit_price && request.price > 0.0 &&
         request.order_type == domain::OrderType::Limit);
    if (!has_limit) {
      throw ValidationError(std::string(domain::toString(request.order_type)) +
                            " order requires a positive limit price");
    }
  }
  if (requiresStopPrice(request.order_type)) {
    if (!request.stop_price || *request.stop_price <= 0.0) {
      throw ValidationError(std::string(domain::toString(request.order_type)) +
                            " order requires a positive stop price");
    }
  }
  if (request.time_in_force == domain::TimeInForce::Gtd &&
      !request.expire_at_ms) {
    throw ValidationError("GTD order requires expire_at_ms");
  }

  const auto& params = request.algorithm_params;
  const std::int64_t start =
      params.start_time_ms > 0 ? params.start_time_ms : now_ms;

  switch (request.algorithm_type) {
    case domain::AlgorithmType::None:
      break;

    case domain::AlgorithmType::Twap:
    case domain::AlgorithmType::Vwap:
    case domain::AlgorithmType::Pov:
      if (params.end_time_ms <= start) {
        throw ValidationError("algorithm end_time_ms must be after start");
      }
      if (params.slice_interval_ms < 0 || params.num_slices < 0) {
        throw ValidationError("slice interval and count must be >= 0");
      }
      if (params.num_slices > domain::kMaxAlgorithmSlices ||
          params.custom_curve.size() >
              static_cast<std::size_t>(domain::kMaxAlgorithmSlices)) {
        throw ValidationError("at most " +
                              std::to_string(domain::kMaxAlgorithmSlices) +
                              " slices per order");
      }
      if (params.num_slices > request.quantity) {
        throw ValidationError("num_slices must not exceed quantity");
      }
      if (params.slice_interval_ms > 0 &&
          (params.end_time_ms - start + params.slice_interval_ms - 1) /
                  params.slice_interval_ms >
              domain::kMaxAlgorithmSlices) {
        throw ValidationError("slice_interval_ms too small for the window: "
                              "at most " +
                              std::to_string(domain::kMaxAlgorithmSlices) +
                              " slices per order");
      }
      for (double weight : params.custom_curve) {
        if (weight < 0.0) {
          throw ValidationError("volume curve weights must be >= 0");
        }
      }
      if (request.algorithm_type == domain::AlgorithmType::Pov) {
        const double lo = params.min_participation_rate;
        const double mid = params.participation_rate;
        const double hi = params.max_participation_rate;
        if (!(lo > 0.0 && lo <= mid && mid <= hi && hi <= 1.0)) {
          throw ValidationError(
              "participation rates must satisfy 0 < min <= target <= max <= 1");
        }
      }
      break;

    case domain::AlgorithmType::Iceberg:
      if (params.display_quantity <= 0) {
        throw ValidationError("iceberg display_quantity must be > 0");
      }
      if (params.slice_interval_ms < 0) {
        throw ValidationError("slice interval must be >= 0");
      }
      if ((request.quantity + params.display_quantity - 1) /
              params.display_quantity >
          domain::kMaxAlgorithmSlices) {
        throw ValidationError("display_quantity too small: at most " +
                              std::to_string(domain::kMaxAlgorithmSlices) +
                              " slices per order");
      }
      break;
  }
}

// -----------------------------------------------------------------------------
// create
// -----------------------------------------------------------------------------
domain::Order OrderStateMachine::create(const domain::OrderRequest& request) {
  const std::int64_t now = clock_.now_ms();
  validateRequest(request, now);

  domain::Order order;
  order.order_id = ids_.next_id();
  order.client_order_id = request.client_order_id;
  order.parent_order_id = request.parent_order_id;
  order.symbol = request.symbol;
  order.security_id = request.security_id;
  order.account = request.account;
  order.side = request.side;
  order.order_type = request.order_type;
  order.quantity = request.quantity;
  order.filled_quantity = 0;
  order.remaining_quantity = request.quantity;
  order.price = request.price;
  order.limit_price = request.limit_price;
  if (!order.limit_price && order.order_type == domain::OrderType::Limit) {
    order.limit_price = request.price;
  }
  order.stop_price = request.stop_price;
  order.average_price = 0.0;
  order.time_in_force = request.time_in_force;
  order.expire_at_ms = request.expire_at_ms;
  order.algorithm_type = request.algorithm_type;
  order.algorithm_params = request.algorithm_params;
  if (order.algorithm_type != domain::AlgorithmType::None &&
      order.algorithm_params.start_time_ms <= 0) {
    order.algorithm_params.start_time_ms = now;
  }
  order.status = OrderStatus::Pending;
  order.created_at_ms = now;
  order.updated_at_ms = now;

  LedgerEntry entry;
  entry.order = order;
  entry.history.push_back(
      TransitionRecord{OrderStatus::Pending, OrderStatus::Pending, "created",
                       now});
  ledger_.insert(std::move(entry));

  publish({OrderUpdateEvent{order, OrderStatus::Pending, "created", now}});
  return order;
}

// -----------------------------------------------------------------------------
// accept
// -----------------------------------------------------------------------------
domain::Order OrderStateMachine::accept(domain::OrderId order_id,
                                        const domain::ComplianceResult& result) {
  const bool blocked = result.blocking();
  const std::string reason = blocked ? describeBlocking(result) : "accepted";

  std::vector<Event> events;
  domain::Order order = ledger_.mutate(order_id, [&](LedgerEntry& e) {
    if (domain::isTerminal(e.order.status)) {
      throw TerminalOrder(order_id, e.order.status);
    }
    const OrderStatus previous = e.order.status;
    const std::int64_t now = clock_.now_ms();
    transition(e, blocked ? OrderStatus::Rejected : OrderStatus::New, reason,
               now);
    events.emplace_back(OrderUpdateEvent{e.order, previous, reason, now});
    return e.order;
  });
  publish(events);

  for (const auto& warning : result.warnings()) {
    std::cerr << "[OrderStateMachine] WARNING: order " << order_id << " "
              << warning.name << ": " << warning.message << "\n";
  }

  if (blocked) {
    throw ComplianceRejection(order_id, result);
  }
  return order;
}

// -----------------------------------------------------------------------------
// reject
// -----------------------------------------------------------------------------
domain::Order OrderStateMachine::reject(domain::OrderId order_id,
                                        const std::string& reason) {
  std::vector<Event> events;
  domain::Order order = ledger_.mutate(order_id, [&](LedgerEntry& e) {
    if (domain::isTerminal(e.order.status)) {
      throw TerminalOrder(order_id, e.order.status);
    }
    const OrderStatus previous = e.order.status;
    const std::int64_t now = clock_.now_ms();
    transition(e, OrderStatus::Rejected, reason, now);
    events.emplace_back(OrderUpdateEvent{e.order, previous, reason, now});
    return e.order;
  });
  publish(events);
  return order;
}

// -----------------------------------------------------------------------------
// applyExecution
// -----------------------------------------------------------------------------
bool OrderStateMachine::applyExecution(const domain::ExecutionReport& report) {
  if (report.execution_id.empty()) {
    throw ValidationError("execution report without execution_id");
  }
  if (report.quantity <= 0) {
    throw ValidationError("execution quantity must be > 0");
  }
  if (report.price <= 0.0) {
    throw ValidationError("execution price must be > 0");
  }

  std::vector<Event> events;
  const bool applied = ledger_.mutate(report.order_id, [&](LedgerEntry& e) {
    domain::Order& order = e.order;

    if (e.seen_execution_ids.count(report.execution_id) != 0) {
      return false;
    }
    if (domain::isTerminal(order.status)) {
      throw TerminalOrder(order.order_id, order.status);
    }
    if (!domain::isFillable(order.status)) {
      throw InvalidTransition(order.order_id, order.status,
                              OrderStatus::PartiallyFilled);
    }
    if (report.quantity > order.remaining_quantity) {
      throw ValidationError(
          "overfill on order " + std::to_string(order.order_id) + ": " +
          std::to_string(report.quantity) + " > remaining " +
          std::to_string(order.remaining_quantity));
    }

    const OrderStatus previous = order.status;
    const domain::Quantity filled = order.filled_quantity + report.quantity;
    const domain::Quantity remaining = order.quantity - filled;

    OrderStatus next = OrderStatus::PartiallyFilled;
    if (remaining == 0) {
      next = OrderStatus::Filled;
    } else if (previous == OrderStatus::PendingCancel ||
               previous == OrderStatus::PendingReplace) {
      next = previous;
    }

    const std::int64_t now = clock_.now_ms();
    const std::string reason = "fill " + std::to_string(report.quantity) +
                               " on " + report.venue;
    if (next != previous) {
      transition(e, next, reason, now);
    }

    order.average_price =
        (order.average_price * static_cast<double>(order.filled_quantity) +
         report.price * static_cast<double>(report.quantity)) /
        static_cast<double>(filled);
    order.filled_quantity = filled;
    order.remaining_quantity = remaining;
    order.updated_at_ms = now;

    e.seen_execution_ids.insert(report.execution_id);
    e.fills.push_back(
        domain::FillRecord{report, filled, order.average_price, remaining});

    events.emplace_back(ExecutionReportEvent{report, order});
    events.emplace_back(OrderUpdateEvent{order, previous, reason, now});
    return true;
  });
  publish(events);
  return applied;
}

// -----------------------------------------------------------------------------
// cancel
// -----------------------------------------------------------------------------
CancelResult OrderStateMachine::cancel(domain::OrderId order_id,
                                       const std::string& reason) {
  std::vector<Event> events;
  CancelResult result = ledger_.mutate(order_id, [&](LedgerEntry& e) {
    domain::Order& order = e.order;

    if (domain::isTerminal(order.status)) {
      return CancelResult{false, order,
                          std::string("order is ") +
                              domain::toString(order.status)};
    }
    if (order.status == OrderStatus::PendingCancel) {
      return CancelResult{false, order, "cancel already pending"};
    }

    const OrderStatus previous = order.status;
    const std::int64_t now = clock_.now_ms();
    transition(e, OrderStatus::PendingCancel, reason, now);
    e.drain_target = OrderStatus::Canceled;
    if (e.outstanding_activity == 0) {
      transition(e, OrderStatus::Canceled, reason, now);
    }
    events.emplace_back(OrderUpdateEvent{order, previous, reason, now});
    return CancelResult{true, order, reason};
  });
  publish(events);

  if (!result.cancelled) {
    std::cerr << "[OrderStateMachine] WARNING: cancel of order " << order_id
              << " ignored: " << result.reason << "\n";
  }
  return result;
}

// -----------------------------------------------------------------------------
// modify
// -----------------------------------------------------------------------------
domain::Order OrderStateMachine::modify(domain::OrderId order_id,
                                        const domain::OrderModification& changes) {
  if (!changes.quantity && !changes.limit_price && !changes.stop_price) {
    throw ValidationError("modification changes nothing");
  }
  if (changes.quantity && *changes.quantity <= 0) {
    throw ValidationError("quantity must be > 0");
  }
  if ((changes.limit_price && *changes.limit_price <= 0.0) ||
      (changes.stop_price && *changes.stop_price <= 0.0)) {
    throw ValidationError("prices must be > 0");
  }

  const std::string reason =
      changes.reason.empty() ? std::string("modify") : changes.reason;

  std::vector<Event> events;
  domain::Order order = ledger_.mutate(order_id, [&](LedgerEntry& e) {
    domain::Order& o = e.order;

    if (domain::isTerminal(o.status)) {
      throw TerminalOrder(order_id, o.status);
    }
    if (o.status != OrderStatus::New &&
        o.status != OrderStatus::PartiallyFilled &&
        o.status != OrderStatus::PendingReplace) {
      throw InvalidTransition(order_id, o.status, OrderStatus::PendingReplace);
    }
    if (o.child_count > 0) {
      throw ValidationError("order " + std::to_string(order_id) +
                            " is split into child orders");
    }
    if (changes.quantity && *changes.quantity < o.filled_quantity) {
      throw ValidationError("quantity " + std::to_string(*changes.quantity) +
                            " is below filled quantity " +
                            std::to_string(o.filled_quantity));
    }
    // Venue calls still in flight may fill up to their full size.
    if (changes.quantity && *changes.quantity < o.quantity &&
        *changes.quantity < o.filled_quantity + e.in_flight_quantity) {
      throw ValidationError(
          "quantity " + std::to_string(*changes.quantity) +
          " is below filled plus in-flight quantity " +
          std::to_string(o.filled_quantity + e.in_flight_quantity));
    }
    if (changes.limit_price && !requiresLimitPrice(o.order_type)) {
      throw ValidationError(std::string(domain::toString(o.order_type)) +
                            " order has no limit price");
    }
    if (changes.stop_price && !requiresStopPrice(o.order_type)) {
      throw ValidationError(std::string(domain::toString(o.order_type)) +
                            " order has no stop price");
    }

    const OrderStatus previous = o.status;
    const std::int64_t now = clock_.now_ms();
    const domain::Quantity quantity = changes.quantity.value_or(o.quantity);
    const OrderStatus next = quantity == o.filled_quantity
                                 ? OrderStatus::Filled
                                 : OrderStatus::PendingReplace;
    if (next != previous) {
      transition(e, next, reason, now);
    }

    o.quantity = quantity;
    o.remaining_quantity = quantity - o.filled_quantity;
    if (changes.limit_price) {
      o.limit_price = changes.limit_price;
    }
    if (changes.stop_price) {
      o.stop_price = changes.stop_price;
    }
    o.updated_at_ms = now;

    events.emplace_back(OrderUpdateEvent{o, previous, reason, now});
    return o;
  });
  publish(events);
  return order;
}

// -----------------------------------------------------------------------------
// completeReplace
// -----------------------------------------------------------------------------
domain::Order OrderStateMachine::completeReplace(domain::OrderId order_id) {
  std::vector<Event> events;
  domain::Order order = ledger_.mutate(order_id, [&](LedgerEntry& e) {
    domain::Order& o = e.order;
    if (domain::isTerminal(o.status)) {
      throw TerminalOrder(order_id, o.status);
    }
    if (o.status != OrderStatus::PendingReplace) {
      throw InvalidTransition(order_id, o.status, OrderStatus::Replaced);
    }

    const OrderStatus previous = o.status;
    const std::int64_t now = clock_.now_ms();
    transition(e, OrderStatus::Replaced, "replace routed", now);
    transition(e,
               o.filled_quantity > 0 ? OrderStatus::PartiallyFilled
                                     : OrderStatus::New,
               "replace complete", now);
    events.emplace_back(OrderUpdateEvent{o, previous, "replaced", now});
    return o;
  });
  publish(events);
  return order;
}

// -----------------------------------------------------------------------------
// expire / expireDue
// -----------------------------------------------------------------------------
domain::Order OrderStateMachine::expire(domain::OrderId order_id,
                                        const std::string& reason) {
  std::vector<Event> events;
  domain::Order order = ledger_.mutate(order_id, [&](LedgerEntry& e) {
    domain::Order& o = e.order;
    if (domain::isTerminal(o.status)) {
      throw TerminalOrder(order_id, o.status);
    }
    if (!expires(o.time_in_force)) {
      throw ValidationError(std::string(domain::toString(o.time_in_force)) +
                            " orders do not expire");
    }
    const OrderStatus previous = o.status;
    const std::int64_t now = clock_.now_ms();
    if (e.outstanding_activity > 0) {
      // Venue calls in flight: drain like a cancel, then confirm EXPIRED.
      transition(e, OrderStatus::PendingCancel, reason, now);
      e.drain_target = OrderStatus::Expired;
    } else {
      transition(e, OrderStatus::Expired, reason, now);
    }
    events.emplace_back(OrderUpdateEvent{o, previous, reason, now});
    return o;
  });
  publish(events);
  return order;
}

std::vector<domain::OrderId> OrderStateMachine::expireDue(std::int64_t now_ms) {
  std::vector<domain::OrderId> expired;
  for (const auto& order : ledger_.snapshots()) {
    const bool live = order.status == OrderStatus::New ||
                      order.status == OrderStatus::PartiallyFilled;
    if (!live || !expires(order.time_in_force) || !order.expire_at_ms ||
        *order.expire_at_ms > now_ms || order.remaining_quantity == 0) {
      continue;
    }
    try {
      const domain::Order after = expire(order.order_id, "time in force elapsed");
      if (after.status == OrderStatus::PendingCancel) {
        std::cout << "[OrderStateMachine] order " << order.order_id
                  << " expiring once in-flight venue work drains\n";
      }
      expired.push_back(order.order_id);
    } catch (const OmsError& e) {
      // The order moved on between the snapshot and the expiry attempt.
      std::cerr << "[OrderStateMachine] WARNING: expiry of order "
                << order.order_id << " skipped: " << e.what() << "\n";
    }
  }
  return expired;
}

// -----------------------------------------------------------------------------
// beginActivity / endActivity
// -----------------------------------------------------------------------------
bool OrderStateMachine::beginActivity(domain::OrderId order_id,
                                      domain::Quantity venue_quantity) {
  return ledger_.mutate(order_id, [&](LedgerEntry& e) {
    const OrderStatus status = e.order.status;
    if (domain::isTerminal(status) || status == OrderStatus::Pending ||
        status == OrderStatus::PendingCancel ||
        status == OrderStatus::Replaced || e.order.child_count > 0) {
      return false;
    }
    ++e.outstanding_activity;
    e.in_flight_quantity += std::max<domain::Quantity>(venue_quantity, 0);
    return true;
  });
}

void OrderStateMachine::endActivity(domain::OrderId order_id,
                                    domain::Quantity venue_quantity) {
  std::vector<Event> events;
  ledger_.mutate(order_id, [&](LedgerEntry& e) {
    if (e.outstanding_activity <= 0) {
      std::cerr << "[OrderStateMachine] WARNING: unbalanced endActivity for "
                   "order "
                << order_id << "\n";
      return;
    }
    --e.outstanding_activity;
    e.in_flight_quantity = std::max<domain::Quantity>(
        0, e.in_flight_quantity - std::max<domain::Quantity>(venue_quantity, 0));
    if (e.outstanding_activity == 0 &&
        e.order.status == OrderStatus::PendingCancel) {
      const std::int64_t now = clock_.now_ms();
      const bool expiring = e.drain_target == OrderStatus::Expired;
      transition(e, e.drain_target, "outstanding activity drained", now);
      events.emplace_back(OrderUpdateEvent{
          e.order, OrderStatus::PendingCancel,
          expiring ? "expiry confirmed" : "cancel confirmed", now});
    }
  });
  publish(events);
}

// -----------------------------------------------------------------------------
// cancelAllForSymbol
// -----------------------------------------------------------------------------
CancelAllResult OrderStateMachine::cancelAllForSymbol(
    const std::string& symbol, const std::string& reason) {
  CancelAllResult result;
  for (const auto& order : ledger_.snapshots()) {
    if (order.symbol != symbol || domain::isTerminal(order.status)) {
      continue;
    }
    if (cancel(order.order_id, reason).cancelled) {
      ++result.cancelled_count;
    } else {
      ++result.failed_count;
    }
  }

  std::cout << "[OrderStateMachine] cancel-all " << symbol << ": "
            << result.cancelled_count << " cancelled, "
            << result.failed_count << " failed\n";
  return result;
}

// -----------------------------------------------------------------------------
// splitToChildren / aggregateChildren
// -----------------------------------------------------------------------------
std::vector<domain::Order> OrderStateMachine::splitToChildren(
    domain::OrderId parent_id, const std::vector<domain::ChildSplit>& splits) {
  if (splits.empty()) {
    throw ValidationError("split needs at least one child");
  }
  domain::Quantity total = 0;
  for (const auto& split : splits) {
    if (split.quantity <= 0) {
      throw ValidationError("child quantity must be > 0");
    }
    if (split.limit_price && *split.limit_price <= 0.0) {
      throw ValidationError("child limit_price must be > 0");
    }
    total += split.quantity;
  }

  const domain::Order parent = ledger_.snapshot(parent_id);
  if (parent.algorithm_type != domain::AlgorithmType::None) {
    throw ValidationError("algorithmic order " + std::to_string(parent_id) +
                          " cannot be split");
  }

  std::vector<domain::OrderRequest> requests;
  requests.reserve(splits.size());
  const std::int64_t now = clock_.now_ms();
  for (const auto& split : splits) {
    domain::OrderRequest r;
    r.client_order_id = parent.client_order_id;
    r.parent_order_id = parent_id;
    r.symbol = parent.symbol;
    r.security_id = parent.security_id;
    r.account = parent.account;
    r.side = parent.side;
    r.order_type = parent.order_type;
    r.quantity = split.quantity;
    r.price = parent.price;
    r.limit_price = split.limit_price ? split.limit_price : parent.limit_price;
    r.stop_price = parent.stop_price;
    r.time_in_force = parent.time_in_force;
    r.expire_at_ms = parent.expire_at_ms;
    validateRequest(r, now);
    requests.push_back(std::move(r));
  }

  // Claim the parent atomically against concurrent routing and fills.
  std::vector<Event> events;
  ledger_.mutate(parent_id, [&](LedgerEntry& e) {
    domain::Order& o = e.order;
    if (domain::isTerminal(o.status)) {
      throw TerminalOrder(parent_id, o.status);
    }
    if (o.child_count > 0) {
      throw ValidationError("order " + std::to_string(parent_id) +
                            " is already split");
    }
    if (o.status != OrderStatus::New || o.filled_quantity > 0 ||
        e.outstanding_activity > 0) {
      throw ValidationError("order " + std::to_string(parent_id) +
                            " is already working; only an untouched NEW "
                            "order can be split");
    }
    if (total != o.quantity) {
      throw ValidationError("split quantities (" + std::to_string(total) +
                            ") do not match parent quantity (" +
                            std::to_string(o.quantity) + ")");
    }
    o.child_count = splits.size();
    o.updated_at_ms = now;
    events.emplace_back(OrderUpdateEvent{
        o, o.status,
        "split into " + std::to_string(splits.size()) + " child orders", now});
  });
  publish(events);

  std::vector<domain::Order> children;
  children.reserve(requests.size());
  for (const auto& r : requests) {
    children.push_back(create(r));
  }
  std::cout << "[OrderStateMachine] order " << parent_id << " split into "
            << children.size() << " child order(s)\n";
  return children;
}

ChildAggregate OrderStateMachine::aggregateChildren(
    domain::OrderId parent_id) const {
  const domain::Order parent = ledger_.snapshot(parent_id);
  if (parent.child_count == 0) {
    throw ValidationError("order " + std::to_string(parent_id) +
                          " has no child orders");
  }

  ChildAggregate aggregate;
  aggregate.parent_order_id = parent_id;
  for (auto& order : ledger_.snapshots()) {
    if (order.parent_order_id && *order.parent_order_id == parent_id) {
      aggregate.children.push_back(std::move(order));
    }
  }
  std::sort(aggregate.children.begin(), aggregate.children.end(),
            [](const domain::Order& a, const domain::Order& b) {
              return a.order_id < b.order_id;
            });

  bool all_terminal = true;
  std::optional<OrderStatus> common;
  for (const auto& child : aggregate.children) {
    aggregate.total_filled += child.filled_quantity;
    aggregate.total_remaining += child.remaining_quantity;
    if (!domain::isTerminal(child.status)) {
      all_terminal = false;
    } else if (!common) {
      common = child.status;
    } else if (*common != child.status) {
      common = OrderStatus::Canceled;
    }
  }

  if (aggregate.total_remaining == 0) {
    aggregate.status = OrderStatus::Filled;
  } else if (all_terminal && common) {
    aggregate.status = *common;
  } else if (aggregate.total_filled > 0) {
    aggregate.status = OrderStatus::PartiallyFilled;
  } else {
    aggregate.status = OrderStatus::New;
  }
  return aggregate;
}

// -----------------------------------------------------------------------------
// Read accessors
// -----------------------------------------------------------------------------
domain::Order OrderStateMachine::snapshot(domain::OrderId order_id) const {
  return ledger_.snapshot(order_id);
}

std::vector<TransitionRecord> OrderStateMachine::history(
    domain::OrderId order_id) const {
  return ledger_.read(order_id,
                      [](const LedgerEntry& e) { return e.history; });
}

std::vector<domain::FillRecord> OrderStateMachine::fills(
    domain::OrderId order_id) const {
  return ledger_.read(order_id, [](const LedgerEntry& e) { return e.fills; });
}

int OrderStateMachine::outstandingActivity(domain::OrderId order_id) const {
  return ledger_.read(order_id, [](const LedgerEntry& e) {
    return e.outstanding_activity;
  });
}

}  // namespace oms
