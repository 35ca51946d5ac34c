#pragma once

#include "oms/concurrent/order_id_generator.hpp"
#include "oms/domain/compliance.hpp"
#include "oms/domain/execution_report.hpp"
#include "oms/domain/order.hpp"
#include "oms/domain/order_status.hpp"
#include "oms/eventbus/event_bus.hpp"
#include "oms/events/event.hpp"
#include "oms/ledger/order_ledger.hpp"
#include "oms/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace oms {

// Result of cancel(). cancelled is false when the request changed nothing
// (order already terminal, or a cancel is already pending); `reason` says
// why. `order` is the snapshot after the call either way.
struct CancelResult {
  bool cancelled{false};
  domain::Order order;
  std::string reason;
};

struct CancelAllResult {
  std::size_t cancelled_count{0};
  std::size_t failed_count{0};
};

// Roll-up of a split parent's children, ordered by order id.
struct ChildAggregate {
  domain::OrderId parent_order_id{0};
  domain::Quantity total_filled{0};
  domain::Quantity total_remaining{0};
  domain::OrderStatus status{domain::OrderStatus::New};
  std::vector<domain::Order> children;
};

// -----------------------------------------------------------------------------
// OrderStateMachine: sole writer of the OrderLedger
// -----------------------------------------------------------------------------
//
// @brief  Applies creations, compliance decisions, execution reports,
//         modifications, cancellations and expiry to orders, enforcing the
//         OrderStatus transition graph and the fill arithmetic.
//
// @details
// Every operation runs inside OrderLedger::mutate() for the target order, so
// concurrent fills from several venues for the same order are applied one at
// a time and never lose an update. Each operation validates completely
// before it changes anything: an operation that throws leaves the ledger
// exactly as it found it.
//
// Fill arithmetic, per applied report of quantity q at price p:
//   filled'    = filled + q
//   remaining' = quantity - filled'
//   average'   = (average * filled + p * q) / filled'
// A report whose quantity exceeds the remaining quantity is rejected with
// ValidationError. Reports are de-duplicated by execution_id.
//
// Outstanding activity:
//   beginActivity()/endActivity() bracket every venue call and every running
//   algorithmic schedule. cancel() moves a live order to PENDING_CANCEL and
//   confirms CANCELED as soon as no activity is outstanding; fills that land
//   in between are still applied. expire() drains the same way and confirms
//   EXPIRED. Venue calls also register their quantity, and modify() refuses
//   to cut the order below filled plus in-flight quantity, so a late fill
//   can never overfill a reduced order.
//
// Events:
//   OrderUpdateEvent after every change and ExecutionReportEvent after every
//   applied fill are published on the optional EventBus once the order's
//   lock has been released.
//
// Thread model:
//   All members are safe to call concurrently from any thread.
//
// Ownership:
//   Owned by OrderManagementEngine. Borrows the ledger, id generator, clock
//   and bus, all of which must outlive it.
// -----------------------------------------------------------------------------
class OrderStateMachine {
 public:
  OrderStateMachine(OrderLedger& ledger, OrderIdGenerator& ids,
                    const ITimeProvider& clock, EventBus* bus = nullptr);

  OrderStateMachine(const OrderStateMachine&) = delete;
  OrderStateMachine& operator=(const OrderStateMachine&) = delete;
  OrderStateMachine(OrderStateMachine&&) = delete;
  OrderStateMachine& operator=(OrderStateMachine&&) = delete;

  // -------------------------------------------------------------------------
  // create(request)
  // -------------------------------------------------------------------------
  //
  // @brief  Validates a request and records a new PENDING order.
  //
  // @details
  // Requires quantity > 0, a symbol, a limit price for LIMIT/STOP_LIMIT (a
  // positive `price` on a LIMIT order is taken as its limit), a stop price
  // for STOP/STOP_LIMIT, an expiry for GTD, and consistent algorithm
  // parameters. An algorithmic order with no start time starts now.
  //
  // Throws: ValidationError.
  // -------------------------------------------------------------------------
  domain::Order create(const domain::OrderRequest& request);

  // -------------------------------------------------------------------------
  // accept(order_id, result)
  // -------------------------------------------------------------------------
  // PENDING -> NEW when `result` has no blocking check. Otherwise
  // PENDING -> REJECTED, then throws ComplianceRejection carrying the result.
  // -------------------------------------------------------------------------
  domain::Order accept(domain::OrderId order_id,
                       const domain::ComplianceResult& result);

  // PENDING -> REJECTED.
  domain::Order reject(domain::OrderId order_id, const std::string& reason);

  // -------------------------------------------------------------------------
  // applyExecution(report)
  // -------------------------------------------------------------------------
  //
  // @return true when the report was applied; false when its execution_id
  //         had already been applied (no change).
  //
  // Throws: ValidationError (bad quantity/price, overfill), UnknownOrder,
  //         TerminalOrder, InvalidTransition (order not yet live).
  // -------------------------------------------------------------------------
  bool applyExecution(const domain::ExecutionReport& report);

  // Throws UnknownOrder only. Terminal orders return cancelled == false.
  CancelResult cancel(domain::OrderId order_id, const std::string& reason);

  // -------------------------------------------------------------------------
  // modify(order_id, changes)
  // -------------------------------------------------------------------------
  // Applies the changes and moves the order to PENDING_REPLACE; the caller
  // re-routes the remaining quantity and then calls completeReplace(). A new
  // quantity equal to the filled quantity completes the order (FILLED).
  //
  // Throws: ValidationError, UnknownOrder, TerminalOrder, InvalidTransition.
  // -------------------------------------------------------------------------
  domain::Order modify(domain::OrderId order_id,
                       const domain::OrderModification& changes);

  // PENDING_REPLACE -> REPLACED -> NEW (PARTIALLY_FILLED if it has fills).
  domain::Order completeReplace(domain::OrderId order_id);

  // NEW/PARTIALLY_FILLED DAY or GTD order -> EXPIRED, or -> PENDING_CANCEL
  // while activity is outstanding; endActivity() then confirms EXPIRED.
  domain::Order expire(domain::OrderId order_id, const std::string& reason);

  // Expires every DAY/GTD order whose expire_at_ms is at or before now_ms.
  // Returns the orders expired or left draining towards EXPIRED.
  std::vector<domain::OrderId> expireDue(std::int64_t now_ms);

  // -------------------------------------------------------------------------
  // beginActivity / endActivity
  // -------------------------------------------------------------------------
  // beginActivity() returns false, taking nothing, when the order may not
  // receive new venue work (not yet live, PENDING_CANCEL, or terminal). Every
  // true return must be matched by exactly one endActivity() with the same
  // venue_quantity (0 for a schedule token).
  // -------------------------------------------------------------------------
  bool beginActivity(domain::OrderId order_id,
                     domain::Quantity venue_quantity = 0);
  void endActivity(domain::OrderId order_id,
                   domain::Quantity venue_quantity = 0);

  CancelAllResult cancelAllForSymbol(const std::string& symbol,
                                     const std::string& reason);

  // -------------------------------------------------------------------------
  // splitToChildren(parent_id, splits)
  // -------------------------------------------------------------------------
  //
  // @brief  Replaces a working parent by PENDING child orders whose
  //         quantities add up to the parent's quantity.
  //
  // @details
  // The parent must be a NEW plain order with no fills, no outstanding
  // activity and no earlier split. Each child copies the parent's
  // instrument, side, type and time in force, with its own quantity and
  // optional limit price. The parent keeps its status, records child_count
  // and refuses venue work and modifications from then on.
  //
  // Throws: ValidationError, UnknownOrder, TerminalOrder.
  // -------------------------------------------------------------------------
  std::vector<domain::Order> splitToChildren(
      domain::OrderId parent_id, const std::vector<domain::ChildSplit>& splits);

  // Status roll-up: FILLED once nothing remains, the children's common
  // terminal status (CANCELED when they differ) once all are terminal,
  // otherwise PARTIALLY_FILLED or NEW. Throws UnknownOrder, ValidationError
  // when the order was never split.
  ChildAggregate aggregateChildren(domain::OrderId parent_id) const;

  domain::Order snapshot(domain::OrderId order_id) const;
  std::vector<TransitionRecord> history(domain::OrderId order_id) const;
  std::vector<domain::FillRecord> fills(domain::OrderId order_id) const;
  int outstandingActivity(domain::OrderId order_id) const;

  static bool isValidTransition(domain::OrderStatus from,
                                domain::OrderStatus to);

 private:
  void validateRequest(const domain::OrderRequest& request,
                       std::int64_t now_ms) const;

  // Records from -> to on the entry. Throws InvalidTransition (before
  // touching the entry) when the edge is not in the graph.
  void transition(LedgerEntry& entry, domain::OrderStatus to,
                  const std::string& reason, std::int64_t now_ms);

  void publish(const std::vector<Event>& events);

  OrderLedger& ledger_;
  OrderIdGenerator& ids_;
  const ITimeProvider& clock_;
  EventBus* bus_;
};

}  // namespace oms
