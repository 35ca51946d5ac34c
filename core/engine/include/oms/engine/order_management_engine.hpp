#pragma once

#include "oms/algo/algorithmic_scheduler.hpp"
#include "oms/allocation/fill_allocator.hpp"
#include "oms/compliance/rule_based_compliance_gate.hpp"
#include "oms/concurrent/order_id_generator.hpp"
#include "oms/config/engine_config.hpp"
#include "oms/domain/compliance.hpp"
#include "oms/domain/order.hpp"
#include "oms/eventbus/event_bus.hpp"
#include "oms/execution/execution_dispatcher.hpp"
#include "oms/ledger/order_ledger.hpp"
#include "oms/network/ipc_server.hpp"
#include "oms/network/order_routing_thread.hpp"
#include "oms/ports/i_compliance_gate.hpp"
#include "oms/ports/i_market_volume_source.hpp"
#include "oms/ports/i_order_store.hpp"
#include "oms/ports/i_quote_source.hpp"
#include "oms/ports/i_venue_endpoint.hpp"
#include "oms/routing/router.hpp"
#include "oms/state/order_state_machine.hpp"
#include "oms/time/i_time_provider.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace oms {

// Outcome of submitOrder(). A compliance rejection is a normal outcome here:
// accepted is false, status is REJECTED and compliance names the failing
// checks.
struct SubmitResult {
  domain::OrderId order_id{0};
  bool accepted{false};
  domain::OrderStatus status{domain::OrderStatus::Pending};
  domain::ComplianceResult compliance;
  std::string reason;
};

// Outcome of splitOrder(): one SubmitResult per child, in split order. A
// child whose admission threw is reported with accepted false and the error
// as reason.
struct SplitResult {
  domain::OrderId parent_order_id{0};
  std::vector<SubmitResult> children;
};

// The external collaborators an engine runs against. compliance and store
// are optional: without a compliance gate the engine builds a
// RuleBasedComplianceGate from EngineConfig::compliance; without a store
// the ledger is memory-only.
struct EnginePorts {
  ports::IQuoteSource& quotes;
  ports::IMarketVolumeSource& volume;
  ports::IVenueEndpoint& endpoint;
  ports::IComplianceGate* compliance{nullptr};
  ports::IOrderStore* store{nullptr};
};

// -----------------------------------------------------------------------------
// OrderManagementEngine
// -----------------------------------------------------------------------------
//
// @brief  Owns the order lifecycle core and exposes it to request-handling
//         code: in-process calls for embedding and tests, executeCommand()
//         for the IPC gateway.
//
// @details
// Submission path:
//   create (PENDING) -> compliance check -> accept (NEW) or REJECTED.
//   Non-algorithmic orders are then handed to the OrderRoutingThread, which
//   routes and dispatches them off the caller's thread. Algorithmic orders
//   are handed to the AlgorithmicScheduler, which drives their slices on
//   per-order timers (or on tick() when SchedulerConfig::tick_interval_ms
//   is 0).
//
// Warm-up:
//   start() hydrates the ledger from the IOrderStore, advances the id
//   generator past every stored id and reschedules stored algorithmic
//   orders that are still live, before the routing thread or the IPC
//   server accept any request.
//
// Thread layout:
//   caller threads           submitOrder / cancelOrder / modifyOrder / ...
//   order_routing thread     Router + ExecutionDispatcher for plain orders
//   dispatcher pool          concurrent venue calls
//   scheduler timers         one per running algorithmic order
//   ipc thread               ZeroMQ command and telemetry sockets (optional)
//
// Ownership:
//   OrderManagementEngine
//    ├── ids_              (OrderIdGenerator, value member)
//    ├── bus_              (EventBus, value member)
//    ├── ledger_           (OrderLedger, value member)
//    ├── osm_              (OrderStateMachine, value member)
//    ├── router_           (Router, value member)
//    ├── own_compliance_   (unique_ptr<RuleBasedComplianceGate>, optional)
//    ├── dispatcher_       (unique_ptr<ExecutionDispatcher>)
//    ├── scheduler_        (unique_ptr<AlgorithmicScheduler>)
//    ├── routing_thread_   (unique_ptr<OrderRoutingThread>)
//    └── ipc_server_       (unique_ptr<IpcServer>, only when started)
//   The ports and the clock are borrowed and must outlive the engine.
// -----------------------------------------------------------------------------
class OrderManagementEngine {
 public:
  OrderManagementEngine(config::EngineConfig config, const ITimeProvider& clock,
                        EnginePorts ports);
  ~OrderManagementEngine();

  OrderManagementEngine(const OrderManagementEngine&) = delete;
  OrderManagementEngine& operator=(const OrderManagementEngine&) = delete;
  OrderManagementEngine(OrderManagementEngine&&) = delete;
  OrderManagementEngine& operator=(OrderManagementEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start(enable_ipc)
  // -------------------------------------------------------------------------
  // Warm-up, then starts the routing thread and, when enable_ipc is true and
  // IpcConfig::cmd_endpoint is set, the IPC server with a telemetry bridge
  // from the engine's bus. Idempotent; an engine that has been stopped does
  // not start again.
  // -------------------------------------------------------------------------
  void start(bool enable_ipc = false);

  // Stops the IPC server, the scheduler timers, the routing thread and the
  // dispatcher pool, in that order, then drops the telemetry bridge.
  // Idempotent.
  void stop();

  // -------------------------------------------------------------------------
  // submitOrder(request)
  // -------------------------------------------------------------------------
  // Throws ValidationError for malformed requests (no order is created), and
  // propagates any exception thrown by the compliance gate after rejecting
  // the order.
  // -------------------------------------------------------------------------
  SubmitResult submitOrder(const domain::OrderRequest& request);

  // Cancels the order and stops its algorithmic schedule, if any. Cancelling
  // a split parent cancels its live children too. Throws UnknownOrder.
  CancelResult cancelOrder(domain::OrderId order_id, const std::string& reason);

  // -------------------------------------------------------------------------
  // splitOrder(parent_id, splits)
  // -------------------------------------------------------------------------
  // Splits an untouched NEW plain order into child orders (see
  // OrderStateMachine::splitToChildren) and submits each child through
  // compliance and routing like a new order.
  //
  // Throws: ValidationError, UnknownOrder, TerminalOrder.
  // -------------------------------------------------------------------------
  SplitResult splitOrder(domain::OrderId parent_id,
                         const std::vector<domain::ChildSplit>& splits);

  ChildAggregate childStatus(domain::OrderId parent_id) const;

  // -------------------------------------------------------------------------
  // modifyOrder(order_id, changes)
  // -------------------------------------------------------------------------
  // Algorithmic orders have their pending slices replanned and the replace
  // completed immediately. Plain orders are re-routed on the routing thread,
  // which completes the replace once the new plan exists.
  //
  // Throws: ValidationError, UnknownOrder, TerminalOrder, InvalidTransition.
  // -------------------------------------------------------------------------
  domain::Order modifyOrder(domain::OrderId order_id,
                            const domain::OrderModification& changes);

  domain::Order orderSnapshot(domain::OrderId order_id) const;
  std::vector<TransitionRecord> orderHistory(domain::OrderId order_id) const;
  std::vector<domain::FillRecord> orderFills(domain::OrderId order_id) const;

  AlgoProgress monitorProgress(domain::OrderId order_id) const;
  std::vector<domain::OrderSlice> orderSlices(domain::OrderId order_id) const;
  void pauseAlgo(domain::OrderId order_id, const std::string& reason);
  void resumeAlgo(domain::OrderId order_id);
  void adjustAlgo(domain::OrderId order_id, const AlgoAdjustment& adjustment);

  // Ticks every running schedule once (for tick_interval_ms == 0).
  void tickAlgos();

  // Expires every DAY/GTD order past its expiry; returns their ids.
  std::vector<domain::OrderId> expireOrders();

  CancelAllResult cancelAllForSymbol(const std::string& symbol,
                                     const std::string& reason);

  std::vector<Allocation> allocateFills(
      domain::OrderId order_id,
      const std::vector<AllocationInstruction>& instructions) const;

  // Kill switch of the built-in compliance gate. Throws ValidationError when
  // the engine runs with an injected gate.
  void haltTrading(const std::string& reason);
  void resumeTrading();
  bool tradingHalted() const;

  // Blocks until the routing thread has handled every request pushed so far.
  void waitForRouting();

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  // JSON request/response handler bound to the IPC REP socket. `cmd` is a
  // JSON object with a "command" field, or a bare command word ("PING").
  //
  //   PING            -> {"status":"ok","response":"PONG"}
  //   SUBMIT          {"order":{...}}                -> submit result
  //   CANCEL          {"order_id":N,"reason":"..."}  -> cancel result
  //   MODIFY          {"order_id":N,"changes":{...}} -> order
  //   SPLIT           {"order_id":N,"splits":[{"quantity":Q}...]} -> children
  //   STATUS          {"order_id":N} -> order, history, fills, and the
  //                                     children roll-up of a split parent
  //                   {}             -> engine summary
  //   PROGRESS        {"order_id":N} -> progress, slices
  //   PAUSE / RESUME  {"order_id":N[,"reason":"..."]}
  //   ADJUST          {"order_id":N,"adjustment":{...}}
  //   EXPIRE          -> expired order ids
  //   ALLOCATE        {"order_id":N,"allocations":[...]}
  //   CANCEL_ALL      {"symbol":"...","reason":"..."}
  //   HALT            {"reason":"..."} / RESUME_TRADING
  //
  // Never throws: every failure becomes {"status":"error","error_type":...,
  // "message":...}.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  EventBus& eventBus() { return bus_; }
  const config::EngineConfig& config() const { return config_; }

 private:
  void warmUp();

  // compliance -> accept -> route or schedule, for an order already created.
  SubmitResult admit(const domain::Order& created);

  config::EngineConfig config_;
  const ITimeProvider& clock_;
  EnginePorts ports_;

  OrderIdGenerator ids_;
  EventBus bus_;
  OrderLedger ledger_;
  OrderStateMachine osm_;
  Router router_;

  std::unique_ptr<RuleBasedComplianceGate> own_compliance_;
  ports::IComplianceGate* compliance_;

  std::unique_ptr<ExecutionDispatcher> dispatcher_;
  std::unique_ptr<AlgorithmicScheduler> scheduler_;
  std::unique_ptr<OrderRoutingThread> routing_thread_;
  std::unique_ptr<IpcServer> ipc_server_;
  EventBus::SubscriptionId telemetry_subscription_{0};

  bool running_{false};
  bool stopped_{false};
};

}  // namespace oms
