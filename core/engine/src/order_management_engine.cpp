#include "oms/engine/order_management_engine.hpp"
#include "oms/codec/json_codec.hpp"
#include "oms/core/error.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace oms {

namespace {

using nlohmann::json;

json errorResponse(const std::string& type, const std::string& message) {
  json j;
  j["status"] = "error";
  j["error_type"] = type;
  j["message"] = message;
  return j;
}

domain::OrderId requireOrderId(const json& request) {
  auto it = request.find("order_id");
  if (it == request.end() || !it->is_number_unsigned()) {
    throw ValidationError("order_id: required positive integer");
  }
  return it->get<domain::OrderId>();
}

std::string optionalString(const json& request, const char* key,
                           const std::string& fallback) {
  auto it = request.find(key);
  if (it == request.end() || it->is_null()) {
    return fallback;
  }
  if (!it->is_string()) {
    throw ValidationError(std::string(key) + ": expected a string");
  }
  return it->get<std::string>();
}

const json& requireField(const json& request, const char* key) {
  auto it = request.find(key);
  if (it == request.end()) {
    throw ValidationError(std::string(key) + ": required");
  }
  return *it;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: wire the core; no threads are started here
// -----------------------------------------------------------------------------
OrderManagementEngine::OrderManagementEngine(config::EngineConfig config,
                                             const ITimeProvider& clock,
                                             EnginePorts ports)
    : config_(std::move(config)),
      clock_(clock),
      ports_(ports),
      ledger_(ports.store),
      osm_(ledger_, ids_, clock_, &bus_),
      router_(config_.router),
      compliance_(ports.compliance) {
  if (compliance_ == nullptr) {
    own_compliance_ =
        std::make_unique<RuleBasedComplianceGate>(config_.compliance);
    compliance_ = own_compliance_.get();
  }

  dispatcher_ = std::make_unique<ExecutionDispatcher>(
      osm_, router_, ports_.quotes, ports_.endpoint, config_.dispatcher,
      clock_, &bus_);
  scheduler_ = std::make_unique<AlgorithmicScheduler>(
      osm_, router_, *dispatcher_, ports_.quotes, ports_.volume, *compliance_,
      clock_, config_.scheduler, config_.analytics, &bus_);
  routing_thread_ = std::make_unique<OrderRoutingThread>(
      osm_, router_, ports_.quotes, *dispatcher_);
}

OrderManagementEngine::~OrderManagementEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void OrderManagementEngine::start(bool enable_ipc) {
  if (running_) {
    return;
  }
  if (stopped_) {
    std::cerr << "[OrderManagementEngine] WARNING: start() after stop() "
                 "ignored\n";
    return;
  }

  // ---  1) Warm-up gate: no request is accepted before the ledger is whole --
  warmUp();

  // ---  2) Routing thread --------------------------------------------------
  routing_thread_->start();

  // ---  3) IPC server and telemetry bridge ----------------------------------
  if (enable_ipc && !config_.ipc.cmd_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.ipc.cmd_endpoint, config_.ipc.pub_endpoint);
    ipc_server_->start();
    telemetry_subscription_ = bus_.subscribe([this](const Event& e) {
      if (!std::holds_alternative<RouteRequestEvent>(e)) {
        ipc_server_->pushTelemetry(e);
      }
    });
  }

  running_ = true;
  std::cout << "[OrderManagementEngine] started. Threads: order_routing, "
            << config_.dispatcher.worker_threads << " dispatcher worker(s)"
            << (ipc_server_ ? ", ipc" : "") << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void OrderManagementEngine::stop() {
  if (!running_) {
    return;
  }

  // ---  1) No new commands ----------------------------------------------------
  if (ipc_server_) {
    ipc_server_->stop();
  }

  // ---  2) No new slices, then no new routing work ---------------------------
  scheduler_->stop();
  routing_thread_->stop();

  // ---  3) Let in-flight venue calls finish ----------------------------------
  dispatcher_->shutdown();

  // ---  4) Nothing publishes any more: drop the telemetry bridge -------------
  if (ipc_server_) {
    bus_.unsubscribe(telemetry_subscription_);
    ipc_server_.reset();
  }

  running_ = false;
  stopped_ = true;
  std::cout << "[OrderManagementEngine] stopped. All threads joined.\n";
}

// -----------------------------------------------------------------------------
// warmUp(): hydrate from the store and resume live schedules
// -----------------------------------------------------------------------------
void OrderManagementEngine::warmUp() {
  if (ports_.store == nullptr) {
    return;
  }

  const std::vector<domain::Order> stored = ports_.store->loadAll();
  const std::size_t inserted = ledger_.hydrate(stored);
  for (const auto& order : stored) {
    ids_.observe(order.order_id);
  }

  std::size_t resumed = 0;
  for (const auto& order : stored) {
    const bool live = order.status == domain::OrderStatus::New ||
                      order.status == domain::OrderStatus::PartiallyFilled;
    if (!live || order.algorithm_type == domain::AlgorithmType::None) {
      continue;
    }
    try {
      scheduler_->submit(order);
      ++resumed;
    } catch (const std::exception& e) {
      std::cerr << "[OrderManagementEngine] WARNING: could not resume "
                << domain::toString(order.algorithm_type) << " order "
                << order.order_id << ": " << e.what() << "\n";
    }
  }

  std::cout << "[OrderManagementEngine] warm-up: " << inserted
            << " order(s) hydrated, " << resumed
            << " algorithmic schedule(s) resumed\n";
}

// -----------------------------------------------------------------------------
// submitOrder(): create -> compliance -> accept -> route or schedule
// -----------------------------------------------------------------------------
SubmitResult OrderManagementEngine::submitOrder(
    const domain::OrderRequest& request) {
  return admit(osm_.create(request));
}

SubmitResult OrderManagementEngine::admit(const domain::Order& created) {
  SubmitResult result;
  result.order_id = created.order_id;

  try {
    result.compliance = compliance_->check(created);
  } catch (const std::exception& e) {
    osm_.reject(created.order_id,
                std::string("compliance check failed: ") + e.what());
    throw;
  }

  domain::Order order;
  try {
    order = osm_.accept(created.order_id, result.compliance);
  } catch (const ComplianceRejection& e) {
    result.accepted = false;
    result.status = domain::OrderStatus::Rejected;
    result.reason = e.what();
    bus_.publish(ComplianceRejectEvent{created.order_id, created.symbol,
                                       result.compliance, clock_.now_ms()});
    std::cerr << "[OrderManagementEngine] order " << created.order_id
              << " rejected: " << e.what() << "\n";
    return result;
  }

  result.accepted = true;
  result.status = order.status;
  result.reason = "accepted";

  if (order.algorithm_type != domain::AlgorithmType::None) {
    try {
      scheduler_->submit(order);
    } catch (const std::exception& e) {
      osm_.cancel(order.order_id,
                  std::string("schedule could not start: ") + e.what());
      throw;
    }
  } else {
    routing_thread_->push(
        RouteRequestEvent{order.order_id, RouteRequestEvent::Kind::Submit});
  }
  return result;
}

// -----------------------------------------------------------------------------
// splitOrder(): children admitted one by one like fresh submissions
// -----------------------------------------------------------------------------
SplitResult OrderManagementEngine::splitOrder(
    domain::OrderId parent_id, const std::vector<domain::ChildSplit>& splits) {
  SplitResult result;
  result.parent_order_id = parent_id;
  for (const auto& child : osm_.splitToChildren(parent_id, splits)) {
    try {
      result.children.push_back(admit(child));
    } catch (const std::exception& e) {
      std::cerr << "[OrderManagementEngine] ERROR: child order "
                << child.order_id << " of " << parent_id
                << " not admitted: " << e.what() << "\n";
      SubmitResult failed;
      failed.order_id = child.order_id;
      failed.status = osm_.snapshot(child.order_id).status;
      failed.reason = e.what();
      result.children.push_back(std::move(failed));
    }
  }
  return result;
}

ChildAggregate OrderManagementEngine::childStatus(
    domain::OrderId parent_id) const {
  return osm_.aggregateChildren(parent_id);
}

CancelResult OrderManagementEngine::cancelOrder(domain::OrderId order_id,
                                                const std::string& reason) {
  CancelResult result = osm_.cancel(order_id, reason);
  if (result.cancelled &&
      result.order.algorithm_type != domain::AlgorithmType::None) {
    scheduler_->notifyCancel(order_id);
    result.order = osm_.snapshot(order_id);
  }
  if (result.cancelled && result.order.child_count > 0) {
    for (const auto& child : osm_.aggregateChildren(order_id).children) {
      if (!domain::isTerminal(child.status)) {
        osm_.cancel(child.order_id, "parent " + std::to_string(order_id) +
                                        " canceled: " + reason);
      }
    }
  }
  return result;
}

domain::Order OrderManagementEngine::modifyOrder(
    domain::OrderId order_id, const domain::OrderModification& changes) {
  domain::Order order = osm_.modify(order_id, changes);
  if (order.status != domain::OrderStatus::PendingReplace) {
    return order;
  }

  if (order.algorithm_type != domain::AlgorithmType::None) {
    if (scheduler_->isActive(order_id)) {
      scheduler_->replan(order_id);
    }
    return osm_.completeReplace(order_id);
  }

  routing_thread_->push(
      RouteRequestEvent{order_id, RouteRequestEvent::Kind::Replace});
  return order;
}

domain::Order OrderManagementEngine::orderSnapshot(
    domain::OrderId order_id) const {
  return osm_.snapshot(order_id);
}

std::vector<TransitionRecord> OrderManagementEngine::orderHistory(
    domain::OrderId order_id) const {
  return osm_.history(order_id);
}

std::vector<domain::FillRecord> OrderManagementEngine::orderFills(
    domain::OrderId order_id) const {
  return osm_.fills(order_id);
}

AlgoProgress OrderManagementEngine::monitorProgress(
    domain::OrderId order_id) const {
  return scheduler_->monitorProgress(order_id);
}

std::vector<domain::OrderSlice> OrderManagementEngine::orderSlices(
    domain::OrderId order_id) const {
  return scheduler_->slices(order_id);
}

void OrderManagementEngine::pauseAlgo(domain::OrderId order_id,
                                      const std::string& reason) {
  scheduler_->pause(order_id, reason);
}

void OrderManagementEngine::resumeAlgo(domain::OrderId order_id) {
  scheduler_->resume(order_id);
}

void OrderManagementEngine::adjustAlgo(domain::OrderId order_id,
                                       const AlgoAdjustment& adjustment) {
  scheduler_->adjustParameters(order_id, adjustment);
}

void OrderManagementEngine::tickAlgos() { scheduler_->tickAll(); }

std::vector<domain::OrderId> OrderManagementEngine::expireOrders() {
  std::vector<domain::OrderId> expired = osm_.expireDue(clock_.now_ms());
  for (const auto id : expired) {
    scheduler_->notifyCancel(id);
  }
  return expired;
}

CancelAllResult OrderManagementEngine::cancelAllForSymbol(
    const std::string& symbol, const std::string& reason) {
  const CancelAllResult result = osm_.cancelAllForSymbol(symbol, reason);
  for (const auto& order : ledger_.snapshots()) {
    if (order.symbol == symbol &&
        order.algorithm_type != domain::AlgorithmType::None) {
      scheduler_->notifyCancel(order.order_id);
    }
  }
  return result;
}

std::vector<Allocation> OrderManagementEngine::allocateFills(
    domain::OrderId order_id,
    const std::vector<AllocationInstruction>& instructions) const {
  return oms::allocateFills(osm_.snapshot(order_id), instructions);
}

// -----------------------------------------------------------------------------
// Kill switch
// -----------------------------------------------------------------------------
void OrderManagementEngine::haltTrading(const std::string& reason) {
  if (!own_compliance_) {
    throw ValidationError("kill switch needs the built-in compliance gate");
  }
  own_compliance_->halt(reason);
}

void OrderManagementEngine::resumeTrading() {
  if (!own_compliance_) {
    throw ValidationError("kill switch needs the built-in compliance gate");
  }
  own_compliance_->resumeTrading();
}

bool OrderManagementEngine::tradingHalted() const {
  return own_compliance_ && own_compliance_->isHalted();
}

void OrderManagementEngine::waitForRouting() { routing_thread_->waitIdle(); }

// -----------------------------------------------------------------------------
// executeCommand(): IPC request handler
// -----------------------------------------------------------------------------
std::string OrderManagementEngine::executeCommand(const std::string& cmd) {
  json request;
  try {
    if (!cmd.empty() && cmd.front() == '{') {
      request = json::parse(cmd);
    } else {
      request["command"] = cmd;
    }
  } catch (const json::parse_error& e) {
    return errorResponse("VALIDATION_ERROR",
                         std::string("malformed JSON: ") + e.what())
        .dump();
  }

  json response;
  std::string command;
  try {
    command = optionalString(request, "command", "");
    response["status"] = "ok";

    if (command == "PING") {
      response["response"] = "PONG";
    } else if (command == "SUBMIT") {
      const SubmitResult r = submitOrder(
          codec::orderRequestFromJson(requireField(request, "order")));
      response["order_id"] = r.order_id;
      response["accepted"] = r.accepted;
      response["order_status"] = domain::toString(r.status);
      response["compliance"] = codec::toJson(r.compliance);
      response["reason"] = r.reason;
    } else if (command == "SPLIT") {
      const SplitResult r = splitOrder(
          requireOrderId(request),
          codec::childSplitsFromJson(requireField(request, "splits")));
      response["parent_order_id"] = r.parent_order_id;
      json children = json::array();
      for (const auto& child : r.children) {
        children.push_back({{"order_id", child.order_id},
                            {"accepted", child.accepted},
                            {"order_status", domain::toString(child.status)},
                            {"reason", child.reason}});
      }
      response["children"] = std::move(children);
    } else if (command == "CANCEL") {
      const CancelResult r = cancelOrder(
          requireOrderId(request),
          optionalString(request, "reason", "client cancel"));
      response["cancelled"] = r.cancelled;
      response["reason"] = r.reason;
      response["order"] = codec::toJson(r.order);
    } else if (command == "MODIFY") {
      const domain::Order order = modifyOrder(
          requireOrderId(request),
          codec::modificationFromJson(requireField(request, "changes")));
      response["order"] = codec::toJson(order);
    } else if (command == "STATUS") {
      if (request.contains("order_id")) {
        const domain::OrderId id = requireOrderId(request);
        response["order"] = codec::toJson(orderSnapshot(id));
        json history = json::array();
        for (const auto& record : orderHistory(id)) {
          history.push_back(codec::toJson(record));
        }
        json fills = json::array();
        for (const auto& fill : orderFills(id)) {
          fills.push_back(codec::toJson(fill));
        }
        response["history"] = std::move(history);
        response["fills"] = std::move(fills);
        if (response["order"].contains("child_count")) {
          response["children"] = codec::toJson(childStatus(id));
        }
      } else {
        std::size_t live = 0;
        const auto orders = ledger_.snapshots();
        for (const auto& order : orders) {
          if (!domain::isTerminal(order.status)) {
            ++live;
          }
        }
        response["halted"] = tradingHalted();
        response["orders"] = orders.size();
        response["live_orders"] = live;
      }
    } else if (command == "PROGRESS") {
      const domain::OrderId id = requireOrderId(request);
      response["progress"] = codec::toJson(monitorProgress(id));
      json slices = json::array();
      for (const auto& slice : orderSlices(id)) {
        slices.push_back(codec::toJson(slice));
      }
      response["slices"] = std::move(slices);
    } else if (command == "PAUSE") {
      pauseAlgo(requireOrderId(request),
                optionalString(request, "reason", "client pause"));
    } else if (command == "RESUME") {
      resumeAlgo(requireOrderId(request));
    } else if (command == "ADJUST") {
      adjustAlgo(requireOrderId(request),
                 codec::algoAdjustmentFromJson(
                     requireField(request, "adjustment")));
    } else if (command == "EXPIRE") {
      response["expired"] = expireOrders();
    } else if (command == "ALLOCATE") {
      json allocations = json::array();
      for (const auto& a :
           allocateFills(requireOrderId(request),
                         codec::allocationInstructionsFromJson(
                             requireField(request, "allocations")))) {
        allocations.push_back(codec::toJson(a));
      }
      response["allocations"] = std::move(allocations);
    } else if (command == "CANCEL_ALL") {
      const std::string symbol = optionalString(request, "symbol", "");
      if (symbol.empty()) {
        throw ValidationError("symbol: required");
      }
      const CancelAllResult r = cancelAllForSymbol(
          symbol, optionalString(request, "reason", "cancel all"));
      response["cancelled_count"] = r.cancelled_count;
      response["failed_count"] = r.failed_count;
    } else if (command == "HALT") {
      haltTrading(optionalString(request, "reason", "manual halt"));
      response["response"] = "Trading halted";
    } else if (command == "RESUME_TRADING") {
      resumeTrading();
      response["response"] = "Trading resumed";
    } else {
      return errorResponse("UNKNOWN_COMMAND", "Unknown command: " + command)
          .dump();
    }
  } catch (const OmsError& e) {
    std::cerr << "[OrderManagementEngine] command " << command
              << " failed: " << e.what() << "\n";
    return errorResponse(errorCode(e), e.what()).dump();
  } catch (const json::exception& e) {
    std::cerr << "[OrderManagementEngine] command " << command
              << " failed: " << e.what() << "\n";
    return errorResponse("VALIDATION_ERROR", e.what()).dump();
  } catch (const std::exception& e) {
    std::cerr << "[OrderManagementEngine] ERROR: command " << command
              << " failed: " << e.what() << "\n";
    return errorResponse("INTERNAL_ERROR", e.what()).dump();
  }

  return response.dump();
}

}  // namespace oms
