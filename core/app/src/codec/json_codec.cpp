#include "oms/codec/json_codec.hpp"
#include "oms/core/error.hpp"

#include <algorithm>
#include <initializer_list>
#include <type_traits>
#include <utility>

namespace oms {
namespace codec {

namespace {

using nlohmann::json;

void requireObject(const json& node, const std::string& path) {
  if (!node.is_object()) {
    throw ValidationError(path + ": expected an object");
  }
}

void rejectUnknownKeys(const json& node, const std::string& path,
                       std::initializer_list<const char*> known) {
  for (auto it = node.begin(); it != node.end(); ++it) {
    const bool recognized =
        std::any_of(known.begin(), known.end(),
                    [&](const char* k) { return it.key() == k; });
    if (!recognized) {
      throw ValidationError(path + ": unknown key '" + it.key() + "'");
    }
  }
}

template <typename T>
T convert(const json& value, const std::string& path) {
  try {
    return value.get<T>();
  } catch (const json::exception& e) {
    throw ValidationError(path + ": " + e.what());
  }
}

// Leaves `out` untouched when the key is absent or null.
template <typename T>
void read(const json& node, const char* key, const std::string& path,
          T& out) {
  auto it = node.find(key);
  if (it == node.end() || it->is_null()) {
    return;
  }
  out = convert<T>(*it, path + "." + key);
}

template <typename T>
void read(const json& node, const char* key, const std::string& path,
          std::optional<T>& out) {
  auto it = node.find(key);
  if (it == node.end() || it->is_null()) {
    return;
  }
  out = convert<T>(*it, path + "." + key);
}

template <typename T>
T require(const json& node, const char* key, const std::string& path) {
  auto it = node.find(key);
  if (it == node.end() || it->is_null()) {
    throw ValidationError(path + "." + key + ": required");
  }
  return convert<T>(*it, path + "." + key);
}

template <typename Parse>
auto readEnum(const json& node, const char* key, const std::string& path,
              Parse parse) -> std::optional<decltype(parse(std::string()))> {
  std::optional<std::string> text;
  read(node, key, path, text);
  if (!text.has_value()) {
    return std::nullopt;
  }
  try {
    return parse(*text);
  } catch (const ValidationError& e) {
    throw ValidationError(path + "." + key + ": " + e.what());
  }
}

template <typename T>
void putOptional(json& j, const char* key, const std::optional<T>& value) {
  if (value.has_value()) {
    j[key] = *value;
  }
}

json algorithmParamsToJson(const domain::AlgorithmParams& p) {
  json j;
  j["start_time_ms"] = p.start_time_ms;
  j["end_time_ms"] = p.end_time_ms;
  j["slice_interval_ms"] = p.slice_interval_ms;
  j["num_slices"] = p.num_slices;
  if (!p.custom_curve.empty()) {
    j["custom_curve"] = p.custom_curve;
  }
  j["participation_rate"] = p.participation_rate;
  j["min_participation_rate"] = p.min_participation_rate;
  j["max_participation_rate"] = p.max_participation_rate;
  j["display_quantity"] = p.display_quantity;
  if (p.benchmark.has_value()) {
    j["benchmark"] = toString(*p.benchmark);
  }
  return j;
}

void algorithmFromJson(const json& node, domain::OrderRequest& request) {
  const std::string path = "order.algorithm";
  requireObject(node, path);
  rejectUnknownKeys(node, path,
                    {"type", "start_time_ms", "end_time_ms",
                     "slice_interval_ms", "num_slices", "custom_curve",
                     "participation_rate", "min_participation_rate",
                     "max_participation_rate", "display_quantity",
                     "benchmark"});

  const auto type = readEnum(node, "type", path, parseAlgorithmType);
  if (!type.has_value()) {
    throw ValidationError(path + ".type: required");
  }
  request.algorithm_type = *type;

  domain::AlgorithmParams& p = request.algorithm_params;
  read(node, "start_time_ms", path, p.start_time_ms);
  read(node, "end_time_ms", path, p.end_time_ms);
  read(node, "slice_interval_ms", path, p.slice_interval_ms);
  read(node, "num_slices", path, p.num_slices);
  read(node, "custom_curve", path, p.custom_curve);
  read(node, "participation_rate", path, p.participation_rate);
  read(node, "min_participation_rate", path, p.min_participation_rate);
  read(node, "max_participation_rate", path, p.max_participation_rate);
  read(node, "display_quantity", path, p.display_quantity);
  p.benchmark = readEnum(node, "benchmark", path, parseBenchmarkType);
}

}  // namespace

// -----------------------------------------------------------------------------
// Enumeration tags
// -----------------------------------------------------------------------------
const char* toString(domain::BenchmarkType benchmark) {
  switch (benchmark) {
    case domain::BenchmarkType::Arrival:    return "ARRIVAL";
    case domain::BenchmarkType::MarketVwap: return "MARKET_VWAP";
  }
  return "UNKNOWN";
}

domain::BenchmarkType parseBenchmarkType(const std::string& text) {
  if (text == "ARRIVAL") return domain::BenchmarkType::Arrival;
  if (text == "MARKET_VWAP") return domain::BenchmarkType::MarketVwap;
  throw ValidationError("unknown benchmark '" + text + "'");
}

domain::Side parseSide(const std::string& text) {
  if (text == "BUY") return domain::Side::Buy;
  if (text == "SELL") return domain::Side::Sell;
  throw ValidationError("unknown side '" + text + "'");
}

domain::OrderType parseOrderType(const std::string& text) {
  if (text == "MARKET") return domain::OrderType::Market;
  if (text == "LIMIT") return domain::OrderType::Limit;
  if (text == "STOP") return domain::OrderType::Stop;
  if (text == "STOP_LIMIT") return domain::OrderType::StopLimit;
  throw ValidationError("unknown order type '" + text + "'");
}

domain::TimeInForce parseTimeInForce(const std::string& text) {
  if (text == "DAY") return domain::TimeInForce::Day;
  if (text == "GTC") return domain::TimeInForce::Gtc;
  if (text == "IOC") return domain::TimeInForce::Ioc;
  if (text == "FOK") return domain::TimeInForce::Fok;
  if (text == "GTD") return domain::TimeInForce::Gtd;
  throw ValidationError("unknown time in force '" + text + "'");
}

domain::AlgorithmType parseAlgorithmType(const std::string& text) {
  if (text == "NONE") return domain::AlgorithmType::None;
  if (text == "TWAP") return domain::AlgorithmType::Twap;
  if (text == "VWAP") return domain::AlgorithmType::Vwap;
  if (text == "POV") return domain::AlgorithmType::Pov;
  if (text == "ICEBERG") return domain::AlgorithmType::Iceberg;
  throw ValidationError("unknown algorithm '" + text + "'");
}

// -----------------------------------------------------------------------------
// Encoding
// -----------------------------------------------------------------------------
json toJson(const domain::Order& order) {
  json j;
  j["order_id"] = order.order_id;
  j["client_order_id"] = order.client_order_id;
  putOptional(j, "parent_order_id", order.parent_order_id);
  if (order.child_count > 0) {
    j["child_count"] = order.child_count;
  }
  j["symbol"] = order.symbol;
  j["security_id"] = order.security_id;
  j["account"] = order.account;
  j["side"] = domain::toString(order.side);
  j["order_type"] = domain::toString(order.order_type);
  j["quantity"] = order.quantity;
  j["filled_quantity"] = order.filled_quantity;
  j["remaining_quantity"] = order.remaining_quantity;
  j["price"] = order.price;
  putOptional(j, "limit_price", order.limit_price);
  putOptional(j, "stop_price", order.stop_price);
  j["average_price"] = order.average_price;
  j["time_in_force"] = domain::toString(order.time_in_force);
  putOptional(j, "expire_at_ms", order.expire_at_ms);
  j["algorithm_type"] = domain::toString(order.algorithm_type);
  if (order.algorithm_type != domain::AlgorithmType::None) {
    j["algorithm_params"] = algorithmParamsToJson(order.algorithm_params);
  }
  j["status"] = domain::toString(order.status);
  j["created_at_ms"] = order.created_at_ms;
  j["updated_at_ms"] = order.updated_at_ms;
  return j;
}

json toJson(const domain::ExecutionReport& report) {
  json j;
  j["execution_id"] = report.execution_id;
  j["order_id"] = report.order_id;
  putOptional(j, "slice_id", report.slice_id);
  j["quantity"] = report.quantity;
  j["price"] = report.price;
  j["venue"] = report.venue;
  j["timestamp_ms"] = report.timestamp_ms;
  return j;
}

json toJson(const domain::FillRecord& fill) {
  json j = toJson(fill.report);
  j["cumulative_quantity"] = fill.cumulative_quantity;
  j["average_price"] = fill.average_price;
  j["leaves_quantity"] = fill.leaves_quantity;
  return j;
}

json toJson(const domain::RoutingPlan& plan) {
  json routes = json::array();
  for (const auto& route : plan.routes) {
    json r;
    r["venue"] = route.venue;
    r["quantity"] = route.quantity;
    r["expected_price"] = route.expected_price;
    r["priority"] = route.priority;
    routes.push_back(std::move(r));
  }
  json j;
  j["routes"] = std::move(routes);
  j["primary_venue"] = plan.primary_venue;
  j["requested_quantity"] = plan.requested_quantity;
  j["routed_quantity"] = plan.routed_quantity;
  j["confidence"] = plan.confidence;
  return j;
}

json toJson(const domain::OrderSlice& slice) {
  json j;
  j["slice_id"] = slice.slice_id;
  j["parent_order_id"] = slice.parent_order_id;
  j["quantity"] = slice.quantity;
  j["scheduled_time_ms"] = slice.scheduled_time_ms;
  j["status"] = domain::toString(slice.status);
  j["target_quantity"] = slice.target_quantity;
  j["filled_quantity"] = slice.filled_quantity;
  j["carried_forward"] = slice.carried_forward;
  j["catch_up"] = slice.catch_up;
  return j;
}

json toJson(const domain::ComplianceResult& result) {
  json checks = json::array();
  for (const auto& check : result.checks) {
    json c;
    c["name"] = check.name;
    c["severity"] = domain::toString(check.severity);
    c["passed"] = check.passed;
    c["message"] = check.message;
    checks.push_back(std::move(c));
  }
  json j;
  j["passed"] = result.passed;
  j["checks"] = std::move(checks);
  return j;
}

json toJson(const TransitionRecord& record) {
  json j;
  j["from"] = domain::toString(record.from);
  j["to"] = domain::toString(record.to);
  j["reason"] = record.reason;
  j["timestamp_ms"] = record.timestamp_ms;
  return j;
}

json toJson(const AlgoProgress& progress) {
  json j;
  j["order_id"] = progress.order_id;
  j["algorithm"] = domain::toString(progress.algorithm);
  j["status"] = domain::toString(progress.status);
  j["progress"] = progress.progress;
  j["quantity"] = progress.quantity;
  j["filled_quantity"] = progress.filled_quantity;
  j["remaining_quantity"] = progress.remaining_quantity;
  j["average_price"] = progress.average_price;
  j["benchmark"] = toString(progress.benchmark);
  j["benchmark_price"] = progress.benchmark_price;
  j["slippage_bps"] = progress.slippage_bps;
  j["expected_filled"] = progress.expected_filled;
  j["on_schedule"] = progress.on_schedule;
  j["execution_score"] = progress.execution_score;
  j["paused"] = progress.paused;
  j["compliance_hold"] = progress.compliance_hold;
  j["finished"] = progress.finished;
  j["slices_total"] = progress.slices_total;
  j["slices_completed"] = progress.slices_completed;
  j["slices_pending"] = progress.slices_pending;
  return j;
}

json toJson(const Allocation& allocation) {
  json j;
  j["account"] = allocation.account;
  j["quantity"] = allocation.quantity;
  j["price"] = allocation.price;
  return j;
}

json toJson(const ChildAggregate& aggregate) {
  json j;
  j["parent_order_id"] = aggregate.parent_order_id;
  j["total_filled"] = aggregate.total_filled;
  j["total_remaining"] = aggregate.total_remaining;
  j["status"] = domain::toString(aggregate.status);
  json children = json::array();
  for (const auto& child : aggregate.children) {
    children.push_back(toJson(child));
  }
  j["children"] = std::move(children);
  return j;
}

// -----------------------------------------------------------------------------
// telemetryJson(): per-event PUB payloads
// -----------------------------------------------------------------------------
std::optional<json> telemetryJson(const Event& event) {
  if (const auto* e = std::get_if<OrderUpdateEvent>(&event)) {
    json j;
    j["type"] = "order_update";
    j["order"] = toJson(e->order);
    j["previous_status"] = domain::toString(e->previous_status);
    j["reason"] = e->reason;
    j["timestamp_ms"] = e->timestamp_ms;
    return j;
  }
  if (const auto* e = std::get_if<ExecutionReportEvent>(&event)) {
    json j;
    j["type"] = "execution_report";
    j["report"] = toJson(e->report);
    j["order_id"] = e->order.order_id;
    j["status"] = domain::toString(e->order.status);
    j["filled_quantity"] = e->order.filled_quantity;
    j["remaining_quantity"] = e->order.remaining_quantity;
    j["average_price"] = e->order.average_price;
    return j;
  }
  if (const auto* e = std::get_if<SliceUpdateEvent>(&event)) {
    json j;
    j["type"] = "slice_update";
    j["slice"] = toJson(e->slice);
    j["timestamp_ms"] = e->timestamp_ms;
    return j;
  }
  if (const auto* e = std::get_if<VenueFailureEvent>(&event)) {
    json j;
    j["type"] = "venue_failure";
    j["order_id"] = e->order_id;
    j["venue"] = e->venue;
    j["quantity"] = e->quantity;
    j["error"] = e->error;
    j["timed_out"] = e->timed_out;
    j["fallback_attempted"] = e->fallback_attempted;
    j["fallback_filled"] = e->fallback_filled;
    j["timestamp_ms"] = e->timestamp_ms;
    return j;
  }
  if (const auto* e = std::get_if<ComplianceRejectEvent>(&event)) {
    json j;
    j["type"] = "compliance_reject";
    j["order_id"] = e->order_id;
    j["symbol"] = e->symbol;
    j["result"] = toJson(e->result);
    j["timestamp_ms"] = e->timestamp_ms;
    return j;
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// Decoding
// -----------------------------------------------------------------------------
domain::OrderRequest orderRequestFromJson(const json& node) {
  const std::string path = "order";
  requireObject(node, path);
  rejectUnknownKeys(node, path,
                    {"client_order_id", "parent_order_id", "symbol",
                     "security_id", "account", "side", "order_type",
                     "quantity", "price", "limit_price", "stop_price",
                     "time_in_force", "expire_at_ms", "algorithm"});

  domain::OrderRequest request;
  read(node, "client_order_id", path, request.client_order_id);
  read(node, "parent_order_id", path, request.parent_order_id);
  request.symbol = require<std::string>(node, "symbol", path);
  read(node, "security_id", path, request.security_id);
  read(node, "account", path, request.account);

  const auto side = readEnum(node, "side", path, parseSide);
  if (!side.has_value()) {
    throw ValidationError(path + ".side: required");
  }
  request.side = *side;
  if (auto type = readEnum(node, "order_type", path, parseOrderType)) {
    request.order_type = *type;
  }

  request.quantity = require<domain::Quantity>(node, "quantity", path);
  read(node, "price", path, request.price);
  read(node, "limit_price", path, request.limit_price);
  read(node, "stop_price", path, request.stop_price);

  if (auto tif = readEnum(node, "time_in_force", path, parseTimeInForce)) {
    request.time_in_force = *tif;
  }
  read(node, "expire_at_ms", path, request.expire_at_ms);

  if (auto it = node.find("algorithm"); it != node.end() && !it->is_null()) {
    algorithmFromJson(*it, request);
  }
  return request;
}

domain::OrderModification modificationFromJson(const json& node) {
  const std::string path = "changes";
  requireObject(node, path);
  rejectUnknownKeys(node, path,
                    {"quantity", "limit_price", "stop_price", "reason"});
  domain::OrderModification changes;
  read(node, "quantity", path, changes.quantity);
  read(node, "limit_price", path, changes.limit_price);
  read(node, "stop_price", path, changes.stop_price);
  read(node, "reason", path, changes.reason);
  return changes;
}

AlgoAdjustment algoAdjustmentFromJson(const json& node) {
  const std::string path = "adjustment";
  requireObject(node, path);
  rejectUnknownKeys(node, path,
                    {"participation_rate", "min_participation_rate",
                     "max_participation_rate", "limit_price",
                     "display_quantity"});
  AlgoAdjustment adjustment;
  read(node, "participation_rate", path, adjustment.participation_rate);
  read(node, "min_participation_rate", path,
       adjustment.min_participation_rate);
  read(node, "max_participation_rate", path,
       adjustment.max_participation_rate);
  read(node, "limit_price", path, adjustment.limit_price);
  read(node, "display_quantity", path, adjustment.display_quantity);
  return adjustment;
}

std::vector<AllocationInstruction> allocationInstructionsFromJson(
    const json& node) {
  if (!node.is_array()) {
    throw ValidationError("allocations: expected an array");
  }
  std::vector<AllocationInstruction> out;
  out.reserve(node.size());
  for (std::size_t i = 0; i < node.size(); ++i) {
    const std::string path = "allocations[" + std::to_string(i) + "]";
    const json& item = node[i];
    requireObject(item, path);
    rejectUnknownKeys(item, path, {"account", "percentage"});
    AllocationInstruction instruction;
    instruction.account = require<std::string>(item, "account", path);
    instruction.percentage = require<double>(item, "percentage", path);
    out.push_back(std::move(instruction));
  }
  return out;
}

std::vector<domain::ChildSplit> childSplitsFromJson(const json& node) {
  if (!node.is_array()) {
    throw ValidationError("splits: expected an array");
  }
  std::vector<domain::ChildSplit> out;
  out.reserve(node.size());
  for (std::size_t i = 0; i < node.size(); ++i) {
    const std::string path = "splits[" + std::to_string(i) + "]";
    const json& item = node[i];
    requireObject(item, path);
    rejectUnknownKeys(item, path, {"quantity", "limit_price"});
    domain::ChildSplit split;
    split.quantity = require<domain::Quantity>(item, "quantity", path);
    read(item, "limit_price", path, split.limit_price);
    out.push_back(split);
  }
  return out;
}

}  // namespace codec
}  // namespace oms
