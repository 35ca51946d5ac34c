#pragma once

#include "oms/algo/algorithmic_scheduler.hpp"
#include "oms/allocation/fill_allocator.hpp"
#include "oms/domain/compliance.hpp"
#include "oms/domain/execution_report.hpp"
#include "oms/domain/order.hpp"
#include "oms/domain/order_slice.hpp"
#include "oms/domain/routing_plan.hpp"
#include "oms/events/event.hpp"
#include "oms/ledger/order_ledger.hpp"
#include "oms/state/order_state_machine.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace oms {
namespace codec {

// -----------------------------------------------------------------------------
// JSON codec: wire representation of requests, orders and telemetry
// -----------------------------------------------------------------------------
//
// @brief  Converts between the core's value types and nlohmann::json for the
//         IPC gateway, the engine's command handler and configuration files.
//
// @details
// Keys are snake_case and mirror the C++ field names. Enumerations travel as
// upper-case tags ("BUY", "STOP_LIMIT", "PARTIALLY_FILLED", "MARKET_VWAP"),
// the same text toString() produces. Timestamps are int64 milliseconds since
// the Unix epoch. Optional fields are omitted when unset.
//
// Decoding is strict: unknown keys, missing required keys, wrong value types
// and unknown enumeration tags all raise ValidationError naming the
// offending key. nlohmann exceptions never escape this module.
// -----------------------------------------------------------------------------

const char* toString(domain::BenchmarkType benchmark);

domain::BenchmarkType parseBenchmarkType(const std::string& text);
domain::Side parseSide(const std::string& text);
domain::OrderType parseOrderType(const std::string& text);
domain::TimeInForce parseTimeInForce(const std::string& text);
domain::AlgorithmType parseAlgorithmType(const std::string& text);

// --- Encoding ---------------------------------------------------------------
nlohmann::json toJson(const domain::Order& order);
nlohmann::json toJson(const domain::ExecutionReport& report);
nlohmann::json toJson(const domain::FillRecord& fill);
nlohmann::json toJson(const domain::RoutingPlan& plan);
nlohmann::json toJson(const domain::OrderSlice& slice);
nlohmann::json toJson(const domain::ComplianceResult& result);
nlohmann::json toJson(const TransitionRecord& record);
nlohmann::json toJson(const AlgoProgress& progress);
nlohmann::json toJson(const Allocation& allocation);
nlohmann::json toJson(const ChildAggregate& aggregate);

// -----------------------------------------------------------------------------
// telemetryJson(event)
// -----------------------------------------------------------------------------
// One PUB-socket message per event, tagged with "type" (order_update,
// execution_report, slice_update, venue_failure, compliance_reject).
// RouteRequestEvent is internal work, not telemetry: std::nullopt.
// -----------------------------------------------------------------------------
std::optional<nlohmann::json> telemetryJson(const Event& event);

// --- Decoding ---------------------------------------------------------------

// -----------------------------------------------------------------------------
// orderRequestFromJson(node)
// -----------------------------------------------------------------------------
// Required: symbol, side, quantity. order_type defaults to MARKET and
// time_in_force to DAY. Algorithmic instructions go in an optional
// "algorithm" object whose "type" is required:
//
//   {"symbol":"AAPL","side":"BUY","quantity":10000,"order_type":"LIMIT",
//    "limit_price":150.0,
//    "algorithm":{"type":"TWAP","start_time_ms":...,"end_time_ms":...}}
//
// Only the shape is checked here; business validation belongs to
// OrderStateMachine::create().
//
// Throws: ValidationError.
// -----------------------------------------------------------------------------
domain::OrderRequest orderRequestFromJson(const nlohmann::json& node);

// Keys: quantity, limit_price, stop_price, reason. Throws ValidationError.
domain::OrderModification modificationFromJson(const nlohmann::json& node);

// Keys: participation_rate, min_participation_rate, max_participation_rate,
// limit_price, display_quantity. Throws ValidationError.
AlgoAdjustment algoAdjustmentFromJson(const nlohmann::json& node);

// Array of {"account": "...", "percentage": 60.0}. Throws ValidationError.
std::vector<AllocationInstruction> allocationInstructionsFromJson(
    const nlohmann::json& node);

// Array of {"quantity": 300, "limit_price": 150.0}; limit_price is optional.
// Throws ValidationError.
std::vector<domain::ChildSplit> childSplitsFromJson(const nlohmann::json& node);

}  // namespace codec
}  // namespace oms
