#pragma once

#include "oms/domain/order_status.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace oms {
namespace domain {

// -----------------------------------------------------------------------------
// OrderId / Quantity / Price
// -----------------------------------------------------------------------------
// OrderId is produced by the OrderIdGenerator (0 is the "unset" sentinel).
// Quantities are whole units: slicing uses floor division and the
// filled + remaining == quantity invariant must hold exactly.
// -----------------------------------------------------------------------------
using OrderId = std::uint64_t;
using Quantity = std::int64_t;
using Price = double;

enum class Side {
  Buy,
  Sell,
};

enum class OrderType {
  Market,
  Limit,
  Stop,
  StopLimit,
};

enum class TimeInForce {
  Day,
  Gtc,
  Ioc,
  Fok,
  Gtd,
};

// -----------------------------------------------------------------------------
// AlgorithmType / AlgorithmParams
// -----------------------------------------------------------------------------
// None means the order is routed and dispatched as a single unit. Any other
// value hands the order to the AlgorithmicScheduler after acceptance.
// -----------------------------------------------------------------------------
enum class AlgorithmType {
  None,
  Twap,
  Vwap,
  Pov,
  Iceberg,
};

enum class BenchmarkType {
  Arrival,
  MarketVwap,
};

// Upper bound on the number of slices one algorithmic order may plan.
constexpr int kMaxAlgorithmSlices = 10000;

struct AlgorithmParams {
  std::int64_t start_time_ms{0};
  std::int64_t end_time_ms{0};

  // TWAP/VWAP slice width. 0 falls back to SchedulerConfig's default.
  std::int64_t slice_interval_ms{0};

  // Explicit slice count. 0 derives it from the window and the interval.
  int num_slices{0};

  // VWAP volume curve. Empty means "derive from historical volume".
  std::vector<double> custom_curve;

  // POV participation band and target.
  double participation_rate{0.10};
  double min_participation_rate{0.05};
  double max_participation_rate{0.20};

  // Iceberg visible size.
  Quantity display_quantity{0};

  std::optional<BenchmarkType> benchmark;
};

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
//
// @brief  Full state of one order: identity, instrument, economics,
//         instructions and lifecycle status.
//
// @details
// Invariant: filled_quantity + remaining_quantity == quantity at all times.
// average_price is the notional-weighted mean of every applied fill.
//
// Only the OrderStateMachine mutates the authoritative copy, which lives in
// the OrderLedger. Every other component works on value snapshots.
//
// A parent split into child orders (child_count > 0) never trades itself;
// its children carry parent_order_id.
// -----------------------------------------------------------------------------
struct Order {
  OrderId order_id{0};
  std::string client_order_id;
  std::optional<OrderId> parent_order_id;
  std::size_t child_count{0};

  std::string symbol;
  std::string security_id;
  std::string account;

  Side side{Side::Buy};
  OrderType order_type{OrderType::Market};
  Quantity quantity{0};
  Quantity filled_quantity{0};
  Quantity remaining_quantity{0};
  Price price{0.0};
  std::optional<Price> limit_price;
  std::optional<Price> stop_price;
  Price average_price{0.0};

  TimeInForce time_in_force{TimeInForce::Day};
  std::optional<std::int64_t> expire_at_ms;
  AlgorithmType algorithm_type{AlgorithmType::None};
  AlgorithmParams algorithm_params;

  OrderStatus status{OrderStatus::Pending};
  std::int64_t created_at_ms{0};
  std::int64_t updated_at_ms{0};
};

// -----------------------------------------------------------------------------
// OrderRequest
// -----------------------------------------------------------------------------
// Client-supplied fields for a new order. Identity, fill state and status are
// assigned by OrderStateMachine::create().
// -----------------------------------------------------------------------------
struct OrderRequest {
  std::string client_order_id;
  std::optional<OrderId> parent_order_id;
  std::string symbol;
  std::string security_id;
  std::string account;
  Side side{Side::Buy};
  OrderType order_type{OrderType::Market};
  Quantity quantity{0};
  Price price{0.0};
  std::optional<Price> limit_price;
  std::optional<Price> stop_price;
  TimeInForce time_in_force{TimeInForce::Day};
  std::optional<std::int64_t> expire_at_ms;
  AlgorithmType algorithm_type{AlgorithmType::None};
  AlgorithmParams algorithm_params;
};

// -----------------------------------------------------------------------------
// OrderModification
// -----------------------------------------------------------------------------
// Proposed amendment. Unset fields are left unchanged. A new quantity must be
// positive and not below the already filled quantity.
// -----------------------------------------------------------------------------
struct OrderModification {
  std::optional<Quantity> quantity;
  std::optional<Price> limit_price;
  std::optional<Price> stop_price;
  std::string reason;
};

// One child of OrderStateMachine::splitToChildren(). An unset limit_price
// keeps the parent's.
struct ChildSplit {
  Quantity quantity{0};
  std::optional<Price> limit_price;
};

// Reference price for notional and routing: limit, then price, then stop.
Price referencePrice(const Order& order);

const char* toString(Side side);
const char* toString(OrderType type);
const char* toString(TimeInForce tif);
const char* toString(AlgorithmType type);

}  // namespace domain
}  // namespace oms
