#pragma once

#include "oms/domain/market_data.hpp"
#include "oms/domain/order.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace oms {
namespace domain {

using SliceId = std::uint64_t;

// -----------------------------------------------------------------------------
// ExecutionReport
// -----------------------------------------------------------------------------
//
// @brief  Immutable fact emitted by one venue interaction.
//
// @details
// order_id always names the order whose fill state changes; for algorithmic
// child slices that is the parent, and slice_id identifies the slice. The
// OrderStateMachine consumes each execution_id exactly once.
// -----------------------------------------------------------------------------
struct ExecutionReport {
  std::string execution_id;
  OrderId order_id{0};
  std::optional<SliceId> slice_id;
  Quantity quantity{0};
  Price price{0.0};
  Venue venue;
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// VenueOrder
// -----------------------------------------------------------------------------
// What the dispatcher sends to IVenueEndpoint::execute() for one route line.
// -----------------------------------------------------------------------------
struct VenueOrder {
  OrderId order_id{0};
  std::optional<SliceId> slice_id;
  std::string symbol;
  Side side{Side::Buy};
  OrderType order_type{OrderType::Market};
  Quantity quantity{0};
  std::optional<Price> limit_price;
  Price expected_price{0.0};
  Venue venue;
};

// -----------------------------------------------------------------------------
// FillRecord
// -----------------------------------------------------------------------------
// Ledger-side record of one applied report: the fill plus the cumulative
// state it produced.
// -----------------------------------------------------------------------------
struct FillRecord {
  ExecutionReport report;
  Quantity cumulative_quantity{0};
  Price average_price{0.0};
  Quantity leaves_quantity{0};
};

}  // namespace domain
}  // namespace oms
