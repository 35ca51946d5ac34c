#pragma once

namespace oms {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus: order lifecycle state machine
// -----------------------------------------------------------------------------
//
// @brief  Enumerates every state an order can occupy between acceptance and
//         its terminal outcome.
//
// @details
// Legal transitions, enforced by the OrderStateMachine:
//
//   Pending          -> New | Rejected | PendingCancel
//   New              -> PartiallyFilled | Filled | PendingCancel
//                       | PendingReplace | Expired
//   PartiallyFilled  -> PartiallyFilled | Filled | PendingCancel
//                       | PendingReplace | Expired
//   PendingCancel    -> Canceled | Filled
//   PendingReplace   -> Replaced | Filled | PendingReplace | PendingCancel
//   Replaced         -> New | PartiallyFilled (when fills exist)
//
// Terminal states: Filled, Canceled, Rejected, Expired. A terminal order is
// immutable; any further event is reported as an InvalidTransition or a
// TerminalOrder error and never mutates the ledger.
// -----------------------------------------------------------------------------
enum class OrderStatus {
  Pending,          // Created, awaiting compliance acceptance
  New,              // Accepted and live
  PartiallyFilled,  // Some quantity filled, remainder open
  Filled,           // Fully filled, terminal
  PendingCancel,    // Cancel requested, waiting for in-flight work to drain
  Canceled,         // Canceled, terminal
  PendingReplace,   // Modification requested, remainder being re-routed
  Replaced,         // Modification applied (transient)
  Rejected,         // Rejected before going live, terminal
  Expired,          // Time in force elapsed with quantity open, terminal
};

// Returns true for Filled, Canceled, Rejected, Expired.
bool isTerminal(OrderStatus status);

// Returns true when execution reports may be applied in this state.
bool isFillable(OrderStatus status);

const char* toString(OrderStatus status);

}  // namespace domain
}  // namespace oms
