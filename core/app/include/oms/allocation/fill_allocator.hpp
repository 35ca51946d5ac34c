#pragma once

#include "oms/domain/order.hpp"

#include <string>
#include <vector>

namespace oms {

struct AllocationInstruction {
  std::string account;
  double percentage{0.0};
};

struct Allocation {
  std::string account;
  domain::Quantity quantity{0};
  domain::Price price{0.0};
};

// -----------------------------------------------------------------------------
// allocateFills(order, instructions)
// -----------------------------------------------------------------------------
//
// @brief  Splits an order's filled quantity across accounts.
//
// @details
// Percentages must each be >= 0 and sum to 100 within 0.01. Every account but
// the last receives floor(filled * percentage / 100); the last receives the
// remainder, so the allocations sum exactly to the filled quantity. Every
// allocation is priced at the order's average fill price.
//
// Throws: ValidationError (no instructions, bad percentages, nothing filled).
// -----------------------------------------------------------------------------
std::vector<Allocation> allocateFills(
    const domain::Order& order,
    const std::vector<AllocationInstruction>& instructions);

}  // namespace oms
