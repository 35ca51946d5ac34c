#include "oms/allocation/fill_allocator.hpp"
#include "oms/core/error.hpp"

#include <cmath>
#include <iostream>

namespace oms {

namespace {

constexpr double kPercentTolerance = 0.01;

}  // namespace

std::vector<Allocation> allocateFills(
    const domain::Order& order,
    const std::vector<AllocationInstruction>& instructions) {
  if (instructions.empty()) {
    throw ValidationError("allocation needs at least one account");
  }

  double total = 0.0;
  for (const auto& instruction : instructions) {
    if (instruction.account.empty()) {
      throw ValidationError("allocation account must not be empty");
    }
    if (instruction.percentage < 0.0) {
      throw ValidationError("allocation percentage for " +
                            instruction.account + " is negative");
    }
    total += instruction.percentage;
  }
  if (std::fabs(total - 100.0) > kPercentTolerance) {
    throw ValidationError("allocation percentages sum to " +
                          std::to_string(total) + ", expected 100");
  }
  if (order.filled_quantity <= 0) {
    throw ValidationError("order " + std::to_string(order.order_id) +
                          " has no fills to allocate");
  }

  std::vector<Allocation> out;
  out.reserve(instructions.size());
  domain::Quantity assigned = 0;
  for (std::size_t i = 0; i < instructions.size(); ++i) {
    domain::Quantity quantity = 0;
    if (i + 1 == instructions.size()) {
      quantity = order.filled_quantity - assigned;
    } else {
      quantity = static_cast<domain::Quantity>(
          std::floor(static_cast<double>(order.filled_quantity) *
                     instructions[i].percentage / 100.0));
    }
    assigned += quantity;
    out.push_back(Allocation{instructions[i].account, quantity,
                             order.average_price});
  }

  std::cout << "[FillAllocator] order " << order.order_id << ": "
            << order.filled_quantity << " allocated across " << out.size()
            << " account(s)\n";
  return out;
}

}  // namespace oms
